#include "gridstore/gridfs/upload_stream.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "gridstore/error_codes.hpp"

namespace gridstore::gridfs
{

    namespace
    {

        std::int64_t now_millis()
        {
            using namespace std::chrono;
            return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        }

    } // namespace

    UploadStream::UploadStream(std::shared_ptr<store::Collection> files_collection,
                               std::shared_ptr<store::Collection> chunks_collection, ObjectId file_id,
                               std::string filename, std::size_t chunk_size_bytes, Document metadata)
        : files_(std::move(files_collection)),
          chunks_(std::move(chunks_collection)),
          file_id_(file_id),
          filename_(std::move(filename)),
          chunk_size_bytes_(chunk_size_bytes),
          metadata_(metadata.is_null() ? Document::object() : std::move(metadata)),
          digest_(crypto::kMd5)
    {
        if (!files_ || !chunks_)
        {
            throw GridError(ErrorCode::InvalidArgument, "Upload stream requires files and chunks collections");
        }
        if (chunk_size_bytes_ == 0)
        {
            throw GridError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
        }
        if (!metadata_.is_object())
        {
            throw GridError(ErrorCode::InvalidArgument, "Metadata must be a document");
        }
        buffer_.resize(chunk_size_bytes_);
    }

    UploadStream::~UploadStream()
    {
        if (!is_closed())
        {
            spdlog::warn("Upload stream for {} ({}) dropped without close or abort, {} chunks left behind",
                         file_id_.to_hex(), filename_, chunk_index_);
        }
    }

    bool UploadStream::is_closed() const
    {
        std::lock_guard lock(close_mutex_);
        return closed_;
    }

    void UploadStream::write(std::byte value)
    {
        write(std::span<const std::byte>(&value, 1));
    }

    void UploadStream::write(std::span<const std::byte> data)
    {
        write(data, 0, data.size());
    }

    void UploadStream::write(const std::byte *data, std::size_t length)
    {
        check_closed();
        if (data == nullptr && length > 0)
        {
            throw GridError(ErrorCode::InvalidArgument, "Null buffer passed to write");
        }
        write(std::span<const std::byte>(data, length));
    }

    void UploadStream::write(std::span<const std::byte> data, std::size_t offset, std::size_t length)
    {
        check_closed();
        if (offset > data.size() || length > data.size() - offset)
        {
            throw GridError(ErrorCode::InvalidArgument, "Write range out of bounds");
        }
        if (length == 0)
        {
            return;
        }

        auto remaining = data.subspan(offset, length);
        while (!remaining.empty())
        {
            const auto amount = std::min(remaining.size(), chunk_size_bytes_ - buffer_offset_);
            std::copy_n(remaining.begin(), amount, buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_offset_));

            buffer_offset_ += amount;
            length_in_bytes_ += amount;
            remaining = remaining.subspan(amount);

            if (buffer_offset_ == chunk_size_bytes_)
            {
                flush_chunk();
            }
        }
    }

    void UploadStream::close()
    {
        {
            std::lock_guard lock(close_mutex_);
            if (closed_)
            {
                return;
            }
            closed_ = true;
        }

        flush_chunk();
        release_buffer();

        Document file = Document::object();
        file["_id"] = file_id_.to_hex();
        file["length"] = length_in_bytes_;
        file["chunkSize"] = chunk_size_bytes_;
        file["uploadDate"] = now_millis();
        file["md5"] = digest_.finish_hex();
        file["filename"] = filename_;
        if (!metadata_.empty())
        {
            file["metadata"] = metadata_;
        }
        files_->insert_one(file);

        spdlog::info("Stored {} as {}: {} bytes in {} chunks", filename_, file_id_.to_hex(), length_in_bytes_,
                     chunk_index_);
    }

    void UploadStream::abort()
    {
        {
            std::lock_guard lock(close_mutex_);
            if (closed_)
            {
                throw GridError(ErrorCode::StreamClosed, "The upload stream has been closed");
            }
            closed_ = true;
        }

        release_buffer();

        Document filter = Document::object();
        filter["files_id"] = file_id_.to_hex();
        const auto removed = chunks_->delete_many(filter);
        spdlog::warn("Aborted upload of {} ({}), removed {} chunks", filename_, file_id_.to_hex(), removed);
    }

    void UploadStream::check_closed() const
    {
        std::lock_guard lock(close_mutex_);
        if (closed_)
        {
            throw GridError(ErrorCode::StreamClosed, "The upload stream has been closed");
        }
    }

    void UploadStream::flush_chunk()
    {
        if (buffer_offset_ == 0)
        {
            return;
        }

        const std::span<const std::byte> payload(buffer_.data(), buffer_offset_);
        Document chunk = Document::object();
        chunk["files_id"] = file_id_.to_hex();
        chunk["n"] = chunk_index_;
        chunk["data"] = make_binary(payload);
        chunks_->insert_one(chunk);
        digest_.update(payload);

        spdlog::debug("Flushed chunk {} of {} ({} bytes)", chunk_index_, file_id_.to_hex(), buffer_offset_);
        ++chunk_index_;
        buffer_offset_ = 0;
    }

    void UploadStream::release_buffer()
    {
        std::vector<std::byte>().swap(buffer_);
        buffer_offset_ = 0;
    }

} // namespace gridstore::gridfs
