#include "gridstore/gridfs/bucket.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "gridstore/error_codes.hpp"

namespace gridstore::gridfs
{

    Bucket::Bucket(std::shared_ptr<store::Database> database, BucketOptions options)
        : database_(std::move(database)), options_(std::move(options))
    {
        if (!database_)
        {
            throw GridError(ErrorCode::InvalidArgument, "Bucket requires a database");
        }
        if (options_.bucket_name.empty())
        {
            throw GridError(ErrorCode::InvalidArgument, "Bucket name must not be empty");
        }
        if (options_.chunk_size_bytes == 0)
        {
            throw GridError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
        }
        files_ = database_->collection(options_.bucket_name + ".files");
        chunks_ = database_->collection(options_.bucket_name + ".chunks");
    }

    std::unique_ptr<UploadStream> Bucket::open_upload_stream(const std::string &filename, UploadOptions options)
    {
        return open_upload_stream_with_id(ObjectId::generate(), filename, std::move(options));
    }

    std::unique_ptr<UploadStream> Bucket::open_upload_stream_with_id(const ObjectId &file_id,
                                                                     const std::string &filename,
                                                                     UploadOptions options)
    {
        const auto chunk_size = options.chunk_size_bytes.value_or(options_.chunk_size_bytes);
        return std::make_unique<UploadStream>(files_, chunks_, file_id, filename, chunk_size,
                                              std::move(options.metadata));
    }

    ObjectId Bucket::upload_from_stream(const std::string &filename, std::istream &source, UploadOptions options)
    {
        auto stream = open_upload_stream(filename, std::move(options));
        try
        {
            std::vector<std::byte> block(stream->chunk_size_bytes());
            while (source)
            {
                source.read(reinterpret_cast<char *>(block.data()), static_cast<std::streamsize>(block.size()));
                const auto read_count = static_cast<std::size_t>(source.gcount());
                if (read_count > 0)
                {
                    stream->write(std::span<const std::byte>(block.data(), read_count));
                }
            }
            if (source.bad())
            {
                throw GridError(ErrorCode::InternalError, "Failed to read upload source");
            }
            stream->close();
        }
        catch (const std::exception &ex)
        {
            if (!stream->is_closed())
            {
                try
                {
                    stream->abort();
                }
                catch (const std::exception &abort_error)
                {
                    spdlog::error("Failed to abort upload {} after error ({}): {}", stream->file_id().to_hex(),
                                  ex.what(), abort_error.what());
                }
            }
            throw;
        }
        return stream->file_id();
    }

} // namespace gridstore::gridfs
