/**
 * GridStore - Chunked upload writer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include "gridstore/crypto.hpp"
#include "gridstore/document.hpp"
#include "gridstore/object_id.hpp"
#include "gridstore/store/collection.hpp"

namespace gridstore::gridfs
{

    /**
     * Splits a byte stream into fixed-size chunk documents and finishes with one
     * file document.
     *
     * Chunk documents are { files_id, n, data } and go to the chunks collection as
     * each chunk fills. close() writes the trailing partial chunk and the file
     * document { _id, length, chunkSize, uploadDate, md5, filename, metadata? }.
     * abort() deletes every chunk carrying this file id and writes nothing else.
     *
     * Only the closed flag is safe to race: concurrent close()/abort() calls let
     * exactly one through. All other calls must be serialized by the caller.
     *
     * Store errors propagate unchanged. A store failure while flushing leaves the
     * byte counters advanced for data that was never persisted; the stream should
     * then be aborted and the upload restarted under a new file id.
     */
    class UploadStream
    {
    public:
        // Throws GridError(DigestUnavailable) when MD5 is not available and
        // GridError(InvalidArgument) for a null collection, a zero chunk size or
        // non-object metadata.
        UploadStream(std::shared_ptr<store::Collection> files_collection,
                     std::shared_ptr<store::Collection> chunks_collection, ObjectId file_id, std::string filename,
                     std::size_t chunk_size_bytes, Document metadata = Document::object());
        ~UploadStream();

        UploadStream(const UploadStream &) = delete;
        UploadStream &operator=(const UploadStream &) = delete;

        const ObjectId &file_id() const noexcept { return file_id_; }
        const std::string &filename() const noexcept { return filename_; }
        std::size_t chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

        // Bytes accepted so far, including bytes still buffered.
        std::uint64_t length() const noexcept { return length_in_bytes_; }

        // Chunk documents written so far.
        std::uint64_t chunks_written() const noexcept { return chunk_index_; }

        bool is_closed() const;

        void write(std::byte value);
        void write(std::span<const std::byte> data);
        void write(std::span<const std::byte> data, std::size_t offset, std::size_t length);
        void write(const std::byte *data, std::size_t length);

        // No-op when already closed or aborted.
        void close();

        // Throws GridError(StreamClosed) when already closed or aborted.
        void abort();

    private:
        void check_closed() const;
        void flush_chunk();
        void release_buffer();

        std::shared_ptr<store::Collection> files_;
        std::shared_ptr<store::Collection> chunks_;
        const ObjectId file_id_;
        const std::string filename_;
        const std::size_t chunk_size_bytes_;
        const Document metadata_;
        crypto::Digest digest_;

        std::vector<std::byte> buffer_;
        std::size_t buffer_offset_{0};
        std::uint64_t chunk_index_{0};
        std::uint64_t length_in_bytes_{0};

        mutable std::mutex close_mutex_;
        bool closed_{false};
    };

} // namespace gridstore::gridfs
