#pragma once

#include <istream>
#include <memory>
#include <string>

#include "gridstore/gridfs/options.hpp"
#include "gridstore/gridfs/upload_stream.hpp"
#include "gridstore/object_id.hpp"
#include "gridstore/store/collection.hpp"

namespace gridstore::gridfs
{

    /**
     * Pairs the "<bucket>.files" and "<bucket>.chunks" collections of a database
     * and opens upload streams against them.
     */
    class Bucket
    {
    public:
        explicit Bucket(std::shared_ptr<store::Database> database, BucketOptions options = {});

        const BucketOptions &options() const noexcept { return options_; }

        std::shared_ptr<store::Collection> files_collection() const { return files_; }
        std::shared_ptr<store::Collection> chunks_collection() const { return chunks_; }

        std::unique_ptr<UploadStream> open_upload_stream(const std::string &filename, UploadOptions options = {});

        std::unique_ptr<UploadStream> open_upload_stream_with_id(const ObjectId &file_id, const std::string &filename,
                                                                 UploadOptions options = {});

        // Copies the whole source into a new file. On failure the partial upload is
        // aborted and the original error is rethrown.
        ObjectId upload_from_stream(const std::string &filename, std::istream &source, UploadOptions options = {});

    private:
        std::shared_ptr<store::Database> database_;
        BucketOptions options_;
        std::shared_ptr<store::Collection> files_;
        std::shared_ptr<store::Collection> chunks_;
    };

} // namespace gridstore::gridfs
