#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "gridstore/document.hpp"

namespace gridstore::gridfs
{

    inline constexpr std::size_t kDefaultChunkSizeBytes = 255 * 1024;

    struct BucketOptions
    {
        std::string bucket_name{"fs"};
        std::size_t chunk_size_bytes{kDefaultChunkSizeBytes};
    };

    struct UploadOptions
    {
        std::optional<std::size_t> chunk_size_bytes;
        Document metadata = Document::object();
    };

} // namespace gridstore::gridfs
