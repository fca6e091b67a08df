#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gridstore/document.hpp"

namespace gridstore::put
{

    struct PutConfig
    {
        std::filesystem::path root;
        std::string bucket_name{"fs"};
        std::optional<std::size_t> chunk_size_bytes;
        Document metadata = Document::object();
        std::optional<std::string> name;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        std::vector<std::filesystem::path> inputs;
    };

    // Throws std::runtime_error describing the problem on malformed arguments.
    PutConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace gridstore::put
