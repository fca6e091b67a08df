#include "gridstore/put/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gridstore::put
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " --root <DIR> [--bucket <NAME>] [--chunk-size <BYTES>] [--metadata <JSON>] [--name <FILENAME>]"
               " [--log <FILE>] [--verbose] <FILE>...";
    }

    PutConfig parse_arguments(int argc, char *argv[])
    {
        PutConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--bucket")
            {
                config.bucket_name = require_value(index, argc, argv, arg);
                if (config.bucket_name.empty())
                {
                    throw std::runtime_error("--bucket must not be empty");
                }
            }
            else if (arg == "--chunk-size")
            {
                const auto value = require_value(index, argc, argv, arg);
                const bool digits_only = !value.empty() && std::all_of(value.begin(), value.end(), [](char c)
                                                                       { return c >= '0' && c <= '9'; });
                unsigned long long chunk_size = 0;
                try
                {
                    chunk_size = digits_only ? std::stoull(value) : 0;
                }
                catch (const std::out_of_range &)
                {
                    chunk_size = 0;
                }
                if (chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size expects a positive number of bytes");
                }
                config.chunk_size_bytes = static_cast<std::size_t>(chunk_size);
            }
            else if (arg == "--metadata")
            {
                const auto value = require_value(index, argc, argv, arg);
                auto metadata = Document::parse(value, nullptr, false);
                if (metadata.is_discarded() || !metadata.is_object())
                {
                    throw std::runtime_error("--metadata expects a JSON object");
                }
                config.metadata = std::move(metadata);
            }
            else if (arg == "--name")
            {
                config.name = require_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.inputs.emplace_back(arg);
            }
        }

        if (config.root.empty())
        {
            throw std::runtime_error("--root is required");
        }
        if (config.inputs.empty())
        {
            throw std::runtime_error("At least one input file is required");
        }
        if (config.name && config.inputs.size() != 1)
        {
            throw std::runtime_error("--name can only be used with a single input file");
        }
        return config;
    }

} // namespace gridstore::put
