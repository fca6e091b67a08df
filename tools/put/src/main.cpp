#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gridstore/crypto.hpp"
#include "gridstore/gridfs/bucket.hpp"
#include "gridstore/put/config.hpp"
#include "gridstore/store/directory_collection.hpp"
#include "gridstore/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void install_logger(const gridstore::put::PutConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("put", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using gridstore::gridfs::Bucket;
    using gridstore::gridfs::BucketOptions;
    using gridstore::gridfs::UploadOptions;

    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << "gridstore-put " << gridstore::version() << "\n"
                  << gridstore::put::usage(argv[0]) << "\n";
        return EXIT_SUCCESS;
    }

    gridstore::put::PutConfig config;
    try
    {
        config = gridstore::put::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n"
                  << gridstore::put::usage(argv[0]) << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        install_logger(config);
        gridstore::crypto::ensure_sodium_init();
        spdlog::debug("gridstore-put {} writing to {} (bucket {})", gridstore::version(), config.root.string(),
                      config.bucket_name);

        auto database = std::make_shared<gridstore::store::DirectoryDatabase>(config.root);
        BucketOptions bucket_options;
        bucket_options.bucket_name = config.bucket_name;
        Bucket bucket(database, bucket_options);

        for (const auto &input : config.inputs)
        {
            std::ifstream source(input, std::ios::binary);
            if (!source.is_open())
            {
                throw std::runtime_error("Failed to open " + input.string());
            }
            UploadOptions upload_options;
            upload_options.chunk_size_bytes = config.chunk_size_bytes;
            upload_options.metadata = config.metadata;
            const auto filename = config.name.value_or(input.filename().string());
            const auto file_id = bucket.upload_from_stream(filename, source, std::move(upload_options));

            gridstore::Document filter = gridstore::Document::object();
            filter["_id"] = file_id.to_hex();
            const auto stored = bucket.files_collection()->find(filter);
            const auto length = stored.empty() ? 0 : stored.front().value("length", std::uint64_t{0});
            std::cout << file_id.to_hex() << "  " << filename << "  " << length << "\n";
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Upload failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
