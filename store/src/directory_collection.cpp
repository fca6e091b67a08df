#include "gridstore/store/directory_collection.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "gridstore/error_codes.hpp"

namespace gridstore::store
{

    namespace
    {
        constexpr auto kDocumentExtension = ".bson";
        constexpr auto kTempExtension = ".tmp";

        bool valid_collection_name(const std::string &name)
        {
            if (name.empty() || name == "." || name == "..")
            {
                return false;
            }
            return name.find_first_of("/\\") == std::string::npos;
        }

        // Names outside [0, UINT64_MAX) are not ours and are ignored.
        std::optional<std::uint64_t> sequence_from_path(const std::filesystem::path &path)
        {
            if (path.extension() != kDocumentExtension)
            {
                return std::nullopt;
            }
            const auto stem = path.stem().string();
            if (stem.empty() || !std::all_of(stem.begin(), stem.end(), [](char c)
                                             { return c >= '0' && c <= '9'; }))
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            try
            {
                value = std::stoull(stem);
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
            if (value == std::numeric_limits<std::uint64_t>::max())
            {
                return std::nullopt;
            }
            return value;
        }

        Document read_document(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw StoreError(ErrorCode::StoreFailure, "Failed to open document " + path.string());
            }
            const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            try
            {
                return Document::from_bson(bytes);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw StoreError(ErrorCode::StoreFailure, "Corrupt document " + path.string() + ": " + ex.what());
            }
        }

    } // namespace

    DirectoryCollection::DirectoryCollection(const std::filesystem::path &root, std::string name)
        : name_(std::move(name))
    {
        if (!valid_collection_name(name_))
        {
            throw GridError(ErrorCode::InvalidArgument, "Invalid collection name: " + name_);
        }
        directory_ = root / name_;
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec)
        {
            throw StoreError(ErrorCode::StoreFailure,
                             "Failed to create collection directory " + directory_.string() + ": " + ec.message());
        }
        load_index();
    }

    void DirectoryCollection::insert_one(const Document &document)
    {
        auto prepared = prepare_for_insert(document);
        std::lock_guard lock(mutex_);
        const auto id_key = prepared.at("_id").dump();
        if (ids_.contains(id_key))
        {
            throw StoreError(ErrorCode::DuplicateKey, "Duplicate _id in " + name_ + ": " + id_key);
        }

        std::vector<std::uint8_t> bytes;
        try
        {
            bytes = Document::to_bson(prepared);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw GridError(ErrorCode::InvalidArgument, std::string("Document cannot be stored as BSON: ") + ex.what());
        }

        if (next_sequence_ == std::numeric_limits<std::uint64_t>::max())
        {
            throw StoreError(ErrorCode::StoreFailure, "Sequence space exhausted in " + directory_.string());
        }
        const auto final_path = path_for_sequence(next_sequence_);
        auto temp_path = final_path;
        temp_path += kTempExtension;
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw StoreError(ErrorCode::StoreFailure, "Failed to write document " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StoreError(ErrorCode::StoreFailure,
                             "Failed to commit document " + final_path.string() + ": " + ec.message());
        }

        ++next_sequence_;
        ids_.insert(id_key);
        spdlog::debug("{}: inserted {} ({} bytes)", name_, final_path.filename().string(), bytes.size());
    }

    std::uint64_t DirectoryCollection::delete_many(const Document &filter)
    {
        require_filter(filter);
        std::lock_guard lock(mutex_);
        std::uint64_t removed = 0;
        for (const auto &path : document_paths_locked())
        {
            const auto document = read_document(path);
            if (!matches(document, filter))
            {
                continue;
            }
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                throw StoreError(ErrorCode::StoreFailure,
                                 "Failed to delete document " + path.string() + ": " + ec.message());
            }
            if (document.contains("_id"))
            {
                ids_.erase(document.at("_id").dump());
            }
            ++removed;
        }
        spdlog::debug("{}: deleted {} documents", name_, removed);
        return removed;
    }

    std::vector<Document> DirectoryCollection::find(const Document &filter) const
    {
        require_filter(filter);
        std::lock_guard lock(mutex_);
        std::vector<Document> result;
        for (const auto &path : document_paths_locked())
        {
            auto document = read_document(path);
            if (matches(document, filter))
            {
                result.push_back(std::move(document));
            }
        }
        return result;
    }

    void DirectoryCollection::load_index()
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kTempExtension)
            {
                continue;
            }
            // Left behind by an insert that never reached its rename.
            std::error_code ignored;
            std::filesystem::remove(entry.path(), ignored);
        }
        if (ec)
        {
            throw StoreError(ErrorCode::StoreFailure, "Failed to scan " + directory_.string() + ": " + ec.message());
        }

        for (const auto &path : document_paths_locked())
        {
            next_sequence_ = std::max(next_sequence_, *sequence_from_path(path) + 1);
            const auto document = read_document(path);
            if (document.contains("_id"))
            {
                ids_.insert(document.at("_id").dump());
            }
        }
    }

    std::vector<std::filesystem::path> DirectoryCollection::document_paths_locked() const
    {
        std::vector<std::filesystem::path> paths;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            if (entry.is_regular_file() && sequence_from_path(entry.path()))
            {
                paths.push_back(entry.path());
            }
        }
        if (ec)
        {
            throw StoreError(ErrorCode::StoreFailure, "Failed to scan " + directory_.string() + ": " + ec.message());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    std::filesystem::path DirectoryCollection::path_for_sequence(std::uint64_t sequence) const
    {
        char name[32];
        std::snprintf(name, sizeof(name), "%020llu", static_cast<unsigned long long>(sequence));
        return directory_ / (std::string(name) + kDocumentExtension);
    }

    DirectoryDatabase::DirectoryDatabase(std::filesystem::path root) : root_(std::move(root))
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            throw StoreError(ErrorCode::StoreFailure, "Failed to create store root " + root_.string() + ": " + ec.message());
        }
    }

    std::shared_ptr<Collection> DirectoryDatabase::collection(const std::string &name)
    {
        std::lock_guard lock(mutex_);
        auto &entry = collections_[name];
        if (!entry)
        {
            entry = std::make_shared<DirectoryCollection>(root_, name);
        }
        return entry;
    }

} // namespace gridstore::store
