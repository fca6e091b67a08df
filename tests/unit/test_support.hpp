#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "gridstore/error_codes.hpp"
#include "gridstore/store/memory_collection.hpp"

namespace gridstore::test
{

    inline std::vector<std::byte> bytes_of(std::string_view text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

    inline std::string text_of(const std::vector<std::byte> &bytes)
    {
        std::string text(bytes.size(), '\0');
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            text[i] = static_cast<char>(bytes[i]);
        }
        return text;
    }

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Memory collection that can be told to fail its next store calls.
    class FaultyCollection : public store::Collection
    {
    public:
        explicit FaultyCollection(std::string name) : inner_(std::move(name)) {}

        const std::string &name() const noexcept override { return inner_.name(); }

        void insert_one(const Document &document) override
        {
            ++insert_calls;
            if (fail_inserts_after && inserts_succeeded >= *fail_inserts_after)
            {
                throw StoreError(ErrorCode::StoreFailure, "injected insert failure");
            }
            inner_.insert_one(document);
            ++inserts_succeeded;
        }

        std::uint64_t delete_many(const Document &filter) override
        {
            ++delete_calls;
            if (fail_deletes)
            {
                throw StoreError(ErrorCode::StoreFailure, "injected delete failure");
            }
            return inner_.delete_many(filter);
        }

        std::vector<Document> find(const Document &filter) const override
        {
            return inner_.find(filter);
        }

        std::optional<std::size_t> fail_inserts_after;
        bool fail_deletes{false};
        std::size_t insert_calls{0};
        std::size_t inserts_succeeded{0};
        std::size_t delete_calls{0};

    private:
        store::MemoryCollection inner_;
    };

    void run_store_component_tests();
    void run_upload_stream_tests();
    void run_bucket_component_tests();
    void run_put_config_tests();

} // namespace gridstore::test
