#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gridstore/store/collection.hpp"

namespace gridstore::store
{

    class MemoryCollection : public Collection
    {
    public:
        explicit MemoryCollection(std::string name);

        const std::string &name() const noexcept override { return name_; }

        void insert_one(const Document &document) override;
        std::uint64_t delete_many(const Document &filter) override;
        std::vector<Document> find(const Document &filter) const override;

        std::size_t size() const;

    private:
        std::string name_;
        mutable std::mutex mutex_;
        std::vector<Document> documents_;
    };

    class MemoryDatabase : public Database
    {
    public:
        std::shared_ptr<Collection> collection(const std::string &name) override;

    private:
        std::mutex mutex_;
        std::map<std::string, std::shared_ptr<MemoryCollection>> collections_;
    };

} // namespace gridstore::store
