#include "gridstore/store/memory_collection.hpp"

#include <algorithm>
#include <iterator>

#include "gridstore/error_codes.hpp"

namespace gridstore::store
{

    MemoryCollection::MemoryCollection(std::string name) : name_(std::move(name)) {}

    void MemoryCollection::insert_one(const Document &document)
    {
        auto prepared = prepare_for_insert(document);
        std::lock_guard lock(mutex_);
        const auto &id = prepared.at("_id");
        const auto duplicate = std::any_of(documents_.begin(), documents_.end(), [&](const Document &existing)
                                           { return existing.at("_id") == id; });
        if (duplicate)
        {
            throw StoreError(ErrorCode::DuplicateKey, "Duplicate _id in " + name_ + ": " + id.dump());
        }
        documents_.push_back(std::move(prepared));
    }

    std::uint64_t MemoryCollection::delete_many(const Document &filter)
    {
        require_filter(filter);
        std::lock_guard lock(mutex_);
        const auto removed = std::erase_if(documents_, [&](const Document &document)
                                           { return matches(document, filter); });
        return static_cast<std::uint64_t>(removed);
    }

    std::vector<Document> MemoryCollection::find(const Document &filter) const
    {
        require_filter(filter);
        std::lock_guard lock(mutex_);
        std::vector<Document> result;
        std::copy_if(documents_.begin(), documents_.end(), std::back_inserter(result),
                     [&](const Document &document)
                     { return matches(document, filter); });
        return result;
    }

    std::size_t MemoryCollection::size() const
    {
        std::lock_guard lock(mutex_);
        return documents_.size();
    }

    std::shared_ptr<Collection> MemoryDatabase::collection(const std::string &name)
    {
        std::lock_guard lock(mutex_);
        auto &entry = collections_[name];
        if (!entry)
        {
            entry = std::make_shared<MemoryCollection>(name);
        }
        return entry;
    }

} // namespace gridstore::store
