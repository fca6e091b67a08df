#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "gridstore/store/collection.hpp"

namespace gridstore::store
{

    /**
     * Collection persisted as one BSON file per document under <root>/<name>/.
     *
     * Files are named by a zero-padded insertion sequence so directory order is
     * insertion order. Inserts go through a temporary file and a rename.
     *
     * delete_many removes matching files one by one: a failure part way through
     * throws StoreError after the earlier matches are already gone.
     */
    class DirectoryCollection : public Collection
    {
    public:
        DirectoryCollection(const std::filesystem::path &root, std::string name);

        const std::string &name() const noexcept override { return name_; }

        void insert_one(const Document &document) override;
        std::uint64_t delete_many(const Document &filter) override;
        std::vector<Document> find(const Document &filter) const override;

        std::filesystem::path directory() const { return directory_; }

    private:
        void load_index();
        // Sorted document files; documents are read one at a time by the callers.
        std::vector<std::filesystem::path> document_paths_locked() const;
        std::filesystem::path path_for_sequence(std::uint64_t sequence) const;

        std::string name_;
        std::filesystem::path directory_;
        mutable std::mutex mutex_;
        std::uint64_t next_sequence_{0};
        std::set<std::string> ids_;
    };

    class DirectoryDatabase : public Database
    {
    public:
        explicit DirectoryDatabase(std::filesystem::path root);

        std::shared_ptr<Collection> collection(const std::string &name) override;

        std::filesystem::path root() const { return root_; }

    private:
        std::filesystem::path root_;
        std::mutex mutex_;
        std::map<std::string, std::shared_ptr<DirectoryCollection>> collections_;
    };

} // namespace gridstore::store
