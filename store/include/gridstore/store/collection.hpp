/**
 * GridStore - Document store collaborator used by the upload path.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gridstore/document.hpp"

namespace gridstore::store
{

    /**
     * A named set of documents.
     *
     * insert_one is atomic: it either stores the document or throws StoreError and
     * leaves the collection unchanged. delete_many is atomic unless an
     * implementation documents otherwise. A document inserted
     * without an "_id" field is given a generated ObjectId (hex); a duplicate "_id"
     * throws StoreError(DuplicateKey).
     *
     * Filters match a document when every top-level filter field is present in the
     * document with an equal value. An empty filter matches everything.
     */
    class Collection
    {
    public:
        virtual ~Collection() = default;

        virtual const std::string &name() const noexcept = 0;

        virtual void insert_one(const Document &document) = 0;

        // Returns the number of documents removed.
        virtual std::uint64_t delete_many(const Document &filter) = 0;

        // Matching documents in insertion order.
        virtual std::vector<Document> find(const Document &filter) const = 0;
    };

    class Database
    {
    public:
        virtual ~Database() = default;

        // Repeated calls with the same name return the same collection.
        virtual std::shared_ptr<Collection> collection(const std::string &name) = 0;
    };

    bool matches(const Document &document, const Document &filter);

    // Validates the shape of a document and returns a copy that carries an "_id".
    Document prepare_for_insert(const Document &document);

    void require_filter(const Document &filter);

} // namespace gridstore::store
