#include "gridstore/store/collection.hpp"

#include "gridstore/error_codes.hpp"
#include "gridstore/object_id.hpp"

namespace gridstore::store
{

    bool matches(const Document &document, const Document &filter)
    {
        for (const auto &[key, value] : filter.items())
        {
            const auto it = document.find(key);
            if (it == document.end() || *it != value)
            {
                return false;
            }
        }
        return true;
    }

    Document prepare_for_insert(const Document &document)
    {
        if (!document.is_object())
        {
            throw GridError(ErrorCode::InvalidArgument, "Only object documents can be inserted");
        }
        Document prepared = document;
        if (!prepared.contains("_id"))
        {
            prepared["_id"] = ObjectId::generate().to_hex();
        }
        return prepared;
    }

    void require_filter(const Document &filter)
    {
        if (!filter.is_object())
        {
            throw GridError(ErrorCode::InvalidArgument, "Filter must be an object");
        }
    }

} // namespace gridstore::store
