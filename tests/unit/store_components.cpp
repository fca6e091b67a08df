#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "gridstore/error_codes.hpp"
#include "gridstore/store/directory_collection.hpp"
#include "gridstore/store/memory_collection.hpp"
#include "test_support.hpp"

using namespace gridstore;
using namespace gridstore::store;

namespace
{

    Document chunk_doc(const std::string &files_id, int n)
    {
        Document document = Document::object();
        document["files_id"] = files_id;
        document["n"] = n;
        document["data"] = make_binary(test::bytes_of("payload-" + std::to_string(n)));
        return document;
    }

    Document by_files_id(const std::string &files_id)
    {
        Document filter = Document::object();
        filter["files_id"] = files_id;
        return filter;
    }

    template <typename Fn>
    bool throws_code(ErrorCode code, Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const GridError &ex)
        {
            return ex.code() == code;
        }
        return false;
    }

    void test_filter_matching()
    {
        const Document document = {{"files_id", "a"}, {"n", 3}};
        assert(matches(document, Document::object()));
        assert(matches(document, Document{{"files_id", "a"}}));
        assert(matches(document, Document{{"files_id", "a"}, {"n", 3}}));
        assert(!matches(document, Document{{"files_id", "b"}}));
        assert(!matches(document, Document{{"missing", 1}}));
    }

    void exercise_collection(Collection &collection)
    {
        collection.insert_one(chunk_doc("a", 0));
        collection.insert_one(chunk_doc("b", 0));
        collection.insert_one(chunk_doc("a", 1));

        const auto all = collection.find(Document::object());
        assert(all.size() == 3);
        for (const auto &document : all)
        {
            assert(document.contains("_id"));
        }

        const auto for_a = collection.find(by_files_id("a"));
        assert(for_a.size() == 2);
        assert(for_a[0].at("n") == 0);
        assert(for_a[1].at("n") == 1);
        assert(test::text_of(binary_bytes(for_a[1].at("data"))) == "payload-1");

        Document with_id = {{"_id", "fixed"}, {"value", 1}};
        collection.insert_one(with_id);
        assert(throws_code(ErrorCode::DuplicateKey, [&]
                           { collection.insert_one(with_id); }));
        assert(throws_code(ErrorCode::InvalidArgument, [&]
                           { collection.insert_one(Document::array()); }));
        assert(throws_code(ErrorCode::InvalidArgument, [&]
                           { (void)collection.delete_many(Document("files_id")); }));

        assert(collection.delete_many(by_files_id("a")) == 2);
        assert(collection.delete_many(by_files_id("a")) == 0);
        assert(collection.find(by_files_id("b")).size() == 1);
        assert(collection.find(Document::object()).size() == 2);
    }

    void test_memory_collection()
    {
        MemoryCollection collection("fs.chunks");
        assert(collection.name() == "fs.chunks");
        exercise_collection(collection);
        assert(collection.size() == 2);

        MemoryDatabase database;
        const auto first = database.collection("fs.files");
        const auto second = database.collection("fs.files");
        assert(first == second);
        assert(database.collection("fs.chunks") != first);
    }

    void test_directory_collection()
    {
        const auto root = std::filesystem::temp_directory_path() / "gridstore_directory_collection_test";
        test::cleanup_path(root);

        {
            DirectoryCollection collection(root, "fs.chunks");
            assert(collection.directory() == root / "fs.chunks");
            exercise_collection(collection);
        }

        {
            // Reopened: documents, order and the _id index survive.
            std::ofstream(root / "fs.chunks" / "00000000000000000099.bson.tmp") << "partial";
            DirectoryCollection reopened(root, "fs.chunks");
            assert(!std::filesystem::exists(root / "fs.chunks" / "00000000000000000099.bson.tmp"));
            assert(reopened.find(Document::object()).size() == 2);
            assert(throws_code(ErrorCode::DuplicateKey, [&]
                               { reopened.insert_one(Document{{"_id", "fixed"}}); }));

            reopened.insert_one(chunk_doc("c", 0));
            const auto all = reopened.find(Document::object());
            assert(all.size() == 3);
            assert(all.back().at("files_id") == "c");
        }

        assert(throws_code(ErrorCode::InvalidArgument, [&]
                           { DirectoryCollection bad(root, "../escape"); }));

        {
            // Sequence names at or beyond the top of the range are left alone.
            const auto directory = root / "odd.names";
            std::filesystem::create_directories(directory);
            const auto planted = Document::to_bson(Document{{"_id", "planted"}});
            for (const auto *name : {"99999999999999999999.bson", "18446744073709551615.bson"})
            {
                std::ofstream out(directory / name, std::ios::binary);
                out.write(reinterpret_cast<const char *>(planted.data()), static_cast<std::streamsize>(planted.size()));
            }

            DirectoryCollection odd(root, "odd.names");
            assert(odd.find(Document::object()).empty());
            odd.insert_one(chunk_doc("d", 0));
            assert(std::filesystem::exists(directory / "00000000000000000000.bson"));
            assert(std::filesystem::exists(directory / "99999999999999999999.bson"));
            assert(std::filesystem::exists(directory / "18446744073709551615.bson"));
            assert(odd.find(Document::object()).size() == 1);
            assert(odd.delete_many(Document::object()) == 1);
            assert(std::filesystem::exists(directory / "18446744073709551615.bson"));
        }

        DirectoryDatabase database(root);
        assert(database.collection("fs.files") == database.collection("fs.files"));

        test::cleanup_path(root);
    }

} // namespace

namespace gridstore::test
{

    void run_store_component_tests()
    {
        test_filter_matching();
        test_memory_collection();
        test_directory_collection();
    }

} // namespace gridstore::test
