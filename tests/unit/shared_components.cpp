#undef NDEBUG
#include <cassert>
#include <array>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "gridstore/crypto.hpp"
#include "gridstore/document.hpp"
#include "gridstore/encoding/hex.hpp"
#include "gridstore/error_codes.hpp"
#include "gridstore/object_id.hpp"
#include "test_support.hpp"

using namespace gridstore;

namespace
{

    void test_error_codes()
    {
        assert(to_string(ErrorCode::StreamClosed) == "stream_closed");
        assert(to_string(ErrorCode::DigestUnavailable) == "digest_unavailable");
        assert(error_code_from_int(to_int(ErrorCode::DuplicateKey)) == ErrorCode::DuplicateKey);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        const StoreError error(ErrorCode::StoreFailure, "disk full");
        const GridError &base = error;
        assert(base.code() == ErrorCode::StoreFailure);
        assert(std::string(base.what()) == "disk full");
    }

    void test_hex()
    {
        const std::array<std::byte, 4> data = {std::byte{0xDE}, std::byte{0xAD}, std::byte{0x00}, std::byte{0x0F}};
        assert(encoding::encode_hex(data) == "dead000f");

        const auto decoded = encoding::decode_hex("DEad000f");
        assert(decoded && decoded->size() == 4);
        assert((*decoded)[0] == std::byte{0xDE} && (*decoded)[3] == std::byte{0x0F});

        assert(encoding::decode_hex("")->empty());
        assert(!encoding::decode_hex("abc"));
        assert(!encoding::decode_hex("zz"));
    }

    void test_digest()
    {
        assert(crypto::hash_bytes({}) == "d41d8cd98f00b204e9800998ecf8427e");
        assert(crypto::hash_bytes(test::bytes_of("abc")) == "900150983cd24fb0d6963f7d28e17f72");

        crypto::Digest incremental;
        incremental.update(test::bytes_of("a"));
        incremental.update(test::bytes_of(""));
        incremental.update(test::bytes_of("bc"));
        assert(incremental.finish_hex() == "900150983cd24fb0d6963f7d28e17f72");

        bool finalized_rejected = false;
        try
        {
            incremental.update(test::bytes_of("d"));
        }
        catch (const GridError &ex)
        {
            finalized_rejected = ex.code() == ErrorCode::InternalError;
        }
        assert(finalized_rejected);

        std::istringstream stream("abc");
        assert(crypto::hash_stream(stream) == "900150983cd24fb0d6963f7d28e17f72");

        bool unavailable = false;
        try
        {
            crypto::Digest digest("no-such-digest");
        }
        catch (const GridError &ex)
        {
            unavailable = ex.code() == ErrorCode::DigestUnavailable;
        }
        assert(unavailable);
    }

    void test_object_id()
    {
        crypto::ensure_sodium_init();
        crypto::ensure_sodium_init();
        const auto first = ObjectId::generate();
        const auto second = ObjectId::generate();
        assert(first != second);
        assert(first.to_hex().size() == 24);
        assert(ObjectId::from_hex(first.to_hex()) == first);
        // Same process, same random middle section.
        assert(first.to_hex().substr(8, 10) == second.to_hex().substr(8, 10));

        const auto fixed = ObjectId::from_hex("5f0c1a2b0102030405060708");
        assert(fixed.timestamp() == 0x5f0c1a2bu);

        std::set<std::string> seen;
        for (int i = 0; i < 1000; ++i)
        {
            seen.insert(ObjectId::generate().to_hex());
        }
        assert(seen.size() == 1000);

        bool rejected = false;
        try
        {
            (void)ObjectId::from_hex("not-an-id");
        }
        catch (const GridError &ex)
        {
            rejected = ex.code() == ErrorCode::InvalidArgument;
        }
        assert(rejected);
    }

    void test_binary_documents()
    {
        const auto payload = test::bytes_of("chunk");
        Document document = Document::object();
        document["data"] = make_binary(payload);
        assert(document["data"].is_binary());
        assert(binary_bytes(document["data"]) == payload);

        const auto restored = Document::from_bson(Document::to_bson(document));
        assert(binary_bytes(restored.at("data")) == payload);

        bool rejected = false;
        try
        {
            (void)binary_bytes(Document("text"));
        }
        catch (const GridError &ex)
        {
            rejected = ex.code() == ErrorCode::InvalidArgument;
        }
        assert(rejected);
    }

} // namespace

int main()
{
    spdlog::set_level(spdlog::level::err);
    try
    {
        test_error_codes();
        test_hex();
        test_digest();
        test_object_id();
        test_binary_documents();
        test::run_store_component_tests();
        test::run_upload_stream_tests();
        test::run_bucket_component_tests();
        test::run_put_config_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
