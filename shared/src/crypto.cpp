#include "gridstore/crypto.hpp"

#include <mutex>
#include <vector>

#include <openssl/evp.h>
#include <sodium.h>

#include "gridstore/encoding/hex.hpp"
#include "gridstore/error_codes.hpp"

namespace gridstore::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw GridError(ErrorCode::InternalError, "libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        struct MdDeleter
        {
            void operator()(EVP_MD *md) const noexcept { EVP_MD_free(md); }
        };

        struct MdContextDeleter
        {
            void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
        };

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    void random_bytes(std::span<std::byte> output)
    {
        ensure_initialized_once();
        randombytes_buf(output.data(), output.size());
    }

    std::uint32_t random_uint32()
    {
        ensure_initialized_once();
        return randombytes_random();
    }

    struct Digest::Context
    {
        std::unique_ptr<EVP_MD, MdDeleter> md;
        std::unique_ptr<EVP_MD_CTX, MdContextDeleter> ctx;
        bool finished{false};
    };

    Digest::Digest(std::string_view algorithm)
        : algorithm_(algorithm), context_(std::make_unique<Context>())
    {
        context_->md.reset(EVP_MD_fetch(nullptr, algorithm_.c_str(), nullptr));
        if (!context_->md)
        {
            throw GridError(ErrorCode::DigestUnavailable,
                            "No " + algorithm_ + " message digest available, cannot upload file");
        }
        context_->ctx.reset(EVP_MD_CTX_new());
        if (!context_->ctx || EVP_DigestInit_ex(context_->ctx.get(), context_->md.get(), nullptr) != 1)
        {
            throw GridError(ErrorCode::DigestUnavailable, "Failed to initialize " + algorithm_ + " digest");
        }
    }

    Digest::~Digest() = default;

    Digest::Digest(Digest &&other) noexcept = default;

    Digest &Digest::operator=(Digest &&other) noexcept = default;

    void Digest::update(std::span<const std::byte> data)
    {
        if (!context_ || context_->finished)
        {
            throw GridError(ErrorCode::InternalError, "Digest already finalized");
        }
        if (data.empty())
        {
            return;
        }
        if (EVP_DigestUpdate(context_->ctx.get(), data.data(), data.size()) != 1)
        {
            throw GridError(ErrorCode::InternalError, "EVP_DigestUpdate failed");
        }
    }

    std::string Digest::finish_hex()
    {
        if (!context_ || context_->finished)
        {
            throw GridError(ErrorCode::InternalError, "Digest already finalized");
        }
        std::vector<std::byte> digest(EVP_MAX_MD_SIZE);
        unsigned int digest_length = 0;
        if (EVP_DigestFinal_ex(context_->ctx.get(), reinterpret_cast<unsigned char *>(digest.data()),
                               &digest_length) != 1)
        {
            throw GridError(ErrorCode::InternalError, "EVP_DigestFinal_ex failed");
        }
        context_->finished = true;
        digest.resize(digest_length);
        return encoding::encode_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data, std::string_view algorithm)
    {
        Digest digest(algorithm);
        digest.update(data);
        return digest.finish_hex();
    }

    std::string hash_stream(std::istream &input, std::string_view algorithm)
    {
        Digest digest(algorithm);
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                digest.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return digest.finish_hex();
    }

} // namespace gridstore::crypto
