/**
 * GridStore - Crypto helpers: content digests on OpenSSL EVP, randomness on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace gridstore::crypto
{

    inline constexpr std::string_view kMd5 = "MD5";

    void ensure_sodium_init();

    void random_bytes(std::span<std::byte> output);

    std::uint32_t random_uint32();

    /**
     * Incremental message digest.
     *
     * Construction throws GridError(DigestUnavailable) when the algorithm cannot be
     * fetched from the loaded providers. The digest can be finalized once; update()
     * or finish_hex() after that throws GridError(InternalError).
     */
    class Digest
    {
    public:
        explicit Digest(std::string_view algorithm = kMd5);
        ~Digest();

        Digest(Digest &&other) noexcept;
        Digest &operator=(Digest &&other) noexcept;
        Digest(const Digest &) = delete;
        Digest &operator=(const Digest &) = delete;

        void update(std::span<const std::byte> data);

        std::string finish_hex();

        const std::string &algorithm() const noexcept { return algorithm_; }

    private:
        struct Context;

        std::string algorithm_;
        std::unique_ptr<Context> context_;
    };

    std::string hash_bytes(std::span<const std::byte> data, std::string_view algorithm = kMd5);

    std::string hash_stream(std::istream &input, std::string_view algorithm = kMd5);

} // namespace gridstore::crypto
