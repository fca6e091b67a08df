#include "gridstore/object_id.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>

#include "gridstore/crypto.hpp"
#include "gridstore/encoding/hex.hpp"
#include "gridstore/error_codes.hpp"

namespace gridstore
{

    namespace
    {

        constexpr std::size_t kProcessBytes = 5;

        const std::array<std::byte, kProcessBytes> &process_unique()
        {
            static const auto value = []()
            {
                std::array<std::byte, kProcessBytes> bytes{};
                crypto::random_bytes(bytes);
                return bytes;
            }();
            return value;
        }

        std::atomic<std::uint32_t> &counter()
        {
            static std::atomic<std::uint32_t> value{crypto::random_uint32() & 0x00FFFFFFu};
            return value;
        }

    } // namespace

    ObjectId ObjectId::generate()
    {
        const auto seconds = static_cast<std::uint32_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
        const auto sequence = counter().fetch_add(1, std::memory_order_relaxed) & 0x00FFFFFFu;

        std::array<std::byte, kSize> bytes{};
        bytes[0] = static_cast<std::byte>((seconds >> 24) & 0xFFu);
        bytes[1] = static_cast<std::byte>((seconds >> 16) & 0xFFu);
        bytes[2] = static_cast<std::byte>((seconds >> 8) & 0xFFu);
        bytes[3] = static_cast<std::byte>(seconds & 0xFFu);
        const auto &unique = process_unique();
        for (std::size_t i = 0; i < kProcessBytes; ++i)
        {
            bytes[4 + i] = unique[i];
        }
        bytes[9] = static_cast<std::byte>((sequence >> 16) & 0xFFu);
        bytes[10] = static_cast<std::byte>((sequence >> 8) & 0xFFu);
        bytes[11] = static_cast<std::byte>(sequence & 0xFFu);
        return ObjectId(bytes);
    }

    ObjectId ObjectId::from_hex(std::string_view hex)
    {
        const auto decoded = encoding::decode_hex(hex);
        if (!decoded || decoded->size() != kSize)
        {
            throw GridError(ErrorCode::InvalidArgument, "Invalid ObjectId: " + std::string(hex));
        }
        std::array<std::byte, kSize> bytes{};
        std::copy(decoded->begin(), decoded->end(), bytes.begin());
        return ObjectId(bytes);
    }

    std::string ObjectId::to_hex() const
    {
        return encoding::encode_hex(bytes_);
    }

    std::uint32_t ObjectId::timestamp() const noexcept
    {
        return (static_cast<std::uint32_t>(bytes_[0]) << 24) | (static_cast<std::uint32_t>(bytes_[1]) << 16) |
               (static_cast<std::uint32_t>(bytes_[2]) << 8) | static_cast<std::uint32_t>(bytes_[3]);
    }

} // namespace gridstore
