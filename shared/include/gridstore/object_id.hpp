#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace gridstore
{

    /**
     * 12-byte document identifier: 4-byte big-endian creation time in seconds,
     * 5 random bytes fixed per process, 3-byte big-endian counter.
     */
    class ObjectId
    {
    public:
        static constexpr std::size_t kSize = 12;

        ObjectId() = default;
        explicit ObjectId(const std::array<std::byte, kSize> &bytes) : bytes_(bytes) {}

        static ObjectId generate();

        // Throws GridError(InvalidArgument) unless the input is 24 hex digits.
        static ObjectId from_hex(std::string_view hex);

        std::string to_hex() const;

        std::uint32_t timestamp() const noexcept;

        const std::array<std::byte, kSize> &bytes() const noexcept { return bytes_; }

        friend bool operator==(const ObjectId &, const ObjectId &) = default;
        friend std::strong_ordering operator<=>(const ObjectId &, const ObjectId &) = default;

    private:
        std::array<std::byte, kSize> bytes_{};
    };

} // namespace gridstore
