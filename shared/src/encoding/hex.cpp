#include "gridstore/encoding/hex.hpp"

#include <array>
#include <cstdint>

namespace gridstore::encoding
{

    namespace
    {

        constexpr char kHexDigits[] = "0123456789abcdef";

        consteval auto make_decode_table()
        {
            std::array<int8_t, 256> table{};
            table.fill(-1);
            for (int i = 0; i < 10; ++i)
            {
                table[static_cast<unsigned char>('0' + i)] = static_cast<int8_t>(i);
            }
            for (int i = 0; i < 6; ++i)
            {
                table[static_cast<unsigned char>('a' + i)] = static_cast<int8_t>(10 + i);
                table[static_cast<unsigned char>('A' + i)] = static_cast<int8_t>(10 + i);
            }
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_hex(std::span<const std::byte> data)
    {
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = static_cast<std::uint8_t>(data[i]);
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::optional<std::vector<std::byte>> decode_hex(std::string_view input)
    {
        if (input.size() % 2 != 0)
        {
            return std::nullopt;
        }
        std::vector<std::byte> output;
        output.reserve(input.size() / 2);
        for (std::size_t i = 0; i < input.size(); i += 2)
        {
            const int high = kDecodeTable[static_cast<unsigned char>(input[i])];
            const int low = kDecodeTable[static_cast<unsigned char>(input[i + 1])];
            if (high < 0 || low < 0)
            {
                return std::nullopt;
            }
            output.push_back(static_cast<std::byte>((high << 4) | low));
        }
        return output;
    }

} // namespace gridstore::encoding
