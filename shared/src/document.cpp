#include "gridstore/document.hpp"

#include <cstdint>

#include "gridstore/error_codes.hpp"

namespace gridstore
{

    Document make_binary(std::span<const std::byte> data)
    {
        const auto *begin = reinterpret_cast<const std::uint8_t *>(data.data());
        return Document::binary(std::vector<std::uint8_t>(begin, begin + data.size()));
    }

    std::vector<std::byte> binary_bytes(const Document &value)
    {
        if (!value.is_binary())
        {
            throw GridError(ErrorCode::InvalidArgument, "Document value is not binary");
        }
        const auto &binary = value.get_binary();
        std::vector<std::byte> bytes(binary.size());
        for (std::size_t i = 0; i < binary.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(binary[i]);
        }
        return bytes;
    }

} // namespace gridstore
