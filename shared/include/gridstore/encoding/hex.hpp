#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gridstore::encoding
{

    std::string encode_hex(std::span<const std::byte> data);

    // Lowercase or uppercase digits; std::nullopt on odd length or a non-hex character.
    std::optional<std::vector<std::byte>> decode_hex(std::string_view input);

} // namespace gridstore::encoding
