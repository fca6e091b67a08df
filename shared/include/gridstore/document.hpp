#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace gridstore
{

    using Document = nlohmann::json;

    // Wraps raw bytes as a binary document value (BSON binary, generic subtype).
    Document make_binary(std::span<const std::byte> data);

    // Returns the bytes of a binary value; throws GridError(InvalidArgument) for other types.
    std::vector<std::byte> binary_bytes(const Document &value);

} // namespace gridstore
