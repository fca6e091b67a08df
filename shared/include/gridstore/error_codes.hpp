/**
 * GridStore - Error codes and the exception types that carry them.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gridstore
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        StreamClosed = 2,
        DigestUnavailable = 3,
        DuplicateKey = 4,
        StoreFailure = 5,
        InternalError = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class GridError : public std::runtime_error
    {
    public:
        GridError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Raised by collection implementations. Never caught by the upload path.
    class StoreError : public GridError
    {
    public:
        StoreError(ErrorCode code, std::string message);
    };

} // namespace gridstore
