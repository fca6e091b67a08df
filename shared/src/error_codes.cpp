#include "gridstore/error_codes.hpp"

#include <array>

namespace gridstore
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::StreamClosed, "stream_closed"},
            {ErrorCode::DigestUnavailable, "digest_unavailable"},
            {ErrorCode::DuplicateKey, "duplicate_key"},
            {ErrorCode::StoreFailure, "store_failure"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    GridError::GridError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    StoreError::StoreError(ErrorCode code, std::string message)
        : GridError(code, std::move(message)) {}

} // namespace gridstore
