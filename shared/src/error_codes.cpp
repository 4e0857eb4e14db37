#include "sliceload/error_codes.hpp"

#include <array>

namespace sliceload
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int http_status;
        };

        constexpr std::array<ErrorCodeDescription, 8> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidCommand, "invalid_command", 400},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Conflict, "conflict", 422},
            {ErrorCode::Unsupported, "unsupported", 501},
            {ErrorCode::Timeout, "timeout", 504},
            {ErrorCode::InternalError, "internal_error", 500},
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

    int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.http_status;
            }
        }
        return 500;
    }

} // namespace sliceload
