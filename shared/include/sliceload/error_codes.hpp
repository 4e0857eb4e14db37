/**
 * SliceLoad - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace sliceload
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Conflict = 4,
        Unsupported = 5,
        Timeout = 6,
        InternalError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // HTTP-equivalent status class for a failure code (400, 404, 422, 500...).
    int http_status(ErrorCode code) noexcept;

} // namespace sliceload
