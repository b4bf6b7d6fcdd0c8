/**
 * tusk - Shared error codes used by the upload engine, the HTTP layer and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace tusk
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        OffsetMismatch = 2,
        LengthExceeded = 3,
        InvalidLength = 4,
        AlreadySet = 5,
        Unauthorized = 6,
        StorageUnavailable = 7,
        Terminated = 8,
        Busy = 9,
        InvalidOffset = 10,
        VersionMismatch = 11,
        UnsupportedMediaType = 12,
        ChecksumMismatch = 13,
        UnsupportedChecksum = 14,
        InvalidRange = 15,
        InvalidRequest = 16,
        MethodNotAllowed = 17,
        InternalError = 18
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // HTTP status used by the tus surface for this code.
    int http_status(ErrorCode code) noexcept;

    // Best-effort reverse mapping used by the client; unknown statuses map to InternalError.
    ErrorCode error_code_from_http_status(int status) noexcept;

    // True when repeating the request (possibly after a HEAD) may succeed.
    bool is_transient(ErrorCode code) noexcept;

} // namespace tusk
