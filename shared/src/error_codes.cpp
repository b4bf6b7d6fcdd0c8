#include "tusk/error_codes.hpp"

#include <array>

namespace tusk
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int status;
        };

        constexpr std::array<ErrorCodeDescription, 19> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::OffsetMismatch, "offset_mismatch", 409},
            {ErrorCode::LengthExceeded, "length_exceeded", 413},
            {ErrorCode::InvalidLength, "invalid_length", 400},
            {ErrorCode::AlreadySet, "already_set", 400},
            {ErrorCode::Unauthorized, "unauthorized", 401},
            {ErrorCode::StorageUnavailable, "storage_unavailable", 503},
            {ErrorCode::Terminated, "terminated", 410},
            {ErrorCode::Busy, "busy", 423},
            {ErrorCode::InvalidOffset, "invalid_offset", 409},
            {ErrorCode::VersionMismatch, "version_mismatch", 412},
            {ErrorCode::UnsupportedMediaType, "unsupported_media_type", 415},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", 460},
            {ErrorCode::UnsupportedChecksum, "unsupported_checksum", 400},
            {ErrorCode::InvalidRange, "invalid_range", 416},
            {ErrorCode::InvalidRequest, "invalid_request", 400},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
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
                return entry.status;
            }
        }
        return 500;
    }

    ErrorCode error_code_from_http_status(int status) noexcept
    {
        if (status >= 200 && status < 300)
        {
            return ErrorCode::Ok;
        }
        // 400 and 409 are shared by several codes; the first entry wins.
        for (const auto &entry : kDescriptions)
        {
            if (entry.status == status)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_transient(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::OffsetMismatch:
        case ErrorCode::StorageUnavailable:
        case ErrorCode::Busy:
            return true;
        default:
            return false;
        }
    }

} // namespace tusk
