/**
 * tusk - tus 1.0.0 protocol constants and header codecs.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tusk::tus
{

    inline constexpr std::string_view kVersion = "1.0.0";
    inline constexpr std::string_view kSupportedVersions = "1.0.0";
    inline constexpr std::string_view kExtensions =
        "creation,creation-with-upload,creation-defer-length,termination,checksum,expiration";
    inline constexpr std::string_view kChecksumAlgorithms = "sha256,sha512";
    inline constexpr std::string_view kOffsetContentType = "application/offset+octet-stream";

    namespace header
    {
        inline constexpr std::string_view kResumable = "Tus-Resumable";
        inline constexpr std::string_view kVersion = "Tus-Version";
        inline constexpr std::string_view kExtension = "Tus-Extension";
        inline constexpr std::string_view kMaxSize = "Tus-Max-Size";
        inline constexpr std::string_view kChecksumAlgorithm = "Tus-Checksum-Algorithm";
        inline constexpr std::string_view kUploadOffset = "Upload-Offset";
        inline constexpr std::string_view kUploadLength = "Upload-Length";
        inline constexpr std::string_view kUploadDeferLength = "Upload-Defer-Length";
        inline constexpr std::string_view kUploadMetadata = "Upload-Metadata";
        inline constexpr std::string_view kUploadChecksum = "Upload-Checksum";
        inline constexpr std::string_view kUploadExpires = "Upload-Expires";
        inline constexpr std::string_view kMethodOverride = "X-HTTP-Method-Override";
    } // namespace header

    using Metadata = std::map<std::string, std::string>;

    struct Checksum
    {
        std::string algorithm;
        std::vector<std::byte> digest;
    };

    // "key base64,key2 base64"; a key without value maps to "". std::nullopt when malformed.
    std::optional<Metadata> parse_metadata(std::string_view header);

    std::string encode_metadata(const Metadata &metadata);

    // Non-negative decimal only.
    std::optional<std::uint64_t> parse_offset(std::string_view value);

    // Signed so that negative declarations can be told apart from garbage.
    std::optional<std::int64_t> parse_length(std::string_view value);

    // "<algorithm> <base64 digest>".
    std::optional<Checksum> parse_checksum(std::string_view value);

    std::string format_checksum(const Checksum &checksum);

    // RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
    std::string format_http_date(std::chrono::system_clock::time_point time);

} // namespace tusk::tus
