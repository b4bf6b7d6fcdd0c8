/**
 * tusk - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tusk::crypto
{

    void ensure_sodium_init();

    // 32 lowercase hex characters from 16 random bytes.
    std::string random_id();

    std::vector<std::byte> sha256(std::span<const std::byte> data);

    std::vector<std::byte> sha512(std::span<const std::byte> data);

    bool is_supported_digest(std::string_view algorithm) noexcept;

    // Digest for a tus checksum algorithm name; std::nullopt for unsupported algorithms.
    std::optional<std::vector<std::byte>> digest(std::string_view algorithm, std::span<const std::byte> data);

    bool constant_time_equals(std::string_view lhs, std::string_view rhs);

    std::string to_hex(std::span<const std::byte> data);

} // namespace tusk::crypto
