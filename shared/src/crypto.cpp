#include "tusk/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace tusk::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        const unsigned char *as_uchar(std::span<const std::byte> data)
        {
            return reinterpret_cast<const unsigned char *>(data.data());
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string random_id()
    {
        ensure_initialized_once();
        std::array<std::byte, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

    std::vector<std::byte> sha256(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<std::byte> out(crypto_hash_sha256_BYTES);
        if (crypto_hash_sha256(reinterpret_cast<unsigned char *>(out.data()), as_uchar(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return out;
    }

    std::vector<std::byte> sha512(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<std::byte> out(crypto_hash_sha512_BYTES);
        if (crypto_hash_sha512(reinterpret_cast<unsigned char *>(out.data()), as_uchar(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha512 failed");
        }
        return out;
    }

    bool is_supported_digest(std::string_view algorithm) noexcept
    {
        return algorithm == "sha256" || algorithm == "sha512";
    }

    std::optional<std::vector<std::byte>> digest(std::string_view algorithm, std::span<const std::byte> data)
    {
        if (algorithm == "sha256")
        {
            return sha256(data);
        }
        if (algorithm == "sha512")
        {
            return sha512(data);
        }
        return std::nullopt;
    }

    bool constant_time_equals(std::string_view lhs, std::string_view rhs)
    {
        ensure_initialized_once();
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        if (lhs.empty())
        {
            return true;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

    std::string to_hex(std::span<const std::byte> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = static_cast<unsigned char>(data[i]);
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

} // namespace tusk::crypto
