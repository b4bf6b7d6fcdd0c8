#include "tusk/tus.hpp"

#include <charconv>
#include <ctime>

#include "tusk/encoding/base64.hpp"

namespace tusk::tus
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && value.front() == ' ')
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && value.back() == ' ')
            {
                value.remove_suffix(1);
            }
            return value;
        }

        bool valid_key(std::string_view key)
        {
            if (key.empty())
            {
                return false;
            }
            for (const char c : key)
            {
                if (c == ' ' || c == ',' || static_cast<unsigned char>(c) < 0x21 || static_cast<unsigned char>(c) > 0x7E)
                {
                    return false;
                }
            }
            return true;
        }

        template <typename T>
        std::optional<T> parse_integer(std::string_view value)
        {
            if (value.empty())
            {
                return std::nullopt;
            }
            T result{};
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc{} || ptr != value.data() + value.size())
            {
                return std::nullopt;
            }
            return result;
        }

    } // namespace

    std::optional<Metadata> parse_metadata(std::string_view header)
    {
        Metadata metadata;
        header = trim(header);
        if (header.empty())
        {
            return metadata;
        }

        while (true)
        {
            const auto comma = header.find(',');
            const auto pair = trim(header.substr(0, comma));
            const auto space = pair.find(' ');
            const auto key = pair.substr(0, space);
            if (!valid_key(key) || metadata.contains(std::string(key)))
            {
                return std::nullopt;
            }

            std::string value;
            if (space != std::string_view::npos)
            {
                auto decoded = encoding::decode_base64_text(trim(pair.substr(space + 1)));
                if (!decoded)
                {
                    return std::nullopt;
                }
                value = std::move(*decoded);
            }
            metadata.emplace(std::string(key), std::move(value));

            if (comma == std::string_view::npos)
            {
                break;
            }
            header.remove_prefix(comma + 1);
        }
        return metadata;
    }

    std::string encode_metadata(const Metadata &metadata)
    {
        std::string out;
        for (const auto &[key, value] : metadata)
        {
            if (!out.empty())
            {
                out += ',';
            }
            out += key;
            if (!value.empty())
            {
                out += ' ';
                out += encoding::encode_base64(std::string_view(value));
            }
        }
        return out;
    }

    std::optional<std::uint64_t> parse_offset(std::string_view value)
    {
        return parse_integer<std::uint64_t>(trim(value));
    }

    std::optional<std::int64_t> parse_length(std::string_view value)
    {
        return parse_integer<std::int64_t>(trim(value));
    }

    std::optional<Checksum> parse_checksum(std::string_view value)
    {
        value = trim(value);
        const auto space = value.find(' ');
        if (space == std::string_view::npos || space == 0)
        {
            return std::nullopt;
        }
        auto digest = encoding::decode_base64(trim(value.substr(space + 1)));
        if (!digest || digest->empty())
        {
            return std::nullopt;
        }
        return Checksum{
            .algorithm = std::string(value.substr(0, space)),
            .digest = std::move(*digest),
        };
    }

    std::string format_checksum(const Checksum &checksum)
    {
        return checksum.algorithm + " " + encoding::encode_base64(checksum.digest);
    }

    std::string format_http_date(std::chrono::system_clock::time_point time)
    {
        const std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
#ifdef _WIN32
        gmtime_s(&utc, &raw);
#else
        gmtime_r(&raw, &utc);
#endif
        char buffer[64];
        const auto written = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &utc);
        return std::string(buffer, written);
    }

} // namespace tusk::tus
