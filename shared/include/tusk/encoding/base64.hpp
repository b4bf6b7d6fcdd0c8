#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tusk::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    std::string encode_base64(std::string_view text);

    // std::nullopt when the input holds characters outside the base64 alphabet.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

    std::optional<std::string> decode_base64_text(std::string_view input);

} // namespace tusk::encoding
