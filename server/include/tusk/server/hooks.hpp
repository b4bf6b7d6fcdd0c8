#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "tusk/server/upload_engine.hpp"

namespace tusk::server
{

    // Strips a literal "Bearer " prefix; std::nullopt when the header carries another scheme.
    std::optional<std::string_view> bearer_token(std::string_view authorization);

    // Allows everything when `token` is unset; otherwise requires "Authorization: Bearer <token>".
    Authorizer make_bearer_token_authorizer(std::optional<std::string> token);

    // Copies a "Filename" request header into the "filename" metadata key unless the client sent one.
    MetadataHook make_filename_hook();

} // namespace tusk::server
