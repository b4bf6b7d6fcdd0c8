#include "tusk/server/hooks.hpp"

#include "tusk/crypto.hpp"

namespace tusk::server
{

    namespace
    {
        constexpr std::string_view kBearerPrefix = "Bearer ";
    } // namespace

    std::optional<std::string_view> bearer_token(std::string_view authorization)
    {
        if (!authorization.starts_with(kBearerPrefix))
        {
            return std::nullopt;
        }
        authorization.remove_prefix(kBearerPrefix.size());
        return authorization;
    }

    Authorizer make_bearer_token_authorizer(std::optional<std::string> token)
    {
        if (!token)
        {
            return [](const RequestContext &)
            { return AuthDecision::allow(); };
        }
        return [expected = std::move(*token)](const RequestContext &context)
        {
            const auto header = http::find_header(context.headers, "Authorization");
            if (!header)
            {
                return AuthDecision::deny("Missing Authorization header");
            }
            const auto presented = bearer_token(*header);
            if (!presented || !crypto::constant_time_equals(*presented, expected))
            {
                return AuthDecision::deny("Access denied");
            }
            return AuthDecision::allow();
        };
    }

    MetadataHook make_filename_hook()
    {
        return [](const CreateRequest &request, const RequestContext &context)
        {
            auto metadata = request.metadata;
            if (!metadata.contains("filename"))
            {
                if (const auto filename = http::find_header(context.headers, "Filename"); filename && !filename->empty())
                {
                    metadata.emplace("filename", std::string(*filename));
                }
            }
            return metadata;
        };
    }

} // namespace tusk::server
