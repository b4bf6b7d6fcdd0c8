#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tusk/error_codes.hpp"
#include "tusk/http.hpp"
#include "tusk/server/upload_engine.hpp"

namespace tusk::server
{

    struct HandlerOptions
    {
        std::string base_path{"/files/"};
        std::uint64_t max_body{16ULL * 1024 * 1024};
    };

    // Maps tus HTTP requests onto UploadEngine operations.
    class TusHandler
    {
    public:
        TusHandler(UploadEngine &engine, HandlerOptions options);

        http::Response handle(const http::Request &request, const std::string &remote);

        http::Response error_response(tusk::ErrorCode code, std::string_view message) const;

        const HandlerOptions &options() const noexcept { return options_; }

    private:
        http::Response handle_options() const;
        http::Response handle_create(const http::Request &request, const RequestContext &context);
        http::Response handle_head(const std::string &id, const RequestContext &context) const;
        http::Response handle_patch(const std::string &id, const http::Request &request, const RequestContext &context);
        http::Response handle_delete(const std::string &id, const RequestContext &context);
        http::Response handle_get(const std::string &id, const http::Request &request, const RequestContext &context) const;

        http::Response make_response(int status) const;
        void add_expiry(http::Response &response, const UploadStatus &status) const;

        UploadEngine &engine_;
        HandlerOptions options_;
    };

} // namespace tusk::server
