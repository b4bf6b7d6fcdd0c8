#include "tusk/server/tus_handler.hpp"

#include <algorithm>
#include <charconv>

#include <spdlog/spdlog.h>

#include "tusk/server/upload_error.hpp"
#include "tusk/tus.hpp"

namespace tusk::server
{

    namespace
    {

        struct ByteRange
        {
            std::uint64_t start{};
            std::uint64_t end{}; // exclusive
        };

        std::string_view strip_query(std::string_view target)
        {
            const auto pos = target.find('?');
            return pos == std::string_view::npos ? target : target.substr(0, pos);
        }

        bool is_offset_content_type(std::optional<std::string_view> value)
        {
            if (!value)
            {
                return false;
            }
            auto media_type = value->substr(0, value->find(';'));
            while (!media_type.empty() && media_type.back() == ' ')
            {
                media_type.remove_suffix(1);
            }
            return media_type == tus::kOffsetContentType;
        }

        std::optional<std::uint64_t> parse_number(std::string_view text)
        {
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        // "bytes=a-b" or "bytes=a-" against `available` bytes.
        ByteRange parse_range(std::string_view header, std::uint64_t available)
        {
            constexpr std::string_view kUnit = "bytes=";
            if (!header.starts_with(kUnit))
            {
                throw UploadError(ErrorCode::InvalidRange, "Only byte ranges are supported");
            }
            header.remove_prefix(kUnit.size());
            const auto dash = header.find('-');
            if (dash == std::string_view::npos)
            {
                throw UploadError(ErrorCode::InvalidRange, "Malformed range");
            }
            const auto start = parse_number(header.substr(0, dash));
            const auto last_text = header.substr(dash + 1);
            if (!start || *start >= available)
            {
                throw UploadError(ErrorCode::InvalidRange, "Range start outside received bytes");
            }
            std::uint64_t end = available;
            if (!last_text.empty())
            {
                const auto last = parse_number(last_text);
                if (!last || *last < *start)
                {
                    throw UploadError(ErrorCode::InvalidRange, "Malformed range end");
                }
                end = *last >= available - 1 ? available : *last + 1;
            }
            return ByteRange{.start = *start, .end = end};
        }

        std::string quoted_filename(std::string_view name)
        {
            std::string out;
            out.reserve(name.size());
            for (const char c : name)
            {
                if (c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20)
                {
                    out.push_back('_');
                }
                else
                {
                    out.push_back(c);
                }
            }
            return out;
        }

    } // namespace

    TusHandler::TusHandler(UploadEngine &engine, HandlerOptions options)
        : engine_(engine), options_(std::move(options))
    {
        if (options_.base_path.empty() || options_.base_path.front() != '/')
        {
            options_.base_path.insert(options_.base_path.begin(), '/');
        }
        if (options_.base_path.back() != '/')
        {
            options_.base_path.push_back('/');
        }
    }

    http::Response TusHandler::handle(const http::Request &request, const std::string &remote)
    {
        RequestContext context{
            .method = std::string(http::method_of(request)),
            .target = std::string(http::target_of(request)),
            .headers = static_cast<const http::Headers &>(request),
            .remote = remote,
        };
        if (const auto override_method = http::find_header(request, tus::header::kMethodOverride))
        {
            context.method = std::string(*override_method);
        }

        const auto path = strip_query(http::target_of(request));
        const std::string_view base = options_.base_path;
        const auto collection = std::string_view(base).substr(0, base.size() - 1);
        const bool is_collection = path == base || path == collection;
        std::optional<std::string> id;
        if (!is_collection)
        {
            if (!path.starts_with(base) || path.size() == base.size() ||
                path.find('/', base.size()) != std::string_view::npos)
            {
                return error_response(ErrorCode::NotFound, "Unknown resource");
            }
            id = std::string(path.substr(base.size()));
        }

        spdlog::debug("{} {} {}", remote, context.method, http::target_of(request));

        try
        {
            if (context.method == "OPTIONS")
            {
                return handle_options();
            }
            if (context.method == "GET" && id)
            {
                return handle_get(*id, request, context);
            }

            const auto version = http::find_header(request, tus::header::kResumable);
            if (!version || *version != tus::kVersion)
            {
                auto response = error_response(ErrorCode::VersionMismatch, "Unsupported tus version");
                http::set_header(response, tus::header::kVersion, tus::kSupportedVersions);
                return response;
            }

            if (is_collection)
            {
                if (context.method == "POST")
                {
                    return handle_create(request, context);
                }
            }
            else if (context.method == "HEAD")
            {
                return handle_head(*id, context);
            }
            else if (context.method == "PATCH")
            {
                return handle_patch(*id, request, context);
            }
            else if (context.method == "DELETE")
            {
                return handle_delete(*id, context);
            }
            return error_response(ErrorCode::MethodNotAllowed, "Method not allowed");
        }
        catch (const UploadError &ex)
        {
            if (http_status(ex.code()) >= 500)
            {
                spdlog::error("{} {} {} failed: {}", remote, context.method, http::target_of(request), ex.what());
            }
            else
            {
                spdlog::debug("{} {} {} rejected ({}): {}", remote, context.method, http::target_of(request),
                              tusk::to_string(ex.code()), ex.what());
            }
            return error_response(ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} {} failed: {}", remote, context.method, http::target_of(request), ex.what());
            return error_response(ErrorCode::InternalError, "Internal server error");
        }
    }

    http::Response TusHandler::error_response(tusk::ErrorCode code, std::string_view message) const
    {
        auto response = make_response(http_status(code));
        http::set_header(response, "Content-Type", "text/plain; charset=utf-8");
        response.body() = http::to_body(std::string(message) + "\n");
        return response;
    }

    http::Response TusHandler::handle_options() const
    {
        auto response = make_response(204);
        http::set_header(response, tus::header::kVersion, tus::kSupportedVersions);
        http::set_header(response, tus::header::kExtension, tus::kExtensions);
        http::set_header(response, tus::header::kChecksumAlgorithm, tus::kChecksumAlgorithms);
        if (const auto &max_size = engine_.options().max_size)
        {
            http::set_header(response, tus::header::kMaxSize, std::to_string(*max_size));
        }
        return response;
    }

    http::Response TusHandler::handle_create(const http::Request &request, const RequestContext &context)
    {
        CreateRequest create;
        if (const auto length = http::find_header(request, tus::header::kUploadLength))
        {
            create.length = tus::parse_length(*length);
            if (!create.length)
            {
                throw UploadError(ErrorCode::InvalidLength, "Malformed Upload-Length");
            }
        }
        if (const auto defer = http::find_header(request, tus::header::kUploadDeferLength))
        {
            if (*defer != "1")
            {
                throw UploadError(ErrorCode::InvalidLength, "Upload-Defer-Length must be 1");
            }
            create.defer_length = true;
        }
        if (const auto metadata = http::find_header(request, tus::header::kUploadMetadata))
        {
            auto parsed = tus::parse_metadata(*metadata);
            if (!parsed)
            {
                throw UploadError(ErrorCode::InvalidRequest, "Malformed Upload-Metadata");
            }
            create.metadata = std::move(*parsed);
        }

        std::optional<tus::Checksum> checksum;
        if (!request.body().empty())
        {
            if (!is_offset_content_type(http::find_header(request, "Content-Type")))
            {
                throw UploadError(ErrorCode::UnsupportedMediaType, "Initial data requires " +
                                                                       std::string(tus::kOffsetContentType));
            }
            if (const auto header = http::find_header(request, tus::header::kUploadChecksum))
            {
                checksum = tus::parse_checksum(*header);
                if (!checksum)
                {
                    throw UploadError(ErrorCode::InvalidRequest, "Malformed Upload-Checksum");
                }
            }
        }

        const auto status = engine_.create(context, create, request.body(), checksum);
        auto response = make_response(201);
        http::set_header(response, "Location", options_.base_path + status.info.id);
        http::set_header(response, tus::header::kUploadOffset, std::to_string(status.info.offset));
        add_expiry(response, status);
        return response;
    }

    http::Response TusHandler::handle_head(const std::string &id, const RequestContext &context) const
    {
        const auto status = engine_.head(context, id);
        auto response = make_response(200);
        http::set_header(response, "Cache-Control", "no-store");
        http::set_header(response, tus::header::kUploadOffset, std::to_string(status.info.offset));
        if (status.info.length)
        {
            http::set_header(response, tus::header::kUploadLength, std::to_string(*status.info.length));
        }
        else
        {
            http::set_header(response, tus::header::kUploadDeferLength, "1");
        }
        if (!status.info.metadata.empty())
        {
            http::set_header(response, tus::header::kUploadMetadata, tus::encode_metadata(status.info.metadata));
        }
        add_expiry(response, status);
        return response;
    }

    http::Response TusHandler::handle_patch(const std::string &id, const http::Request &request,
                                            const RequestContext &context)
    {
        if (!is_offset_content_type(http::find_header(request, "Content-Type")))
        {
            throw UploadError(ErrorCode::UnsupportedMediaType, "PATCH requires " + std::string(tus::kOffsetContentType));
        }
        const auto offset_header = http::find_header(request, tus::header::kUploadOffset);
        if (!offset_header)
        {
            throw UploadError(ErrorCode::InvalidRequest, "Missing Upload-Offset");
        }
        const auto offset = tus::parse_offset(*offset_header);
        if (!offset)
        {
            throw UploadError(ErrorCode::InvalidRequest, "Malformed Upload-Offset");
        }

        AppendRequest append{
            .id = id,
            .expected_offset = *offset,
            .payload = request.body(),
            .checksum = std::nullopt,
            .declare_length = std::nullopt,
        };
        if (const auto length = http::find_header(request, tus::header::kUploadLength))
        {
            append.declare_length = tus::parse_length(*length);
            if (!append.declare_length)
            {
                throw UploadError(ErrorCode::InvalidLength, "Malformed Upload-Length");
            }
        }
        if (const auto header = http::find_header(request, tus::header::kUploadChecksum))
        {
            append.checksum = tus::parse_checksum(*header);
            if (!append.checksum)
            {
                throw UploadError(ErrorCode::InvalidRequest, "Malformed Upload-Checksum");
            }
        }

        const auto status = engine_.append(context, append);
        auto response = make_response(204);
        http::set_header(response, tus::header::kUploadOffset, std::to_string(status.info.offset));
        add_expiry(response, status);
        return response;
    }

    http::Response TusHandler::handle_delete(const std::string &id, const RequestContext &context)
    {
        engine_.terminate(context, id);
        return make_response(204);
    }

    http::Response TusHandler::handle_get(const std::string &id, const http::Request &request,
                                          const RequestContext &context) const
    {
        const auto status = engine_.head(context, id);
        const auto available = status.info.offset;

        ByteRange range{.start = 0, .end = available};
        const auto range_header = http::find_header(request, "Range");
        if (range_header)
        {
            range = parse_range(*range_header, available);
        }
        if (range.end - range.start > options_.max_body)
        {
            throw UploadError(ErrorCode::InvalidRange, "Requested range exceeds the response size limit");
        }

        auto reader = engine_.read(context, id, range.start, range.end);
        auto response = make_response(range_header ? 206 : 200);
        response.body() = read_all(*reader);
        http::set_header(response, "Content-Type", "application/octet-stream");
        http::set_header(response, "Accept-Ranges", "bytes");
        if (range_header)
        {
            http::set_header(response, "Content-Range",
                             "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end - 1) + "/" +
                                 std::to_string(available));
        }
        if (const auto filename = status.info.metadata.find("filename"); filename != status.info.metadata.end())
        {
            http::set_header(response, "Content-Disposition",
                             "attachment; filename=\"" + quoted_filename(filename->second) + "\"");
        }
        return response;
    }

    http::Response TusHandler::make_response(int status) const
    {
        http::Response response;
        http::set_status(response, status);
        http::set_header(response, tus::header::kResumable, tus::kVersion);
        return response;
    }

    void TusHandler::add_expiry(http::Response &response, const UploadStatus &status) const
    {
        if (status.expires_at)
        {
            http::set_header(response, tus::header::kUploadExpires, tus::format_http_date(*status.expires_at));
        }
    }

} // namespace tusk::server
