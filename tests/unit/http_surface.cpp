#include <cassert>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "tusk/crypto.hpp"
#include "tusk/http.hpp"
#include "tusk/server/config.hpp"
#include "tusk/server/file_storage.hpp"
#include "tusk/server/hooks.hpp"
#include "tusk/server/log_completion_sink.hpp"
#include "tusk/server/metadata_store.hpp"
#include "tusk/server/transfer_coordinator.hpp"
#include "tusk/server/tus_handler.hpp"
#include "tusk/server/upload_engine.hpp"
#include "tusk/tus.hpp"

using namespace tusk;
using namespace tusk::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    struct Fixture
    {
        Fixture(const std::string &name, EngineOptions options)
            : root((cleanup_path(std::filesystem::temp_directory_path() / name),
                    std::filesystem::temp_directory_path() / name)),
              storage(root / "uploads"),
              metadata(root / "records"),
              coordinator(std::chrono::milliseconds(500)),
              sink(std::make_shared<LogCompletionSink>()),
              engine(storage, metadata, coordinator, std::move(options)),
              handler(engine, HandlerOptions{.base_path = "files", .max_body = 1024})
        {
            coordinator.subscribe(sink);
        }

        ~Fixture() { cleanup_path(root); }

        std::filesystem::path root;
        FileStorage storage;
        MetadataStore metadata;
        TransferCoordinator coordinator;
        std::shared_ptr<LogCompletionSink> sink;
        UploadEngine engine;
        TusHandler handler;
    };

    http::Request tus_request(std::string method, std::string target)
    {
        auto request = http::make_request(method, target);
        request.set("Tus-Resumable", "1.0.0");
        return request;
    }

    http::Request patch_request(const std::string &location, std::uint64_t offset, std::string_view payload)
    {
        auto request = tus_request("PATCH", location);
        request.set("Content-Type", "application/offset+octet-stream");
        request.set("Upload-Offset", std::to_string(offset));
        request.body() = http::to_body(payload);
        return request;
    }

    std::string header(const http::Response &response, std::string_view name)
    {
        const auto value = http::find_header(response, name);
        return value ? std::string(*value) : std::string();
    }

    void test_options_advertises_capabilities()
    {
        EngineOptions options;
        options.max_size = 4096;
        Fixture f("tusk_http_options", std::move(options));

        const auto request = http::make_request("OPTIONS", "/files/");
        const auto response = f.handler.handle(request, "peer");
        assert(http::status_of(response) == 204);
        assert(header(response, "Tus-Version") == "1.0.0");
        assert(header(response, "Tus-Extension").find("creation-defer-length") != std::string::npos);
        assert(header(response, "Tus-Extension").find("termination") != std::string::npos);
        assert(header(response, "Tus-Checksum-Algorithm") == "sha256,sha512");
        assert(header(response, "Tus-Max-Size") == "4096");
        assert(header(response, "Tus-Resumable") == "1.0.0");
    }

    void test_version_is_required()
    {
        Fixture f("tusk_http_version", {});
        auto request = tus_request("POST", "/files/");
        request.erase("Tus-Resumable");
        request.set("Upload-Length", "3");
        auto response = f.handler.handle(request, "peer");
        assert(http::status_of(response) == 412);
        assert(header(response, "Tus-Version") == "1.0.0");

        request.set("Tus-Resumable", "0.2.2");
        response = f.handler.handle(request, "peer");
        assert(http::status_of(response) == 412);
        assert(f.metadata.list().empty());
    }

    void test_upload_through_handler()
    {
        EngineOptions options;
        options.pre_create = make_filename_hook();
        Fixture f("tusk_http_upload", std::move(options));

        auto create = tus_request("POST", "/files/");
        create.set("Upload-Length", "24");
        create.set("Upload-Metadata", "kind " + std::string("dGV4dA=="));
        create.set("Filename", "report.txt");
        const auto created = f.handler.handle(create, "peer");
        assert(http::status_of(created) == 201);
        const auto location = header(created, "Location");
        assert(location.starts_with("/files/"));
        assert(header(created, "Upload-Offset") == "0");
        assert(!header(created, "Upload-Expires").empty());

        const auto head = f.handler.handle(tus_request("HEAD", location), "peer");
        assert(http::status_of(head) == 200);
        assert(header(head, "Upload-Offset") == "0");
        assert(header(head, "Upload-Length") == "24");
        assert(header(head, "Cache-Control") == "no-store");
        const auto metadata = tus::parse_metadata(header(head, "Upload-Metadata"));
        assert(metadata && metadata->at("filename") == "report.txt");
        assert(metadata->at("kind") == "text");

        auto wrong_type = patch_request(location, 0, "0123456789");
        wrong_type.set("Content-Type", "text/plain");
        assert(http::status_of(f.handler.handle(wrong_type, "peer")) == 415);

        auto no_offset = patch_request(location, 0, "0123456789");
        no_offset.erase("Upload-Offset");
        assert(http::status_of(f.handler.handle(no_offset, "peer")) == 400);

        auto first = f.handler.handle(patch_request(location, 0, "0123456789"), "peer");
        assert(http::status_of(first) == 204);
        assert(header(first, "Upload-Offset") == "10");

        auto stale = f.handler.handle(patch_request(location, 5, "56789"), "peer");
        assert(http::status_of(stale) == 409);

        auto corrupt = patch_request(location, 10, "abcdefghijklmn");
        const auto wrong_digest = crypto::sha256(http::to_body("something else"));
        corrupt.set("Upload-Checksum", tus::format_checksum(tus::Checksum{"sha256", wrong_digest}));
        assert(http::status_of(f.handler.handle(corrupt, "peer")) == 460);

        auto last = patch_request(location, 10, "abcdefghijklmn");
        last.set("Upload-Checksum",
                 tus::format_checksum(tus::Checksum{"sha256", crypto::sha256(http::to_body("abcdefghijklmn"))}));
        const auto done = f.handler.handle(last, "peer");
        assert(http::status_of(done) == 204);
        assert(header(done, "Upload-Offset") == "24");
        assert(f.sink->delivered() == 1);
        assert(f.sink->tracked() == 0);

        auto overflow = f.handler.handle(patch_request(location, 24, "x"), "peer");
        assert(http::status_of(overflow) == 413);

        auto get = http::make_request("GET", location);
        const auto download = f.handler.handle(get, "peer");
        assert(http::status_of(download) == 200);
        assert(http::body_text(download.body()) == "0123456789abcdefghijklmn");
        assert(header(download, "Content-Disposition") == "attachment; filename=\"report.txt\"");

        get.set("Range", "bytes=2-4");
        const auto partial = f.handler.handle(get, "peer");
        assert(http::status_of(partial) == 206);
        assert(http::body_text(partial.body()) == "234");
        assert(header(partial, "Content-Range") == "bytes 2-4/24");

        get.set("Range", "bytes=20-99");
        assert(header(f.handler.handle(get, "peer"), "Content-Range") == "bytes 20-23/24");

        // The largest representable end must clamp to the received bytes, not wrap around.
        get.set("Range", "bytes=0-18446744073709551615");
        const auto clamped = f.handler.handle(get, "peer");
        assert(http::status_of(clamped) == 206);
        assert(http::body_text(clamped.body()) == "0123456789abcdefghijklmn");
        assert(header(clamped, "Content-Range") == "bytes 0-23/24");

        get.set("Range", "bytes=30-");
        assert(http::status_of(f.handler.handle(get, "peer")) == 416);

        // Termination through the method override used by clients behind restrictive proxies.
        auto overridden = tus_request("POST", location);
        overridden.set("X-HTTP-Method-Override", "DELETE");
        assert(http::status_of(f.handler.handle(overridden, "peer")) == 204);
        assert(http::status_of(f.handler.handle(tus_request("HEAD", location), "peer")) == 404);
        assert(http::status_of(f.handler.handle(tus_request("DELETE", location), "peer")) == 204);
        get.erase("Range");
        assert(http::status_of(f.handler.handle(get, "peer")) == 404);
    }

    void test_creation_variants()
    {
        Fixture f("tusk_http_creation", {});

        auto with_data = tus_request("POST", "/files");
        with_data.set("Upload-Length", "8");
        with_data.set("Content-Type", "application/offset+octet-stream");
        with_data.body() = http::to_body("hello");
        const auto created = f.handler.handle(with_data, "peer");
        assert(http::status_of(created) == 201);
        assert(header(created, "Upload-Offset") == "5");

        auto deferred = tus_request("POST", "/files/");
        deferred.set("Upload-Defer-Length", "1");
        const auto deferred_created = f.handler.handle(deferred, "peer");
        assert(http::status_of(deferred_created) == 201);
        const auto location = header(deferred_created, "Location");
        const auto head = f.handler.handle(tus_request("HEAD", location), "peer");
        assert(header(head, "Upload-Defer-Length") == "1");
        assert(header(head, "Upload-Length").empty());

        auto finish = patch_request(location, 0, "abc");
        finish.set("Upload-Length", "3");
        assert(http::status_of(f.handler.handle(finish, "peer")) == 204);
        assert(header(f.handler.handle(tus_request("HEAD", location), "peer"), "Upload-Length") == "3");

        auto both = tus_request("POST", "/files/");
        both.set("Upload-Length", "3");
        both.set("Upload-Defer-Length", "1");
        assert(http::status_of(f.handler.handle(both, "peer")) == 400);

        auto negative = tus_request("POST", "/files/");
        negative.set("Upload-Length", "-5");
        assert(http::status_of(f.handler.handle(negative, "peer")) == 400);

        auto bad_metadata = tus_request("POST", "/files/");
        bad_metadata.set("Upload-Length", "3");
        bad_metadata.set("Upload-Metadata", "a Zm9v,a YmFy");
        assert(http::status_of(f.handler.handle(bad_metadata, "peer")) == 400);
    }

    void test_routing()
    {
        Fixture f("tusk_http_routing", {});
        assert(f.handler.options().base_path == "/files/");
        assert(http::status_of(f.handler.handle(tus_request("HEAD", "/elsewhere/abc"), "peer")) == 404);
        assert(http::status_of(f.handler.handle(tus_request("HEAD", "/files/a/b"), "peer")) == 404);
        assert(http::status_of(f.handler.handle(tus_request("HEAD", "/files/unknown"), "peer")) == 404);
        assert(http::status_of(f.handler.handle(tus_request("PUT", "/files/unknown"), "peer")) == 405);
        assert(http::status_of(f.handler.handle(tus_request("PATCH", "/files/"), "peer")) == 405);

        auto create = tus_request("POST", "/files/?source=test");
        create.set("Upload-Length", "1");
        const auto location = header(f.handler.handle(create, "peer"), "Location");
        assert(http::status_of(f.handler.handle(tus_request("POST", location), "peer")) == 405);
    }

    void test_bearer_authorization()
    {
        assert(bearer_token("Bearer TrueJWT") == std::optional<std::string_view>("TrueJWT"));
        assert(bearer_token("Bearer Bearer") == std::optional<std::string_view>("Bearer"));
        assert(!bearer_token("Basic dXNlcjpwYXNz"));
        assert(!bearer_token("bearer"));

        EngineOptions options;
        options.authorizer = make_bearer_token_authorizer(std::string("TrueJWT"));
        Fixture f("tusk_http_auth", std::move(options));

        auto create = tus_request("POST", "/files/");
        create.set("Upload-Length", "3");
        const auto denied = f.handler.handle(create, "peer");
        assert(http::status_of(denied) == 401);
        assert(header(denied, "Tus-Resumable") == "1.0.0");
        assert(f.metadata.list().empty());

        // A token that merely consists of prefix characters must not pass.
        create.set("Authorization", "Bearer eeTrueJWT");
        assert(http::status_of(f.handler.handle(create, "peer")) == 401);
        create.set("Authorization", "TrueJWT");
        assert(http::status_of(f.handler.handle(create, "peer")) == 401);

        create.set("Authorization", "Bearer TrueJWT");
        assert(http::status_of(f.handler.handle(create, "peer")) == 201);

        const auto open = make_bearer_token_authorizer(std::nullopt);
        assert(open(RequestContext{}).allowed);
    }

    void test_filename_hook()
    {
        const auto hook = make_filename_hook();
        RequestContext context;
        context.headers.set("Filename", "from-header.bin");

        CreateRequest request{.length = 1, .defer_length = false, .metadata = {}};
        assert(hook(request, context).at("filename") == "from-header.bin");

        request.metadata["filename"] = "from-client.bin";
        assert(hook(request, context).at("filename") == "from-client.bin");

        request.metadata.clear();
        assert(!hook(request, RequestContext{}).contains("filename"));
    }

    void test_completion_sink_dedupes()
    {
        LogCompletionSink sink;
        sink.on_upload_completed(CompletionEvent{"a", 3, {{"filename", "a.txt"}}});
        sink.on_upload_completed(CompletionEvent{"a", 3, {}});
        sink.on_upload_completed(CompletionEvent{"b", 0, {}});
        assert(sink.delivered() == 2);
        assert(sink.tracked() == 2);

        // Settled ids are forgotten; only unsettled ones are kept for deduplication.
        sink.on_completion_settled("a");
        assert(sink.tracked() == 1);
        sink.on_completion_settled("b");
        assert(sink.tracked() == 0);
        sink.on_completion_settled("never-seen");
        assert(sink.delivered() == 2);
    }

    ServerConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "tusk_server");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_server_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool rejects(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_server_arguments()
    {
        const auto config = parse({"--port", "8080", "--root", "/tmp/tusk", "--storage", "segmented", "--max-size",
                                   "1048576", "--retention", "60", "--completed-retention", "120", "--lock-timeout",
                                   "250", "--token", "TrueJWT", "--log-level", "debug", "--base-path", "/uploads/"});
        assert(config.port == 8080);
        assert(config.root == std::filesystem::path("/tmp/tusk"));
        assert(config.storage == StorageKind::Segmented);
        assert(config.max_size == std::optional<std::uint64_t>(1048576));
        assert(config.retention == std::chrono::seconds(60));
        assert(config.completed_retention == std::optional<std::chrono::seconds>(std::chrono::seconds(120)));
        assert(config.lock_timeout == std::chrono::milliseconds(250));
        assert(config.auth_token == std::optional<std::string>("TrueJWT"));
        assert(config.log_level == spdlog::level::debug);
        assert(config.base_path == "/uploads/");

        assert(parse({"--help"}).show_help);
        assert(rejects({"--root", "/tmp/tusk"}));
        assert(rejects({"--port", "70000", "--root", "/tmp/tusk"}));
        assert(rejects({"--port", "-1", "--root", "/tmp/tusk"}));
        assert(rejects({"--port", "80", "--root", "/tmp/tusk", "--storage", "s3"}));
        assert(rejects({"--port", "80", "--root", "/tmp/tusk", "--log-level", "loud"}));
        assert(rejects({"--port", "80", "--root", "/tmp/tusk", "--reap-interval", "0"}));
        assert(rejects({"--port", "80", "--root", "/tmp/tusk", "--bogus"}));
        assert(rejects({"--port"}));
    }

} // namespace

void run_http_surface_tests()
{
    test_options_advertises_capabilities();
    test_version_is_required();
    test_upload_through_handler();
    test_creation_variants();
    test_routing();
    test_bearer_authorization();
    test_filename_hook();
    test_completion_sink_dedupes();
    test_server_arguments();
}
