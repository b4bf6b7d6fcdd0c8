#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <array>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "tusk/client/config.hpp"
#include "tusk/client/http_connection.hpp"
#include "tusk/client/logger.hpp"
#include "tusk/client/transfer_state_store.hpp"
#include "tusk/client/upload_client.hpp"
#include "tusk/http.hpp"
#include "tusk/server/file_storage.hpp"
#include "tusk/server/hooks.hpp"
#include "tusk/server/http_session.hpp"
#include "tusk/server/metadata_store.hpp"
#include "tusk/server/transfer_coordinator.hpp"
#include "tusk/server/tus_handler.hpp"
#include "tusk/server/upload_engine.hpp"

using namespace tusk;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string pattern(std::size_t size)
    {
        std::string out;
        out.reserve(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            out.push_back(static_cast<char>('a' + (i * 7) % 26));
        }
        return out;
    }

    client::ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "tusk_client");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return client::parse_arguments(static_cast<int>(argv.size()), argv.data());
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

    void test_client_arguments()
    {
        const auto config = parse({"localhost:1080", "movie.mp4", "--chunk-size", "4096", "--token", "TrueJWT",
                                   "--metadata", "filetype=video/mp4", "--metadata", "note=a=b", "--retries", "2",
                                   "--state", "/tmp/state.json", "--max-upload-rate", "1000"});
        assert(config.host == "localhost");
        assert(config.port == 1080);
        assert(config.file == std::filesystem::path("movie.mp4"));
        assert(config.chunk_size == 4096);
        assert(config.token == std::optional<std::string>("TrueJWT"));
        assert(config.metadata.at("filetype") == "video/mp4");
        assert(config.metadata.at("note") == "a=b");
        assert(config.retries == 2);
        assert(config.state_path == std::optional<std::filesystem::path>("/tmp/state.json"));
        assert(config.max_upload_rate == std::optional<std::size_t>(1000));
        assert(config.base_path == "/files/");

        assert(rejects({"localhost:1080"}));
        assert(rejects({"localhost", "file"}));
        assert(rejects({"localhost:0", "file"}));
        assert(rejects({"localhost:http", "file"}));
        assert(rejects({"localhost:1080", "file", "--chunk-size", "0"}));
        assert(rejects({"localhost:1080", "file", "--metadata", "novalue"}));
        assert(rejects({"localhost:1080", "file", "--metadata", "bad key=v"}));
        assert(rejects({"localhost:1080", "file", "--unknown"}));
    }

    void test_location_targets()
    {
        assert(client::target_from_location("/files/abc") == "/files/abc");
        assert(client::target_from_location("http://localhost:1080/files/abc") == "/files/abc");
        assert(client::target_from_location("https://example.org") == "/");
    }

    void test_transfer_state_store()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_client_state_test";
        cleanup_path(temp_root);
        const auto state_path = temp_root / "state" / "uploads.json";
        const auto local = temp_root / "data.bin";

        {
            client::TransferStateStore store(state_path);
            assert(store.entries().empty());
            store.upsert("host:1/files/", local, 100, "/files/abc");
            store.update_progress("host:1/files/", local, 40);
            assert(std::filesystem::exists(state_path));
        }

        client::TransferStateStore reloaded(state_path);
        const auto entry = reloaded.find("host:1/files/", local, 100);
        assert(entry);
        assert(entry->upload_url == "/files/abc");
        assert(entry->bytes_transferred == 40);
        assert(!reloaded.find("host:1/files/", local, 101));
        assert(!reloaded.find("host:2/files/", local, 100));
        // Relative spellings of the same file match.
        assert(reloaded.find("host:1/files/", temp_root / "x" / ".." / "data.bin", 100));

        reloaded.upsert("host:1/files/", local, 100, "/files/def");
        assert(reloaded.entries().size() == 1);
        assert(reloaded.find("host:1/files/", local, 100)->bytes_transferred == 0);

        reloaded.remove("host:1/files/", local);
        assert(!reloaded.find("host:1/files/", local, 100));

        write_file(state_path, "{ definitely not json");
        client::TransferStateStore corrupt(state_path);
        assert(corrupt.entries().empty());

        cleanup_path(temp_root);
    }

    // A tus server on a loopback port backed by the real engine and HTTP session.
    class LoopbackServer
    {
    public:
        LoopbackServer(const std::filesystem::path &root, std::optional<std::string> token)
            : storage_(root / "uploads"),
              metadata_(root / "records"),
              coordinator_(std::chrono::milliseconds(1000)),
              engine_(storage_, metadata_, coordinator_, options(std::move(token))),
              handler_(engine_, server::HandlerOptions{.base_path = "/files/", .max_body = 1024 * 1024}),
              acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        {
            accept_next();
            runner_ = std::thread([this]
                                  { io_context_.run(); });
        }

        ~LoopbackServer()
        {
            io_context_.stop();
            if (runner_.joinable())
            {
                runner_.join();
            }
        }

        std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

        server::UploadEngine &engine() { return engine_; }
        server::MetadataStore &metadata() { return metadata_; }
        server::FileStorage &storage() { return storage_; }

    private:
        static server::EngineOptions options(std::optional<std::string> token)
        {
            server::EngineOptions options;
            options.authorizer = server::make_bearer_token_authorizer(std::move(token));
            return options;
        }

        void accept_next()
        {
            acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                                   {
                if (ec)
                {
                    return;
                }
                std::make_shared<server::HttpSession>(std::move(socket), handler_)->start();
                accept_next(); });
        }

        server::FileStorage storage_;
        server::MetadataStore metadata_;
        server::TransferCoordinator coordinator_;
        server::UploadEngine engine_;
        server::TusHandler handler_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        std::thread runner_;
    };

    client::UploadOptions upload_options(std::optional<std::string> token)
    {
        client::UploadOptions options;
        options.chunk_size = 1000;
        options.token = std::move(token);
        options.retries = 2;
        options.initial_backoff = std::chrono::milliseconds(10);
        return options;
    }

    void test_end_to_end_upload()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_client_e2e";
        cleanup_path(temp_root);
        const auto content = pattern(4321);
        const auto file = temp_root / "local" / "payload.bin";
        write_file(file, content);

        LoopbackServer server(temp_root / "server", std::string("TrueJWT"));
        client::HttpConnection connection("127.0.0.1", server.port());
        client::TransferStateStore state(temp_root / "state.json");
        client::Logger logger(std::nullopt);

        std::vector<std::uint64_t> progress;
        client::UploadClient uploader(connection, state, logger, upload_options(std::string("TrueJWT")));
        const auto result = uploader.upload(file, [&](std::uint64_t offset, std::uint64_t)
                                            { progress.push_back(offset); });
        assert(!result.resumed);
        assert(result.length == content.size());
        assert(progress.front() == 0);
        assert(progress.back() == content.size());
        assert(progress.size() == 6);
        assert(state.entries().empty());

        const auto id = result.url.substr(std::string("/files/").size());
        const auto info = server.metadata().get(id);
        assert(info && info->completed());
        assert(info->metadata.at("filename") == "payload.bin");
        assert(read_file(server.storage().object_path(id)) == content);

        // A wrong token is refused before anything is created.
        client::UploadClient intruder(connection, state, logger, upload_options(std::string("nope")));
        bool refused = false;
        try
        {
            (void)intruder.upload(file);
        }
        catch (const client::TransferError &ex)
        {
            refused = ex.status() == 401 && ex.code() == ErrorCode::Unauthorized;
        }
        assert(refused);
        assert(server.metadata().list().size() == 1);

        uploader.terminate(result.url);
        assert(!server.metadata().get(id));
        assert(!uploader.query_offset(result.url));

        cleanup_path(temp_root);
    }

    void test_resume_from_recorded_state()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_client_resume";
        cleanup_path(temp_root);
        const auto content = pattern(2500);
        const auto file = temp_root / "local" / "resume.bin";
        write_file(file, content);

        LoopbackServer server(temp_root / "server", std::nullopt);
        client::HttpConnection connection("127.0.0.1", server.port());
        client::TransferStateStore state(temp_root / "state.json");
        const auto log_path = temp_root / "transfer.log";
        client::Logger logger(log_path);
        client::UploadClient uploader(connection, state, logger, upload_options(std::nullopt));

        // An earlier run created the upload and got 1200 bytes across before it died.
        const auto url = uploader.create(content.size(), {{"filename", "resume.bin"}});
        const auto first_part = std::string_view(content).substr(0, 1200);
        assert(uploader.patch(url, 0, std::as_bytes(std::span(first_part.data(), first_part.size()))) == 1200);
        state.upsert(connection.authority() + "/files/", file, content.size(), url);

        // The server offset wins over whatever the client believes.
        assert(uploader.query_offset(url) == std::optional<std::uint64_t>(1200));
        bool conflict = false;
        try
        {
            const auto stale = std::string_view(content).substr(0, 100);
            (void)uploader.patch(url, 0, std::as_bytes(std::span(stale.data(), stale.size())));
        }
        catch (const client::TransferError &ex)
        {
            conflict = ex.code() == ErrorCode::OffsetMismatch;
        }
        assert(conflict);

        const auto result = uploader.upload(file);
        assert(result.resumed);
        assert(result.url == url);
        const auto id = url.substr(std::string("/files/").size());
        assert(read_file(server.storage().object_path(id)) == content);
        assert(state.entries().empty());

        // A recorded upload the server forgot about is replaced by a fresh one.
        state.upsert(connection.authority() + "/files/", file, content.size(), "/files/forgotten");
        const auto fresh = uploader.upload(file);
        assert(!fresh.resumed);
        assert(fresh.url != "/files/forgotten");
        assert(server.metadata().list().size() == 2);

        // Each transfer log line carries the upload URL, and the resume line the offset it resumed from.
        const auto log = read_file(log_path);
        assert(log.find(url + " resuming at offset 1200 of 2500") != std::string::npos);
        assert(log.find(url + " finished, 2500 bytes on the server") != std::string::npos);
        assert(log.find("/files/forgotten is gone from the server") != std::string::npos);
        assert(log.find(fresh.url + " created for ") != std::string::npos);

        cleanup_path(temp_root);
    }

    http::Response read_raw_response(asio::ip::tcp::socket &socket, std::string &buffer)
    {
        http::ResponseReader reader(false);
        std::array<char, 4096> chunk{};
        while (true)
        {
            buffer.erase(0, reader.feed(buffer));
            if (reader.done())
            {
                return reader.release();
            }
            std::error_code ec;
            const auto bytes = socket.read_some(asio::buffer(chunk), ec);
            if (ec == asio::error::eof)
            {
                reader.finish();
                return reader.release();
            }
            if (ec)
            {
                throw std::system_error(ec);
            }
            buffer.append(chunk.data(), bytes);
        }
    }

    void test_session_wire_handling()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_client_wire";
        cleanup_path(temp_root);
        LoopbackServer server(temp_root / "server", std::nullopt);
        asio::io_context io_context;
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), server.port());

        {
            // A chunked creation-with-upload and a pipelined OPTIONS in one write.
            asio::ip::tcp::socket socket(io_context);
            socket.connect(endpoint);
            const std::string requests = "POST /files/ HTTP/1.1\r\nHost: test\r\nTus-Resumable: 1.0.0\r\n"
                                         "Upload-Length: 3\r\nContent-Type: application/offset+octet-stream\r\n"
                                         "Transfer-Encoding: chunked\r\n\r\n"
                                         "3\r\nabc\r\n0\r\n\r\n"
                                         "OPTIONS /files/ HTTP/1.1\r\nHost: test\r\n\r\n";
            asio::write(socket, asio::buffer(requests));

            std::string buffer;
            const auto created = read_raw_response(socket, buffer);
            assert(http::status_of(created) == 201);
            assert(http::find_header(created, "Upload-Offset") == std::optional<std::string_view>("3"));
            const auto options = read_raw_response(socket, buffer);
            assert(http::status_of(options) == 204);
            assert(http::find_header(options, "Tus-Version") == std::optional<std::string_view>("1.0.0"));
        }

        {
            // Only the head is sent: the declared body is refused without waiting for it.
            asio::ip::tcp::socket socket(io_context);
            socket.connect(endpoint);
            const std::string head = "PATCH /files/abc HTTP/1.1\r\nHost: test\r\nTus-Resumable: 1.0.0\r\n"
                                     "Content-Type: application/offset+octet-stream\r\nUpload-Offset: 0\r\n"
                                     "Content-Length: 2000000\r\n\r\n";
            asio::write(socket, asio::buffer(head));

            std::string buffer;
            const auto refused = read_raw_response(socket, buffer);
            assert(http::status_of(refused) == 413);
            assert(!refused.keep_alive());
        }

        assert(server.metadata().list().size() == 1);
        cleanup_path(temp_root);
    }

} // namespace

void run_client_component_tests()
{
    test_client_arguments();
    test_location_targets();
    test_transfer_state_store();
    test_end_to_end_upload();
    test_resume_from_recorded_state();
    test_session_wire_handling();
}
