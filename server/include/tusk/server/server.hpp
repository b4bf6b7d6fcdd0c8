#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "tusk/server/config.hpp"
#include "tusk/server/log_completion_sink.hpp"
#include "tusk/server/metadata_store.hpp"
#include "tusk/server/storage_backend.hpp"
#include "tusk/server/transfer_coordinator.hpp"
#include "tusk/server/tus_handler.hpp"
#include "tusk/server/upload_engine.hpp"
#include "tusk/server/upload_reaper.hpp"

namespace tusk::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::unique_ptr<StorageBackend> storage_;
        MetadataStore metadata_;
        TransferCoordinator coordinator_;
        std::shared_ptr<LogCompletionSink> completion_log_;
        UploadEngine engine_;
        TusHandler handler_;
        UploadReaper reaper_;

        std::vector<std::thread> workers_;
    };

} // namespace tusk::server
