#include "tusk/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "tusk/server/hooks.hpp"
#include "tusk/server/http_session.hpp"

namespace tusk::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        EngineOptions engine_options(const ServerConfig &config)
        {
            EngineOptions options;
            options.max_size = config.max_size;
            options.retention = config.retention;
            options.completed_retention = config.completed_retention;
            options.pre_create = make_filename_hook();
            options.authorizer = make_bearer_token_authorizer(config.auth_token);
            return options;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          storage_(make_storage(config_.storage, config_.root / "uploads")),
          metadata_(config_.root / "records"),
          coordinator_(config_.lock_timeout),
          completion_log_(std::make_shared<LogCompletionSink>()),
          engine_(*storage_, metadata_, coordinator_, engine_options(config_)),
          handler_(engine_, HandlerOptions{config_.base_path, config_.max_body}),
          reaper_(io_context_, engine_, config_.reap_interval)
    {
        coordinator_.subscribe(completion_log_);

        const auto report = engine_.recover();
        spdlog::info("Recovered uploads: {} truncated, {} removed, {} completion events republished",
                     report.truncated, report.removed, report.republished);

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} at {} with {} storage in {}", config_.address, config_.port,
                     handler_.options().base_path, to_string(config_.storage), config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        reaper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto session = std::make_shared<HttpSession>(std::move(socket), handler_);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        reaper_.stop();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace tusk::server
