#include "tusk/server/http_session.hpp"

#include <asio/write.hpp>

#include <vector>

#include <spdlog/spdlog.h>

namespace tusk::server
{

    namespace
    {
        constexpr std::uint32_t kMaxHeadSize = 64 * 1024;
    } // namespace

    HttpSession::HttpSession(asio::ip::tcp::socket socket, TusHandler &handler)
        : socket_(std::move(socket)), handler_(handler)
    {
        remote_ = remote_endpoint();
    }

    void HttpSession::start()
    {
        spdlog::debug("Client connected from {}", remote_);
        next_request();
    }

    void HttpSession::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::debug("Closed connection for {}", remote_);
    }

    void HttpSession::next_request()
    {
        reader_.emplace(handler_.options().max_body, kMaxHeadSize);
        parse_buffered();
    }

    void HttpSession::parse_buffered()
    {
        try
        {
            pending_.erase(0, reader_->feed(pending_));
        }
        catch (const http::ParseError &ex)
        {
            // A declared body over the limit is refused here, before any of it is read.
            reject(ex.code(), ex.what());
            return;
        }
        if (reader_->done())
        {
            dispatch();
            return;
        }
        read_more();
    }

    void HttpSession::read_more()
    {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(read_buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    if (ec)
                                    {
                                        if (reader_->header_done())
                                        {
                                            // Incomplete body: the request is dropped and no state changes.
                                            spdlog::debug("{} disconnected mid-body: {}", remote_, ec.message());
                                        }
                                        stop();
                                        return;
                                    }
                                    pending_.append(read_buffer_.data(), bytes_transferred);
                                    parse_buffered();
                                });
    }

    void HttpSession::dispatch()
    {
        const auto request = reader_->release();
        reader_.reset();
        auto response = handler_.handle(request, remote_);
        if (request.method() == http::beast_http::verb::head)
        {
            response.body().clear();
        }
        send_response(std::move(response), !request.keep_alive());
    }

    void HttpSession::send_response(http::Response response, bool close_after)
    {
        if (close_after)
        {
            response.keep_alive(false);
        }
        auto frame = std::make_shared<std::vector<std::uint8_t>>(http::encode_response(std::move(response)));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame, close_after](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || close_after)
                              {
                                  stop();
                                  return;
                              }
                              next_request();
                          });
    }

    void HttpSession::reject(tusk::ErrorCode code, std::string message)
    {
        spdlog::debug("Rejecting request from {}: {}", remote_, message);
        send_response(handler_.error_response(code, message), true);
    }

    std::string HttpSession::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace tusk::server
