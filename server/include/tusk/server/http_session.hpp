#pragma once

#include <asio/ip/tcp.hpp>

#include <array>
#include <memory>
#include <optional>
#include <string>

#include "tusk/http.hpp"
#include "tusk/server/tus_handler.hpp"

namespace tusk::server
{

    // One keep-alive HTTP/1.1 connection; requests are handled one at a time.
    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(asio::ip::tcp::socket socket, TusHandler &handler);

        void start();

        void stop();

    private:
        void next_request();
        void parse_buffered();
        void read_more();
        void dispatch();
        void send_response(http::Response response, bool close_after);
        void reject(tusk::ErrorCode code, std::string message);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        TusHandler &handler_;
        std::string remote_;
        std::array<char, 16 * 1024> read_buffer_{};
        // Received bytes the parser has not consumed yet (a partial head or a pipelined request).
        std::string pending_;
        std::optional<http::RequestReader> reader_;
    };

} // namespace tusk::server
