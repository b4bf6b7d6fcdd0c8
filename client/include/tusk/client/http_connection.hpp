#pragma once

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <string>

#include "tusk/http.hpp"

namespace tusk::client
{

    // Blocking keep-alive HTTP/1.1 connection; reconnects lazily after the server closes it.
    class HttpConnection
    {
    public:
        HttpConnection(std::string host, std::uint16_t port);

        // Throws std::system_error on socket failures and http::ParseError on malformed responses.
        http::Response send(http::Request request);

        void close();

        bool is_open() const { return socket_.is_open(); }

        std::string authority() const;

    private:
        void connect();
        http::Response read_response(bool head_request);

        std::string host_;
        std::uint16_t port_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::array<char, 16 * 1024> read_buffer_{};
        // Bytes received past the end of the previous response.
        std::string buffer_;
    };

} // namespace tusk::client
