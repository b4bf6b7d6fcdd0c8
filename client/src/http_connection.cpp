#include "tusk/client/http_connection.hpp"

#include <system_error>

namespace tusk::client
{

    HttpConnection::HttpConnection(std::string host, std::uint16_t port)
        : host_(std::move(host)), port_(port), socket_(io_context_)
    {
    }

    http::Response HttpConnection::send(http::Request request)
    {
        if (!socket_.is_open())
        {
            connect();
        }
        if (!http::find_header(request, "Host"))
        {
            http::set_header(request, "Host", authority());
        }
        const bool head_request = request.method() == http::beast_http::verb::head;
        const auto frame = http::encode_request(std::move(request));
        try
        {
            asio::write(socket_, asio::buffer(frame));
            auto response = read_response(head_request);
            if (!response.keep_alive())
            {
                close();
            }
            return response;
        }
        catch (const std::exception &)
        {
            close();
            throw;
        }
    }

    void HttpConnection::close()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        buffer_.clear();
    }

    std::string HttpConnection::authority() const
    {
        return host_ + ":" + std::to_string(port_);
    }

    void HttpConnection::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host_, std::to_string(port_));
        asio::connect(socket_, results);
        buffer_.clear();
    }

    http::Response HttpConnection::read_response(bool head_request)
    {
        http::ResponseReader reader(head_request);
        while (true)
        {
            buffer_.erase(0, reader.feed(buffer_));
            if (reader.done())
            {
                return reader.release();
            }

            std::error_code ec;
            const auto bytes = socket_.read_some(asio::buffer(read_buffer_), ec);
            if (ec == asio::error::eof)
            {
                reader.finish();
                return reader.release();
            }
            if (ec)
            {
                throw std::system_error(ec, "Reading response from " + authority());
            }
            buffer_.append(read_buffer_.data(), bytes);
        }
    }

} // namespace tusk::client
