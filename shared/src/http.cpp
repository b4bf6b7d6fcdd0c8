#include "tusk/http.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffer_traits.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/serializer.hpp>

#include <algorithm>

namespace tusk::http
{

    namespace
    {

        boost::beast::string_view beast_view(std::string_view text)
        {
            return boost::beast::string_view(text.data(), text.size());
        }

        std::string_view std_view(boost::beast::string_view text)
        {
            return std::string_view(text.data(), text.size());
        }

        template <class Parser>
        std::size_t feed_parser(Parser &parser, std::string_view input)
        {
            std::size_t consumed = 0;
            while (consumed < input.size() && !parser.is_done())
            {
                boost::beast::error_code ec;
                const auto used = parser.put(boost::asio::buffer(input.data() + consumed, input.size() - consumed), ec);
                consumed += used;
                if (ec == beast_http::error::need_more || (!ec && used == 0))
                {
                    break;
                }
                if (ec == beast_http::error::body_limit)
                {
                    throw ParseError(ErrorCode::LengthExceeded, "Message body exceeds the configured limit");
                }
                if (ec)
                {
                    throw ParseError(ErrorCode::InvalidRequest, "Malformed HTTP message: " + ec.message());
                }
            }
            return consumed;
        }

        template <bool IsRequest>
        std::vector<std::uint8_t> serialize(beast_http::message<IsRequest, Body> &message)
        {
            message.prepare_payload();
            beast_http::serializer<IsRequest, Body> serializer(message);
            std::vector<std::uint8_t> out;
            out.reserve(256 + message.body().size());

            boost::beast::error_code ec;
            while (!serializer.is_done())
            {
                serializer.next(ec, [&](boost::beast::error_code &, const auto &buffers)
                                {
                                    const auto size = boost::beast::buffer_bytes(buffers);
                                    const auto position = out.size();
                                    out.resize(position + size);
                                    boost::asio::buffer_copy(boost::asio::buffer(out.data() + position, size), buffers);
                                    serializer.consume(size); });
                if (ec)
                {
                    throw ParseError(ErrorCode::InternalError, "Cannot serialize HTTP message: " + ec.message());
                }
            }
            return out;
        }

    } // namespace

    ParseError::ParseError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code)
    {
    }

    RequestReader::RequestReader(std::uint64_t body_limit, std::uint32_t header_limit)
    {
        parser_.body_limit(body_limit);
        parser_.header_limit(header_limit);
    }

    std::size_t RequestReader::feed(std::string_view input)
    {
        return feed_parser(parser_, input);
    }

    ResponseReader::ResponseReader(bool head_request)
    {
        parser_.skip(head_request);
    }

    std::size_t ResponseReader::feed(std::string_view input)
    {
        return feed_parser(parser_, input);
    }

    void ResponseReader::finish()
    {
        boost::beast::error_code ec;
        parser_.put_eof(ec);
        if (ec || !parser_.is_done())
        {
            throw ParseError(ErrorCode::InvalidRequest, "Connection closed before the response was complete");
        }
    }

    std::vector<std::uint8_t> encode_request(Request request)
    {
        return serialize(request);
    }

    std::vector<std::uint8_t> encode_response(Response response)
    {
        return serialize(response);
    }

    Request make_request(std::string_view method, std::string_view target)
    {
        Request request;
        request.version(11);
        request.method_string(beast_view(method));
        request.target(beast_view(target));
        return request;
    }

    void set_status(Response &response, int status)
    {
        response.result(static_cast<unsigned>(status));
        if (status == 460)
        {
            response.reason("Checksum Mismatch");
        }
    }

    int status_of(const Response &response)
    {
        return static_cast<int>(response.result_int());
    }

    std::string_view method_of(const Request &request)
    {
        return std_view(request.method_string());
    }

    std::string_view target_of(const Request &request)
    {
        return std_view(request.target());
    }

    std::optional<std::string_view> find_header(const Headers &headers, std::string_view name)
    {
        const auto it = headers.find(beast_view(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return std_view(it->value());
    }

    void set_header(Headers &headers, std::string_view name, std::string_view value)
    {
        headers.set(beast_view(name), beast_view(value));
    }

    std::string body_text(const std::vector<std::byte> &body)
    {
        return std::string(reinterpret_cast<const char *>(body.data()), body.size());
    }

    std::vector<std::byte> to_body(std::string_view text)
    {
        std::vector<std::byte> body(text.size());
        std::transform(text.begin(), text.end(), body.begin(), [](char c)
                       { return static_cast<std::byte>(c); });
        return body;
    }

} // namespace tusk::http
