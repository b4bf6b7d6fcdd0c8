/**
 * tusk - HTTP/1.1 messages shared by the server and the client.
 *
 * Messages are Boost.Beast messages with a byte-vector body. The sockets stay on
 * standalone asio; RequestReader and ResponseReader feed the bytes they receive
 * into Beast's parsers, and encode_* serializes a message into one frame.
 */
#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/vector_body.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tusk/error_codes.hpp"

namespace tusk::http
{

    namespace beast_http = boost::beast::http;

    using Body = beast_http::vector_body<std::byte>;
    using Headers = beast_http::fields;
    using Request = beast_http::request<Body>;
    using Response = beast_http::response<Body>;

    // Malformed or oversized message. `code()` is LengthExceeded for a body over the limit.
    class ParseError : public std::runtime_error
    {
    public:
        ParseError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class RequestReader
    {
    public:
        RequestReader(std::uint64_t body_limit, std::uint32_t header_limit);

        // Returns how many bytes of `input` were consumed; the rest belongs to a later read.
        std::size_t feed(std::string_view input);

        bool header_done() const { return parser_.is_header_done(); }
        bool done() const { return parser_.is_done(); }

        Request release() { return parser_.release(); }

    private:
        beast_http::request_parser<Body> parser_;
    };

    class ResponseReader
    {
    public:
        // A response to HEAD never carries a body, whatever its Content-Length says.
        explicit ResponseReader(bool head_request);

        std::size_t feed(std::string_view input);

        // The peer closed the connection. Throws ParseError unless that completes the message.
        void finish();

        bool done() const { return parser_.is_done(); }

        Response release() { return parser_.release(); }

    private:
        beast_http::response_parser<Body> parser_;
    };

    // Sets Content-Length (or chunked framing) from the body before serializing.
    std::vector<std::uint8_t> encode_request(Request request);
    std::vector<std::uint8_t> encode_response(Response response);

    Request make_request(std::string_view method, std::string_view target);

    // Status codes outside Beast's table (tus 460) get their reason phrase here.
    void set_status(Response &response, int status);

    int status_of(const Response &response);

    std::string_view method_of(const Request &request);
    std::string_view target_of(const Request &request);

    std::optional<std::string_view> find_header(const Headers &headers, std::string_view name);
    void set_header(Headers &headers, std::string_view name, std::string_view value);

    std::string body_text(const std::vector<std::byte> &body);

    std::vector<std::byte> to_body(std::string_view text);

} // namespace tusk::http
