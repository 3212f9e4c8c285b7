#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/streambuf.hpp>

#include "atlas/crypto.hpp"
#include "atlas/encoding/base64.hpp"
#include "atlas/error_codes.hpp"
#include "atlas/http.hpp"
#include "atlas/http_io.hpp"

using namespace atlas;

void run_server_component_tests();
void run_middleware_tests();

namespace
{

    // Hands out the scripted bytes a few at a time, then reports EOF.
    class ScriptedStream
    {
    public:
        explicit ScriptedStream(std::string data, std::size_t max_read = 7)
            : data_(std::move(data)), max_read_(max_read) {}

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers, std::error_code &ec)
        {
            if (position_ >= data_.size())
            {
                ec = asio::error::make_error_code(asio::error::eof);
                return 0;
            }
            ec = {};
            const auto available = std::min(max_read_, data_.size() - position_);
            const auto copied = asio::buffer_copy(buffers, asio::buffer(data_.data() + position_, available));
            position_ += copied;
            return copied;
        }

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers)
        {
            std::error_code ec;
            const auto n = read_some(buffers, ec);
            if (ec)
            {
                throw std::system_error(ec);
            }
            return n;
        }

    private:
        std::string data_;
        std::size_t max_read_;
        std::size_t position_{0};
    };

    std::string read_whole_body(ScriptedStream &stream, asio::streambuf &buffer, const http::BodyLength &length,
                                std::uint64_t limit = 1024 * 1024)
    {
        std::string body;
        http::read_body(stream, buffer, length, limit, [&body](std::string_view piece)
                        { body.append(piece); });
        return body;
    }

    void test_base64()
    {
        using encoding::decode_base64;
        using encoding::encode_base64;

        assert(encode_base64("") == "");
        assert(encode_base64("f") == "Zg==");
        assert(encode_base64("fo") == "Zm8=");
        assert(encode_base64("foobar") == "Zm9vYmFy");
        assert(encode_base64("alice:secret") == "YWxpY2U6c2VjcmV0");

        assert(decode_base64("Zm9vYmFy").value() == "foobar");
        assert(decode_base64("Zg==").value() == "f");
        assert(decode_base64("").value().empty());

        assert(!decode_base64("Zg"));       // missing padding
        assert(!decode_base64("Z=g="));     // padding in the middle
        assert(!decode_base64("Zm9v!mFy")); // outside the alphabet
        assert(!decode_base64("Zm9vYmFy="));
    }

    void test_crypto()
    {
        const auto hash = crypto::hash_password("correct horse");
        assert(!hash.empty());
        assert(hash != "correct horse");
        assert(crypto::verify_password("correct horse", hash));
        assert(!crypto::verify_password("battery staple", hash));

        // Salted: equal passwords produce different hashes.
        assert(crypto::hash_password("correct horse") != hash);

        assert(!crypto::verify_password("anything", ""));
        assert(!crypto::verify_password("anything", "not-a-hash"));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::InvalidArgument) == "invalid_argument");
        assert(to_string(ErrorCode::StorageFailure) == "storage_failure");
        const Error error(ErrorCode::AlreadyExists, "user alice already exists");
        assert(error.code() == ErrorCode::AlreadyExists);
        assert(std::string(error.what()) == "user alice already exists");
    }

    void test_headers()
    {
        http::Headers headers;
        assert(headers.empty());
        headers.add("Set-Cookie", "a=1");
        headers.add("set-cookie", "b=2");
        headers.set("Content-Type", "text/plain");
        assert(headers.size() == 3);
        assert(headers.get("SET-COOKIE").value() == "a=1");
        assert(headers.get("content-type").value() == "text/plain");

        headers.set("CONTENT-TYPE", "text/xml");
        assert(headers.size() == 3);
        assert(headers.get("Content-Type").value() == "text/xml");

        headers.remove("Set-Cookie");
        assert(headers.size() == 1);
        assert(!headers.contains("set-cookie"));
        assert(!headers.get("Missing"));

        assert(http::iequals("PropFind", "PROPFIND"));
        assert(!http::iequals("PROPFIND", "PROPFINDX"));
        assert(http::reason_phrase(207) == "Multi-Status");
        assert(http::reason_phrase(599) == "Unknown");
    }

    void test_chain_order()
    {
        std::vector<std::string> trace;
        auto tagging = [&trace](std::string name) -> http::Middleware
        {
            return [&trace, name](http::HandlerPtr next) -> http::HandlerPtr
            {
                return http::make_handler([&trace, name, next](http::ResponseWriter &writer, const http::Request &request)
                                          {
                    trace.push_back(name);
                    next->serve(writer, request); });
            };
        };

        auto endpoint = http::make_handler([&trace](http::ResponseWriter &writer, const http::Request &)
                                           {
            trace.push_back("engine");
            writer.write_header(http::status::kNoContent); });

        auto handler = http::chain(endpoint, {tagging("outer"), tagging("inner")});

        http::Request request;
        std::string wire;
        http::StreamResponseWriter writer([&wire](std::string_view data)
                                          { wire.append(data); },
                                          request);
        handler->serve(writer, request);
        writer.finish();

        assert((trace == std::vector<std::string>{"outer", "inner", "engine"}));
        assert(wire.starts_with("HTTP/1.1 204 No Content\r\n"));

        // No middleware: the handler itself.
        assert(http::chain(endpoint, {}) == endpoint);
    }

    void test_percent_decode()
    {
        assert(http::percent_decode("/a%20b/%C3%A9") == "/a b/\xC3\xA9");
        assert(http::percent_decode("/plain") == "/plain");

        bool caught = false;
        try
        {
            (void)http::percent_decode("/bad%2");
        }
        catch (const http::HttpError &ex)
        {
            caught = ex.status() == http::status::kBadRequest;
        }
        assert(caught);
    }

    void test_parse_request_head()
    {
        const auto request = http::parse_request_head("\r\nPROPFIND /docs/My%20File.txt?x=1 HTTP/1.1\r\n"
                                                      "Host: example.com\r\n"
                                                      "Depth:  1 \r\n"
                                                      "\r\n");
        assert(request.method == "PROPFIND");
        assert(request.target == "/docs/My%20File.txt?x=1");
        assert(request.path == "/docs/My File.txt");
        assert(request.query == "x=1");
        assert(request.version == "HTTP/1.1");
        assert(request.headers.get("depth").value() == "1");

        const auto absolute = http::parse_request_head("GET http://example.com/a/b HTTP/1.0\r\n\r\n");
        assert(absolute.path == "/a/b");
        assert(absolute.version == "HTTP/1.0");

        for (const std::string_view bad : {
                 std::string_view("GET /\r\n\r\n"),
                 std::string_view("GET / HTTP/2.0\r\n\r\n"),
                 std::string_view("G(T / HTTP/1.1\r\n\r\n"),
                 std::string_view("GET / HTTP/1.1\r\nNo colon here\r\n\r\n"),
             })
        {
            bool caught = false;
            try
            {
                (void)http::parse_request_head(bad);
            }
            catch (const http::HttpError &ex)
            {
                caught = ex.status() == http::status::kBadRequest;
            }
            assert(caught);
        }
    }

    void test_body_framing()
    {
        http::Headers headers;
        assert(http::request_body_length(headers).framing == http::BodyFraming::None);

        headers.set("Content-Length", "12");
        auto length = http::request_body_length(headers);
        assert(length.framing == http::BodyFraming::ContentLength);
        assert(length.length == 12);

        headers.set("Content-Length", "0");
        assert(http::request_body_length(headers).framing == http::BodyFraming::None);

        headers.set("Transfer-Encoding", "chunked");
        bool conflict = false;
        try
        {
            (void)http::request_body_length(headers);
        }
        catch (const http::HttpError &ex)
        {
            conflict = ex.status() == http::status::kBadRequest;
        }
        assert(conflict);

        headers.remove("Content-Length");
        assert(http::request_body_length(headers).framing == http::BodyFraming::Chunked);

        headers.set("Transfer-Encoding", "gzip");
        bool unsupported = false;
        try
        {
            (void)http::request_body_length(headers);
        }
        catch (const http::HttpError &ex)
        {
            unsupported = ex.status() == http::status::kNotImplemented;
        }
        assert(unsupported);

        http::Headers response;
        assert(http::response_body_length("GET", 200, response).framing == http::BodyFraming::UntilClose);
        assert(http::response_body_length("HEAD", 200, response).framing == http::BodyFraming::None);
        assert(http::response_body_length("GET", 204, response).framing == http::BodyFraming::None);
        response.set("Content-Length", "5");
        assert(http::response_body_length("GET", 200, response).length == 5);

        assert(http::parse_chunk_size("1a;name=value") == 26);
        assert(http::parse_chunk_size("0") == 0);
    }

    void test_keep_alive_rules()
    {
        http::Request request;
        assert(http::wants_keep_alive(request));
        request.headers.set("Connection", "Close");
        assert(!http::wants_keep_alive(request));

        request.version = "HTTP/1.0";
        request.headers.remove("Connection");
        assert(!http::wants_keep_alive(request));
        request.headers.set("Connection", "keep-alive");
        assert(http::wants_keep_alive(request));

        http::Request upload;
        upload.headers.set("Expect", "100-continue");
        assert(http::expects_continue(upload));
        upload.version = "HTTP/1.0";
        assert(!http::expects_continue(upload));
    }

    void test_read_head_and_bodies()
    {
        {
            ScriptedStream stream("PUT /f.txt HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"
                                  "GET / HTTP/1.1\r\n\r\n");
            asio::streambuf buffer(http::kMaxHeadSize);
            const auto head = http::read_head(stream, buffer);
            assert(head);
            const auto request = http::parse_request_head(*head);
            assert(read_whole_body(stream, buffer, http::request_body_length(request.headers)) == "hello");

            // Pipelined follow-up request is still in the buffer/stream.
            const auto next = http::read_head(stream, buffer);
            assert(next);
            assert(http::parse_request_head(*next).method == "GET");
            assert(!http::read_head(stream, buffer));
        }

        {
            ScriptedStream stream("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\nX-Trailer: 1\r\n\r\n");
            asio::streambuf buffer(http::kMaxHeadSize);
            const http::BodyLength chunked{http::BodyFraming::Chunked, 0};
            assert(read_whole_body(stream, buffer, chunked) == "Wikipedia");
        }

        {
            ScriptedStream stream("everything until the peer closes", 5);
            asio::streambuf buffer(http::kMaxHeadSize);
            const http::BodyLength until_close{http::BodyFraming::UntilClose, 0};
            assert(read_whole_body(stream, buffer, until_close) == "everything until the peer closes");
        }

        {
            ScriptedStream stream("0123456789");
            asio::streambuf buffer(http::kMaxHeadSize);
            bool too_large = false;
            try
            {
                (void)read_whole_body(stream, buffer, {http::BodyFraming::ContentLength, 10}, 4);
            }
            catch (const http::HttpError &ex)
            {
                too_large = ex.status() == http::status::kPayloadTooLarge;
            }
            assert(too_large);
        }

        {
            ScriptedStream stream("GET / HTTP/1.1\r\nX-Long: " + std::string(1024, 'a'), 256);
            asio::streambuf buffer(512);
            bool too_large = false;
            try
            {
                (void)http::read_head(stream, buffer);
            }
            catch (const http::HttpError &ex)
            {
                too_large = ex.status() == http::status::kHeaderFieldsTooLarge;
            }
            assert(too_large);
        }
    }

    void test_response_writer_framing()
    {
        http::Request request;
        {
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              request);
            writer.headers().set("Content-Type", "text/plain");
            writer.write("abc");
            writer.write("de");
            writer.finish();
            assert(wire.starts_with("HTTP/1.1 200 OK\r\n"));
            assert(wire.find("Transfer-Encoding: chunked\r\n") != std::string::npos);
            assert(wire.find("Date: ") != std::string::npos);
            assert(wire.ends_with("\r\n\r\n3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n"));
            assert(writer.keep_alive());
        }
        {
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              request);
            writer.headers().set("Content-Length", "5");
            writer.write_header(http::status::kMultiStatus);
            writer.write_header(http::status::kOk); // first status wins
            writer.write("hello");
            writer.finish();
            assert(wire.starts_with("HTTP/1.1 207 Multi-Status\r\n"));
            assert(wire.find("Transfer-Encoding") == std::string::npos);
            assert(wire.ends_with("\r\n\r\nhello"));
            assert(writer.status() == http::status::kMultiStatus);
        }
        {
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              request);
            writer.finish();
            assert(wire.find("Content-Length: 0\r\n") != std::string::npos);
        }
        {
            http::Request head_request;
            head_request.method = "HEAD";
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              head_request);
            writer.headers().set("Content-Length", "100");
            writer.write("ignored body");
            writer.finish();
            assert(wire.find("Content-Length: 100\r\n") != std::string::npos);
            assert(wire.ends_with("\r\n\r\n"));
        }
        {
            http::Request legacy;
            legacy.version = "HTTP/1.0";
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              legacy);
            writer.write("streamed");
            writer.finish();
            assert(wire.find("Connection: close\r\n") != std::string::npos);
            assert(wire.ends_with("\r\n\r\nstreamed"));
            assert(!writer.keep_alive());
        }
        {
            std::string wire;
            http::StreamResponseWriter writer([&wire](std::string_view data)
                                              { wire.append(data); },
                                              request);
            writer.headers().set("Content-Length", "9");
            http::write_error(writer, http::status::kUnauthorized, "Unauthorized");
            writer.finish();
            assert(wire.starts_with("HTTP/1.1 401 Unauthorized\r\n"));
            assert(wire.find("Content-Length: 9") == std::string::npos);
            assert(wire.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
            assert(wire.find("\r\n\r\n") != std::string::npos);
            assert(wire.find("Unauthorized\n") != std::string::npos);
        }
    }

} // namespace

int main()
{
    try
    {
        test_base64();
        test_crypto();
        test_error_codes();
        test_headers();
        test_chain_order();
        test_percent_decode();
        test_parse_request_head();
        test_body_framing();
        test_keep_alive_rules();
        test_read_head_and_bodies();
        test_response_writer_framing();
        run_server_component_tests();
        run_middleware_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
