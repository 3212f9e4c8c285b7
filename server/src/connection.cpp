#include "atlas/server/connection.hpp"

#include <asio/write.hpp>

#include <sys/socket.h>

#include <spdlog/spdlog.h>

#include "atlas/http_io.hpp"

namespace atlas::server
{

    namespace
    {

        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Connection::Connection(asio::ip::tcp::socket socket, http::HandlerPtr handler, std::uint64_t max_request_body)
        : socket_(std::move(socket)),
          handler_(std::move(handler)),
          max_request_body_(max_request_body),
          buffer_(http::kMaxHeadSize),
          remote_endpoint_(describe_endpoint(socket_)),
          native_handle_(socket_.native_handle())
    {
    }

    void Connection::run()
    {
        spdlog::debug("Client connected from {}", remote_endpoint_);
        try
        {
            while (serve_one())
            {
            }
        }
        catch (const std::system_error &ex)
        {
            spdlog::debug("Connection {} closed: {}", remote_endpoint_, ex.what());
        }

        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        finished_ = true;
        spdlog::debug("Client {} disconnected", remote_endpoint_);
    }

    void Connection::stop()
    {
        stopping_ = true;
        if (!busy_)
        {
            force_close();
        }
    }

    void Connection::force_close()
    {
        ::shutdown(native_handle_, SHUT_RDWR);
    }

    bool Connection::serve_one()
    {
        busy_ = false;
        if (stopping_)
        {
            return false;
        }

        http::Request request;
        try
        {
            const auto head = http::read_head(socket_, buffer_);
            if (!head)
            {
                return false;
            }
            busy_ = true;
            request = http::parse_request_head(*head);
            request.remote_endpoint = remote_endpoint_;

            const auto length = http::request_body_length(request.headers);
            if (length.framing != http::BodyFraming::None && http::expects_continue(request))
            {
                if (length.framing == http::BodyFraming::ContentLength && length.length > max_request_body_)
                {
                    throw http::HttpError(http::status::kPayloadTooLarge, "Message body exceeds limit");
                }
                send("HTTP/1.1 100 Continue\r\n\r\n");
            }
            http::read_body(socket_, buffer_, length, max_request_body_, [&request](std::string_view piece)
                            { request.body.append(piece); });
        }
        catch (const http::HttpError &ex)
        {
            spdlog::info("Rejecting request from {}: {}", remote_endpoint_, ex.what());
            reply_error(ex.status(), http::reason_phrase(ex.status()));
            return false;
        }

        http::StreamResponseWriter writer([this](std::string_view data)
                                          { send(data); },
                                          request);
        try
        {
            handler_->serve(writer, request);
        }
        catch (const std::system_error &)
        {
            throw;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Handler failed for {} {} from {}: {}", request.method, request.path, remote_endpoint_,
                          ex.what());
            if (writer.committed())
            {
                // Part of the response is on the wire; the framing cannot be repaired.
                return false;
            }
            writer.headers().set("Connection", "close");
            http::write_error(writer, http::status::kInternalServerError, "Internal Server Error");
        }
        writer.finish();
        return writer.keep_alive() && !stopping_;
    }

    void Connection::send(std::string_view data)
    {
        asio::write(socket_, asio::buffer(data.data(), data.size()));
    }

    void Connection::reply_error(int status, std::string_view message)
    {
        http::Request placeholder;
        placeholder.headers.set("Connection", "close");
        http::StreamResponseWriter writer([this](std::string_view data)
                                          { send(data); },
                                          placeholder);
        try
        {
            http::write_error(writer, status, message);
            writer.finish();
        }
        catch (const std::system_error &ex)
        {
            spdlog::debug("Could not send {} to {}: {}", status, remote_endpoint_, ex.what());
        }
    }

} // namespace atlas::server
