#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "atlas/http.hpp"

namespace atlas::server
{

    /// One accepted client. run() serves requests sequentially on the calling
    /// thread until the peer closes, asks to close, or an I/O error occurs.
    class Connection
    {
    public:
        Connection(asio::ip::tcp::socket socket, http::HandlerPtr handler, std::uint64_t max_request_body);

        void run();

        /// Asks run() to return: an idle connection is shut down at once, one
        /// that is serving a request closes after the response. Safe to call
        /// from any thread.
        void stop();

        /// Shuts the connection down even mid-request. Safe to call from any thread.
        void force_close();

        bool finished() const noexcept { return finished_.load(); }

        const std::string &remote_endpoint() const noexcept { return remote_endpoint_; }

    private:
        /// Returns false when the connection must not be reused.
        bool serve_one();

        void send(std::string_view data);
        void reply_error(int status, std::string_view message);

        asio::ip::tcp::socket socket_;
        http::HandlerPtr handler_;
        std::uint64_t max_request_body_;
        asio::streambuf buffer_;
        std::string remote_endpoint_;
        // Captured at construction; other threads shut down through the
        // descriptor and never touch socket_ itself.
        asio::ip::tcp::socket::native_handle_type native_handle_;
        std::atomic<bool> busy_{false};
        std::atomic<bool> stopping_{false};
        std::atomic<bool> finished_{false};
    };

} // namespace atlas::server
