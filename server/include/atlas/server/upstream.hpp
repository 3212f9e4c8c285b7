#pragma once

#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

#include "atlas/http.hpp"
#include "atlas/server/config.hpp"

namespace atlas::server
{

    /// Bridges the middleware chain to an external WebDAV engine listening on
    /// an HTTP endpoint. One upstream connection per request; the response is
    /// streamed back through the caller's writer as it arrives.
    class UpstreamEngine : public http::Handler
    {
    public:
        explicit UpstreamEngine(Endpoint endpoint);

        void serve(http::ResponseWriter &writer, const http::Request &request) override;

        /// Request head sent upstream for request: hop-by-hop fields and
        /// Authorization removed, Host and absolute Destination re-pointed.
        /// PROPFIND asks for an unencoded body so it can be rewritten.
        std::string build_request_head(const http::Request &request) const;

        /// Aborts every exchange in flight and answers later requests with 502.
        /// Safe to call from any thread.
        void cancel_all();

        const Endpoint &endpoint() const noexcept { return endpoint_; }

    private:
        using NativeHandle = asio::ip::tcp::socket::native_handle_type;

        class ActiveExchange;

        std::string authority() const;

        Endpoint endpoint_;

        std::mutex active_mutex_;
        std::set<NativeHandle> active_;
        bool cancelled_{false};
    };

    bool is_hop_by_hop_header(std::string_view name) noexcept;

    /// Windows Explorer probes these in every folder; their 404s are noise.
    bool is_shell_probe(std::string_view path) noexcept;

} // namespace atlas::server
