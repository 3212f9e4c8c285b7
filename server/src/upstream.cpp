#include "atlas/server/upstream.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <optional>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <sys/socket.h>

#include <spdlog/spdlog.h>

#include "atlas/http_io.hpp"

namespace atlas::server
{

    namespace
    {

        constexpr std::array<std::string_view, 9> kHopByHop{
            "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authenticate", "Proxy-Authorization",
            "TE", "Trailer", "Transfer-Encoding", "Upgrade",
        };

        constexpr std::array<std::string_view, 4> kShellProbes{
            "desktop.ini", "autorun.inf", "thumbs.db", "folder.jpg",
        };

        void log_upstream_status(const http::Request &request, const http::ResponseHead &head)
        {
            if (head.status < 400)
            {
                return;
            }
            if (head.status == http::status::kNotFound && is_shell_probe(request.path))
            {
                return;
            }
            if (head.status >= 500)
            {
                spdlog::warn("WebDAV Error: {} {}: {} {}", request.method, request.path, head.status, head.reason);
            }
            else
            {
                spdlog::info("WebDAV {} {}: {} {}", request.method, request.path, head.status, head.reason);
            }
        }

    } // namespace

    bool is_hop_by_hop_header(std::string_view name) noexcept
    {
        return std::any_of(kHopByHop.begin(), kHopByHop.end(), [name](std::string_view hop)
                           { return http::iequals(hop, name); });
    }

    bool is_shell_probe(std::string_view path) noexcept
    {
        const auto slash = path.find_last_of('/');
        const auto base = slash == std::string_view::npos ? path : path.substr(slash + 1);
        return std::any_of(kShellProbes.begin(), kShellProbes.end(), [base](std::string_view probe)
                           { return http::iequals(probe, base); });
    }

    // Registers a connected upstream socket for the lifetime of one exchange so
    // that cancel_all() can shut it down from another thread.
    class UpstreamEngine::ActiveExchange
    {
    public:
        ActiveExchange(UpstreamEngine &engine, NativeHandle handle) : engine_(engine), handle_(handle)
        {
            std::lock_guard lock(engine_.active_mutex_);
            if (engine_.cancelled_)
            {
                throw http::HttpError(http::status::kBadGateway, "Upstream exchanges cancelled");
            }
            engine_.active_.insert(handle_);
        }

        ~ActiveExchange()
        {
            std::lock_guard lock(engine_.active_mutex_);
            engine_.active_.erase(handle_);
        }

        ActiveExchange(const ActiveExchange &) = delete;
        ActiveExchange &operator=(const ActiveExchange &) = delete;

    private:
        UpstreamEngine &engine_;
        NativeHandle handle_;
    };

    UpstreamEngine::UpstreamEngine(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

    void UpstreamEngine::cancel_all()
    {
        std::lock_guard lock(active_mutex_);
        cancelled_ = true;
        // The descriptors stay open until their exchange unregisters, so
        // shutdown() cannot hit a reused descriptor.
        for (const auto handle : active_)
        {
            ::shutdown(handle, SHUT_RDWR);
        }
        if (!active_.empty())
        {
            spdlog::info("Cancelled {} upstream exchange(s)", active_.size());
        }
    }

    std::string UpstreamEngine::authority() const
    {
        if (endpoint_.host.find(':') != std::string::npos)
        {
            return "[" + endpoint_.host + "]:" + std::to_string(endpoint_.port);
        }
        return endpoint_.host + ":" + std::to_string(endpoint_.port);
    }

    std::string UpstreamEngine::build_request_head(const http::Request &request) const
    {
        std::string head = request.method + " " + request.target + " HTTP/1.1\r\n";
        head.append("Host: ").append(authority()).append("\r\n");

        for (const auto &[name, value] : request.headers)
        {
            if (is_hop_by_hop_header(name) || http::iequals(name, "Host") || http::iequals(name, "Authorization") ||
                http::iequals(name, "Content-Length") || http::iequals(name, "Expect"))
            {
                continue;
            }
            // Multistatus bodies are edited in place; compressed ones cannot be.
            if (request.method == http::method::kPropfind && http::iequals(name, "Accept-Encoding"))
            {
                continue;
            }
            if (http::iequals(name, "Destination") && (value.starts_with("http://") || value.starts_with("https://")))
            {
                const auto authority_start = value.find("//") + 2;
                const auto path_start = value.find('/', authority_start);
                const std::string path = path_start == std::string::npos ? "/" : value.substr(path_start);
                head.append(name).append(": http://").append(authority()).append(path).append("\r\n");
                continue;
            }
            head.append(name).append(": ").append(value).append("\r\n");
        }

        if (!request.body.empty() || request.headers.contains("Content-Length") ||
            request.headers.contains("Transfer-Encoding"))
        {
            head.append("Content-Length: ").append(std::to_string(request.body.size())).append("\r\n");
        }
        head.append("Connection: close\r\n\r\n");
        return head;
    }

    void UpstreamEngine::serve(http::ResponseWriter &writer, const http::Request &request)
    {
        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        asio::streambuf buffer(http::kMaxHeadSize);
        http::ResponseHead head;
        http::BodyLength length;
        std::optional<ActiveExchange> exchange;

        try
        {
            asio::ip::tcp::resolver resolver(io_context);
            asio::connect(socket, resolver.resolve(endpoint_.host, std::to_string(endpoint_.port)));
            exchange.emplace(*this, socket.native_handle());

            const auto request_head = build_request_head(request);
            asio::write(socket, asio::buffer(request_head));
            if (!request.body.empty())
            {
                asio::write(socket, asio::buffer(request.body));
            }

            // Interim 1xx responses are consumed here.
            do
            {
                const auto raw = http::read_head(socket, buffer);
                if (!raw)
                {
                    throw http::HttpError(http::status::kBadGateway, "Upstream closed the connection");
                }
                head = http::parse_response_head(*raw);
            } while (head.status / 100 == 1);
            length = http::response_body_length(request.method, head.status, head.headers);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upstream {} failed for {} {}: {}", authority(), request.method, request.path, ex.what());
            http::write_error(writer, http::status::kBadGateway, "Bad Gateway");
            return;
        }

        log_upstream_status(request, head);

        auto &headers = writer.headers();
        // A type hinted from the file name wins over the engine's guess for
        // file downloads.
        const bool keep_content_type = (request.method == http::method::kGet || request.method == http::method::kHead) &&
                                       headers.contains("Content-Type");
        for (const auto &[name, value] : head.headers)
        {
            if (keep_content_type && http::iequals(name, "Content-Type"))
            {
                continue;
            }
            headers.remove(name);
        }
        for (const auto &[name, value] : head.headers)
        {
            if (is_hop_by_hop_header(name) || (keep_content_type && http::iequals(name, "Content-Type")))
            {
                continue;
            }
            headers.add(name, value);
        }

        writer.write_header(head.status);
        http::read_body(socket, buffer, length, std::numeric_limits<std::uint64_t>::max(),
                        [&writer](std::string_view piece)
                        { writer.write(piece); });

        std::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }

} // namespace atlas::server
