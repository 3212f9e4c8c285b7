#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "atlas/http.hpp"
#include "atlas/server/config.hpp"
#include "atlas/server/credential_store.hpp"
#include "atlas/server/usage.hpp"

namespace atlas::server
{

    class Connection;
    class UpstreamEngine;

    /// Auth gate -> content-type hint -> quota reporter -> engine.
    http::HandlerPtr make_pipeline(const ServerConfig &config, const CredentialStore &store,
                                   const UsageProvider &usage, http::HandlerPtr engine);

    class Server
    {
    public:
        /// engine defaults to an UpstreamEngine for config.upstream.
        Server(ServerConfig config, const CredentialStore &store, http::HandlerPtr engine = nullptr);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        void run();

        /// Ends run() as a signal would. Safe to call from any thread.
        void stop();

        /// Bound port; differs from the configured one when that was 0.
        std::uint16_t port() const noexcept { return port_; }

        std::size_t connection_count();

        /// How long shutdown waits for requests in flight before cutting them off.
        static constexpr std::chrono::seconds kShutdownGrace{5};

    private:
        struct Worker
        {
            std::shared_ptr<Connection> connection;
            std::thread thread;
        };

        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void reap_finished();
        void stop_workers();

        ServerConfig config_;
        SystemUsageProvider usage_;
        std::shared_ptr<UpstreamEngine> upstream_;
        http::HandlerPtr handler_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::uint16_t port_{0};

        std::mutex workers_mutex_;
        std::list<Worker> workers_;
    };

} // namespace atlas::server
