#include "atlas/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>

#include <spdlog/spdlog.h>

#include "atlas/server/auth_gate.hpp"
#include "atlas/server/connection.hpp"
#include "atlas/server/content_type_hint.hpp"
#include "atlas/server/quota_reporter.hpp"
#include "atlas/server/upstream.hpp"

namespace atlas::server
{

    http::HandlerPtr make_pipeline(const ServerConfig &config, const CredentialStore &store,
                                   const UsageProvider &usage, http::HandlerPtr engine)
    {
        QuotaOptions quota{std::filesystem::absolute(config.data_dir), config.quota_bytes};
        return http::chain(std::move(engine), {
                                                  auth_gate(store, config.realm),
                                                  content_type_hint(),
                                                  quota_reporter(std::move(quota), usage),
                                              });
    }

    Server::Server(ServerConfig config, const CredentialStore &store, http::HandlerPtr engine)
        : config_(std::move(config)),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        if (!engine)
        {
            upstream_ = std::make_shared<UpstreamEngine>(config_.upstream);
            engine = upstream_;
        }
        handler_ = make_pipeline(config_, store, usage_, std::move(engine));

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with data root {}", config_.address, port_,
                     std::filesystem::absolute(config_.data_dir).string());
        spdlog::info("Forwarding WebDAV requests to {}:{}", config_.upstream.host, config_.upstream.port);
        if (config_.quota_bytes > 0)
        {
            spdlog::info("Quota: {} bytes ({:.2f} GiB)", config_.quota_bytes,
                         static_cast<double>(config_.quota_bytes) / (1024.0 * 1024.0 * 1024.0));
        }
        if (store.empty())
        {
            spdlog::warn("No users configured; every request will be rejected. Add one with 'atlas user add'");
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    Server::~Server()
    {
        stop_workers();
    }

    void Server::run()
    {
        accept_next();
        io_context_.run();
        stop_workers();
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::size_t Server::connection_count()
    {
        std::lock_guard lock(workers_mutex_);
        return workers_.size();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), handler_, config_.max_request_body);
            std::lock_guard lock(workers_mutex_);
            workers_.push_back(Worker{connection, std::thread([this, connection]
                                                              {
                connection->run();
                asio::post(io_context_, [this] { reap_finished(); }); })});
        }
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("Shutting down");
    }

    void Server::reap_finished()
    {
        std::lock_guard lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();)
        {
            if (it->connection->finished())
            {
                it->thread.join();
                it = workers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    void Server::stop_workers()
    {
        std::lock_guard lock(workers_mutex_);
        for (auto &worker : workers_)
        {
            worker.connection->stop();
        }

        const auto deadline = std::chrono::steady_clock::now() + kShutdownGrace;
        const auto all_finished = [this]
        {
            for (const auto &worker : workers_)
            {
                if (!worker.connection->finished())
                {
                    return false;
                }
            }
            return true;
        };
        while (!all_finished() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!all_finished())
        {
            spdlog::warn("Requests still running after {}s; closing them", kShutdownGrace.count());
            for (auto &worker : workers_)
            {
                worker.connection->force_close();
            }
            if (upstream_)
            {
                upstream_->cancel_all();
            }
        }

        for (auto &worker : workers_)
        {
            if (worker.thread.joinable())
            {
                worker.thread.join();
            }
        }
        workers_.clear();
    }

} // namespace atlas::server
