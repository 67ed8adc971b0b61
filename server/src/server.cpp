#include "mediadrop/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "mediadrop/server/session.hpp"

namespace mediadrop::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          janitor_timer_(io_context_),
          owner_reload_timer_(io_context_),
          layout_(config_.root),
          owners_(config_.credentials_file.value_or(layout_.default_credentials_path())),
          manifests_(layout_),
          upload_log_(layout_.upload_log_path()),
          deduper_(upload_log_),
          allocator_(layout_.store_dir(), AllocatorOptions{.stale_after = config_.lock_ttl, .max_probes = 1'000'000}),
          assembler_(layout_, manifests_),
          ingest_(layout_, manifests_, owners_, assembler_, deduper_, allocator_, upload_log_, config_.auto_assemble),
          janitor_(layout_, JanitorOptions{.lock_ttl = config_.lock_ttl, .temp_ttl = config_.temp_ttl})
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        spdlog::info("Owners: {} from {}", owners_.size(), owners_.path().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        janitor_.sweep_once();
        schedule_janitor();
        schedule_owner_reload();
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    std::uint16_t Server::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
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
            ServerServices services{ingest_, owners_, config_, port()};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        janitor_timer_.cancel();
        owner_reload_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

    void Server::schedule_janitor()
    {
        janitor_timer_.expires_after(config_.janitor_interval);
        janitor_timer_.async_wait([this](const std::error_code &ec)
                                  {
            if (ec)
            {
                return;
            }
            janitor_.sweep_once();
            schedule_janitor(); });
    }

    void Server::schedule_owner_reload()
    {
        owner_reload_timer_.expires_after(config_.owner_reload_interval);
        owner_reload_timer_.async_wait([this](const std::error_code &ec)
                                       {
            if (ec)
            {
                return;
            }
            owners_.reload_if_changed();
            schedule_owner_reload(); });
    }

} // namespace mediadrop::server
