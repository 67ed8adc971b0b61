#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "mediadrop/server/assembler.hpp"
#include "mediadrop/server/config.hpp"
#include "mediadrop/server/hash_deduper.hpp"
#include "mediadrop/server/ingest_service.hpp"
#include "mediadrop/server/janitor.hpp"
#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/owner_directory.hpp"
#include "mediadrop/server/serial_allocator.hpp"
#include "mediadrop/server/storage_layout.hpp"
#include "mediadrop/server/upload_log.hpp"

namespace mediadrop::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void schedule_janitor();
        void schedule_owner_reload();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer janitor_timer_;
        asio::steady_timer owner_reload_timer_;

        StorageLayout layout_;
        OwnerDirectory owners_;
        ManifestStore manifests_;
        UploadLog upload_log_;
        HashDeduper deduper_;
        SerialAllocator allocator_;
        Assembler assembler_;
        IngestService ingest_;
        Janitor janitor_;

        std::vector<std::thread> workers_;
    };

} // namespace mediadrop::server
