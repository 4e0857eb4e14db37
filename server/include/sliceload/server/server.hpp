#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <thread>
#include <vector>

#include "sliceload/server/config.hpp"
#include "sliceload/server/layout.hpp"
#include "sliceload/server/lock_registry.hpp"
#include "sliceload/server/upload_service.hpp"

namespace sliceload::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        // Safe to call from any thread.
        void stop();

        // Bound port; differs from config when it asked for port 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        StorageLayout layout_;
        SessionLockRegistry locks_;
        UploadService upload_service_;

        std::vector<std::thread> workers_;
    };

} // namespace sliceload::server
