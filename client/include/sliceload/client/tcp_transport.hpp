#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sliceload/client/logger.hpp"
#include "sliceload/client/transport.hpp"
#include "sliceload/protocol.hpp"

namespace sliceload::client
{

    /**
     * Blocking transport over the framed JSON protocol.
     *
     * Each call borrows a connection from a small pool, or opens a new one,
     * so concurrent slice workers each get their own socket. A connection
     * that saw a network or framing failure is dropped instead of returned.
     */
    class TcpTransport : public Transport
    {
    public:
        TcpTransport(std::string host, std::uint16_t port, Logger &logger);

        FileMeta create_session(const protocol::CreateSessionRequest &request) override;
        SliceAck upload_slice(const protocol::UploadSliceRequest &request) override;
        FileMeta fetch_meta(const std::string &file_id) override;

        void ping();

    private:
        struct Connection
        {
            asio::io_context io_context;
            asio::ip::tcp::socket socket{io_context};
        };

        std::unique_ptr<Connection> checkout();
        void checkin(std::unique_ptr<Connection> connection);

        // Returns OK and CONTINUE responses; throws RemoteError on ERROR.
        protocol::ResponseEnvelope rpc(protocol::Command command, const nlohmann::json &payload);
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        Logger &logger_;

        std::mutex mutex_;
        std::vector<std::unique_ptr<Connection>> idle_;
        std::atomic<std::uint64_t> request_counter_{0};
    };

} // namespace sliceload::client
