#include "sliceload/client/tcp_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <stdexcept>

#include "sliceload/client/errors.hpp"
#include "sliceload/error_codes.hpp"
#include "sliceload/framing.hpp"

namespace sliceload::client
{

    TcpTransport::TcpTransport(std::string host, std::uint16_t port, Logger &logger)
        : host_(std::move(host)), port_(port), logger_(logger) {}

    FileMeta TcpTransport::create_session(const protocol::CreateSessionRequest &request)
    {
        const auto response = rpc(protocol::Command::CreateSession, request);
        return response.payload.at("meta").get<FileMeta>();
    }

    SliceAck TcpTransport::upload_slice(const protocol::UploadSliceRequest &request)
    {
        const auto response = rpc(protocol::Command::UploadSlice, request);
        const auto body = response.payload.get<protocol::UploadSliceResponse>();
        return SliceAck{
            .complete = response.kind == protocol::ResponseKind::Ok,
            .sha1 = body.sha1,
        };
    }

    FileMeta TcpTransport::fetch_meta(const std::string &file_id)
    {
        const auto response = rpc(protocol::Command::SessionMeta, protocol::SessionMetaRequest{.file_id = file_id});
        return response.payload.at("meta").get<FileMeta>();
    }

    void TcpTransport::ping()
    {
        rpc(protocol::Command::Ping, nlohmann::json::object());
    }

    std::unique_ptr<TcpTransport::Connection> TcpTransport::checkout()
    {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty())
            {
                auto connection = std::move(idle_.back());
                idle_.pop_back();
                return connection;
            }
        }
        auto connection = std::make_unique<Connection>();
        asio::ip::tcp::resolver resolver(connection->io_context);
        const auto results = resolver.resolve(host_, std::to_string(port_));
        asio::connect(connection->socket, results);
        logger_.log("info", "connected to ", host_, ':', port_);
        return connection;
    }

    void TcpTransport::checkin(std::unique_ptr<Connection> connection)
    {
        std::lock_guard lock(mutex_);
        idle_.push_back(std::move(connection));
    }

    protocol::ResponseEnvelope TcpTransport::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        // An exception below destroys the connection with it.
        auto connection = checkout();
        const auto frame = protocol::encode_frame(nlohmann::json(envelope));
        asio::write(connection->socket, asio::buffer(frame));

        protocol::FrameHeader header{};
        asio::read(connection->socket, asio::buffer(header));
        const auto size = protocol::decode_frame_length(header);
        std::vector<char> buffer(size);
        asio::read(connection->socket, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            logger_.log("rpc", "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<protocol::ResponseEnvelope>();
        checkin(std::move(connection));

        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.log("rpc", "error=", sliceload::to_string(response.error), " status=",
                        sliceload::http_status(response.error), " msg=", response.message);
            throw RemoteError(response.error, response.message);
        }
        logger_.log("rpc", "success cmd=", protocol::to_string(command), " status=", protocol::to_string(response.kind));
        return response;
    }

    std::string TcpTransport::next_request_id()
    {
        return std::to_string(++request_counter_);
    }

} // namespace sliceload::client
