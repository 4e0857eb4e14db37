#pragma once

#include <asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sliceload/error_codes.hpp"
#include "sliceload/framing.hpp"
#include "sliceload/protocol.hpp"
#include "sliceload/server/upload_service.hpp"

namespace sliceload::server
{

    struct ServerServices
    {
        UploadService &uploads;
        std::chrono::seconds session_timeout;
    };

    // One client connection. Handlers run on the connection's strand, one
    // request at a time; concurrency between uploads comes from clients
    // opening several connections.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const sliceload::protocol::ResponseEnvelope &envelope);
        void send_error(sliceload::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        // Command handlers
        void handle_create_session(const sliceload::protocol::RequestEnvelope &envelope);
        void handle_upload_slice(const sliceload::protocol::RequestEnvelope &envelope);
        void handle_session_meta(const sliceload::protocol::RequestEnvelope &envelope);
        void handle_ping(const sliceload::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        sliceload::protocol::FrameHeader header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::string endpoint_label_;
    };

} // namespace sliceload::server
