#include "sliceload/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "sliceload/framing.hpp"
#include "session_common.hpp"

namespace sliceload::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_label_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    void Session::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        std::error_code ec;
        spdlog::debug("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = sliceload::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(sliceload::ErrorCode::InvalidPayload, ex.what());
                             }
                             buffer_.clear();
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        sliceload::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<sliceload::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(sliceload::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), sliceload::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case sliceload::protocol::Command::CreateSession:
            handle_create_session(envelope);
            break;
        case sliceload::protocol::Command::UploadSlice:
            handle_upload_slice(envelope);
            break;
        case sliceload::protocol::Command::SessionMeta:
            handle_session_meta(envelope);
            break;
        case sliceload::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(sliceload::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const sliceload::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(sliceload::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                              }
                          });
    }

    void Session::send_error(sliceload::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        sliceload::protocol::ResponseEnvelope envelope;
        envelope.kind = sliceload::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::handle_ping(const sliceload::protocol::RequestEnvelope &envelope)
    {
        send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_label_;
    }

} // namespace sliceload::server
