/**
 * SliceLoad - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sliceload/error_codes.hpp"
#include "sliceload/file_meta.hpp"

namespace sliceload::protocol
{

    enum class Command : std::uint8_t
    {
        CreateSession,
        UploadSlice,
        SessionMeta,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    // Ok and Continue map to 200 and 206: an accepted slice that completed the
    // session answers Ok, any other accepted slice answers Continue.
    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Continue = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct CreateSessionRequest
    {
        std::string file_name;
        std::string file_type;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string prefix;
        std::optional<StorageMode> storage{};
    };

    void to_json(nlohmann::json &json, const CreateSessionRequest &request);
    void from_json(const nlohmann::json &json, CreateSessionRequest &request);

    // The session's declared attributes travel with every slice so the server
    // can detect a client that is describing a different file.
    struct UploadSliceRequest
    {
        std::string file_id;
        std::string file_name;
        std::string file_type;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string slice_id;
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadSliceRequest &request);
    void from_json(const nlohmann::json &json, UploadSliceRequest &request);

    struct UploadSliceResponse
    {
        std::string slice_id;
        std::string sha1;
        bool complete{};
    };

    void to_json(nlohmann::json &json, const UploadSliceResponse &response);
    void from_json(const nlohmann::json &json, UploadSliceResponse &response);

    struct SessionMetaRequest
    {
        std::string file_id;
    };

    void to_json(nlohmann::json &json, const SessionMetaRequest &request);
    void from_json(const nlohmann::json &json, SessionMetaRequest &request);

} // namespace sliceload::protocol
