#include "sliceload/protocol.hpp"

#include <array>
#include <stdexcept>

namespace sliceload::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 4> kCommandMappings{{
            {Command::CreateSession, "CREATE_SESSION"},
            {Command::UploadSlice, "UPLOAD_SLICE"},
            {Command::SessionMeta, "SESSION_META"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Continue, "CONTINUE"},
        }};

        // Numbers must arrive as JSON integers; strings such as "12" are rejected.
        std::uint64_t read_unsigned(const nlohmann::json &json, const char *key)
        {
            const auto &value = json.at(key);
            if (!value.is_number_unsigned())
            {
                throw std::invalid_argument(std::string("Field '") + key + "' must be a non-negative integer");
            }
            return value.get<std::uint64_t>();
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const CreateSessionRequest &request)
    {
        json = {
            {"file_name", request.file_name},
            {"file_type", request.file_type},
            {"file_size", request.file_size},
            {"chunk_size", request.chunk_size},
            {"prefix", request.prefix},
        };
        if (request.storage)
        {
            json["storage"] = to_string(*request.storage);
        }
    }

    void from_json(const nlohmann::json &json, CreateSessionRequest &request)
    {
        request.file_name = json.at("file_name").get<std::string>();
        request.file_type = json.at("file_type").get<std::string>();
        request.file_size = read_unsigned(json, "file_size");
        request.chunk_size = read_unsigned(json, "chunk_size");
        request.prefix = json.value("prefix", std::string{});
        if (auto it = json.find("storage"); it != json.end() && !it->is_null())
        {
            const auto label = it->get<std::string>();
            request.storage = storage_mode_from_string(label);
            if (!request.storage)
            {
                throw std::invalid_argument("Unknown storage mode: " + label);
            }
        }
        else
        {
            request.storage.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadSliceRequest &request)
    {
        json = {
            {"file_id", request.file_id},
            {"file_name", request.file_name},
            {"file_type", request.file_type},
            {"file_size", request.file_size},
            {"chunk_size", request.chunk_size},
            {"slice_id", request.slice_id},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadSliceRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
        request.file_name = json.at("file_name").get<std::string>();
        request.file_type = json.at("file_type").get<std::string>();
        request.file_size = read_unsigned(json, "file_size");
        request.chunk_size = read_unsigned(json, "chunk_size");
        request.slice_id = json.at("slice_id").get<std::string>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadSliceResponse &response)
    {
        json = {
            {"slice_id", response.slice_id},
            {"sha1", response.sha1},
            {"complete", response.complete},
        };
    }

    void from_json(const nlohmann::json &json, UploadSliceResponse &response)
    {
        response.slice_id = json.value("slice_id", std::string{});
        response.sha1 = json.value("sha1", std::string{});
        response.complete = json.value("complete", false);
    }

    void to_json(nlohmann::json &json, const SessionMetaRequest &request)
    {
        json = {{"file_id", request.file_id}};
    }

    void from_json(const nlohmann::json &json, SessionMetaRequest &request)
    {
        request.file_id = json.at("file_id").get<std::string>();
    }

} // namespace sliceload::protocol
