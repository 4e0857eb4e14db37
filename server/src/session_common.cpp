#include "session_common.hpp"

#include "sliceload/error_codes.hpp"

namespace sliceload::server::session_common
{

    sliceload::protocol::ResponseEnvelope make_response(sliceload::protocol::ResponseKind kind, nlohmann::json payload,
                                                        const std::optional<std::string> &request_id)
    {
        sliceload::protocol::ResponseEnvelope envelope;
        envelope.kind = kind;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = sliceload::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    sliceload::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id)
    {
        return make_response(sliceload::protocol::ResponseKind::Ok, std::move(payload), request_id);
    }

} // namespace sliceload::server::session_common
