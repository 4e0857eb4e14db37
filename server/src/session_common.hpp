#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sliceload/protocol.hpp"

namespace sliceload::server::session_common
{

    sliceload::protocol::ResponseEnvelope make_response(sliceload::protocol::ResponseKind kind, nlohmann::json payload,
                                                        const std::optional<std::string> &request_id);

    sliceload::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id);

} // namespace sliceload::server::session_common
