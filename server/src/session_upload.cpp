#include "sliceload/server/session.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sliceload/encoding/base64.hpp"
#include "sliceload/server/errors.hpp"
#include "session_common.hpp"

namespace sliceload::server
{

    void Session::handle_create_session(const sliceload::protocol::RequestEnvelope &envelope)
    {
        try
        {
            if (services_.session_timeout.count() > 0)
            {
                const auto reaped = services_.uploads.reap_stale(services_.session_timeout);
                if (reaped > 0)
                {
                    spdlog::info("Reaped {} abandoned upload session(s)", reaped);
                }
            }
            const auto request = envelope.payload.get<sliceload::protocol::CreateSessionRequest>();
            const auto meta = services_.uploads.create_session(request);
            nlohmann::json payload;
            payload["meta"] = meta;
            send_response(session_common::make_ok_response(payload, envelope.request_id));
        }
        catch (const UploadError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(sliceload::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_slice(const sliceload::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<sliceload::protocol::UploadSliceRequest>();
            const auto data = sliceload::encoding::decode_base64(request.data_base64);
            if (!data)
            {
                send_error(sliceload::ErrorCode::InvalidPayload, "Invalid slice data", envelope.request_id);
                return;
            }

            const SliceUpload upload{
                .file_id = request.file_id,
                .file_name = request.file_name,
                .file_type = request.file_type,
                .file_size = request.file_size,
                .chunk_size = request.chunk_size,
                .slice_id = request.slice_id,
            };
            const auto receipt = services_.uploads.upload_slice(upload, *data);

            const sliceload::protocol::UploadSliceResponse response{
                .slice_id = receipt.slice_id,
                .sha1 = receipt.sha1,
                .complete = receipt.outcome == SliceOutcome::Completed,
            };
            const auto kind = response.complete ? sliceload::protocol::ResponseKind::Ok
                                                : sliceload::protocol::ResponseKind::Continue;
            send_response(session_common::make_response(kind, nlohmann::json(response), envelope.request_id));
        }
        catch (const UploadError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(sliceload::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_session_meta(const sliceload::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<sliceload::protocol::SessionMetaRequest>();
            const auto meta = services_.uploads.session_meta(request.file_id);
            nlohmann::json payload;
            payload["meta"] = meta;
            send_response(session_common::make_ok_response(payload, envelope.request_id));
        }
        catch (const UploadError &err)
        {
            send_error(err.code(), err.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(sliceload::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(sliceload::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace sliceload::server
