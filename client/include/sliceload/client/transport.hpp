#pragma once

#include <string>

#include "sliceload/file_meta.hpp"
#include "sliceload/protocol.hpp"

namespace sliceload::client
{

    struct SliceAck
    {
        // True when this slice completed the session (OK rather than CONTINUE).
        bool complete{};
        std::string sha1;
    };

    /**
     * Request/response binding used by the uploader. Implementations must be
     * safe to call from several slice workers at once and report server-side
     * failures as RemoteError.
     */
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual FileMeta create_session(const protocol::CreateSessionRequest &request) = 0;

        virtual SliceAck upload_slice(const protocol::UploadSliceRequest &request) = 0;

        virtual FileMeta fetch_meta(const std::string &file_id) = 0;
    };

} // namespace sliceload::client
