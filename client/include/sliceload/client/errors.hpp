#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "sliceload/error_codes.hpp"

namespace sliceload::client
{

    // The server answered with an ERROR envelope.
    class RemoteError : public std::runtime_error
    {
    public:
        RemoteError(sliceload::ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        sliceload::ErrorCode code() const noexcept { return code_; }

        int http_status() const noexcept { return sliceload::http_status(code_); }

    private:
        sliceload::ErrorCode code_;
    };

    // Raised when the cancellation token was observed before a slice started.
    class UserCanceledError : public std::runtime_error
    {
    public:
        UserCanceledError() : std::runtime_error("upload canceled by user") {}
    };

    class ChecksumMismatchError : public std::runtime_error
    {
    public:
        explicit ChecksumMismatchError(std::string slice_id)
            : std::runtime_error("checksum mismatch on slice " + slice_id + " could not be repaired"),
              slice_id_(std::move(slice_id)) {}

        const std::string &slice_id() const noexcept { return slice_id_; }

    private:
        std::string slice_id_;
    };

} // namespace sliceload::client
