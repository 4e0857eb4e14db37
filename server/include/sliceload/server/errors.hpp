#pragma once

#include <stdexcept>
#include <string>

#include "sliceload/error_codes.hpp"

namespace sliceload::server
{

    // Raised by the upload core; the connection layer turns it into an ERROR
    // response carrying code().
    class UploadError : public std::runtime_error
    {
    public:
        UploadError(sliceload::ErrorCode code, std::string message);

        sliceload::ErrorCode code() const noexcept { return code_; }

    private:
        sliceload::ErrorCode code_;
    };

} // namespace sliceload::server
