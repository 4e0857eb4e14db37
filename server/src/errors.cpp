#include "sliceload/server/errors.hpp"

namespace sliceload::server
{

    UploadError::UploadError(sliceload::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace sliceload::server
