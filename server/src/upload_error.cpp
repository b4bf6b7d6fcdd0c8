#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    UploadError::UploadError(tusk::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace tusk::server
