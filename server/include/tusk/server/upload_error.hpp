#pragma once

#include <stdexcept>
#include <string>

#include "tusk/error_codes.hpp"

namespace tusk::server
{

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(tusk::ErrorCode code, std::string message);

        tusk::ErrorCode code() const noexcept { return code_; }

    private:
        tusk::ErrorCode code_;
    };

} // namespace tusk::server
