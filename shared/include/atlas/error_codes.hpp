/**
 * Atlas - Error codes shared by the credential store, configuration and HTTP layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace atlas
{

    enum class ErrorCode : std::uint16_t
    {
        InvalidArgument = 1,
        InvalidPayload = 2,
        AlreadyExists = 3,
        StorageFailure = 4
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace atlas
