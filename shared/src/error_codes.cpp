#include "atlas/error_codes.hpp"

#include <array>
#include <utility>

namespace atlas
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 4> kDescriptions{{
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::StorageFailure, "storage_failure"},
        }};
    } // namespace

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace atlas
