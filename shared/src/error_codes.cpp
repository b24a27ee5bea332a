#include "stompcli/error_codes.hpp"

#include <array>

namespace stompcli
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::Usage, "invalid_usage"},
            {ErrorCode::StateConflict, "state_conflict"},
            {ErrorCode::NotConnected, "not_connected"},
            {ErrorCode::Resource, "resource_error"},
            {ErrorCode::Protocol, "protocol_error"},
            {ErrorCode::Internal, "internal_error"},
        }};
    } // namespace

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

} // namespace stompcli
