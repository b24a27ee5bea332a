/**
 * stompcli - Error taxonomy shared by the console session and its connections.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace stompcli
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        Usage = 1,
        StateConflict = 2,
        NotConnected = 3,
        Resource = 4,
        Protocol = 5,
        Internal = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace stompcli
