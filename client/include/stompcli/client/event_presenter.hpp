#pragma once

#include <string_view>

#include "stompcli/client/console.hpp"
#include "stompcli/events.hpp"

namespace stompcli::client
{

    class EventPresenter
    {
    public:
        explicit EventPresenter(Console &console) : console_(console) {}

        // Clears whatever the operator has typed on the current line, prints
        // the event and redraws an empty prompt. Never throws.
        void present(std::string_view label, const Headers &headers, std::string_view body) noexcept;

        void notice(std::string_view line) noexcept;

    private:
        Console &console_;
    };

} // namespace stompcli::client
