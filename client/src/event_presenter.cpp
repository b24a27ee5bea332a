#include "stompcli/client/event_presenter.hpp"

#include <exception>

namespace stompcli::client
{

    namespace
    {
        constexpr std::string_view kClearLine = "\r  \r";
    } // namespace

    void EventPresenter::present(std::string_view label, const Headers &headers, std::string_view body) noexcept
    {
        try
        {
            console_.write([&](std::ostream &out)
                           {
                out << kClearLine << label << '\n';
                for (const auto &[key, value] : headers)
                {
                    out << key << ": " << value << '\n';
                }
                out << '\n';
                out.write(body.data(), static_cast<std::streamsize>(body.size()));
                out << '\n' << kPrompt; });
        }
        catch (const std::exception &)
        {
            // rendering is best effort
        }
    }

    void EventPresenter::notice(std::string_view line) noexcept
    {
        try
        {
            console_.write([line](std::ostream &out)
                           { out << kClearLine << line << '\n'
                                 << kPrompt; });
        }
        catch (const std::exception &)
        {
            // best effort
        }
    }

} // namespace stompcli::client
