#include "stompcli/client/console.hpp"

namespace stompcli::client
{

    void Console::print_line(std::string_view line)
    {
        write([line](std::ostream &out)
              { out << line << '\n'; });
    }

    void Console::prompt()
    {
        write([](std::ostream &out)
              { out << kPrompt; });
    }

} // namespace stompcli::client
