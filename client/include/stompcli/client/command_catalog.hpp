#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stompcli::client
{

    class SessionController;

    using CommandHandler = void (SessionController::*)(const std::vector<std::string> &);

    struct CommandEntry
    {
        std::string_view name;
        std::string_view usage;
        CommandHandler handler{};
    };

    struct CommandAlias
    {
        std::string_view alias;
        std::string_view target;
    };

    // Static registry of the operator commands. Aliases resolve to their
    // target but are not listed.
    class CommandCatalog
    {
    public:
        CommandCatalog(std::vector<CommandEntry> commands, std::vector<CommandAlias> aliases);

        static const CommandCatalog &standard();

        const std::vector<std::string> &list() const { return names_; }
        std::optional<std::string_view> describe(std::string_view name) const;
        const CommandEntry *find(std::string_view name) const;
        std::vector<std::string> complete(std::string_view prefix) const;

    private:
        std::vector<CommandEntry> commands_;
        std::vector<CommandAlias> aliases_;
        std::vector<std::string> names_;
    };

} // namespace stompcli::client
