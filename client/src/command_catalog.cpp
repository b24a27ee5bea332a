#include "stompcli/client/command_catalog.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "stompcli/client/session.hpp"

namespace stompcli::client
{

    namespace
    {

        constexpr std::string_view kAbortUsage = R"(Usage:
    abort

Description:
    Roll back the transaction in progress.)";

        constexpr std::string_view kAckUsage = R"(Usage:
    ack <message-id>

Required Parameters:
    message-id - the id of the message being acknowledged

Description:
    Acknowledge consumption of a message received on a subscription with
    client acknowledgement. Inside a transaction the acknowledgement is part
    of the transaction.)";

        constexpr std::string_view kBeginUsage = R"(Usage:
    begin

Description:
    Start a transaction. Messages sent and acknowledged until commit or
    abort are handled atomically.)";

        constexpr std::string_view kCommitUsage = R"(Usage:
    commit

Description:
    Commit the transaction in progress.)";

        constexpr std::string_view kDisconnectUsage = R"(Usage:
    disconnect

Description:
    Gracefully disconnect from the server and leave the console.)";

        constexpr std::string_view kHelpUsage = R"(Usage:
    help [command]

Description:
    Display help for a command, or the list of available commands.
    Also available as 'man'.)";

        constexpr std::string_view kSendUsage = R"(Usage:
    send <destination> <message>

Required Parameters:
    destination - where to send the message
    message - the content to send; the remaining words are joined by spaces

Description:
    Send a message to a destination. Inside a transaction the message is
    delivered on commit.)";

        constexpr std::string_view kSendfileUsage = R"(Usage:
    sendfile <destination> <filename>

Required Parameters:
    destination - where to send the file
    filename - the local file to send

Description:
    Send the base64 encoded content of a file. The message carries a
    'filename' header so that a receiving console saves it to disk.)";

        constexpr std::string_view kStatsUsage = R"(Usage:
    stats [on|off]

Description:
    Record statistics on connections, messages sent and received, errors
    and receipts. Without an argument, print the current statistics.)";

        constexpr std::string_view kSubscribeUsage = R"(Usage:
    subscribe <destination> [ack]

Required Parameters:
    destination - the destination to subscribe to

Optional Parameters:
    ack - acknowledgement mode, 'auto' (default) or 'client'

Description:
    Register to receive messages sent to a destination. With 'client'
    acknowledgement every message must be confirmed with 'ack'.)";

        constexpr std::string_view kUnsubscribeUsage = R"(Usage:
    unsubscribe <destination>

Required Parameters:
    destination - the destination to unsubscribe from

Description:
    Remove an existing subscription.)";

        constexpr std::string_view kVersionUsage = R"(Usage:
    version

Description:
    Display the stompcli version. Also available as 'ver'.)";

    } // namespace

    CommandCatalog::CommandCatalog(std::vector<CommandEntry> commands, std::vector<CommandAlias> aliases)
        : commands_(std::move(commands)),
          aliases_(std::move(aliases))
    {
        std::sort(commands_.begin(), commands_.end(), [](const CommandEntry &lhs, const CommandEntry &rhs)
                  { return lhs.name < rhs.name; });
        for (std::size_t i = 1; i < commands_.size(); ++i)
        {
            if (commands_[i - 1].name == commands_[i].name)
            {
                throw std::invalid_argument("duplicate command " + std::string(commands_[i].name));
            }
        }
        for (const auto &alias : aliases_)
        {
            if (find(alias.target) == nullptr)
            {
                throw std::invalid_argument("alias " + std::string(alias.alias) + " has no target");
            }
        }
        names_.reserve(commands_.size());
        for (const auto &entry : commands_)
        {
            names_.emplace_back(entry.name);
        }
    }

    const CommandCatalog &CommandCatalog::standard()
    {
        static const CommandCatalog catalog(
            {
                {"abort", kAbortUsage, &SessionController::handle_abort},
                {"ack", kAckUsage, &SessionController::handle_ack},
                {"begin", kBeginUsage, &SessionController::handle_begin},
                {"commit", kCommitUsage, &SessionController::handle_commit},
                {"disconnect", kDisconnectUsage, &SessionController::handle_disconnect},
                {"help", kHelpUsage, &SessionController::handle_help},
                {"send", kSendUsage, &SessionController::handle_send},
                {"sendfile", kSendfileUsage, &SessionController::handle_sendfile},
                {"stats", kStatsUsage, &SessionController::handle_stats},
                {"subscribe", kSubscribeUsage, &SessionController::handle_subscribe},
                {"unsubscribe", kUnsubscribeUsage, &SessionController::handle_unsubscribe},
                {"version", kVersionUsage, &SessionController::handle_version},
            },
            {
                {"man", "help"},
                {"ver", "version"},
            });
        return catalog;
    }

    std::optional<std::string_view> CommandCatalog::describe(std::string_view name) const
    {
        const auto *entry = find(name);
        if (entry == nullptr)
        {
            return std::nullopt;
        }
        return entry->usage;
    }

    const CommandEntry *CommandCatalog::find(std::string_view name) const
    {
        for (const auto &alias : aliases_)
        {
            if (alias.alias == name)
            {
                name = alias.target;
                break;
            }
        }
        const auto it = std::lower_bound(commands_.begin(), commands_.end(), name,
                                         [](const CommandEntry &entry, std::string_view key)
                                         { return entry.name < key; });
        if (it == commands_.end() || it->name != name)
        {
            return nullptr;
        }
        return &*it;
    }

    std::vector<std::string> CommandCatalog::complete(std::string_view prefix) const
    {
        std::vector<std::string> matches;
        for (const auto &name : names_)
        {
            if (name.starts_with(prefix))
            {
                matches.push_back(name);
            }
        }
        return matches;
    }

} // namespace stompcli::client
