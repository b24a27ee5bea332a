#pragma once

#include <atomic>
#include <istream>
#include <string>

#include "stompcli/client/command_catalog.hpp"
#include "stompcli/client/console.hpp"
#include "stompcli/client/logger.hpp"

namespace stompcli::client
{

    class SessionController;

    class CommandLoop
    {
    public:
        enum class State
        {
            Reading,
            Dispatching,
            Exiting
        };

        CommandLoop(SessionController &session, const CommandCatalog &catalog, Console &console, std::istream &input,
                    Logger logger);

        // Returns the process exit code once the operator quits, input ends
        // or shutdown() is requested.
        int run();

        // Disconnects exactly once, whichever of the loop or the interrupt
        // handler gets here first.
        void shutdown();

        State state() const { return state_.load(); }

    private:
        void dispatch(const std::string &line);

        SessionController &session_;
        const CommandCatalog &catalog_;
        Console &console_;
        std::istream &input_;
        Logger logger_;
        std::atomic<State> state_{State::Reading};
        std::atomic<bool> shut_down_{false};
    };

} // namespace stompcli::client
