#include "stompcli/client/command_loop.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "stompcli/client/session.hpp"
#include "stompcli/error_codes.hpp"

namespace stompcli::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        bool is_exit_line(const std::string &line)
        {
            return line.starts_with("quit") || line.starts_with("disconnect");
        }

    } // namespace

    CommandLoop::CommandLoop(SessionController &session, const CommandCatalog &catalog, Console &console,
                             std::istream &input, Logger logger)
        : session_(session),
          catalog_(catalog),
          console_(console),
          input_(input),
          logger_(std::move(logger)) {}

    int CommandLoop::run()
    {
        while (state_.load() != State::Exiting)
        {
            console_.prompt();
            std::string line;
            if (!std::getline(input_, line))
            {
                console_.print_line("");
                logger_.log("info", "end of input");
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            if (is_exit_line(line))
            {
                break;
            }
            state_.store(State::Dispatching);
            dispatch(line);
            auto expected = State::Dispatching;
            state_.compare_exchange_strong(expected, State::Reading);
        }
        shutdown();
        return 0;
    }

    void CommandLoop::shutdown()
    {
        state_.store(State::Exiting);
        if (shut_down_.exchange(true))
        {
            return;
        }
        session_.handle_disconnect({"disconnect"});
    }

    void CommandLoop::dispatch(const std::string &line)
    {
        const auto tokens = split_tokens(line);
        if (tokens.empty())
        {
            return;
        }
        const auto *command = catalog_.find(tokens[0]);
        if (command == nullptr)
        {
            console_.print_line("Unrecognized command");
            return;
        }

        try
        {
            (session_.*(command->handler))(tokens);
        }
        catch (const NotConnectedError &ex)
        {
            console_.print_line("ERROR: " + std::string(to_string(ErrorCode::NotConnected)));
            console_.print_line(ex.what());
            logger_.log("error", "command failed: ", ex.what());
        }
        catch (const std::exception &ex)
        {
            console_.print_line("ERROR: " + std::string(to_string(ErrorCode::Internal)));
            console_.print_line(ex.what());
            logger_.log("error", "command failed: ", ex.what());
        }
    }

} // namespace stompcli::client
