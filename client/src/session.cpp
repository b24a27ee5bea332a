#include "stompcli/client/session.hpp"

#include <utility>

namespace stompcli::client
{

    SessionController::SessionController(Connection &connection, Console &console, Logger logger,
                                         std::filesystem::path receive_directory)
        : connection_(connection),
          console_(console),
          presenter_(console),
          logger_(std::move(logger)),
          catalog_(CommandCatalog::standard()),
          receive_directory_(std::move(receive_directory)) {}

    void SessionController::start()
    {
        connection_.set_listener(kSessionListenerName, shared_from_this());
        connection_.start();
    }

    void SessionController::print(const std::string &line)
    {
        console_.print_line(line);
    }

    void SessionController::report(ErrorCode code, const std::string &message)
    {
        console_.print_line(message);
        logger_.log("error", to_string(code), ": ", message);
    }

} // namespace stompcli::client
