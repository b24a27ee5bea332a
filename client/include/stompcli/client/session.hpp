#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stompcli/client/command_catalog.hpp"
#include "stompcli/client/console.hpp"
#include "stompcli/client/event_presenter.hpp"
#include "stompcli/client/logger.hpp"
#include "stompcli/connection.hpp"
#include "stompcli/error_codes.hpp"

namespace stompcli::client
{

    inline constexpr const char *kSessionListenerName = "session";
    inline constexpr const char *kStatsListenerName = "stats";

    // Operator commands run on the foreground thread only; the listener
    // callbacks run on the connection's delivery thread and never touch the
    // transaction or listener state.
    class SessionController : public ConnectionListener,
                              public std::enable_shared_from_this<SessionController>
    {
    public:
        using Args = std::vector<std::string>;

        SessionController(Connection &connection, Console &console, Logger logger,
                          std::filesystem::path receive_directory = {});

        // Registers this controller with the connection and lets the
        // connection establish the link through on_connecting.
        void start();

        const std::optional<std::string> &transaction() const { return transaction_id_; }

        void handle_abort(const Args &args);
        void handle_ack(const Args &args);
        void handle_begin(const Args &args);
        void handle_commit(const Args &args);
        void handle_disconnect(const Args &args);
        void handle_help(const Args &args);
        void handle_send(const Args &args);
        void handle_sendfile(const Args &args);
        void handle_stats(const Args &args);
        void handle_subscribe(const Args &args);
        void handle_unsubscribe(const Args &args);
        void handle_version(const Args &args);

        void on_connecting(const HostAndPort &host_and_port) override;
        void on_connected(const Headers &headers, const std::string &body) override;
        void on_disconnected() override;
        void on_message(const Headers &headers, const std::string &body) override;
        void on_error(const Headers &headers, const std::string &body) override;
        void on_receipt(const Headers &headers, const std::string &body) override;

    private:
        void print(const std::string &line);
        void report(ErrorCode code, const std::string &message);

        Connection &connection_;
        Console &console_;
        EventPresenter presenter_;
        Logger logger_;
        const CommandCatalog &catalog_;
        std::filesystem::path receive_directory_;
        std::optional<std::string> transaction_id_;
    };

} // namespace stompcli::client
