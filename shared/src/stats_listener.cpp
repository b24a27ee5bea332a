#include "stompcli/stats_listener.hpp"

#include <sstream>

namespace stompcli
{

    void to_json(nlohmann::json &json, const StatsSnapshot &snapshot)
    {
        json = nlohmann::json{
            {"connections", snapshot.connections},
            {"disconnects", snapshot.disconnects},
            {"messages_received", snapshot.messages_received},
            {"messages_sent", snapshot.messages_sent},
            {"errors", snapshot.errors},
            {"receipts", snapshot.receipts},
        };
    }

    void StatsListener::on_connected(const Headers &, const std::string &)
    {
        ++connections_;
    }

    void StatsListener::on_disconnected()
    {
        ++disconnects_;
    }

    void StatsListener::on_message(const Headers &, const std::string &)
    {
        ++messages_received_;
    }

    void StatsListener::on_error(const Headers &, const std::string &)
    {
        ++errors_;
    }

    void StatsListener::on_receipt(const Headers &, const std::string &)
    {
        ++receipts_;
    }

    void StatsListener::on_send(const std::string &, const Headers &, const std::string &)
    {
        ++messages_sent_;
    }

    StatsSnapshot StatsListener::snapshot() const
    {
        return StatsSnapshot{
            .connections = connections_.load(),
            .disconnects = disconnects_.load(),
            .messages_received = messages_received_.load(),
            .messages_sent = messages_sent_.load(),
            .errors = errors_.load(),
            .receipts = receipts_.load(),
        };
    }

    std::string StatsListener::to_string() const
    {
        const auto stats = snapshot();
        std::ostringstream oss;
        oss << "Connections: " << stats.connections << '\n'
            << "Disconnects: " << stats.disconnects << '\n'
            << "Messages: " << stats.messages_received << '\n'
            << "Sent: " << stats.messages_sent << '\n'
            << "Errors: " << stats.errors << '\n'
            << "Receipts: " << stats.receipts;
        return oss.str();
    }

} // namespace stompcli
