/**
 * stompcli - Listener that counts connection activity.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "stompcli/connection.hpp"

namespace stompcli
{

    struct StatsSnapshot
    {
        std::uint64_t connections{};
        std::uint64_t disconnects{};
        std::uint64_t messages_received{};
        std::uint64_t messages_sent{};
        std::uint64_t errors{};
        std::uint64_t receipts{};
    };

    void to_json(nlohmann::json &json, const StatsSnapshot &snapshot);

    class StatsListener : public ConnectionListener
    {
    public:
        void on_connected(const Headers &headers, const std::string &body) override;
        void on_disconnected() override;
        void on_message(const Headers &headers, const std::string &body) override;
        void on_error(const Headers &headers, const std::string &body) override;
        void on_receipt(const Headers &headers, const std::string &body) override;
        void on_send(const std::string &destination, const Headers &headers, const std::string &body) override;

        StatsSnapshot snapshot() const;
        std::string to_string() const;

    private:
        std::atomic<std::uint64_t> connections_{0};
        std::atomic<std::uint64_t> disconnects_{0};
        std::atomic<std::uint64_t> messages_received_{0};
        std::atomic<std::uint64_t> messages_sent_{0};
        std::atomic<std::uint64_t> errors_{0};
        std::atomic<std::uint64_t> receipts_{0};
    };

} // namespace stompcli
