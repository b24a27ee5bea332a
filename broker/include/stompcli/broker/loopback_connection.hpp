#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "stompcli/connection.hpp"

namespace stompcli::broker
{

    // In-process connection: messages sent to a destination are routed to the
    // local subscriptions instead of a remote server. Every listener callback
    // runs on one delivery thread, in the order the events were produced.
    class LoopbackConnection : public Connection
    {
    public:
        LoopbackConnection(HostAndPort endpoint, std::optional<std::string> login);
        ~LoopbackConnection() override;

        LoopbackConnection(const LoopbackConnection &) = delete;
        LoopbackConnection &operator=(const LoopbackConnection &) = delete;

        void start() override;
        void connect(bool wait) override;
        void disconnect() override;
        bool is_connected() const override;

        void send(const std::string &destination, const std::string &message,
                  const std::optional<std::string> &transaction, const Headers &extra_headers) override;
        void subscribe(const std::string &destination, AckMode ack) override;
        void unsubscribe(const std::string &destination) override;
        void ack(const Headers &headers, const std::optional<std::string> &transaction) override;

        std::string begin() override;
        void commit(const std::string &transaction) override;
        void abort(const std::string &transaction) override;

        void set_listener(const std::string &name, std::shared_ptr<ConnectionListener> listener) override;
        std::shared_ptr<ConnectionListener> get_listener(const std::string &name) const override;
        void remove_listener(const std::string &name) override;

        // Blocks until everything queued so far has been delivered. A no-op
        // when called from the delivery thread itself.
        void drain();

    private:
        struct Subscription
        {
            std::string id;
            AckMode ack{};
        };

        struct PendingSend
        {
            std::string destination;
            std::string body;
            Headers headers;
        };

        void require_connected() const;
        void route(const PendingSend &send);
        void queue_error(const std::string &message, const std::string &detail);
        void queue(InboundEvent inbound);
        void queue_send_notice(PendingSend send);
        std::vector<std::shared_ptr<ConnectionListener>> listeners() const;

        HostAndPort endpoint_;
        std::optional<std::string> login_;

        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_;
        std::thread delivery_thread_;

        mutable std::mutex mutex_;
        bool connected_{false};
        std::string session_id_;
        std::uint64_t message_counter_{0};
        std::uint64_t subscription_counter_{0};
        std::map<std::string, Subscription> subscriptions_;
        std::map<std::string, std::vector<PendingSend>> transactions_;
        std::set<std::string> unacked_;

        mutable std::mutex listeners_mutex_;
        std::map<std::string, std::shared_ptr<ConnectionListener>> listeners_;
    };

} // namespace stompcli::broker
