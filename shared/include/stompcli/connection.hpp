/**
 * stompcli - The capability set a messaging connection exposes to the console
 * session, and the listener interface through which it delivers events.
 */
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "stompcli/events.hpp"

namespace stompcli
{

    class NotConnectedError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConnectionListener
    {
    public:
        virtual ~ConnectionListener() = default;

        virtual void on_connecting(const HostAndPort & /*host_and_port*/) {}
        virtual void on_connected(const Headers & /*headers*/, const std::string & /*body*/) {}
        virtual void on_disconnected() {}
        virtual void on_message(const Headers & /*headers*/, const std::string & /*body*/) {}
        virtual void on_error(const Headers & /*headers*/, const std::string & /*body*/) {}
        virtual void on_receipt(const Headers & /*headers*/, const std::string & /*body*/) {}
        virtual void on_send(const std::string & /*destination*/, const Headers & /*headers*/,
                             const std::string & /*body*/) {}
    };

    void deliver(ConnectionListener &listener, const InboundEvent &inbound);

    class Connection
    {
    public:
        virtual ~Connection() = default;

        // Announces the connection attempt to every listener (on_connecting).
        virtual void start() = 0;
        virtual void connect(bool wait) = 0;
        virtual void disconnect() = 0;
        virtual bool is_connected() const = 0;

        virtual void send(const std::string &destination, const std::string &message,
                          const std::optional<std::string> &transaction, const Headers &extra_headers) = 0;
        virtual void subscribe(const std::string &destination, AckMode ack) = 0;
        virtual void unsubscribe(const std::string &destination) = 0;
        virtual void ack(const Headers &headers, const std::optional<std::string> &transaction) = 0;

        virtual std::string begin() = 0;
        virtual void commit(const std::string &transaction) = 0;
        virtual void abort(const std::string &transaction) = 0;

        virtual void set_listener(const std::string &name, std::shared_ptr<ConnectionListener> listener) = 0;
        virtual std::shared_ptr<ConnectionListener> get_listener(const std::string &name) const = 0;
        virtual void remove_listener(const std::string &name) = 0;
    };

} // namespace stompcli
