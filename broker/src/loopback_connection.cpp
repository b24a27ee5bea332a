#include "stompcli/broker/loopback_connection.hpp"

#include <asio/post.hpp>

#include <future>
#include <utility>

#include <spdlog/spdlog.h>

#include "stompcli/crypto.hpp"
#include "stompcli/version.hpp"

namespace stompcli::broker
{

    LoopbackConnection::LoopbackConnection(HostAndPort endpoint, std::optional<std::string> login)
        : endpoint_(std::move(endpoint)),
          login_(std::move(login)),
          work_(asio::make_work_guard(io_context_))
    {
        delivery_thread_ = std::thread([this]
                                       { io_context_.run(); });
    }

    LoopbackConnection::~LoopbackConnection()
    {
        work_.reset();
        if (delivery_thread_.joinable())
        {
            delivery_thread_.join();
        }
    }

    void LoopbackConnection::start()
    {
        for (const auto &listener : listeners())
        {
            listener->on_connecting(endpoint_);
        }
    }

    void LoopbackConnection::connect(bool wait)
    {
        {
            std::lock_guard lock(mutex_);
            if (connected_)
            {
                return;
            }
            connected_ = true;
            session_id_ = "session-" + crypto::random_token(6);
            Headers headers{
                {"session", session_id_},
                {"server", "stompcli-loopback/" + std::string(version())},
                {"host", endpoint_.host + ":" + std::to_string(endpoint_.port)},
                {"version", "1.0"},
            };
            if (login_)
            {
                headers.emplace_back("user-id", *login_);
            }
            queue(event::Connected{std::move(headers), ""});
            spdlog::debug("loopback connected as {}", session_id_);
        }
        if (wait)
        {
            drain();
        }
    }

    void LoopbackConnection::disconnect()
    {
        std::lock_guard lock(mutex_);
        require_connected();
        connected_ = false;
        subscriptions_.clear();
        transactions_.clear();
        unacked_.clear();
        queue(event::Disconnected{});
        spdlog::debug("loopback {} disconnected", session_id_);
    }

    bool LoopbackConnection::is_connected() const
    {
        std::lock_guard lock(mutex_);
        return connected_;
    }

    void LoopbackConnection::send(const std::string &destination, const std::string &message,
                                  const std::optional<std::string> &transaction, const Headers &extra_headers)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        PendingSend pending{destination, message, extra_headers};
        if (transaction)
        {
            auto it = transactions_.find(*transaction);
            if (it == transactions_.end())
            {
                queue_error("invalid transaction", "Transaction " + *transaction + " is not active");
                return;
            }
            it->second.push_back(pending);
        }
        else
        {
            route(pending);
        }
        if (const auto receipt = find_header(extra_headers, "receipt"))
        {
            queue(event::Receipt{{{"receipt-id", *receipt}}, ""});
        }
        queue_send_notice(std::move(pending));
    }

    void LoopbackConnection::subscribe(const std::string &destination, AckMode ack)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        subscriptions_[destination] = Subscription{"sub-" + std::to_string(++subscription_counter_), ack};
        spdlog::debug("loopback subscribed to {} ({})", destination, to_string(ack));
    }

    void LoopbackConnection::unsubscribe(const std::string &destination)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        if (subscriptions_.erase(destination) == 0)
        {
            queue_error("not subscribed", "No subscription for " + destination);
        }
    }

    void LoopbackConnection::ack(const Headers &headers, const std::optional<std::string> &transaction)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        const auto message_id = find_header(headers, "message-id");
        if (!message_id)
        {
            queue_error("missing message-id", "ACK requires a message-id header");
            return;
        }
        if (transaction && transactions_.find(*transaction) == transactions_.end())
        {
            queue_error("invalid transaction", "Transaction " + *transaction + " is not active");
            return;
        }
        if (unacked_.erase(*message_id) == 0)
        {
            queue_error("invalid ack", "Message " + *message_id + " is not awaiting acknowledgement");
        }
    }

    std::string LoopbackConnection::begin()
    {
        std::lock_guard lock(mutex_);
        require_connected();
        auto transaction = "tx-" + crypto::random_token(8);
        transactions_.emplace(transaction, std::vector<PendingSend>{});
        return transaction;
    }

    void LoopbackConnection::commit(const std::string &transaction)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        auto it = transactions_.find(transaction);
        if (it == transactions_.end())
        {
            queue_error("invalid transaction", "Transaction " + transaction + " is not active");
            return;
        }
        for (const auto &pending : it->second)
        {
            route(pending);
        }
        transactions_.erase(it);
    }

    void LoopbackConnection::abort(const std::string &transaction)
    {
        std::lock_guard lock(mutex_);
        require_connected();
        if (transactions_.erase(transaction) == 0)
        {
            queue_error("invalid transaction", "Transaction " + transaction + " is not active");
        }
    }

    void LoopbackConnection::set_listener(const std::string &name, std::shared_ptr<ConnectionListener> listener)
    {
        std::lock_guard lock(listeners_mutex_);
        listeners_[name] = std::move(listener);
    }

    std::shared_ptr<ConnectionListener> LoopbackConnection::get_listener(const std::string &name) const
    {
        std::lock_guard lock(listeners_mutex_);
        const auto it = listeners_.find(name);
        return it == listeners_.end() ? nullptr : it->second;
    }

    void LoopbackConnection::remove_listener(const std::string &name)
    {
        std::lock_guard lock(listeners_mutex_);
        listeners_.erase(name);
    }

    void LoopbackConnection::drain()
    {
        if (std::this_thread::get_id() == delivery_thread_.get_id())
        {
            return;
        }
        std::promise<void> done;
        auto future = done.get_future();
        asio::post(io_context_, [&done]
                   { done.set_value(); });
        future.wait();
    }

    void LoopbackConnection::require_connected() const
    {
        if (!connected_)
        {
            throw NotConnectedError("not connected");
        }
    }

    void LoopbackConnection::route(const PendingSend &send)
    {
        const auto it = subscriptions_.find(send.destination);
        if (it == subscriptions_.end())
        {
            spdlog::debug("loopback dropped message for {} (no subscription)", send.destination);
            return;
        }
        const auto message_id = session_id_ + "-" + std::to_string(++message_counter_);
        Headers headers{
            {"destination", send.destination},
            {"message-id", message_id},
            {"subscription", it->second.id},
        };
        if (it->second.ack == AckMode::Client)
        {
            headers.emplace_back("ack", std::string(to_string(AckMode::Client)));
            unacked_.insert(message_id);
        }
        for (const auto &header : send.headers)
        {
            if (header.first != "receipt")
            {
                headers.push_back(header);
            }
        }
        queue(event::Message{std::move(headers), send.body, send.destination});
    }

    void LoopbackConnection::queue_error(const std::string &message, const std::string &detail)
    {
        spdlog::debug("loopback error: {} ({})", message, detail);
        queue(event::Error{{{"message", message}}, detail});
    }

    void LoopbackConnection::queue(InboundEvent inbound)
    {
        asio::post(io_context_, [this, inbound = std::move(inbound)]
                   {
            for (const auto &listener : listeners())
            {
                try
                {
                    deliver(*listener, inbound);
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("listener failed on {}: {}", label(inbound), ex.what());
                }
            } });
    }

    void LoopbackConnection::queue_send_notice(PendingSend send)
    {
        asio::post(io_context_, [this, send = std::move(send)]
                   {
            for (const auto &listener : listeners())
            {
                try
                {
                    listener->on_send(send.destination, send.headers, send.body);
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("listener failed on send notice: {}", ex.what());
                }
            } });
    }

    std::vector<std::shared_ptr<ConnectionListener>> LoopbackConnection::listeners() const
    {
        std::lock_guard lock(listeners_mutex_);
        std::vector<std::shared_ptr<ConnectionListener>> result;
        result.reserve(listeners_.size());
        for (const auto &[name, listener] : listeners_)
        {
            result.push_back(listener);
        }
        return result;
    }

} // namespace stompcli::broker
