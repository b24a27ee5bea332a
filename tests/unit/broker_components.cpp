#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "stompcli/broker/loopback_connection.hpp"
#include "stompcli/client/command_catalog.hpp"
#include "stompcli/client/command_loop.hpp"
#include "stompcli/client/console.hpp"
#include "stompcli/client/logger.hpp"
#include "stompcli/client/session.hpp"
#include "stompcli/stats_listener.hpp"

using namespace stompcli;
using stompcli::broker::LoopbackConnection;

void run_broker_component_tests();

namespace
{

    class RecordingListener : public ConnectionListener
    {
    public:
        void on_connected(const Headers &headers, const std::string &body) override
        {
            record(event::Connected{headers, body});
        }
        void on_disconnected() override
        {
            record(event::Disconnected{});
        }
        void on_message(const Headers &headers, const std::string &body) override
        {
            record(event::Message{headers, body, find_header(headers, "destination").value_or("")});
        }
        void on_error(const Headers &headers, const std::string &body) override
        {
            record(event::Error{headers, body});
        }
        void on_receipt(const Headers &headers, const std::string &body) override
        {
            record(event::Receipt{headers, body});
        }
        void on_send(const std::string &, const Headers &, const std::string &) override
        {
            std::lock_guard lock(mutex_);
            ++sends_;
        }

        std::vector<InboundEvent> events() const
        {
            std::lock_guard lock(mutex_);
            return events_;
        }

        std::vector<std::string> labels() const
        {
            std::vector<std::string> result;
            for (const auto &e : events())
            {
                result.emplace_back(label(e));
            }
            return result;
        }

        std::vector<event::Message> messages() const
        {
            std::vector<event::Message> result;
            for (const auto &e : events())
            {
                if (const auto *message = std::get_if<event::Message>(&e))
                {
                    result.push_back(*message);
                }
            }
            return result;
        }

        int sends() const
        {
            std::lock_guard lock(mutex_);
            return sends_;
        }

        void clear()
        {
            std::lock_guard lock(mutex_);
            events_.clear();
        }

    private:
        void record(InboundEvent event)
        {
            std::lock_guard lock(mutex_);
            events_.push_back(std::move(event));
        }

        mutable std::mutex mutex_;
        std::vector<InboundEvent> events_;
        int sends_{0};
    };

    struct Fixture
    {
        Fixture() : connection(HostAndPort{"broker.test", 61613}, std::string("alice"))
        {
            connection.set_listener("recorder", recorder);
            connection.connect(true);
            recorder->clear();
        }

        LoopbackConnection connection;
        std::shared_ptr<RecordingListener> recorder = std::make_shared<RecordingListener>();
    };

    template <typename Fn>
    bool throws_not_connected(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const NotConnectedError &)
        {
            return true;
        }
        return false;
    }

    void test_connect_delivers_connected_before_returning()
    {
        LoopbackConnection connection(HostAndPort{"broker.test", 61613}, std::string("alice"));
        auto recorder = std::make_shared<RecordingListener>();
        connection.set_listener("recorder", recorder);
        assert(!connection.is_connected());

        connection.connect(true);
        assert(connection.is_connected());
        const auto events = recorder->events();
        assert(events.size() == 1);
        const auto &connected = std::get<event::Connected>(events[0]);
        assert(find_header(connected.headers, "session").has_value());
        assert(find_header(connected.headers, "host") == std::optional<std::string>("broker.test:61613"));
        assert(find_header(connected.headers, "user-id") == std::optional<std::string>("alice"));

        connection.connect(true);
        assert(recorder->events().size() == 1);
    }

    void test_operations_require_connection()
    {
        LoopbackConnection connection(HostAndPort{"localhost", 61613}, std::nullopt);
        assert(throws_not_connected([&]
                                    { connection.send("/queue/a", "x", std::nullopt, {}); }));
        assert(throws_not_connected([&]
                                    { connection.subscribe("/queue/a", AckMode::Auto); }));
        assert(throws_not_connected([&]
                                    { connection.begin(); }));
        assert(throws_not_connected([&]
                                    { connection.disconnect(); }));
    }

    void test_messages_route_to_subscriptions()
    {
        Fixture f;
        f.connection.send("/queue/nobody", "dropped", std::nullopt, {});
        f.connection.subscribe("/queue/a", AckMode::Auto);
        f.connection.send("/queue/a", "hello", std::nullopt, {{"custom", "1"}});
        f.connection.drain();

        const auto messages = f.recorder->messages();
        assert(messages.size() == 1);
        assert(messages[0].body == "hello");
        assert(messages[0].destination == "/queue/a");
        assert(find_header(messages[0].headers, "message-id").has_value());
        assert(find_header(messages[0].headers, "subscription").has_value());
        assert(find_header(messages[0].headers, "custom") == std::optional<std::string>("1"));
        assert(!find_header(messages[0].headers, "ack").has_value());
        assert(f.recorder->sends() == 2);

        f.connection.unsubscribe("/queue/a");
        f.connection.send("/queue/a", "after", std::nullopt, {});
        f.connection.unsubscribe("/queue/a");
        f.connection.drain();
        assert(f.recorder->messages().size() == 1);
        assert(f.recorder->labels().back() == "ERROR");
    }

    void test_transactions_hold_sends_until_commit()
    {
        Fixture f;
        f.connection.subscribe("/queue/a", AckMode::Auto);

        const auto committed = f.connection.begin();
        f.connection.send("/queue/a", "one", committed, {});
        f.connection.send("/queue/a", "two", committed, {});
        f.connection.drain();
        assert(f.recorder->messages().empty());
        f.connection.commit(committed);
        f.connection.drain();
        const auto messages = f.recorder->messages();
        assert(messages.size() == 2);
        assert(messages[0].body == "one" && messages[1].body == "two");

        const auto aborted = f.connection.begin();
        assert(aborted != committed);
        f.connection.send("/queue/a", "three", aborted, {});
        f.connection.abort(aborted);
        f.connection.drain();
        assert(f.recorder->messages().size() == 2);

        f.recorder->clear();
        f.connection.commit(aborted);
        f.connection.send("/queue/a", "four", std::string("tx-unknown"), {});
        f.connection.drain();
        assert(f.recorder->labels() == (std::vector<std::string>{"ERROR", "ERROR"}));
    }

    void test_client_acknowledgement()
    {
        Fixture f;
        f.connection.subscribe("/queue/manual", AckMode::Client);
        f.connection.send("/queue/manual", "ack me", std::nullopt, {});
        f.connection.drain();
        const auto messages = f.recorder->messages();
        assert(messages.size() == 1);
        assert(find_header(messages[0].headers, "ack") == std::optional<std::string>("client"));
        const auto message_id = *find_header(messages[0].headers, "message-id");

        f.recorder->clear();
        f.connection.ack({{"message-id", message_id}}, std::nullopt);
        f.connection.drain();
        assert(f.recorder->events().empty());

        f.connection.ack({{"message-id", message_id}}, std::nullopt);
        f.connection.drain();
        assert(f.recorder->labels() == std::vector<std::string>{"ERROR"});
    }

    void test_receipts()
    {
        Fixture f;
        f.connection.subscribe("/queue/a", AckMode::Auto);
        f.connection.send("/queue/a", "with receipt", std::nullopt, {{"receipt", "r-42"}});
        f.connection.drain();
        assert(f.recorder->labels() == (std::vector<std::string>{"MESSAGE", "RECEIPT"}));
        const auto events = f.recorder->events();
        const auto &receipt = std::get<event::Receipt>(events[1]);
        assert(find_header(receipt.headers, "receipt-id") == std::optional<std::string>("r-42"));
        assert(!find_header(std::get<event::Message>(events[0]).headers, "receipt").has_value());
    }

    void test_disconnect()
    {
        Fixture f;
        f.connection.subscribe("/queue/a", AckMode::Auto);
        f.connection.disconnect();
        f.connection.drain();
        assert(!f.connection.is_connected());
        assert(f.recorder->labels() == std::vector<std::string>{"DISCONNECTED"});
        assert(throws_not_connected([&]
                                    { f.connection.send("/queue/a", "late", std::nullopt, {}); }));
        assert(throws_not_connected([&]
                                    { f.connection.disconnect(); }));
    }

    void test_destruction_delivers_queued_events()
    {
        auto recorder = std::make_shared<RecordingListener>();
        {
            LoopbackConnection connection(HostAndPort{"broker.test", 61613}, std::nullopt);
            connection.set_listener("recorder", recorder);
            connection.connect(true);
            connection.subscribe("/queue/a", AckMode::Auto);
            connection.send("/queue/a", "last words", std::nullopt, {});
            connection.disconnect();
        }
        assert((recorder->labels() == std::vector<std::string>{"CONNECTED", "MESSAGE", "DISCONNECTED"}));
    }

    void test_listener_registry()
    {
        Fixture f;
        assert(f.connection.get_listener("recorder") == f.recorder);
        assert(f.connection.get_listener("missing") == nullptr);
        f.connection.remove_listener("recorder");
        assert(f.connection.get_listener("recorder") == nullptr);
        f.connection.subscribe("/queue/a", AckMode::Auto);
        f.connection.send("/queue/a", "unheard", std::nullopt, {});
        f.connection.drain();
        assert(f.recorder->events().empty());
    }

    std::string run_session(LoopbackConnection &connection, const std::filesystem::path &receive_directory,
                            const std::string &script)
    {
        std::ostringstream out;
        client::Console console(out);
        auto session = std::make_shared<client::SessionController>(connection, console, client::Logger(std::nullopt),
                                                                   receive_directory);
        session->start();
        std::istringstream input(script);
        client::CommandLoop loop(*session, client::CommandCatalog::standard(), console, input,
                                 client::Logger(std::nullopt));
        assert(loop.run() == 0);
        connection.drain();
        connection.remove_listener(client::kSessionListenerName);
        return out.str();
    }

    void test_session_over_loopback()
    {
        LoopbackConnection connection(HostAndPort{"localhost", 61613}, std::nullopt);
        const auto output = run_session(connection, {},
                                        "subscribe /queue/test\n"
                                        "send /queue/test hello world\n"
                                        "begin\n"
                                        "send /queue/test inside transaction\n"
                                        "commit\n"
                                        "quit\n");
        assert(output.find("CONNECTED\n") != std::string::npos);
        assert(output.find("\r  \rMESSAGE\ndestination: /queue/test\n") != std::string::npos);
        assert(output.find("\n\nhello world\n> ") != std::string::npos);
        assert(output.find("\n\ninside transaction\n> ") != std::string::npos);
        assert(output.find("lost connection") != std::string::npos);
        assert(!connection.is_connected());
    }

    void test_file_transfer_over_loopback()
    {
        const auto root = std::filesystem::temp_directory_path() / "stompcli_loopback_transfer";
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root / "outbox");
        std::filesystem::create_directories(root / "inbox");
        const auto source = root / "outbox" / "image.bin";
        const std::string content("\x89PNG\r\n\x1a\n\x00\x00", 10);
        {
            std::ofstream out(source, std::ios::binary);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
        }

        LoopbackConnection connection(HostAndPort{"localhost", 61613}, std::nullopt);
        const std::string script = "subscribe /queue/files\n"
                                   "stats on\n"
                                   "sendfile /queue/files " +
                                   source.string() + "\n";
        const auto output = run_session(connection, root / "inbox", script);

        const auto received = root / "inbox" / "image.bin";
        assert(std::filesystem::exists(received));
        std::ifstream in(received, std::ios::binary);
        const std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(written == content);
        assert(output.find("Saved file: " + received.string()) != std::string::npos);

        const auto stats = std::dynamic_pointer_cast<StatsListener>(connection.get_listener(client::kStatsListenerName));
        assert(stats != nullptr);
        assert(stats->snapshot().messages_sent == 1);
        assert(stats->snapshot().messages_received == 1);
        assert(stats->snapshot().disconnects == 1);
        std::filesystem::remove_all(root, ec);
    }

} // namespace

void run_broker_component_tests()
{
    test_connect_delivers_connected_before_returning();
    test_operations_require_connection();
    test_messages_route_to_subscriptions();
    test_transactions_hold_sends_until_commit();
    test_client_acknowledgement();
    test_receipts();
    test_disconnect();
    test_destruction_delivers_queued_events();
    test_listener_registry();
    test_session_over_loopback();
    test_file_transfer_over_loopback();
}
