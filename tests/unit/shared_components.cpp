#include <array>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "stompcli/connection.hpp"
#include "stompcli/crypto.hpp"
#include "stompcli/encoding/base64.hpp"
#include "stompcli/error_codes.hpp"
#include "stompcli/events.hpp"
#include "stompcli/stats_listener.hpp"

using namespace stompcli;

void run_client_component_tests();
void run_broker_component_tests();

namespace
{

    std::vector<std::byte> to_bytes(const std::string &text)
    {
        std::vector<std::byte> bytes;
        for (const char ch : text)
        {
            bytes.push_back(static_cast<std::byte>(ch));
        }
        return bytes;
    }

    void test_base64_known_values()
    {
        assert(encoding::encode_base64(to_bytes("")) == "");
        assert(encoding::encode_base64(to_bytes("f")) == "Zg==");
        assert(encoding::encode_base64(to_bytes("foobar")) == "Zm9vYmFy");

        const auto decoded = encoding::decode_base64("Zm9v\nYmE=");
        assert(decoded.has_value());
        assert(*decoded == to_bytes("fooba"));

        const auto unpadded = encoding::decode_base64("Zg");
        assert(unpadded.has_value());
        assert(*unpadded == to_bytes("f"));
    }

    void test_base64_roundtrip()
    {
        const std::vector<std::byte> empty;
        const auto decoded_empty = encoding::decode_base64(encoding::encode_base64(empty));
        assert(decoded_empty.has_value() && decoded_empty->empty());

        const std::array<std::byte, 1> single = {std::byte{0xFF}};
        const auto decoded_single = encoding::decode_base64(encoding::encode_base64(single));
        assert(decoded_single.has_value());
        assert(decoded_single->size() == 1 && (*decoded_single)[0] == std::byte{0xFF});

        std::vector<std::byte> large(256 * 1024 + 7);
        for (std::size_t i = 0; i < large.size(); ++i)
        {
            large[i] = static_cast<std::byte>((i * 131 + 17) & 0xFF);
        }
        const auto decoded_large = encoding::decode_base64(encoding::encode_base64(large));
        assert(decoded_large.has_value());
        assert(*decoded_large == large);
    }

    void test_base64_rejects_garbage()
    {
        assert(!encoding::decode_base64("not base64!").has_value());
        assert(!encoding::decode_base64("Zg==Zg==").has_value());
        assert(!encoding::decode_base64("Zm9vY").has_value());
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::Usage) == "invalid_usage");
        assert(to_string(ErrorCode::NotConnected) == "not_connected");
        assert(to_string(ErrorCode::StateConflict) == "state_conflict");
        assert(to_string(static_cast<ErrorCode>(999)) == "unknown");
    }

    void test_crypto()
    {
        const auto first = crypto::random_token(8);
        const auto second = crypto::random_token(8);
        assert(first.size() == 16);
        assert(first.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(first != second);

        const auto content = to_bytes("report");
        assert(crypto::hash_bytes(content) == crypto::hash_bytes(content));
        assert(crypto::hash_bytes(content).size() == 64);
        assert(crypto::hash_bytes(content) != crypto::hash_bytes(to_bytes("Report")));
    }

    void test_headers_and_ack_modes()
    {
        const Headers headers{{"destination", "/queue/a"}, {"message-id", "m-1"}, {"custom", "x"}};
        assert(find_header(headers, "message-id") == std::optional<std::string>("m-1"));
        assert(!find_header(headers, "filename").has_value());

        const auto json = headers_to_json(headers);
        assert(json.dump() == R"({"destination":"/queue/a","message-id":"m-1","custom":"x"})");

        assert(ack_mode_from_string("client") == AckMode::Client);
        assert(ack_mode_from_string("auto") == AckMode::Auto);
        assert(!ack_mode_from_string("Client").has_value());
        assert(to_string(AckMode::Client) == "client");
    }

    void test_event_labels()
    {
        assert(label(InboundEvent{event::Connected{}}) == "CONNECTED");
        assert(label(InboundEvent{event::Disconnected{}}) == "DISCONNECTED");
        assert(label(InboundEvent{event::Message{}}) == "MESSAGE");
        assert(label(InboundEvent{event::Error{}}) == "ERROR");
        assert(label(InboundEvent{event::Receipt{}}) == "RECEIPT");
    }

    void test_stats_listener()
    {
        StatsListener stats;
        deliver(stats, event::Connected{{{"session", "s-1"}}, ""});
        deliver(stats, event::Message{{{"destination", "/queue/a"}}, "one", "/queue/a"});
        deliver(stats, event::Message{{{"destination", "/queue/a"}}, "two", "/queue/a"});
        deliver(stats, event::Error{{{"message", "boom"}}, ""});
        deliver(stats, event::Receipt{{{"receipt-id", "r-1"}}, ""});
        deliver(stats, event::Disconnected{});
        stats.on_send("/queue/a", {}, "three");

        const auto snapshot = stats.snapshot();
        assert(snapshot.connections == 1);
        assert(snapshot.messages_received == 2);
        assert(snapshot.messages_sent == 1);
        assert(snapshot.errors == 1);
        assert(snapshot.receipts == 1);
        assert(snapshot.disconnects == 1);

        const auto text = stats.to_string();
        assert(text.find("Connections: 1") != std::string::npos);
        assert(text.find("Messages: 2") != std::string::npos);

        const nlohmann::json json = snapshot;
        assert(json.at("messages_received").get<std::uint64_t>() == 2);
        assert(json.at("errors").get<std::uint64_t>() == 1);
    }

} // namespace

int main()
{
    try
    {
        test_base64_known_values();
        test_base64_roundtrip();
        test_base64_rejects_garbage();
        test_error_codes();
        test_crypto();
        test_headers_and_ack_modes();
        test_event_labels();
        test_stats_listener();
        run_client_component_tests();
        run_broker_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
