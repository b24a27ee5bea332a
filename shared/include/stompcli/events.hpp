/**
 * stompcli - Header lists, acknowledgement modes and the inbound event variant
 * delivered by a connection to its listeners.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace stompcli
{

    // Ordered; rendering keeps insertion order.
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

    std::optional<std::string> find_header(const Headers &headers, std::string_view key);

    nlohmann::ordered_json headers_to_json(const Headers &headers);

    enum class AckMode : std::uint8_t
    {
        Auto,
        Client
    };

    std::string_view to_string(AckMode mode) noexcept;
    std::optional<AckMode> ack_mode_from_string(std::string_view value) noexcept;

    struct HostAndPort
    {
        std::string host;
        std::uint16_t port{};
    };

    namespace event
    {

        struct Connected
        {
            Headers headers;
            std::string body;
        };

        struct Disconnected
        {
        };

        struct Message
        {
            Headers headers;
            std::string body;
            std::string destination;
        };

        struct Error
        {
            Headers headers;
            std::string body;
        };

        struct Receipt
        {
            Headers headers;
            std::string body;
        };

    } // namespace event

    using InboundEvent = std::variant<event::Connected, event::Disconnected, event::Message, event::Error,
                                      event::Receipt>;

    std::string_view label(const InboundEvent &inbound) noexcept;

} // namespace stompcli
