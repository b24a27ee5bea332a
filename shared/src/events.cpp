#include "stompcli/events.hpp"

#include <array>

namespace stompcli
{

    namespace
    {
        constexpr std::array<std::pair<AckMode, std::string_view>, 2> kAckModes{{
            {AckMode::Auto, "auto"},
            {AckMode::Client, "client"},
        }};

        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;
    } // namespace

    std::optional<std::string> find_header(const Headers &headers, std::string_view key)
    {
        for (const auto &[name, value] : headers)
        {
            if (name == key)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    nlohmann::ordered_json headers_to_json(const Headers &headers)
    {
        auto json = nlohmann::ordered_json::object();
        for (const auto &[name, value] : headers)
        {
            json[name] = value;
        }
        return json;
    }

    std::string_view to_string(AckMode mode) noexcept
    {
        for (const auto &[value, name] : kAckModes)
        {
            if (value == mode)
            {
                return name;
            }
        }
        return "auto";
    }

    std::optional<AckMode> ack_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &[mode, name] : kAckModes)
        {
            if (name == value)
            {
                return mode;
            }
        }
        return std::nullopt;
    }

    std::string_view label(const InboundEvent &inbound) noexcept
    {
        return std::visit(Overloaded{
                              [](const event::Connected &) -> std::string_view
                              { return "CONNECTED"; },
                              [](const event::Disconnected &) -> std::string_view
                              { return "DISCONNECTED"; },
                              [](const event::Message &) -> std::string_view
                              { return "MESSAGE"; },
                              [](const event::Error &) -> std::string_view
                              { return "ERROR"; },
                              [](const event::Receipt &) -> std::string_view
                              { return "RECEIPT"; },
                          },
                          inbound);
    }

} // namespace stompcli
