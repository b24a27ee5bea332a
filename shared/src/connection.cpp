#include "stompcli/connection.hpp"

#include <type_traits>

namespace stompcli
{

    void deliver(ConnectionListener &listener, const InboundEvent &inbound)
    {
        std::visit(
            [&listener](const auto &e)
            {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, event::Connected>)
                {
                    listener.on_connected(e.headers, e.body);
                }
                else if constexpr (std::is_same_v<T, event::Disconnected>)
                {
                    listener.on_disconnected();
                }
                else if constexpr (std::is_same_v<T, event::Message>)
                {
                    listener.on_message(e.headers, e.body);
                }
                else if constexpr (std::is_same_v<T, event::Error>)
                {
                    listener.on_error(e.headers, e.body);
                }
                else
                {
                    listener.on_receipt(e.headers, e.body);
                }
            },
            inbound);
    }

} // namespace stompcli
