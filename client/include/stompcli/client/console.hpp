#pragma once

#include <mutex>
#include <ostream>
#include <string_view>
#include <utility>

namespace stompcli::client
{

    inline constexpr std::string_view kPrompt = "> ";

    // Every write to the terminal goes through one guard, whether it comes
    // from the command loop or from the event-delivery thread.
    class Console
    {
    public:
        explicit Console(std::ostream &out) : out_(out) {}

        Console(const Console &) = delete;
        Console &operator=(const Console &) = delete;

        void print_line(std::string_view line);
        void prompt();

        template <typename Fn>
        void write(Fn &&fn)
        {
            std::lock_guard lock(mutex_);
            std::forward<Fn>(fn)(out_);
            out_.flush();
        }

    private:
        std::mutex mutex_;
        std::ostream &out_;
    };

} // namespace stompcli::client
