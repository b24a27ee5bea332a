#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace stompcli::client
{

    inline constexpr const char *kUsage = "USAGE: stompcli [host] [port] [user] [passcode]";
    inline constexpr const char *kLogPathVariable = "STOMPCLI_LOG";
    inline constexpr const char *kLogLevelVariable = "STOMPCLI_LOG_LEVEL";

    struct ClientConfig
    {
        std::string host{"localhost"};
        std::uint16_t port{61613};
        std::optional<std::string> user;
        std::optional<std::string> passcode;
        std::optional<std::filesystem::path> log_path;
        std::string log_level{"info"};
    };

    // Positional arguments only; throws std::runtime_error carrying the usage
    // line when there are more than four or the port is not a valid number.
    ClientConfig parse_arguments(int argc, char *argv[]);

    void load_environment(ClientConfig &config);

} // namespace stompcli::client
