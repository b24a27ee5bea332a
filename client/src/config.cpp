#include "stompcli/client/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace stompcli::client
{

    namespace
    {

        std::uint16_t parse_port(const std::string &value)
        {
            std::size_t consumed = 0;
            unsigned long port = 0;
            try
            {
                port = std::stoul(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid port '" + value + "'\n" + kUsage);
            }
            if (consumed != value.size() || port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::runtime_error("Invalid port '" + value + "'\n" + kUsage);
            }
            return static_cast<std::uint16_t>(port);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc > 5)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        if (argc >= 2)
        {
            config.host = argv[1];
        }
        if (argc >= 3)
        {
            config.port = parse_port(argv[2]);
        }
        if (argc >= 4)
        {
            config.user = std::string(argv[3]);
        }
        if (argc >= 5)
        {
            config.passcode = std::string(argv[4]);
        }
        return config;
    }

    void load_environment(ClientConfig &config)
    {
        if (const char *path = std::getenv(kLogPathVariable); path != nullptr && *path != '\0')
        {
            config.log_path = std::filesystem::path(path);
        }
        if (const char *level = std::getenv(kLogLevelVariable); level != nullptr && *level != '\0')
        {
            // from_str maps unknown names to off
            if (spdlog::level::from_str(level) != spdlog::level::off || std::string_view(level) == "off")
            {
                config.log_level = level;
            }
        }
    }

} // namespace stompcli::client
