#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "stompcli/broker/loopback_connection.hpp"
#include "stompcli/client/command_catalog.hpp"
#include "stompcli/client/command_loop.hpp"
#include "stompcli/client/config.hpp"
#include "stompcli/client/console.hpp"
#include "stompcli/client/logger.hpp"
#include "stompcli/client/session.hpp"
#include "stompcli/version.hpp"

int main(int argc, char *argv[])
{
    using namespace stompcli::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    load_environment(config);

    Logger logger(config.log_path, config.log_level);
    if (auto handle = logger.handle())
    {
        spdlog::set_default_logger(handle);
    }
    else
    {
        spdlog::set_level(spdlog::level::off);
    }
    logger.log("info", "stompcli ", stompcli::version(), " starting for ", config.host, ':', config.port);
    if (config.user && !config.passcode)
    {
        logger.log("info", "user ", *config.user, " given without a passcode");
    }

    Console console(std::cout);
    stompcli::broker::LoopbackConnection connection({config.host, config.port}, config.user);
    auto session = std::make_shared<SessionController>(connection, console, logger);
    try
    {
        session->start();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Unable to connect to " << config.host << ':' << config.port << ": " << ex.what() << std::endl;
        logger.log("error", "connect failed: ", ex.what());
        logger.flush();
        return EXIT_FAILURE;
    }

    CommandLoop loop(*session, CommandCatalog::standard(), console, std::cin, logger);

    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code &ec, int signal_number)
                       {
        if (ec)
        {
            return;
        }
        console.print_line("");
        logger.log("info", "signal ", signal_number, " received");
        loop.shutdown();
        logger.flush();
        std::quick_exit(EXIT_SUCCESS); });
    std::thread signal_thread([&signal_context]
                              { signal_context.run(); });

    const int exit_code = loop.run();

    signals.cancel();
    signal_context.stop();
    signal_thread.join();
    logger.flush();
    return exit_code;
}
