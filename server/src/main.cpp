#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "tusk/server/config.hpp"
#include "tusk/server/server.hpp"
#include "tusk/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using tusk::server::Server;
    using tusk::server::ServerConfig;

    ServerConfig config;
    try
    {
        config = tusk::server::parse_server_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << tusk::server::server_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << tusk::server::server_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting tusk server {} on {}:{}", tusk::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
