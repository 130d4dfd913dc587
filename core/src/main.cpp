// RouterLink gateway
// Config-based runtime with CLI argument parsing

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "routerlink-gateway.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: routerlink-gateway [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: routerlink-gateway.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("RouterLink gateway starting...");
    LOG_INFO("Loading config: " + config_path);

    routerlink::runtime::RuntimeConfig config;
    std::string error;

    if (!routerlink::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    routerlink::logging::Logger::set_level(routerlink::logging::string_to_level(config.logging.level));

    // Installed before any socket or adapter pipe exists
    routerlink::runtime::SignalHandler::install();

    routerlink::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    LOG_INFO("Gateway Ready");
    LOG_INFO("  Routers: " << runtime.get_registry().router_count());
    LOG_INFO("  Log level: " << routerlink::logging::level_to_string(routerlink::logging::Logger::level()));
    if (config.http.enabled)
    {
        LOG_INFO("  HTTP: " << config.http.bind << ":" << config.http.port);
    }
    if (config.websocket.enabled)
    {
        LOG_INFO("  WebSocket: " << config.websocket.bind << ":" << config.websocket.port);
    }

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
