#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "device/adapter_dialer.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace routerlink {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing RouterLink gateway");

    if (!init_registry(error)) {
        return false;
    }

    if (!init_connections(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    if (!init_websocket(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_registry(std::string &error) {
    registry_ = std::make_unique<registry::RouterRegistry>();

    for (const auto &seed : config_.routers) {
        auto router = registry_->create_router(seed, error);
        if (!router) {
            error = "Failed to seed router '" + seed.name + "': " + error;
            return false;
        }
        LOG_INFO("[Runtime] Router " << router->id << ": " << router->name << " (" << router->hostname << ":"
                                     << router->port << (router->is_active ? "" : ", inactive") << ")");
    }

    LOG_INFO("[Runtime] Inventory seeded with " << registry_->router_count() << " router(s)");
    return true;
}

bool Runtime::init_connections(std::string &) {
    dialer_ = std::make_shared<device::AdapterDialer>(config_.adapter);

    connections_ = std::make_unique<connection::ConnectionManager>(*registry_, dialer_, config_.connections);
    connections_->start();

    multiplexer_ = std::make_unique<telemetry::TelemetryMultiplexer>(*connections_);
    commands_ = std::make_unique<commands::RouterCommands>(*connections_);

    LOG_INFO("[Runtime] Connection manager started (dial timeout " << config_.connections.dial_timeout_ms
                                                                   << "ms"
                                                                   << (config_.connections.auto_connect
                                                                           ? ", auto-connecting active routers"
                                                                           : "")
                                                                   << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *registry_, *connections_, *commands_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

bool Runtime::init_websocket(std::string &error) {
    if (!config_.websocket.enabled) {
        LOG_INFO("[Runtime] WebSocket server disabled");
        return true;
    }

    ws_server_ = std::make_unique<ws::WebSocketServer>(config_.websocket, *multiplexer_);
    if (!ws_server_->start(error)) {
        error = "WebSocket server failed to start: " + error;
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Shutdown requested (" << SignalHandler::last_signal_name() << "), stopping...");
            running_ = false;
            break;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Stop accepting requests first
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (ws_server_) {
        LOG_INFO("[Runtime] Stopping WebSocket server");
        ws_server_->stop();
    }

    // Ends any stream a client still held
    if (multiplexer_) {
        multiplexer_->shutdown();
    }

    if (connections_) {
        LOG_INFO("[Runtime] Closing router connections");
        connections_->stop();
        connections_->close_all();
    }

    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace routerlink
