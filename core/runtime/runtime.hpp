#pragma once

#include <atomic>
#include <memory>

#include "commands/router_commands.hpp"
#include "config.hpp"
#include "connection/connection_manager.hpp"
#include "device/device_session.hpp"
#include "http/server.hpp"
#include "registry/router_registry.hpp"
#include "telemetry/telemetry_multiplexer.hpp"
#include "ws/websocket_server.hpp"

namespace routerlink {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (inventory, connections, multiplexer, servers)
    bool initialize(std::string &error);

    // Main runtime loop (blocking until stop() or a shutdown signal)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops servers, streams, then connections. Safe to call more than once.
    void shutdown();

    registry::RouterRegistry &get_registry() { return *registry_; }

private:
    // Staged initialization helpers
    bool init_registry(std::string &error);
    bool init_connections(std::string &error);
    bool init_http(std::string &error);
    bool init_websocket(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<registry::RouterRegistry> registry_;
    std::shared_ptr<device::IDeviceDialer> dialer_;
    std::unique_ptr<connection::ConnectionManager> connections_;
    std::unique_ptr<telemetry::TelemetryMultiplexer> multiplexer_;
    std::unique_ptr<commands::RouterCommands> commands_;
    std::unique_ptr<http::HttpServer> http_server_;
    std::unique_ptr<ws::WebSocketServer> ws_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace routerlink
