#pragma once

#include <string>
#include <vector>

#include "connection/connection_manager.hpp"
#include "device/adapter_dialer.hpp"
#include "registry/router.hpp"
#include "ws/websocket_server.hpp"

namespace routerlink {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 40;                           // Worker thread pool size
    int connect_timeout_ms = 30000;                      // Request-level bound on /api/connections/connect
};

struct RuntimeConfig {
    HttpConfig http;
    ws::WebSocketConfig websocket;
    connection::ConnectionConfig connections;
    device::AdapterConfig adapter;
    std::vector<registry::RouterCreateRequest> routers;  // Seed inventory
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace routerlink
