#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>

#include "logging/logger.hpp"
#include "registry/router_registry.hpp"

namespace routerlink {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

template <typename T>
void read_optional(const YAML::Node &node, const char *key, std::optional<T> &out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

registry::RouterCreateRequest parse_router(const YAML::Node &node) {
    registry::RouterCreateRequest router;
    if (node["name"]) router.name = node["name"].as<std::string>();
    if (node["hostname"]) router.hostname = node["hostname"].as<std::string>();
    if (node["username"]) router.username = node["username"].as<std::string>();
    if (node["password"]) router.password = node["password"].as<std::string>();
    read_optional(node, "keepalive", router.keepalive);
    read_optional(node, "timeout", router.timeout);
    read_optional(node, "port", router.port);
    read_optional(node, "location", router.location);
    read_optional(node, "description", router.description);
    read_optional(node, "is_active", router.is_active);
    return router;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
        if (config.http.connect_timeout_ms < 1000) {
            error = "http.connect_timeout_ms must be >= 1000ms";
            return false;
        }
    }

    // Validate WebSocket settings (port 0 = ephemeral)
    if (config.websocket.enabled) {
        if (config.websocket.port < 0 || config.websocket.port > 65535) {
            error = "WebSocket port must be between 0 and 65535";
            return false;
        }
        if (config.websocket.threads < 1) {
            error = "websocket.threads must be at least 1";
            return false;
        }
        if (config.websocket.max_connections < 1) {
            error = "websocket.max_connections must be at least 1";
            return false;
        }
        if (config.http.enabled && config.http.port == config.websocket.port &&
            config.http.bind == config.websocket.bind) {
            error = "HTTP and WebSocket servers cannot share " + config.http.bind + ":" +
                    std::to_string(config.http.port);
            return false;
        }
    }

    // Validate connection settings
    if (config.connections.dial_timeout_ms < 100) {
        error = "connections.dial_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.connections.health_interval_ms < 1000) {
        error = "connections.health_interval_ms must be >= 1000ms";
        return false;
    }

    // Validate adapter settings
    if (config.adapter.command.empty()) {
        error = "adapter.command is required";
        return false;
    }
    if (config.adapter.shutdown_timeout_ms < 0) {
        error = "adapter.shutdown_timeout_ms must be >= 0";
        return false;
    }

    // Validate seed routers
    for (size_t i = 0; i < config.routers.size(); ++i) {
        std::string router_error;
        if (!registry::validate_create_request(config.routers[i], router_error)) {
            error = "routers[" + std::to_string(i) + "]: " + router_error;
            return false;
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, "", {"http", "websocket", "connections", "adapter", "routers", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            warn_unknown_keys(http, "http",
                              {"enabled", "bind", "port", "cors_allowed_origins", "cors_allow_credentials",
                               "thread_pool_size", "connect_timeout_ms"});

            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["connect_timeout_ms"]) {
                config.http.connect_timeout_ms = http["connect_timeout_ms"].as<int>();
            }
        }

        // Load WebSocket config
        if (yaml["websocket"]) {
            const auto &ws = yaml["websocket"];
            warn_unknown_keys(ws, "websocket",
                              {"enabled", "bind", "port", "threads", "max_connections", "shutdown_timeout_ms"});

            if (ws["enabled"]) {
                config.websocket.enabled = ws["enabled"].as<bool>();
            }
            if (ws["bind"]) {
                config.websocket.bind = ws["bind"].as<std::string>();
            }
            if (ws["port"]) {
                config.websocket.port = ws["port"].as<int>();
            }
            if (ws["threads"]) {
                config.websocket.threads = ws["threads"].as<int>();
            }
            if (ws["max_connections"]) {
                config.websocket.max_connections = ws["max_connections"].as<size_t>();
            }
            if (ws["shutdown_timeout_ms"]) {
                config.websocket.shutdown_timeout_ms = ws["shutdown_timeout_ms"].as<int>();
            }
        }

        // Load connection manager config
        if (yaml["connections"]) {
            const auto &conn = yaml["connections"];
            warn_unknown_keys(conn, "connections",
                              {"dial_timeout_ms", "health_interval_ms", "health_sweep_enabled",
                               "reconnect_on_failure", "auto_connect"});

            if (conn["dial_timeout_ms"]) {
                config.connections.dial_timeout_ms = conn["dial_timeout_ms"].as<int>();
            }
            if (conn["health_interval_ms"]) {
                config.connections.health_interval_ms = conn["health_interval_ms"].as<int>();
            }
            if (conn["health_sweep_enabled"]) {
                config.connections.health_sweep_enabled = conn["health_sweep_enabled"].as<bool>();
            }
            if (conn["reconnect_on_failure"]) {
                config.connections.reconnect_on_failure = conn["reconnect_on_failure"].as<bool>();
            }
            if (conn["auto_connect"]) {
                config.connections.auto_connect = conn["auto_connect"].as<bool>();
            }
        }

        // Load adapter config
        if (yaml["adapter"]) {
            const auto &adapter = yaml["adapter"];
            warn_unknown_keys(adapter, "adapter", {"command", "args", "shutdown_timeout_ms"});

            if (adapter["command"]) {
                config.adapter.command = adapter["command"].as<std::string>();
            }
            if (adapter["args"]) {
                config.adapter.args.clear();  // Ensure idempotent parsing
                for (const auto &arg : adapter["args"]) {
                    config.adapter.args.push_back(arg.as<std::string>());
                }
            }
            if (adapter["shutdown_timeout_ms"]) {
                config.adapter.shutdown_timeout_ms = adapter["shutdown_timeout_ms"].as<int>();
            }
        }

        // Load seed inventory
        if (yaml["routers"]) {
            if (!yaml["routers"].IsSequence()) {
                error = "'routers' must be a list";
                return false;
            }
            config.routers.clear();
            for (const auto &router_node : yaml["routers"]) {
                config.routers.push_back(parse_router(router_node));
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        std::stringstream ws_msg;
        ws_msg << "[Config] WebSocket: " << (config.websocket.enabled ? "enabled" : "disabled");
        if (config.websocket.enabled) {
            ws_msg << " (" << config.websocket.bind << ":" << config.websocket.port << ", "
                   << config.websocket.threads << " thread(s))";
        }
        LOG_INFO(ws_msg.str());

        LOG_INFO("[Config] Dial timeout: " << config.connections.dial_timeout_ms << "ms, health sweep: "
                                           << (config.connections.health_sweep_enabled
                                                   ? std::to_string(config.connections.health_interval_ms) + "ms"
                                                   : std::string("disabled"))
                                           << ", auto-connect: " << (config.connections.auto_connect ? "on" : "off"));
        LOG_INFO("[Config] Adapter: " << config.adapter.command);
        LOG_INFO("[Config] Loaded " << config.routers.size() << " seed router(s)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace routerlink
