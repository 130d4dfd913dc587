#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include "connection/connection_manager.hpp"
#include "runtime/config.hpp"

// Forward declarations
namespace routerlink {
namespace registry { class IRouterRegistry; }
namespace commands { class RouterCommands; }
}

namespace routerlink {
namespace http {

/**
 * @brief REST façade over the router inventory, connections and commands
 *
 * The HTTP server is an external adapter layer. It runs in a separate
 * thread and delegates every operation to the core components
 * (RouterRegistry, ConnectionManager, RouterCommands).
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Core components are thread-safe; commands against one router serialize
 *   on that router's command lock
 *
 * Every response body is the envelope {success, message?, data?, error?}.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig& config,
               registry::IRouterRegistry& registry,
               connection::ConnectionManager& connections,
               commands::RouterCommands& commands);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string& error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Port the server is bound to
    int get_port() const { return port_; }

private:
    // Configuration
    runtime::HttpConfig config_;
    int port_ = 0;

    // Core component references
    registry::IRouterRegistry& registry_;
    connection::ConnectionManager& connections_;
    commands::RouterCommands& commands_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    // Connects that outlived their request-level timeout; drained by stop()
    std::mutex abandoned_mutex_;
    std::vector<std::shared_future<connection::ConnectResult>> abandoned_connects_;

    // Route setup
    void setup_routes();

    // System (handlers/system_handlers.cpp)
    void handle_get_health(const httplib::Request& req, httplib::Response& res);

    // Router inventory (handlers/router_handlers.cpp)
    void handle_get_routers(const httplib::Request& req, httplib::Response& res);
    void handle_get_active_routers(const httplib::Request& req, httplib::Response& res);
    void handle_post_router(const httplib::Request& req, httplib::Response& res);
    void handle_get_router(const httplib::Request& req, httplib::Response& res);
    void handle_put_router(const httplib::Request& req, httplib::Response& res);
    void handle_delete_router(const httplib::Request& req, httplib::Response& res);
    void handle_patch_router_status(const httplib::Request& req, httplib::Response& res);
    void handle_patch_router_active(const httplib::Request& req, httplib::Response& res);

    // Connections (handlers/connection_handlers.cpp)
    void handle_connection_status(const httplib::Request& req, httplib::Response& res);
    void handle_connect(const httplib::Request& req, httplib::Response& res);
    void handle_disconnect(const httplib::Request& req, httplib::Response& res);

    // One-shot commands (handlers/command_handlers.cpp)
    void handle_get_interfaces(const httplib::Request& req, httplib::Response& res);
    void handle_list_available_interfaces(const httplib::Request& req, httplib::Response& res);
    void handle_enable_interface(const httplib::Request& req, httplib::Response& res);
    void handle_disable_interface(const httplib::Request& req, httplib::Response& res);
    void handle_get_addresses(const httplib::Request& req, httplib::Response& res);
    void handle_add_address(const httplib::Request& req, httplib::Response& res);
    void handle_remove_address(const httplib::Request& req, httplib::Response& res);
    void handle_get_queues(const httplib::Request& req, httplib::Response& res);
    void handle_add_queue(const httplib::Request& req, httplib::Response& res);
    void handle_remove_queue(const httplib::Request& req, httplib::Response& res);
    void handle_traffic_once(const httplib::Request& req, httplib::Response& res);

    // Shared by the query-driven handlers: 400 + false when router_id is missing or invalid
    bool require_router_id(const httplib::Request& req, httplib::Response& res, registry::RouterId& router_id);
};

} // namespace http
} // namespace routerlink
