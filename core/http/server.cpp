#include "server.hpp"

#include <algorithm>

#include "commands/router_commands.hpp"
#include "connection/connection_manager.hpp"
#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"
#include "registry/router_registry.hpp"

namespace routerlink {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowedMethods = "GET, POST, PUT, PATCH, DELETE, OPTIONS";

void method_not_allowed(const httplib::Request &req, httplib::Response &res) {
    send_error(res, StatusCode::METHOD_NOT_ALLOWED, "Method not allowed: " + req.method + " " + req.path);
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, registry::IRouterRegistry &registry,
                       connection::ConnectionManager &connections, commands::RouterCommands &commands)
    : config_(config), registry_(registry), connections_(connections), commands_(commands) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    // Create server
    server_ = std::make_unique<httplib::Server>();

    // Configure server
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Connect requests may hold a worker for up to connect_timeout_ms
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    // Set up routes
    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = "Internal server error";
        if (res.status == kStatusNotFound) {
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusMethodNotAllowed) {
            message = "Method not allowed: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            message = "Bad request";
        }

        res.set_content(make_error_response(message).dump(), "application/json");
    });

    // Set exception handler
    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(msg).dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    // Start server thread
    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();

    std::vector<std::shared_future<connection::ConnectResult>> abandoned;
    {
        std::lock_guard<std::mutex> lock(abandoned_mutex_);
        abandoned.swap(abandoned_connects_);
    }
    for (auto &connect : abandoned) {
        connect.wait();
    }

    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    using Handler = void (HttpServer::*)(const httplib::Request &, httplib::Response &);

    auto bind = [this](Handler handler) {
        return [this, handler](const httplib::Request &req, httplib::Response &res) { (this->*handler)(req, res); };
    };

    // Query-driven endpoints accept GET and POST; other methods are rejected explicitly
    auto query_route = [this, &bind](const std::string &path, Handler handler) {
        server_->Get(path, bind(handler));
        server_->Post(path, bind(handler));
        server_->Put(path, method_not_allowed);
        server_->Patch(path, method_not_allowed);
        server_->Delete(path, method_not_allowed);
    };

    //=========================================================================
    // System
    //=========================================================================
    server_->Get("/health", bind(&HttpServer::handle_get_health));

    //=========================================================================
    // Router inventory
    //=========================================================================
    server_->Get("/api/routers", bind(&HttpServer::handle_get_routers));
    server_->Post("/api/routers", bind(&HttpServer::handle_post_router));
    server_->Put("/api/routers", method_not_allowed);
    server_->Patch("/api/routers", method_not_allowed);
    server_->Delete("/api/routers", method_not_allowed);

    server_->Get("/api/routers/active", bind(&HttpServer::handle_get_active_routers));
    server_->Post("/api/routers/active", method_not_allowed);
    server_->Put("/api/routers/active", method_not_allowed);
    server_->Patch("/api/routers/active", method_not_allowed);
    server_->Delete("/api/routers/active", method_not_allowed);

    const std::string router_path = R"(/api/routers/(\d+))";
    server_->Get(router_path, bind(&HttpServer::handle_get_router));
    server_->Put(router_path, bind(&HttpServer::handle_put_router));
    server_->Delete(router_path, bind(&HttpServer::handle_delete_router));
    server_->Post(router_path, method_not_allowed);
    server_->Patch(router_path, method_not_allowed);

    const std::string status_path = R"(/api/routers/(\d+)/status)";
    server_->Patch(status_path, bind(&HttpServer::handle_patch_router_status));
    server_->Get(status_path, method_not_allowed);
    server_->Post(status_path, method_not_allowed);
    server_->Put(status_path, method_not_allowed);
    server_->Delete(status_path, method_not_allowed);

    const std::string active_path = R"(/api/routers/(\d+)/active)";
    server_->Patch(active_path, bind(&HttpServer::handle_patch_router_active));
    server_->Get(active_path, method_not_allowed);
    server_->Post(active_path, method_not_allowed);
    server_->Put(active_path, method_not_allowed);
    server_->Delete(active_path, method_not_allowed);

    //=========================================================================
    // Connections
    //=========================================================================
    query_route("/api/connections/status", &HttpServer::handle_connection_status);
    query_route("/api/connections/connect", &HttpServer::handle_connect);
    query_route("/api/connections/disconnect", &HttpServer::handle_disconnect);

    //=========================================================================
    // One-shot commands
    //=========================================================================
    query_route("/api/interfaces", &HttpServer::handle_get_interfaces);
    query_route("/api/interfaces/list", &HttpServer::handle_list_available_interfaces);
    query_route("/api/interfaces/enable", &HttpServer::handle_enable_interface);
    query_route("/api/interfaces/disable", &HttpServer::handle_disable_interface);

    query_route("/api/addresses", &HttpServer::handle_get_addresses);
    query_route("/api/addresses/add", &HttpServer::handle_add_address);
    query_route("/api/addresses/remove", &HttpServer::handle_remove_address);

    query_route("/api/queues", &HttpServer::handle_get_queues);
    query_route("/api/queues/add", &HttpServer::handle_add_queue);
    query_route("/api/queues/remove", &HttpServer::handle_remove_queue);

    query_route("/api/traffic/once", &HttpServer::handle_traffic_once);

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET        /health");
    LOG_INFO("[HTTP]   GET|POST   /api/routers");
    LOG_INFO("[HTTP]   GET        /api/routers/active");
    LOG_INFO("[HTTP]   GET|PUT|DELETE /api/routers/{id}");
    LOG_INFO("[HTTP]   PATCH      /api/routers/{id}/status");
    LOG_INFO("[HTTP]   PATCH      /api/routers/{id}/active");
    LOG_INFO("[HTTP]   GET|POST   /api/connections/{status,connect,disconnect}");
    LOG_INFO("[HTTP]   GET|POST   /api/interfaces[/list,/enable,/disable]");
    LOG_INFO("[HTTP]   GET|POST   /api/addresses[/add,/remove]");
    LOG_INFO("[HTTP]   GET|POST   /api/queues[/add,/remove]");
    LOG_INFO("[HTTP]   GET|POST   /api/traffic/once");
}

bool HttpServer::require_router_id(const httplib::Request &req, httplib::Response &res,
                                   registry::RouterId &router_id) {
    if (!parse_router_id(get_query(req, "router_id"), router_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "parameter 'router_id' is required and must be valid");
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace routerlink
