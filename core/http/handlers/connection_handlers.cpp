#include <algorithm>
#include <chrono>
#include <future>

#include "../../connection/connection_manager.hpp"
#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace routerlink {
namespace http {

//=============================================================================
// GET|POST /api/connections/status
//=============================================================================
void HttpServer::handle_connection_status(const httplib::Request &, httplib::Response &res) {
    auto connections = connections_.get_all_connections();

    nlohmann::json connections_json = nlohmann::json::array();
    for (const auto &status : connections) {
        connections_json.push_back(encode_connection_status(status));
    }

    LOG_DEBUG("[HTTP] Reporting " << connections.size() << " live connection(s)");
    send_json(res, StatusCode::OK, make_success_response(connections_json));
}

//=============================================================================
// GET|POST /api/connections/connect?router_id=
//=============================================================================
void HttpServer::handle_connect(const httplib::Request &req, httplib::Response &res) {
    registry::RouterId router_id = 0;
    if (!require_router_id(req, res, router_id)) {
        return;
    }

    // Bounded independently of the dial timeout: a waiter may queue behind another caller's dial
    std::shared_future<connection::ConnectResult> connect =
        std::async(std::launch::async, [this, router_id]() { return connections_.get_or_connect(router_id); })
            .share();

    const auto timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
    if (connect.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("[HTTP] Connect to router " << router_id << " exceeded " << config_.connect_timeout_ms << "ms");
        {
            std::lock_guard<std::mutex> lock(abandoned_mutex_);
            abandoned_connects_.erase(
                std::remove_if(abandoned_connects_.begin(), abandoned_connects_.end(),
                               [](const std::shared_future<connection::ConnectResult> &pending) {
                                   return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                               }),
                abandoned_connects_.end());
            abandoned_connects_.push_back(connect);
        }
        send_error(res, StatusCode::REQUEST_TIMEOUT,
                   "Connection timeout after " + std::to_string(config_.connect_timeout_ms / 1000) + " seconds");
        return;
    }

    const auto &result = connect.get();
    if (!result.success) {
        LOG_WARN("[HTTP] Connect to router " << router_id << " failed ("
                                             << connection::error_code_to_string(result.code)
                                             << "): " << result.error_message);
        send_error(res, status_from_error(result.code), result.error_message);
        return;
    }

    nlohmann::json data = {{"router_id", router_id}};
    send_json(res, StatusCode::OK, make_success_response(data, "Router connected"));
}

//=============================================================================
// GET|POST /api/connections/disconnect?router_id=
//=============================================================================
void HttpServer::handle_disconnect(const httplib::Request &req, httplib::Response &res) {
    registry::RouterId router_id = 0;
    if (!require_router_id(req, res, router_id)) {
        return;
    }

    auto result = connections_.disconnect(router_id);
    if (!result.success) {
        send_failure(res, result);
        return;
    }

    send_json(res, StatusCode::OK, make_success_response(nullptr, "Router disconnected"));
}

}  // namespace http
}  // namespace routerlink
