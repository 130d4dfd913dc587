#pragma once

/**
 * @file websocket_server.hpp
 * @brief Boost.Beast server for live traffic streaming
 *
 * Endpoints:
 * - /ws/traffic/monitor?router_id=N&interface=X | &interfaces=a,b  (upgrade)
 * - GET /ws/health
 *
 * Owns its io_context and a fixed pool of I/O threads. Each accepted socket
 * gets its own strand.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include "telemetry/telemetry_multiplexer.hpp"
#include "websocket_connection.hpp"

namespace routerlink {
namespace ws {

struct WebSocketConfig {
    bool enabled = true;
    std::string bind = "0.0.0.0";
    int port = 8081;
    int threads = 2;
    size_t max_connections = 100;
    int shutdown_timeout_ms = 10000;  // Bound on waiting for streaming sessions at stop()
};

class WebSocketServer {
public:
    WebSocketServer(const WebSocketConfig &config, telemetry::TelemetryMultiplexer &multiplexer);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer &) = delete;
    WebSocketServer &operator=(const WebSocketServer &) = delete;

    // Binds, listens and starts the I/O threads
    bool start(std::string &error);

    // Closes every client, waits for their sessions to stop, joins the I/O threads
    void stop();

    bool is_running() const { return running_.load(); }
    size_t connection_count() const;

    // Bound port (useful when configured with port 0)
    uint16_t port() const { return bound_port_; }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    ConnectionHooks make_hooks();
    void on_upgraded(const std::shared_ptr<TrafficSocket> &socket);
    void on_closed(const std::string &client_id);
    void worker_started();
    void worker_finished();

    const WebSocketConfig config_;
    telemetry::TelemetryMultiplexer &multiplexer_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
    std::atomic<uint64_t> connection_counter_{0};

    mutable std::mutex connections_mutex_;
    std::unordered_set<std::string> connections_;
    std::unordered_map<std::string, std::weak_ptr<TrafficSocket>> sockets_;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    int workers_ = 0;
};

}  // namespace ws
}  // namespace routerlink
