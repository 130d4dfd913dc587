#include "websocket_server.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace routerlink {
namespace ws {

WebSocketServer::WebSocketServer(const WebSocketConfig &config, telemetry::TelemetryMultiplexer &multiplexer)
    : config_(config), multiplexer_(multiplexer), acceptor_(ioc_) {}

WebSocketServer::~WebSocketServer() { stop(); }

bool WebSocketServer::start(std::string &error) {
    if (running_.load()) {
        error = "already running";
        return false;
    }

    beast::error_code ec;
    auto address = net::ip::make_address(config_.bind, ec);
    if (ec) {
        error = "invalid bind address '" + config_.bind + "': " + ec.message();
        return false;
    }

    tcp::endpoint endpoint(address, static_cast<uint16_t>(config_.port));
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        error = "failed to listen on " + config_.bind + ":" + std::to_string(config_.port) + ": " + ec.message();
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    bound_port_ = acceptor_.local_endpoint().port();
    running_.store(true);
    do_accept();

    int thread_count = config_.threads > 0 ? config_.threads : 1;
    threads_.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this]() { ioc_.run(); });
    }

    LOG_INFO("[WS] Listening on " << config_.bind << ":" << bound_port_ << " (" << thread_count << " thread(s))");
    return true;
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[WS] Stopping server");

    net::post(ioc_, [this]() {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });

    std::vector<std::shared_ptr<TrafficSocket>> sockets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto &[id, weak_socket] : sockets_) {
            if (auto socket = weak_socket.lock()) {
                sockets.push_back(socket);
            }
        }
    }
    for (auto &socket : sockets) {
        socket->close();
    }
    sockets.clear();

    {
        std::unique_lock<std::mutex> lock(workers_mutex_);
        if (!workers_cv_.wait_for(lock, std::chrono::milliseconds(config_.shutdown_timeout_ms),
                                  [this]() { return workers_ == 0; })) {
            LOG_WARN("[WS] " << workers_ << " streaming session(s) still running at shutdown");
        }
    }

    ioc_.stop();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG_INFO("[WS] Server stopped");
}

size_t WebSocketServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
    });
}

void WebSocketServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (!running_.load() || ec == net::error::operation_aborted) {
        return;
    }

    if (ec) {
        LOG_WARN("[WS] Accept failed: " << ec.message());
        do_accept();
        return;
    }

    if (connection_count() >= config_.max_connections) {
        LOG_WARN("[WS] Max connections (" << config_.max_connections << ") reached, rejecting client");
        beast::error_code ignored;
        socket.close(ignored);
        do_accept();
        return;
    }

    std::string client_id = "ws-" + std::to_string(++connection_counter_);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(client_id);
    }

    beast::error_code remote_ec;
    auto remote = socket.remote_endpoint(remote_ec);
    LOG_DEBUG("[WS] " << client_id << ": accepted from "
                      << (remote_ec ? std::string("unknown") : remote.address().to_string()));

    std::make_shared<HttpSession>(std::move(socket), multiplexer_, client_id, make_hooks())->run();

    do_accept();
}

ConnectionHooks WebSocketServer::make_hooks() {
    ConnectionHooks hooks;
    hooks.on_upgraded = [this](const std::shared_ptr<TrafficSocket> &socket) { on_upgraded(socket); };
    hooks.on_closed = [this](const std::string &client_id) { on_closed(client_id); };
    hooks.worker_started = [this]() { worker_started(); };
    hooks.worker_finished = [this]() { worker_finished(); };
    return hooks;
}

void WebSocketServer::on_upgraded(const std::shared_ptr<TrafficSocket> &socket) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    sockets_[socket->client_id()] = socket;
}

void WebSocketServer::on_closed(const std::string &client_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(client_id);
    sockets_.erase(client_id);
}

void WebSocketServer::worker_started() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++workers_;
}

void WebSocketServer::worker_finished() {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        --workers_;
    }
    workers_cv_.notify_all();
}

}  // namespace ws
}  // namespace routerlink
