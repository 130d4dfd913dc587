#include "connection_manager.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace routerlink {
namespace connection {

namespace {

// Shared between a dial worker and the caller racing it
struct DialAttempt {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    device::DialResult result;
};

device::Endpoint endpoint_for(const registry::Router &router) {
    device::Endpoint endpoint;
    endpoint.address = router.hostname;
    endpoint.port = router.port;
    endpoint.username = router.username;
    endpoint.password = router.password;
    endpoint.keepalive = router.keepalive;
    endpoint.command_timeout_ms = router.timeout;
    return endpoint;
}

ErrorCode dial_error_to_code(device::DialError error) {
    switch (error) {
        case device::DialError::AUTH_FAILED:
            return ErrorCode::AUTH_FAILED;
        case device::DialError::TRANSPORT_ERROR:
        default:
            return ErrorCode::TRANSPORT_ERROR;
    }
}

}  // namespace

ConnectionManager::ConnectionManager(registry::IRouterRegistry &registry,
                                     std::shared_ptr<device::IDeviceDialer> dialer, ConnectionConfig config)
    : registry_(registry), dialer_(std::move(dialer)), config_(std::move(config)) {}

ConnectionManager::~ConnectionManager() {
    stop();
    close_all();
}

//=============================================================================
// Connect / disconnect
//=============================================================================
ConnectResult ConnectionManager::get_or_connect(registry::RouterId router_id) { return acquire(router_id, nullptr); }

ConnectResult ConnectionManager::acquire(registry::RouterId router_id,
                                         const std::shared_ptr<ManagedSession> &replacing) {
    std::shared_ptr<ManagedSession> stale;
    std::shared_ptr<PendingConnect> pending;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(map_mutex_);

        auto it = sessions_.find(router_id);
        if (replacing && (it == sessions_.end() || it->second != replacing)) {
            // Disconnected or already replaced since the failed health check
            ConnectResult result;
            result.code = ErrorCode::NOT_CONNECTED;
            result.error_message = "session for router ID " + std::to_string(router_id) + " is no longer current";
            return result;
        }

        if (it != sessions_.end()) {
            if (it->second->is_healthy()) {
                ConnectResult result;
                result.success = true;
                result.session = it->second;
                return result;
            }
            stale = it->second;
            sessions_.erase(it);
        }

        auto pit = pending_.find(router_id);
        if (pit != pending_.end()) {
            pending = pit->second;
        } else {
            pending = std::make_shared<PendingConnect>();
            pending_[router_id] = pending;
            leader = true;
        }
    }

    if (stale) {
        LOG_INFO("[Conn] Closing unhealthy connection for router " << router_id);
        stale->close();
    }

    if (!leader) {
        std::unique_lock<std::mutex> lock(pending->mutex);
        pending->cv.wait(lock, [&pending]() { return pending->done; });
        return pending->result;
    }

    ConnectResult result = establish(router_id);

    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (result.success) {
            sessions_[router_id] = result.session;
        }
        pending_.erase(router_id);
    }

    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->result = result;
        pending->done = true;
    }
    pending->cv.notify_all();

    return result;
}

ConnectResult ConnectionManager::establish(registry::RouterId router_id) {
    ConnectResult result;

    auto router = registry_.get_router(router_id);
    if (!router) {
        result.code = ErrorCode::NOT_FOUND;
        result.error_message = "router with ID " + std::to_string(router_id) + " not found";
        return result;
    }

    if (!router->is_active) {
        result.code = ErrorCode::INACTIVE;
        result.error_message = "router " + router->name + " is not active";
        return result;
    }

    LOG_INFO("[Conn] Connecting to router " << router->name << " (" << router->hostname << ":" << router->port
                                            << ")");

    bool timed_out = false;
    device::DialResult dial = dial_with_timeout(*router, timed_out);

    if (timed_out) {
        result.code = ErrorCode::DIAL_TIMEOUT;
        result.error_message = "connection timeout after " + std::to_string(config_.dial_timeout_ms / 1000) +
                               " seconds";
        LOG_ERROR("[Conn] Router " << router->name << ": " << result.error_message);
        record_status(router_id, registry::kStatusError);
        return result;
    }

    if (!dial.success || !dial.session) {
        result.code = dial_error_to_code(dial.error);
        result.error_message = "failed to connect to " + router->hostname + ": " + dial.error_message;
        LOG_ERROR("[Conn] " << result.error_message);
        record_status(router_id, registry::kStatusError);
        return result;
    }

    auto session = std::make_shared<ManagedSession>(*router, std::move(dial.session));

    record_status(router_id, registry::kStatusOnline);
    refresh_device_info(*session);

    LOG_INFO("[Conn] Connected to router " << router->name << " (ID: " << router_id << ")");

    result.success = true;
    result.session = std::move(session);
    return result;
}

device::DialResult ConnectionManager::dial_with_timeout(const registry::Router &router, bool &timed_out) {
    auto attempt = std::make_shared<DialAttempt>();
    auto timeout = std::chrono::milliseconds(config_.dial_timeout_ms);
    auto endpoint = endpoint_for(router);

    // The worker owns copies of everything it touches so it may outlive this call
    std::thread([dialer = dialer_, endpoint, timeout, attempt]() {
        device::DialResult result = dialer->dial(endpoint, timeout);

        std::unique_lock<std::mutex> lock(attempt->mutex);
        if (attempt->abandoned) {
            lock.unlock();
            if (result.session) {
                LOG_DEBUG("[Conn] Discarding late dial result for " << endpoint.address);
                result.session->close();
            }
            return;
        }
        attempt->result = std::move(result);
        attempt->done = true;
        lock.unlock();
        attempt->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(attempt->mutex);
    if (!attempt->cv.wait_for(lock, timeout, [&attempt]() { return attempt->done; })) {
        attempt->abandoned = true;
        timed_out = true;
        return device::DialResult();
    }

    timed_out = false;
    return std::move(attempt->result);
}

OperationResult ConnectionManager::disconnect(registry::RouterId router_id) {
    std::shared_ptr<ManagedSession> session;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = sessions_.find(router_id);
        if (it == sessions_.end()) {
            return OperationResult::fail(ErrorCode::NOT_CONNECTED,
                                         "router ID " + std::to_string(router_id) + " is not connected");
        }
        session = it->second;
        sessions_.erase(it);
    }

    session->close();
    record_status(router_id, registry::kStatusOffline);

    LOG_INFO("[Conn] Disconnected router " << session->router().name << " (ID: " << router_id << ")");
    return OperationResult::ok();
}

void ConnectionManager::close_all() {
    std::unordered_map<registry::RouterId, std::shared_ptr<ManagedSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        sessions.swap(sessions_);
    }

    for (auto &[router_id, session] : sessions) {
        session->close();
        record_status(router_id, registry::kStatusOffline);
    }

    if (!sessions.empty()) {
        LOG_INFO("[Conn] Closed " << sessions.size() << " connection(s)");
    }
}

//=============================================================================
// Commands
//=============================================================================
CommandResult ConnectionManager::run_command(registry::RouterId router_id, const device::Command &command) {
    CommandResult result;

    ConnectResult connect = get_or_connect(router_id);
    if (!connect.success) {
        result.code = connect.code;
        result.error_message = connect.error_message;
        return result;
    }

    std::string error;
    if (!connect.session->run(command, result.reply, error)) {
        result.code = connect.session->is_healthy() ? ErrorCode::COMMAND_FAILED : ErrorCode::TRANSPORT_ERROR;
        result.error_message = error;
        if (result.code == ErrorCode::TRANSPORT_ERROR) {
            record_status(router_id, registry::kStatusError);
        }
        return result;
    }

    result.success = true;
    return result;
}

OperationResult ConnectionManager::run_transaction(
    registry::RouterId router_id,
    const std::function<bool(const ManagedSession::Step &step, std::string &error)> &body) {
    ConnectResult connect = get_or_connect(router_id);
    if (!connect.success) {
        return OperationResult::fail(connect.code, connect.error_message);
    }

    std::string error;
    if (!connect.session->transact(body, error)) {
        if (!connect.session->is_healthy()) {
            record_status(router_id, registry::kStatusError);
            return OperationResult::fail(ErrorCode::TRANSPORT_ERROR, error);
        }
        return OperationResult::fail(ErrorCode::COMMAND_FAILED, error);
    }
    return OperationResult::ok();
}

//=============================================================================
// Status
//=============================================================================
std::vector<ConnectionStatus> ConnectionManager::get_all_connections() const {
    std::vector<std::shared_ptr<ManagedSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto &[router_id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<ConnectionStatus> result;
    result.reserve(snapshot.size());
    for (const auto &session : snapshot) {
        ConnectionStatus status;
        status.router_id = session->router_id();
        status.router_name = session->router().name;
        status.hostname = session->router().hostname;
        status.is_healthy = session->is_healthy();
        status.last_ping = session->last_activity();
        result.push_back(std::move(status));
    }

    std::sort(result.begin(), result.end(),
              [](const ConnectionStatus &a, const ConnectionStatus &b) { return a.router_id < b.router_id; });
    return result;
}

bool ConnectionManager::is_connected(registry::RouterId router_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.count(router_id) > 0;
}

size_t ConnectionManager::connection_count() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.size();
}

void ConnectionManager::record_status(registry::RouterId router_id, const std::string &status) {
    registry::RouterStatusUpdate update;
    update.status = status;
    std::string error;
    if (!registry_.update_status(router_id, update, error)) {
        LOG_WARN("[Conn] Failed to record status '" << status << "' for router " << router_id << ": " << error);
    }
}

// Best effort: failures are logged and never change the caller's outcome
void ConnectionManager::refresh_device_info(ManagedSession &session, const device::Reply *resource_reply) {
    device::Reply fetched;
    if (resource_reply == nullptr) {
        std::string error;
        if (!session.run(config_.liveness_command, fetched, error)) {
            LOG_WARN("[Conn] Could not fetch device info for router " << session.router_id() << ": " << error);
            return;
        }
        resource_reply = &fetched;
    }

    auto records = resource_reply->records();
    if (records.empty()) {
        return;
    }

    registry::RouterStatusUpdate update;
    update.status = registry::kStatusOnline;
    std::string version = records.front().get("version");
    std::string uptime = records.front().get("uptime");
    if (!version.empty()) update.version = version;
    if (!uptime.empty()) update.uptime = uptime;

    std::string error;
    if (!registry_.update_status(session.router_id(), update, error)) {
        LOG_WARN("[Conn] Failed to store device info for router " << session.router_id() << ": " << error);
    }
}

//=============================================================================
// Health sweep
//=============================================================================
void ConnectionManager::start() {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(health_mutex_);
        stop_requested_ = false;
    }

    if (config_.health_sweep_enabled) {
        health_thread_ = std::thread([this]() { health_loop(); });
        LOG_INFO("[Conn] Health sweep started (interval " << config_.health_interval_ms << "ms)");
    }

    if (config_.auto_connect) {
        auto_connect_ = std::async(std::launch::async, [this]() { connect_active_routers(); });
    }
}

void ConnectionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(health_mutex_);
        stop_requested_ = true;
    }
    health_cv_.notify_all();

    if (health_thread_.joinable()) {
        health_thread_.join();
    }

    // Finishes at most the dial in progress
    if (auto_connect_.valid()) {
        auto_connect_.wait();
    }

    std::vector<std::future<void>> reconnects;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnects.swap(reconnects_);
    }
    for (auto &reconnect : reconnects) {
        reconnect.wait();
    }

    LOG_INFO("[Conn] Health sweep stopped");
}

bool ConnectionManager::stop_requested() {
    std::lock_guard<std::mutex> lock(health_mutex_);
    return stop_requested_;
}

// Sequential; a failing router is logged and the rest are still attempted
void ConnectionManager::connect_active_routers() {
    auto routers = registry_.get_active_routers();
    LOG_INFO("[Conn] Auto-connecting " << routers.size() << " active router(s)");

    size_t connected = 0;
    for (const auto &router : routers) {
        if (stop_requested()) {
            LOG_INFO("[Conn] Auto-connect interrupted by shutdown");
            return;
        }

        ConnectResult result = get_or_connect(router.id);
        if (result.success) {
            ++connected;
            LOG_INFO("[Conn] Auto-connected router " << router.name << " (" << router.hostname << ")");
        } else {
            LOG_WARN("[Conn] Auto-connect failed for router " << router.name << " (ID: " << router.id
                                                               << "): " << result.error_message);
        }
    }

    LOG_INFO("[Conn] Auto-connect finished: " << connected << "/" << routers.size() << " router(s) connected");
}

void ConnectionManager::health_loop() {
    std::unique_lock<std::mutex> lock(health_mutex_);
    while (!stop_requested_) {
        if (health_cv_.wait_for(lock, std::chrono::milliseconds(config_.health_interval_ms),
                                [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        run_health_sweep();
        lock.lock();
    }
}

void ConnectionManager::run_health_sweep() {
    std::vector<std::shared_ptr<ManagedSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (const auto &[router_id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    if (snapshot.empty()) {
        return;
    }

    LOG_DEBUG("[Conn] Health sweep over " << snapshot.size() << " connection(s)");

    std::vector<std::future<void>> checks;
    checks.reserve(snapshot.size());
    for (const auto &session : snapshot) {
        checks.push_back(std::async(std::launch::async, [this, session]() { check_session(session); }));
    }
    for (auto &check : checks) {
        check.wait();
    }
}

bool ConnectionManager::is_current_locked(const std::shared_ptr<ManagedSession> &session) const {
    auto it = sessions_.find(session->router_id());
    return it != sessions_.end() && it->second == session;
}

// Results for a session that was disconnected or replaced mid-check are discarded.
// Status is recorded under map_mutex_ so a concurrent disconnect's "offline" lands last.
void ConnectionManager::check_session(const std::shared_ptr<ManagedSession> &session) {
    device::Reply reply;
    std::string error;

    if (session->run(config_.liveness_command, reply, error)) {
        session->mark_healthy();
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (is_current_locked(session)) {
            refresh_device_info(*session, &reply);
            LOG_DEBUG("[Conn] Router " << session->router().name << " healthy");
        }
        return;
    }

    session->mark_unhealthy();
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (!is_current_locked(session)) {
            LOG_DEBUG("[Conn] Ignoring failed health check of retired session for router " << session->router().name);
            return;
        }
        record_status(session->router_id(), registry::kStatusError);
    }
    LOG_WARN("[Conn] Router " << session->router().name << " unhealthy: " << error);

    if (config_.reconnect_on_failure) {
        schedule_reconnect(session);
    }
}

void ConnectionManager::schedule_reconnect(const std::shared_ptr<ManagedSession> &failed) {
    std::lock_guard<std::mutex> lock(reconnect_mutex_);

    // Drop finished attempts
    reconnects_.erase(std::remove_if(reconnects_.begin(), reconnects_.end(),
                                     [](std::future<void> &f) {
                                         return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                     }),
                      reconnects_.end());

    reconnects_.push_back(std::async(std::launch::async, [this, failed]() {
        const auto router_id = failed->router_id();
        ConnectResult result = acquire(router_id, failed);
        if (result.code == ErrorCode::NOT_CONNECTED) {
            LOG_DEBUG("[Conn] Reconnect for router " << router_id << " skipped: " << result.error_message);
        } else if (!result.success) {
            // Next sweep cycle retries
            LOG_WARN("[Conn] Reconnect failed for router " << router_id << ": " << result.error_message);
        } else {
            LOG_INFO("[Conn] Reconnected router " << router_id);
        }
    }));
}

}  // namespace connection
}  // namespace routerlink
