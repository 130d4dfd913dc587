#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "device/device_session.hpp"
#include "errors.hpp"
#include "managed_session.hpp"
#include "registry/router_registry.hpp"

namespace routerlink {
namespace connection {

struct ConnectionConfig {
    int dial_timeout_ms = 20000;        // Upper bound on dial + login
    int health_interval_ms = 30000;     // Health sweep period
    bool health_sweep_enabled = true;   // Start the background sweep in start()
    bool reconnect_on_failure = true;   // Sweep triggers a reconnect after a failed health check
    bool auto_connect = false;          // start() connects every active router in the background
    device::Command liveness_command{"/system/resource/print"};
};

struct ConnectResult {
    bool success = false;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;
    std::shared_ptr<ManagedSession> session;
};

struct CommandResult {
    bool success = false;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;
    device::Reply reply;
};

// Snapshot of one live session for status reporting
struct ConnectionStatus {
    registry::RouterId router_id = 0;
    std::string router_name;
    std::string hostname;
    bool is_healthy = false;
    std::chrono::system_clock::time_point last_ping;
};

/**
 * @brief Owns at most one live device session per router
 *
 * Locking:
 * - map_mutex_ guards sessions_ and pending_ and is held only for lookups,
 *   mutations and sweep status writes, never across a dial or a device command
 * - each ManagedSession has its own command lock (see ManagedSession::run)
 *
 * Concurrent get_or_connect() calls for the same router coalesce on one
 * pending connect: the first caller dials, the rest wait for its result.
 *
 * Lifecycle is explicit: construct, start() to launch the health sweep,
 * stop() to end it. The destructor stops and closes every session.
 */
class ConnectionManager {
public:
    ConnectionManager(registry::IRouterRegistry &registry, std::shared_ptr<device::IDeviceDialer> dialer,
                      ConnectionConfig config = ConnectionConfig());
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    /**
     * @brief Returns the healthy session for a router, connecting if needed
     *
     * An unhealthy session is closed and evicted before a fresh connect.
     * Fails with NOT_FOUND, INACTIVE, DIAL_TIMEOUT, AUTH_FAILED or
     * TRANSPORT_ERROR. Dial failures are recorded as router status "error".
     */
    ConnectResult get_or_connect(registry::RouterId router_id);

    // Closes and removes the session; NOT_CONNECTED if none is live
    OperationResult disconnect(registry::RouterId router_id);

    // Runs a command under the session's command lock
    CommandResult run_command(registry::RouterId router_id, const device::Command &command);

    // Runs dependent commands under one hold of the session's command lock
    OperationResult run_transaction(
        registry::RouterId router_id,
        const std::function<bool(const ManagedSession::Step &step, std::string &error)> &body);

    std::vector<ConnectionStatus> get_all_connections() const;
    bool is_connected(registry::RouterId router_id) const;
    size_t connection_count() const;

    // Starts the background health sweep and auto-connect (if enabled)
    void start();

    // Stops the sweep and waits for auto-connect and in-flight reconnects
    void stop();

    // One sweep pass over a snapshot of live sessions; blocks until every check finishes
    void run_health_sweep();

    // Closes every session (router status -> offline)
    void close_all();

private:
    struct PendingConnect {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        ConnectResult result;
    };

    // get_or_connect(); with replacing set, proceeds only while that session is still current
    ConnectResult acquire(registry::RouterId router_id, const std::shared_ptr<ManagedSession> &replacing);
    ConnectResult establish(registry::RouterId router_id);
    device::DialResult dial_with_timeout(const registry::Router &router, bool &timed_out);
    void check_session(const std::shared_ptr<ManagedSession> &session);
    bool is_current_locked(const std::shared_ptr<ManagedSession> &session) const;
    void refresh_device_info(ManagedSession &session, const device::Reply *resource_reply = nullptr);
    void record_status(registry::RouterId router_id, const std::string &status);
    void schedule_reconnect(const std::shared_ptr<ManagedSession> &failed);
    void health_loop();
    void connect_active_routers();
    bool stop_requested();

    registry::IRouterRegistry &registry_;
    std::shared_ptr<device::IDeviceDialer> dialer_;
    const ConnectionConfig config_;

    mutable std::mutex map_mutex_;
    std::unordered_map<registry::RouterId, std::shared_ptr<ManagedSession>> sessions_;
    std::unordered_map<registry::RouterId, std::shared_ptr<PendingConnect>> pending_;

    // Health sweep
    std::thread health_thread_;
    std::mutex health_mutex_;
    std::condition_variable health_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};

    // Background reconnects triggered by the sweep
    std::mutex reconnect_mutex_;
    std::vector<std::future<void>> reconnects_;

    std::future<void> auto_connect_;
};

}  // namespace connection
}  // namespace routerlink
