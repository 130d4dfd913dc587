#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "device/device_session.hpp"
#include "registry/router.hpp"

namespace routerlink {
namespace connection {

/**
 * @brief The connection manager's record of one live device session
 *
 * Owned by ConnectionManager; callers borrow it through shared_ptr for the
 * duration of one operation and never close it themselves.
 *
 * Two independent access paths:
 * - run() serializes on the command lock (same-device commands run in
 *   submission order, never concurrently)
 * - subscribe() bypasses the command lock so a stream start never waits
 *   behind a slow command
 */
class ManagedSession {
public:
    ManagedSession(const registry::Router &router, std::unique_ptr<device::IDeviceSession> session);
    ~ManagedSession();

    ManagedSession(const ManagedSession &) = delete;
    ManagedSession &operator=(const ManagedSession &) = delete;

    registry::RouterId router_id() const { return router_.id; }

    // Descriptor snapshot taken at connect time
    const registry::Router &router() const { return router_; }

    // Runs a command under the command lock. Marks the session unhealthy on
    // transport failure (the session reports itself closed).
    bool run(const device::Command &command, device::Reply &reply, std::string &error);

    // Executes one command of a transaction; the caller already holds the command lock
    using Step = std::function<bool(const device::Command &, device::Reply &, std::string &)>;

    // Runs dependent commands (e.g. resolve an id, then set) under a single hold of the command lock
    bool transact(const std::function<bool(const Step &step, std::string &error)> &body, std::string &error);

    std::unique_ptr<device::IDeviceSubscription> subscribe(const device::Command &command, std::string &error);

    bool is_healthy() const { return healthy_.load(std::memory_order_acquire); }
    void mark_healthy();
    void mark_unhealthy() { healthy_.store(false, std::memory_order_release); }

    std::chrono::system_clock::time_point last_activity() const;

    // Closes the device session; pending and future operations fail
    void close();

private:
    bool run_unlocked(const device::Command &command, device::Reply &reply, std::string &error);
    void touch();

    const registry::Router router_;
    std::unique_ptr<device::IDeviceSession> session_;

    std::mutex command_mutex_;
    std::atomic<bool> healthy_{true};

    mutable std::mutex activity_mutex_;
    std::chrono::system_clock::time_point last_activity_;
};

}  // namespace connection
}  // namespace routerlink
