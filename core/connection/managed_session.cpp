#include "managed_session.hpp"

#include "logging/logger.hpp"

namespace routerlink {
namespace connection {

ManagedSession::ManagedSession(const registry::Router &router, std::unique_ptr<device::IDeviceSession> session)
    : router_(router), session_(std::move(session)), last_activity_(std::chrono::system_clock::now()) {}

ManagedSession::~ManagedSession() { close(); }

bool ManagedSession::run(const device::Command &command, device::Reply &reply, std::string &error) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    return run_unlocked(command, reply, error);
}

bool ManagedSession::transact(const std::function<bool(const Step &step, std::string &error)> &body,
                              std::string &error) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    Step step = [this](const device::Command &command, device::Reply &reply, std::string &step_error) {
        return run_unlocked(command, reply, step_error);
    };
    return body(step, error);
}

bool ManagedSession::run_unlocked(const device::Command &command, device::Reply &reply, std::string &error) {
    if (!session_->run(command, reply, error)) {
        if (error.empty()) {
            error = "command failed";
        }
        if (!session_->is_open()) {
            mark_unhealthy();
        }
        return false;
    }

    touch();
    return true;
}

std::unique_ptr<device::IDeviceSubscription> ManagedSession::subscribe(const device::Command &command,
                                                                       std::string &error) {
    auto subscription = session_->subscribe(command, error);
    if (!subscription) {
        if (error.empty()) {
            error = "subscription rejected";
        }
        if (!session_->is_open()) {
            mark_unhealthy();
        }
        return nullptr;
    }
    touch();
    return subscription;
}

void ManagedSession::mark_healthy() {
    healthy_.store(true, std::memory_order_release);
    touch();
}

std::chrono::system_clock::time_point ManagedSession::last_activity() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return last_activity_;
}

void ManagedSession::close() {
    healthy_.store(false, std::memory_order_release);
    if (session_) {
        session_->close();
    }
}

void ManagedSession::touch() {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    last_activity_ = std::chrono::system_clock::now();
}

}  // namespace connection
}  // namespace routerlink
