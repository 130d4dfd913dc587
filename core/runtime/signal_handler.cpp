#include "signal_handler.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include "logging/logger.hpp"

namespace routerlink {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};

void SignalHandler::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_WARN("[Runtime] Failed to install shutdown handlers: " << std::strerror(errno));
    }

    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        LOG_WARN("[Runtime] Failed to ignore SIGPIPE: " << std::strerror(errno));
    }
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

const char *SignalHandler::last_signal_name() {
    switch (last_signal_.load()) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "none";
    }
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations allowed
    last_signal_.store(signal);
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace routerlink
