#pragma once

#include <atomic>

namespace routerlink {
namespace runtime {

// SIGINT/SIGTERM set a flag the main loop polls; SIGPIPE is ignored so a
// vanished client or adapter surfaces as a write error instead
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Name of the signal that requested shutdown, "none" if no signal arrived
    static const char *last_signal_name();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace routerlink
