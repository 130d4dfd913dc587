#pragma once

#include <string>
#include <vector>

#include "device_session.hpp"

namespace routerlink {
namespace device {

struct AdapterConfig {
    std::string command;              // Path to the adapter executable
    std::vector<std::string> args;    // Extra arguments (no credentials)
    int shutdown_timeout_ms = 2000;   // EOF grace period before SIGKILL
};

// Dials by spawning one adapter process per session and logging in through it
class AdapterDialer : public IDeviceDialer {
public:
    explicit AdapterDialer(AdapterConfig config);

    DialResult dial(const Endpoint &endpoint, std::chrono::milliseconds timeout) override;

private:
    AdapterConfig config_;
};

}  // namespace device
}  // namespace routerlink
