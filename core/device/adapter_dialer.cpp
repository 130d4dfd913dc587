#include "adapter_dialer.hpp"

#include <memory>

#include "adapter_process.hpp"
#include "adapter_session.hpp"
#include "logging/logger.hpp"

namespace routerlink {
namespace device {

AdapterDialer::AdapterDialer(AdapterConfig config) : config_(std::move(config)) {}

DialResult AdapterDialer::dial(const Endpoint &endpoint, std::chrono::milliseconds timeout) {
    DialResult result;
    const std::string label = endpoint.address + ":" + std::to_string(endpoint.port);

    auto process = std::make_unique<AdapterProcess>(label, config_.command, config_.args, config_.shutdown_timeout_ms);
    if (!process->spawn()) {
        result.error = DialError::TRANSPORT_ERROR;
        result.error_message = process->last_error();
        return result;
    }

    auto session = std::make_unique<AdapterSession>(std::move(process), endpoint.command_timeout_ms);

    std::string error;
    if (!session->start(error)) {
        result.error = DialError::TRANSPORT_ERROR;
        result.error_message = error;
        return result;
    }

    DialError kind = DialError::NONE;
    if (!session->login(endpoint, static_cast<int>(timeout.count()), kind, error)) {
        LOG_WARN("[Adapter] [" << label << "] Login failed: " << error);
        session->close();
        result.error = kind;
        result.error_message = error;
        return result;
    }

    LOG_DEBUG("[Adapter] [" << label << "] Login succeeded as " << endpoint.username);
    result.success = true;
    result.session = std::move(session);
    return result;
}

}  // namespace device
}  // namespace routerlink
