#pragma once

#include <memory>
#include <string>

#include "adapter_process.hpp"
#include "device_session.hpp"

namespace routerlink {
namespace device {

class AdapterConnection;

/**
 * @brief IDeviceSession backed by a device adapter child process
 *
 * Requests are framed protobuf messages written to the adapter's stdin.
 * A dedicated reader thread demultiplexes responses by request_id:
 * - replies to run/login/listen wake the waiting caller
 * - stream events are queued on the matching subscription
 *
 * Writers share one frame lock that is held only for the duration of a
 * single frame write, so a long-running command never blocks a subscription
 * (or the reverse).
 *
 * Subscriptions keep the underlying connection alive and observe close()
 * as end of stream.
 */
class AdapterSession : public IDeviceSession {
public:
    AdapterSession(std::unique_ptr<AdapterProcess> process, int command_timeout_ms);
    ~AdapterSession() override;

    AdapterSession(const AdapterSession &) = delete;
    AdapterSession &operator=(const AdapterSession &) = delete;

    // Starts the reader thread. Must precede any request.
    bool start(std::string &error);

    // Authenticates against the device through the adapter
    bool login(const Endpoint &endpoint, int timeout_ms, DialError &kind, std::string &error);

    bool run(const Command &command, Reply &reply, std::string &error) override;
    std::unique_ptr<IDeviceSubscription> subscribe(const Command &command, std::string &error) override;
    void close() override;
    bool is_open() const override;

private:
    std::shared_ptr<AdapterConnection> connection_;
};

}  // namespace device
}  // namespace routerlink
