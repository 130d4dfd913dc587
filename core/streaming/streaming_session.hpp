#pragma once

/**
 * @file streaming_session.hpp
 * @brief Per-client coordinator for live traffic of one router
 *
 * Aggregates one multiplexer registration per requested interface into a
 * single outbound event channel.
 *
 * Thread safety:
 * - samples arrive on multiplexer dispatch threads (one per interface)
 * - client messages and disconnect arrive on the transport's thread
 * - every outbound write goes through write_mutex_ (at most one in flight)
 *
 * Cancellation:
 * - cancel() marks the session cancelled and closes the channel; it is safe
 *   from any thread, including from inside a sink
 * - stop() cancels and releases every registration; the owner calls it (or
 *   destroys the session) once the transport is done
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "registry/router.hpp"
#include "telemetry/telemetry_multiplexer.hpp"
#include "telemetry/traffic_sample.hpp"

namespace routerlink {
namespace streaming {

// Outbound half of a client transport
class IOutboundChannel {
public:
    virtual ~IOutboundChannel() = default;

    // Sends one text message; false if the transport is gone
    virtual bool send(const std::string &text) = 0;

    // Initiates close of the transport. Idempotent.
    virtual void close() = 0;
};

// Event types sent to the client
constexpr const char *kEventConnected = "connected";
constexpr const char *kEventTrafficUpdate = "traffic_update";
constexpr const char *kEventError = "error";
constexpr const char *kEventPong = "pong";

struct StreamEvent {
    std::string type;
    std::string interface;
    std::optional<telemetry::TrafficSample> data;
    std::string error;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string to_json() const;
};

struct StreamRequest {
    registry::RouterId router_id = 0;  // 0 = missing or invalid
    std::vector<std::string> interfaces;
};

/**
 * @brief Builds a request from raw query values
 *
 * `interfaces` (comma separated, trimmed, empties dropped) takes precedence
 * over `interface`. Never fails; start() validates the result.
 */
StreamRequest parse_stream_request(const std::string &router_id, const std::string &interface,
                                   const std::string &interfaces);

class StreamingSession {
public:
    StreamingSession(telemetry::TelemetryMultiplexer &multiplexer, std::shared_ptr<IOutboundChannel> channel,
                     std::string client_label);
    ~StreamingSession();

    StreamingSession(const StreamingSession &) = delete;
    StreamingSession &operator=(const StreamingSession &) = delete;

    /**
     * @brief Validates the request and registers every interface
     *
     * Sends "connected" for the interfaces that started and one "error" event
     * listing the ones that failed. Returns false (session cancelled) when the
     * request is invalid or no interface could be started.
     */
    bool start(const StreamRequest &request);

    // Inbound text from the client; {"type":"ping"} is answered with a pong
    void on_client_message(const std::string &text);

    // Transport read side failed or closed
    void on_client_disconnected();

    void cancel();
    void stop();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Blocks until cancelled or timeout; true if cancelled
    bool wait_until_cancelled(std::chrono::milliseconds timeout);

    // Updates sent per interface
    std::map<std::string, uint64_t> update_counts() const;

    // Interfaces currently registered with the multiplexer
    size_t active_stream_count() const;

private:
    bool send_event(const StreamEvent &event);
    void on_sample(const std::string &interface, const telemetry::TrafficSample &sample);
    void on_stream_end(const std::string &interface, const std::string &reason);
    void log_summary();

    telemetry::TelemetryMultiplexer &multiplexer_;
    std::shared_ptr<IOutboundChannel> channel_;
    const std::string client_label_;
    registry::RouterId router_id_ = 0;

    std::mutex write_mutex_;

    std::atomic<bool> cancelled_{false};
    mutable std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;

    mutable std::mutex streams_mutex_;
    std::map<std::string, std::unique_ptr<telemetry::StreamHandle>> handles_;
    size_t live_streams_ = 0;
    bool stopped_ = false;

    mutable std::mutex counters_mutex_;
    std::map<std::string, uint64_t> update_counts_;
};

}  // namespace streaming
}  // namespace routerlink
