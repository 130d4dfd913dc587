#pragma once

/**
 * @file telemetry_multiplexer.hpp
 * @brief Shares one device-side traffic subscription among many consumers
 *
 * Architecture:
 * - One StreamEntry per (router id, interface) key, created by the first
 *   subscriber and torn down when the last consumer detaches
 * - Each entry owns exactly one device subscription and one dispatch thread
 *   that reads it and fans samples out to every registered consumer
 * - End of the device stream closes the entry and notifies every consumer
 *
 * Thread safety:
 * - map_mutex_ guards the key -> entry map only
 * - each entry has its own mutex for state and consumer set
 * - the two locks are never held together, and neither is held while a
 *   consumer callback runs
 * - each consumer has a delivery gate: once unsubscribe() returns, that
 *   consumer's sink is never called again (a sink may unsubscribe itself)
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "connection/connection_manager.hpp"
#include "connection/errors.hpp"
#include "traffic_sample.hpp"

namespace routerlink {
namespace telemetry {

/**
 * @brief Registration handle returned to a consumer
 *
 * RAII: unsubscribes automatically on destruction. Must not outlive the
 * multiplexer that issued it.
 */
class StreamHandle {
public:
    explicit StreamHandle(std::function<void()> release_fn) : release_fn_(std::move(release_fn)) {}
    ~StreamHandle() { release(); }

    StreamHandle(const StreamHandle &) = delete;
    StreamHandle &operator=(const StreamHandle &) = delete;

    StreamHandle(StreamHandle &&other) noexcept : release_fn_(std::move(other.release_fn_)) {
        other.release_fn_ = nullptr;
    }

    StreamHandle &operator=(StreamHandle &&other) noexcept {
        if (this != &other) {
            release();
            release_fn_ = std::move(other.release_fn_);
            other.release_fn_ = nullptr;
        }
        return *this;
    }

    // Unregisters the consumer. Idempotent.
    void release() {
        if (release_fn_) {
            auto fn = std::move(release_fn_);
            release_fn_ = nullptr;
            fn();
        }
    }

    bool is_active() const { return static_cast<bool>(release_fn_); }

private:
    std::function<void()> release_fn_;
};

struct SubscribeResult {
    bool success = false;
    connection::ErrorCode code = connection::ErrorCode::OK;
    std::string error_message;
    std::unique_ptr<StreamHandle> handle;
};

class TelemetryMultiplexer {
public:
    using Sink = std::function<void(const TrafficSample &)>;
    // Called once if the underlying stream ends while the consumer is registered
    using EndHandler = std::function<void(const std::string &reason)>;

    explicit TelemetryMultiplexer(connection::ConnectionManager &connections);
    ~TelemetryMultiplexer();

    TelemetryMultiplexer(const TelemetryMultiplexer &) = delete;
    TelemetryMultiplexer &operator=(const TelemetryMultiplexer &) = delete;

    /**
     * @brief Registers a consumer for live traffic of one interface
     *
     * Opens the device subscription if this is the first consumer for the
     * key; concurrent first subscribers wait for the one opening it.
     * Fails with the connection error (NOT_FOUND, INACTIVE, DIAL_TIMEOUT, ...)
     * or SUBSCRIBE_FAILED when the device rejects the stream.
     */
    SubscribeResult subscribe(registry::RouterId router_id, const std::string &interface, Sink sink,
                              EndHandler on_end = nullptr);

    // Ends every stream; consumers receive on_end. Further subscribes fail.
    void shutdown();

    size_t active_stream_count() const;
    size_t consumer_count(registry::RouterId router_id, const std::string &interface) const;

private:
    using StreamKey = std::pair<registry::RouterId, std::string>;

    enum class StreamState { OPENING, OPEN, FAILED, CLOSED };

    struct Consumer {
        uint64_t id = 0;
        Sink sink;
        EndHandler on_end;
        // Held for the duration of each delivery; recursive so a sink may unsubscribe itself
        std::recursive_mutex gate;
        bool active = true;
    };

    struct StreamEntry {
        StreamKey key;

        std::mutex mutex;
        std::condition_variable cv;
        StreamState state = StreamState::OPENING;
        connection::ErrorCode error_code = connection::ErrorCode::OK;
        std::string error_message;

        std::shared_ptr<connection::ManagedSession> session;
        std::unique_ptr<device::IDeviceSubscription> subscription;
        std::map<uint64_t, std::shared_ptr<Consumer>> consumers;
        std::thread dispatcher;
        uint64_t samples_dispatched = 0;

        ~StreamEntry();
    };

    void open_stream(const std::shared_ptr<StreamEntry> &entry);
    void dispatch_loop(std::shared_ptr<StreamEntry> entry);
    void deliver(const std::shared_ptr<StreamEntry> &entry, const TrafficSample &sample);
    void end_stream(const std::shared_ptr<StreamEntry> &entry, const std::string &reason);
    static void notify_end(Consumer &consumer, const std::string &reason);
    void unsubscribe(const std::weak_ptr<StreamEntry> &weak_entry, const std::shared_ptr<Consumer> &consumer);
    void erase_slot(const std::shared_ptr<StreamEntry> &entry);
    std::unique_ptr<StreamHandle> make_handle(const std::shared_ptr<StreamEntry> &entry,
                                              const std::shared_ptr<Consumer> &consumer);

    static void join_dispatcher(StreamEntry &entry);

    connection::ConnectionManager &connections_;

    mutable std::mutex map_mutex_;
    std::map<StreamKey, std::shared_ptr<StreamEntry>> streams_;
    bool shutting_down_ = false;

    std::atomic<uint64_t> next_consumer_id_{1};
};

}  // namespace telemetry
}  // namespace routerlink
