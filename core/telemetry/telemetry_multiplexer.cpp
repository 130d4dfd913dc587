#include "telemetry_multiplexer.hpp"

#include <exception>
#include <vector>

#include "commands/router_commands.hpp"
#include "logging/logger.hpp"

namespace routerlink {
namespace telemetry {

namespace {

std::string describe(registry::RouterId router_id, const std::string &interface) {
    return "router " + std::to_string(router_id) + "/" + interface;
}

}  // namespace

TelemetryMultiplexer::StreamEntry::~StreamEntry() {
    if (dispatcher.joinable()) {
        // The dispatcher may hold the last reference to its own entry
        if (dispatcher.get_id() == std::this_thread::get_id()) {
            dispatcher.detach();
        } else {
            dispatcher.join();
        }
    }
}

TelemetryMultiplexer::TelemetryMultiplexer(connection::ConnectionManager &connections) : connections_(connections) {}

TelemetryMultiplexer::~TelemetryMultiplexer() { shutdown(); }

SubscribeResult TelemetryMultiplexer::subscribe(registry::RouterId router_id, const std::string &interface, Sink sink,
                                                EndHandler on_end) {
    SubscribeResult result;

    if (interface.empty()) {
        result.code = connection::ErrorCode::INVALID_ARGUMENT;
        result.error_message = "interface name is required";
        return result;
    }

    auto consumer = std::make_shared<Consumer>();
    consumer->id = next_consumer_id_++;
    consumer->sink = std::move(sink);
    consumer->on_end = std::move(on_end);

    const StreamKey key(router_id, interface);

    // A stream may end between lookup and registration; retry with a fresh entry
    while (true) {
        std::shared_ptr<StreamEntry> entry;
        bool opener = false;

        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            if (shutting_down_) {
                result.code = connection::ErrorCode::INTERNAL;
                result.error_message = "telemetry multiplexer is shutting down";
                return result;
            }

            auto it = streams_.find(key);
            if (it != streams_.end()) {
                entry = it->second;
            } else {
                entry = std::make_shared<StreamEntry>();
                entry->key = key;
                streams_[key] = entry;
                opener = true;
            }
        }

        if (opener) {
            open_stream(entry);
        }

        std::unique_lock<std::mutex> lock(entry->mutex);
        entry->cv.wait(lock, [&entry]() { return entry->state != StreamState::OPENING; });

        switch (entry->state) {
            case StreamState::OPEN:
                entry->consumers[consumer->id] = consumer;
                LOG_DEBUG("[Mux] Consumer " << consumer->id << " joined " << describe(router_id, interface) << " ("
                                            << entry->consumers.size() << " consumer(s))");
                lock.unlock();
                result.success = true;
                result.handle = make_handle(entry, consumer);
                return result;

            case StreamState::FAILED:
                result.code = entry->error_code;
                result.error_message = entry->error_message;
                return result;

            case StreamState::CLOSED:
            default:
                // Ended before this consumer joined; its device stream is already cancelled
                lock.unlock();
                erase_slot(entry);
                LOG_DEBUG("[Mux] Stream " << describe(router_id, interface) << " closed while joining, retrying");
                break;
        }
    }
}

void TelemetryMultiplexer::open_stream(const std::shared_ptr<StreamEntry> &entry) {
    const auto &[router_id, interface] = entry->key;

    auto fail = [this, &entry](connection::ErrorCode code, const std::string &message) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->state = StreamState::FAILED;
            entry->error_code = code;
            entry->error_message = message;
        }
        entry->cv.notify_all();
        erase_slot(entry);
    };

    auto connect = connections_.get_or_connect(router_id);
    if (!connect.success) {
        fail(connect.code, connect.error_message);
        return;
    }

    std::string error;
    auto subscription = connect.session->subscribe(commands::monitor_traffic(interface, false), error);
    if (!subscription) {
        LOG_WARN("[Mux] Device rejected stream " << describe(router_id, interface) << ": " << error);
        fail(connection::ErrorCode::SUBSCRIBE_FAILED, error);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->session = connect.session;
        entry->subscription = std::move(subscription);
        entry->state = StreamState::OPEN;
        entry->dispatcher = std::thread(&TelemetryMultiplexer::dispatch_loop, this, entry);
    }
    entry->cv.notify_all();

    LOG_INFO("[Mux] Opened stream " << describe(router_id, interface));
}

void TelemetryMultiplexer::dispatch_loop(std::shared_ptr<StreamEntry> entry) {
    const auto &[router_id, interface] = entry->key;
    device::Sentence sentence;

    while (true) {
        auto next = entry->subscription->next(sentence);

        if (next == device::IDeviceSubscription::NextResult::CANCELLED) {
            LOG_DEBUG("[Mux] Dispatcher for " << describe(router_id, interface) << " cancelled");
            return;
        }

        if (next == device::IDeviceSubscription::NextResult::END) {
            std::string reason = entry->subscription->last_error();
            if (reason.empty()) {
                reason = "stream ended";
            }
            end_stream(entry, reason);
            return;
        }

        if (sentence.is_trap()) {
            LOG_WARN("[Mux] Dropped trap on " << describe(router_id, interface) << ": " << sentence.get("message"));
            continue;
        }
        if (!sentence.is_data()) {
            continue;
        }

        deliver(entry, sample_from_sentence(router_id, interface, sentence));
    }
}

void TelemetryMultiplexer::deliver(const std::shared_ptr<StreamEntry> &entry, const TrafficSample &sample) {
    std::vector<std::shared_ptr<Consumer>> snapshot;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->state != StreamState::OPEN) {
            return;
        }
        entry->samples_dispatched++;
        snapshot.reserve(entry->consumers.size());
        for (const auto &[id, consumer] : entry->consumers) {
            snapshot.push_back(consumer);
        }
    }

    for (const auto &consumer : snapshot) {
        std::lock_guard<std::recursive_mutex> gate(consumer->gate);
        if (!consumer->active || !consumer->sink) {
            continue;
        }
        try {
            consumer->sink(sample);
        } catch (const std::exception &e) {
            LOG_ERROR("[Mux] Consumer " << consumer->id << " sink threw: " << e.what());
        }
    }
}

void TelemetryMultiplexer::end_stream(const std::shared_ptr<StreamEntry> &entry, const std::string &reason) {
    std::map<uint64_t, std::shared_ptr<Consumer>> consumers;
    uint64_t samples = 0;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->state == StreamState::CLOSED) {
            return;
        }
        entry->state = StreamState::CLOSED;
        entry->subscription->cancel();
        consumers.swap(entry->consumers);
        samples = entry->samples_dispatched;
    }

    erase_slot(entry);

    LOG_INFO("[Mux] Stream " << describe(entry->key.first, entry->key.second) << " ended (" << reason << "), "
                             << samples << " sample(s), " << consumers.size() << " consumer(s) notified");

    for (const auto &[id, consumer] : consumers) {
        notify_end(*consumer, reason);
    }
}

void TelemetryMultiplexer::notify_end(Consumer &consumer, const std::string &reason) {
    std::lock_guard<std::recursive_mutex> gate(consumer.gate);
    if (!consumer.active) {
        return;
    }
    consumer.active = false;
    if (!consumer.on_end) {
        return;
    }
    try {
        consumer.on_end(reason);
    } catch (const std::exception &e) {
        LOG_ERROR("[Mux] Consumer " << consumer.id << " end handler threw: " << e.what());
    }
}

void TelemetryMultiplexer::unsubscribe(const std::weak_ptr<StreamEntry> &weak_entry,
                                       const std::shared_ptr<Consumer> &consumer) {
    // Waits out an in-flight delivery or end notification to this consumer
    {
        std::lock_guard<std::recursive_mutex> gate(consumer->gate);
        consumer->active = false;
    }

    auto entry = weak_entry.lock();
    if (!entry) {
        return;
    }

    bool teardown = false;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->consumers.erase(consumer->id) == 0) {
            // Already removed by end of stream or shutdown
            return;
        }
        remaining = entry->consumers.size();
        if (remaining == 0 && entry->state == StreamState::OPEN) {
            // Cancelled before a joiner can observe CLOSED and open a replacement
            entry->state = StreamState::CLOSED;
            entry->subscription->cancel();
            teardown = true;
        }
    }

    const auto &[router_id, interface] = entry->key;
    LOG_DEBUG("[Mux] Consumer " << consumer->id << " left " << describe(router_id, interface) << " ("
                                << remaining << " remaining)");

    if (!teardown) {
        return;
    }

    erase_slot(entry);
    join_dispatcher(*entry);

    LOG_INFO("[Mux] Closed stream " << describe(router_id, interface) << " (last consumer left)");
}

void TelemetryMultiplexer::erase_slot(const std::shared_ptr<StreamEntry> &entry) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = streams_.find(entry->key);
    if (it != streams_.end() && it->second == entry) {
        streams_.erase(it);
    }
}

void TelemetryMultiplexer::join_dispatcher(StreamEntry &entry) {
    // A sink unsubscribing from the dispatch thread cannot join itself; ~StreamEntry detaches
    if (entry.dispatcher.joinable() && entry.dispatcher.get_id() != std::this_thread::get_id()) {
        entry.dispatcher.join();
    }
}

std::unique_ptr<StreamHandle> TelemetryMultiplexer::make_handle(const std::shared_ptr<StreamEntry> &entry,
                                                                const std::shared_ptr<Consumer> &consumer) {
    std::weak_ptr<StreamEntry> weak_entry = entry;
    return std::make_unique<StreamHandle>([this, weak_entry, consumer]() { unsubscribe(weak_entry, consumer); });
}

void TelemetryMultiplexer::shutdown() {
    std::map<StreamKey, std::shared_ptr<StreamEntry>> streams;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        shutting_down_ = true;
        streams.swap(streams_);
    }

    for (auto &[key, entry] : streams) {
        std::map<uint64_t, std::shared_ptr<Consumer>> consumers;
        bool was_open = false;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            was_open = entry->state == StreamState::OPEN;
            if (was_open) {
                entry->state = StreamState::CLOSED;
                entry->subscription->cancel();
                consumers.swap(entry->consumers);
            }
        }
        if (!was_open) {
            continue;
        }

        join_dispatcher(*entry);

        for (const auto &[id, consumer] : consumers) {
            notify_end(*consumer, "gateway shutting down");
        }
    }

    if (!streams.empty()) {
        LOG_INFO("[Mux] Shut down " << streams.size() << " stream(s)");
    }
}

size_t TelemetryMultiplexer::active_stream_count() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return streams_.size();
}

size_t TelemetryMultiplexer::consumer_count(registry::RouterId router_id, const std::string &interface) const {
    std::shared_ptr<StreamEntry> entry;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = streams_.find(StreamKey(router_id, interface));
        if (it == streams_.end()) {
            return 0;
        }
        entry = it->second;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->consumers.size();
}

}  // namespace telemetry
}  // namespace routerlink
