#include "streaming_session.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace routerlink {
namespace streaming {

namespace {

std::string trim(const std::string &value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string join(const std::vector<std::string> &items, const std::string &separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << separator;
        oss << items[i];
    }
    return oss.str();
}

}  // namespace

std::string StreamEvent::to_json() const {
    nlohmann::json j;
    j["type"] = type;
    if (!interface.empty()) j["interface"] = interface;
    if (data) j["data"] = telemetry::sample_to_json(*data);
    if (!error.empty()) j["error"] = error;
    if (!message.empty()) j["message"] = message;
    j["timestamp"] = telemetry::format_rfc3339(timestamp);
    return j.dump();
}

StreamRequest parse_stream_request(const std::string &router_id, const std::string &interface,
                                   const std::string &interfaces) {
    StreamRequest request;

    try {
        size_t consumed = 0;
        long long id = std::stoll(router_id, &consumed);
        if (consumed == router_id.size() && id > 0) {
            request.router_id = id;
        }
    } catch (const std::exception &) {
        request.router_id = 0;
    }

    if (!interfaces.empty()) {
        std::stringstream ss(interfaces);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty() &&
                std::find(request.interfaces.begin(), request.interfaces.end(), item) == request.interfaces.end()) {
                request.interfaces.push_back(item);
            }
        }
    } else {
        auto single = trim(interface);
        if (!single.empty()) {
            request.interfaces.push_back(single);
        }
    }

    return request;
}

StreamingSession::StreamingSession(telemetry::TelemetryMultiplexer &multiplexer,
                                   std::shared_ptr<IOutboundChannel> channel, std::string client_label)
    : multiplexer_(multiplexer), channel_(std::move(channel)), client_label_(std::move(client_label)) {}

StreamingSession::~StreamingSession() { stop(); }

bool StreamingSession::start(const StreamRequest &request) {
    if (request.router_id <= 0) {
        LOG_WARN("[WS] " << client_label_ << ": invalid router_id");
        StreamEvent event;
        event.type = kEventError;
        event.error = "parameter 'router_id' is required and must be valid";
        send_event(event);
        cancel();
        return false;
    }

    if (request.interfaces.empty()) {
        LOG_WARN("[WS] " << client_label_ << ": no interfaces requested");
        StreamEvent event;
        event.type = kEventError;
        event.error = "parameter 'interface' or 'interfaces' is required";
        send_event(event);
        cancel();
        return false;
    }

    router_id_ = request.router_id;
    LOG_INFO("[WS] " << client_label_ << ": monitoring router " << router_id_ << ", interfaces "
                     << join(request.interfaces, ", "));

    std::vector<std::string> started;
    std::vector<std::string> failures;

    {
        // Held across registration so an early end of stream sees a complete handle set
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (const auto &interface : request.interfaces) {
            if (is_cancelled()) {
                break;
            }

            auto result = multiplexer_.subscribe(
                router_id_, interface,
                [this, interface](const telemetry::TrafficSample &sample) { on_sample(interface, sample); },
                [this, interface](const std::string &reason) { on_stream_end(interface, reason); });

            if (!result.success) {
                LOG_WARN("[WS] " << client_label_ << ": failed to start " << interface << ": "
                                 << result.error_message);
                failures.push_back(interface + ": " + result.error_message);
                continue;
            }

            handles_[interface] = std::move(result.handle);
            started.push_back(interface);
        }
        live_streams_ = handles_.size();
    }

    if (!failures.empty()) {
        StreamEvent event;
        event.type = kEventError;
        event.error = "Failed to start " + std::to_string(failures.size()) +
                      " interface(s): " + join(failures, "; ");
        LOG_WARN("[WS] " << client_label_ << ": " << event.error);
        send_event(event);
    }

    if (started.empty()) {
        cancel();
        return false;
    }

    StreamEvent connected;
    connected.type = kEventConnected;
    connected.message = "Monitoring started for router " + std::to_string(router_id_) + ": " +
                        join(started, ", ") + " (" + std::to_string(started.size()) + " interface(s))";
    send_event(connected);

    return !is_cancelled();
}

void StreamingSession::on_client_message(const std::string &text) {
    auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_DEBUG("[WS] " << client_label_ << ": ignoring non-JSON message");
        return;
    }

    auto type = message.find("type");
    if (type != message.end() && type->is_string() && type->get<std::string>() == "ping") {
        StreamEvent pong;
        pong.type = kEventPong;
        send_event(pong);
    }
}

void StreamingSession::on_client_disconnected() {
    LOG_INFO("[WS] " << client_label_ << ": client disconnected");
    cancel();
}

void StreamingSession::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
    }
    cancel_cv_.notify_all();

    if (channel_) {
        channel_->close();
    }
}

void StreamingSession::stop() {
    cancel();

    std::map<std::string, std::unique_ptr<telemetry::StreamHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        handles.swap(handles_);
        live_streams_ = 0;
    }

    // Each release waits out an in-flight delivery to this session
    for (auto &[interface, handle] : handles) {
        handle->release();
    }

    log_summary();
}

bool StreamingSession::wait_until_cancelled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(cancel_mutex_);
    return cancel_cv_.wait_for(lock, timeout, [this]() { return is_cancelled(); });
}

std::map<std::string, uint64_t> StreamingSession::update_counts() const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    return update_counts_;
}

size_t StreamingSession::active_stream_count() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return live_streams_;
}

bool StreamingSession::send_event(const StreamEvent &event) {
    if (is_cancelled()) {
        return false;
    }

    bool sent = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        sent = channel_ && channel_->send(event.to_json());
    }

    if (!sent) {
        LOG_WARN("[WS] " << client_label_ << ": write failed, closing session");
        cancel();
    }
    return sent;
}

void StreamingSession::on_sample(const std::string &interface, const telemetry::TrafficSample &sample) {
    if (is_cancelled()) {
        return;
    }

    StreamEvent event;
    event.type = kEventTrafficUpdate;
    event.interface = interface;
    event.data = sample;

    if (send_event(event)) {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        update_counts_[interface]++;
    }
}

void StreamingSession::on_stream_end(const std::string &interface, const std::string &reason) {
    size_t remaining = 0;
    std::unique_ptr<telemetry::StreamHandle> ended;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = handles_.find(interface);
        if (it == handles_.end()) {
            return;
        }
        ended = std::move(it->second);
        handles_.erase(it);
        remaining = --live_streams_;
    }
    ended.reset();

    LOG_WARN("[WS] " << client_label_ << ": stream " << interface << " ended: " << reason);

    StreamEvent event;
    event.type = kEventError;
    event.interface = interface;
    event.error = "monitoring of interface " + interface + " ended: " + reason;
    send_event(event);

    if (remaining == 0) {
        LOG_INFO("[WS] " << client_label_ << ": all streams ended, closing session");
        cancel();
    }
}

void StreamingSession::log_summary() {
    uint64_t total = 0;
    std::lock_guard<std::mutex> lock(counters_mutex_);
    for (const auto &[interface, count] : update_counts_) {
        LOG_INFO("[WS] " << client_label_ << ": interface " << interface << ": " << count << " update(s)");
        total += count;
    }
    LOG_INFO("[WS] " << client_label_ << ": monitoring stopped for router " << router_id_ << ", total updates: "
                     << total);
}

}  // namespace streaming
}  // namespace routerlink
