#include "adapter_session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "device_adapter.pb.h"
#include "logging/logger.hpp"

namespace routerlink {
namespace device {

namespace pb = routerlink::adapter::v1;

namespace {

Sentence from_proto(const pb::Sentence &proto) {
    Sentence sentence;
    sentence.reply = proto.reply();
    for (const auto &attribute : proto.attributes()) {
        sentence.attributes[attribute.first] = attribute.second;
    }
    return sentence;
}

void fill_words(const Command &command, google::protobuf::RepeatedPtrField<std::string> *words) {
    for (const auto &word : command) {
        *words->Add() = word;
    }
}

std::string status_text(const pb::Status &status) {
    std::string text = pb::Status_Code_Name(status.code());
    if (!status.message().empty()) {
        text += ": " + status.message();
    }
    return text;
}

}  // namespace

//=============================================================================
// Shared connection state (outlives AdapterSession while subscriptions exist)
//=============================================================================
class AdapterConnection {
public:
    struct PendingCall {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool failed = false;
        std::string error;
        pb::Response response;
    };

    struct StreamState {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Sentence> queue;
        bool ended = false;
        bool cancelled = false;
        std::string error;
    };

    AdapterConnection(std::unique_ptr<AdapterProcess> process, int command_timeout_ms)
        : process_(std::move(process)), command_timeout_ms_(command_timeout_ms) {}

    ~AdapterConnection() { close("connection released"); }

    bool start(std::string &error) {
        if (!process_ || !process_->is_running()) {
            error = "Adapter process not running";
            return false;
        }
        open_.store(true);
        reader_ = std::thread([this]() { reader_loop(); });
        return true;
    }

    uint64_t next_request_id() { return next_request_id_.fetch_add(1, std::memory_order_relaxed); }

    // Sends request and waits for the response with the same request_id
    bool call(const pb::Request &request, pb::Response &response, int timeout_ms, std::string &error) {
        auto pending = std::make_shared<PendingCall>();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!open_.load()) {
                error = "Session closed: " + close_reason_;
                return false;
            }
            pending_[request.request_id()] = pending;
        }

        if (!send(request, error)) {
            forget_pending(request.request_id());
            return false;
        }

        std::unique_lock<std::mutex> lock(pending->mutex);
        bool completed = pending->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                              [&pending]() { return pending->done; });
        if (!completed) {
            lock.unlock();
            forget_pending(request.request_id());
            error = "Timeout waiting for adapter response (" + std::to_string(timeout_ms) + "ms)";
            return false;
        }
        if (pending->failed) {
            error = pending->error;
            return false;
        }
        response = std::move(pending->response);
        return true;
    }

    bool send(const pb::Request &request, std::string &error) {
        std::string serialized;
        if (!request.SerializeToString(&serialized)) {
            error = "Failed to serialize request";
            return false;
        }

        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!open_.load()) {
            error = "Session closed";
            return false;
        }
        if (!process_->channel().write_frame(reinterpret_cast<const uint8_t *>(serialized.data()), serialized.size(),
                                             command_timeout_ms_, error)) {
            error = "Failed to write request: " + error;
            return false;
        }
        return true;
    }

    std::shared_ptr<StreamState> open_stream(uint64_t listen_id) {
        auto state = std::make_shared<StreamState>();
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_.load()) {
            return nullptr;
        }
        streams_[listen_id] = state;
        return state;
    }

    void cancel_stream(uint64_t listen_id) {
        bool was_registered = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            was_registered = streams_.erase(listen_id) > 0;
        }
        if (!was_registered || !open_.load()) {
            return;
        }

        pb::Request request;
        request.set_request_id(next_request_id());
        request.mutable_cancel()->set_listen_id(listen_id);

        // The acknowledgement is not awaited; an unmatched response is dropped by the reader
        std::string error;
        if (!send(request, error)) {
            LOG_DEBUG("[Adapter] Cancel for listen " << listen_id << " not delivered: " << error);
        }
    }

    void close(const std::string &reason) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            close_reason_ = reason;
        }

        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            open_.store(false);
            if (process_) {
                process_->shutdown();
            }
        }

        if (reader_.joinable()) {
            reader_.join();
        }
        if (process_) {
            process_->close_read_pipe();
        }

        fail_all(reason);
    }

    bool is_open() const { return open_.load(); }

    int command_timeout_ms() const { return command_timeout_ms_; }

private:
    void reader_loop() {
        std::vector<uint8_t> frame;
        std::string error;

        while (true) {
            error.clear();
            if (!process_->channel().read_frame(frame, -1, error)) {
                break;
            }

            pb::Response response;
            if (!response.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
                LOG_WARN("[Adapter] [" << process_->label() << "] Dropping unparseable frame (" << frame.size()
                                       << " bytes)");
                continue;
            }

            if (response.has_stream()) {
                deliver_stream_event(response);
            } else {
                complete_pending(response);
            }
        }

        bool was_open = open_.exchange(false);
        if (was_open) {
            LOG_WARN("[Adapter] [" << process_->label() << "] Adapter stream closed: " << error);
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (close_reason_.empty()) {
                close_reason_ = "adapter exited: " + error;
            }
        }
        fail_all("Adapter exited: " + error);
    }

    void complete_pending(pb::Response &response) {
        std::shared_ptr<PendingCall> pending;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = pending_.find(response.request_id());
            if (it == pending_.end()) {
                return;
            }
            pending = it->second;
            pending_.erase(it);
        }

        {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->response = std::move(response);
            pending->done = true;
        }
        pending->cv.notify_all();
    }

    void deliver_stream_event(const pb::Response &response) {
        std::shared_ptr<StreamState> state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = streams_.find(response.request_id());
            if (it == streams_.end()) {
                return;
            }
            state = it->second;
            if (response.stream().has_end()) {
                streams_.erase(it);
            }
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (response.stream().has_sentence()) {
                state->queue.push_back(from_proto(response.stream().sentence()));
            } else {
                const auto &status = response.stream().end();
                state->ended = true;
                if (status.code() != pb::Status::CODE_OK) {
                    state->error = status_text(status);
                }
            }
        }
        state->cv.notify_all();
    }

    void forget_pending(uint64_t request_id) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_.erase(request_id);
    }

    void fail_all(const std::string &reason) {
        std::unordered_map<uint64_t, std::shared_ptr<PendingCall>> pending;
        std::unordered_map<uint64_t, std::shared_ptr<StreamState>> streams;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            pending.swap(pending_);
            streams.swap(streams_);
        }

        for (auto &[id, call] : pending) {
            {
                std::lock_guard<std::mutex> lock(call->mutex);
                call->done = true;
                call->failed = true;
                call->error = reason;
            }
            call->cv.notify_all();
        }

        for (auto &[id, state] : streams) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->ended = true;
                if (state->error.empty()) {
                    state->error = reason;
                }
            }
            state->cv.notify_all();
        }
    }

    std::unique_ptr<AdapterProcess> process_;
    const int command_timeout_ms_;

    std::mutex write_mutex_;
    mutable std::mutex state_mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<PendingCall>> pending_;
    std::unordered_map<uint64_t, std::shared_ptr<StreamState>> streams_;
    bool closed_ = false;
    std::string close_reason_;

    std::atomic<bool> open_{false};
    std::atomic<uint64_t> next_request_id_{1};
    std::thread reader_;
};

//=============================================================================
// Subscription
//=============================================================================
namespace {

class AdapterSubscription : public IDeviceSubscription {
public:
    AdapterSubscription(std::shared_ptr<AdapterConnection> connection, uint64_t listen_id,
                        std::shared_ptr<AdapterConnection::StreamState> state)
        : connection_(std::move(connection)), listen_id_(listen_id), state_(std::move(state)) {}

    ~AdapterSubscription() override { cancel(); }

    NextResult next(Sentence &out) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this]() { return state_->cancelled || !state_->queue.empty() || state_->ended; });

        if (state_->cancelled) {
            return NextResult::CANCELLED;
        }
        if (!state_->queue.empty()) {
            out = std::move(state_->queue.front());
            state_->queue.pop_front();
            return NextResult::ITEM;
        }
        error_ = state_->error;
        return NextResult::END;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled) {
                return;
            }
            state_->cancelled = true;
        }
        state_->cv.notify_all();
        connection_->cancel_stream(listen_id_);
    }

    const std::string &last_error() const override { return error_; }

private:
    std::shared_ptr<AdapterConnection> connection_;
    uint64_t listen_id_;
    std::shared_ptr<AdapterConnection::StreamState> state_;
    std::string error_;
};

}  // namespace

//=============================================================================
// AdapterSession
//=============================================================================
AdapterSession::AdapterSession(std::unique_ptr<AdapterProcess> process, int command_timeout_ms)
    : connection_(std::make_shared<AdapterConnection>(std::move(process), command_timeout_ms)) {}

AdapterSession::~AdapterSession() { close(); }

bool AdapterSession::start(std::string &error) { return connection_->start(error); }

bool AdapterSession::login(const Endpoint &endpoint, int timeout_ms, DialError &kind, std::string &error) {
    pb::Request request;
    request.set_request_id(connection_->next_request_id());
    auto *login = request.mutable_login();
    login->set_address(endpoint.address);
    login->set_port(static_cast<uint32_t>(endpoint.port));
    login->set_username(endpoint.username);
    login->set_password(endpoint.password);
    login->set_keepalive(endpoint.keepalive);
    login->set_command_timeout_ms(static_cast<uint32_t>(endpoint.command_timeout_ms));

    pb::Response response;
    if (!connection_->call(request, response, timeout_ms, error)) {
        kind = DialError::TRANSPORT_ERROR;
        return false;
    }

    if (response.status().code() != pb::Status::CODE_OK) {
        kind = response.status().code() == pb::Status::CODE_AUTH_FAILED ? DialError::AUTH_FAILED
                                                                          : DialError::TRANSPORT_ERROR;
        error = status_text(response.status());
        return false;
    }

    kind = DialError::NONE;
    return true;
}

bool AdapterSession::run(const Command &command, Reply &reply, std::string &error) {
    pb::Request request;
    request.set_request_id(connection_->next_request_id());
    fill_words(command, request.mutable_run()->mutable_words());

    pb::Response response;
    if (!connection_->call(request, response, connection_->command_timeout_ms(), error)) {
        return false;
    }

    if (response.status().code() != pb::Status::CODE_OK) {
        error = response.status().message().empty() ? status_text(response.status()) : response.status().message();
        return false;
    }

    reply.sentences.clear();
    for (const auto &sentence : response.run().sentences()) {
        reply.sentences.push_back(from_proto(sentence));
    }

    for (const auto &sentence : reply.sentences) {
        if (sentence.is_trap()) {
            std::string message = sentence.get("message");
            error = message.empty() ? "device returned " + sentence.reply : message;
            return false;
        }
    }
    return true;
}

std::unique_ptr<IDeviceSubscription> AdapterSession::subscribe(const Command &command, std::string &error) {
    pb::Request request;
    uint64_t listen_id = connection_->next_request_id();
    request.set_request_id(listen_id);
    fill_words(command, request.mutable_listen()->mutable_words());

    // Register before sending so no early sentence is lost
    auto state = connection_->open_stream(listen_id);
    if (!state) {
        error = "Session closed";
        return nullptr;
    }

    auto subscription = std::make_unique<AdapterSubscription>(connection_, listen_id, state);

    pb::Response response;
    if (!connection_->call(request, response, connection_->command_timeout_ms(), error)) {
        return nullptr;
    }

    if (response.status().code() != pb::Status::CODE_OK) {
        error = response.status().message().empty() ? status_text(response.status()) : response.status().message();
        return nullptr;
    }

    return subscription;
}

void AdapterSession::close() { connection_->close("session closed"); }

bool AdapterSession::is_open() const { return connection_->is_open(); }

}  // namespace device
}  // namespace routerlink
