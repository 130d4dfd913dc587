#include "websocket_connection.hpp"

#include <chrono>
#include <thread>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace routerlink {
namespace ws {

namespace http = beast::http;
namespace websocket = beast::websocket;

namespace {

constexpr const char *kMonitorPath = "/ws/traffic/monitor";
constexpr const char *kHealthPath = "/ws/health";

// Bridges a StreamingSession to the socket without keeping the socket alive
class SocketChannel : public streaming::IOutboundChannel {
public:
    explicit SocketChannel(std::weak_ptr<TrafficSocket> socket) : socket_(std::move(socket)) {}

    bool send(const std::string &text) override {
        auto socket = socket_.lock();
        return socket && socket->send(text);
    }

    void close() override {
        if (auto socket = socket_.lock()) {
            socket->close();
        }
    }

private:
    std::weak_ptr<TrafficSocket> socket_;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '+') {
            out.push_back(' ');
        } else if (value[i] == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
                   hex_value(value[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
            i += 2;
        } else {
            out.push_back(value[i]);
        }
    }
    return out;
}

std::string get_param(const std::map<std::string, std::string> &query, const std::string &key) {
    auto it = query.find(key);
    return it == query.end() ? std::string() : it->second;
}

}  // namespace

void split_target(const std::string &target, std::string &path, std::map<std::string, std::string> &query) {
    query.clear();
    auto question = target.find('?');
    path = target.substr(0, question);
    if (question == std::string::npos) {
        return;
    }

    std::string rest = target.substr(question + 1);
    size_t start = 0;
    while (start <= rest.size()) {
        auto amp = rest.find('&', start);
        std::string pair = rest.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
            // First occurrence wins
            query.emplace(key, value);
        }
        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }
}

//=============================================================================
// HttpSession
//=============================================================================
HttpSession::HttpSession(tcp::socket &&socket, telemetry::TelemetryMultiplexer &multiplexer, std::string client_id,
                         ConnectionHooks hooks)
    : stream_(std::move(socket)),
      multiplexer_(multiplexer),
      client_id_(std::move(client_id)),
      hooks_(std::move(hooks)) {}

void HttpSession::run() {
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != http::error::end_of_stream) {
            LOG_DEBUG("[WS] " << client_id_ << ": request read failed: " << ec.message());
        }
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        if (hooks_.on_closed) hooks_.on_closed(client_id_);
        return;
    }

    std::string path;
    std::map<std::string, std::string> query;
    split_target(std::string(request_.target()), path, query);

    if (path == kMonitorPath) {
        if (!websocket::is_upgrade(request_)) {
            respond(http::status::bad_request, nlohmann::json{{"success", false},
                                                              {"error", "websocket upgrade required"}}
                                                   .dump());
            return;
        }
        stream_.expires_never();
        auto socket = std::make_shared<TrafficSocket>(stream_.release_socket(), multiplexer_, client_id_, hooks_);
        if (hooks_.on_upgraded) hooks_.on_upgraded(socket);
        socket->run(std::move(request_));
        return;
    }

    if (path == kHealthPath) {
        if (request_.method() != http::verb::get) {
            respond(http::status::method_not_allowed,
                    nlohmann::json{{"success", false}, {"error", "method not allowed"}}.dump());
            return;
        }
        respond(http::status::ok, nlohmann::json{{"success", true}, {"message", "WebSocket server running"}}.dump());
        return;
    }

    respond(http::status::not_found, nlohmann::json{{"success", false}, {"error", "not found"}}.dump());
}

void HttpSession::respond(http::status status, const std::string &body) {
    auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response->set(http::field::server, "routerlink-gateway");
    response->set(http::field::content_type, "application/json");
    response->keep_alive(false);
    response->body() = body;
    response->prepare_payload();

    http::async_write(stream_, *response,
                      [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
                          if (ec) {
                              LOG_DEBUG("[WS] " << self->client_id_ << ": response write failed: " << ec.message());
                          }
                          beast::error_code ignored;
                          self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                          if (self->hooks_.on_closed) self->hooks_.on_closed(self->client_id_);
                      });
}

//=============================================================================
// TrafficSocket
//=============================================================================
TrafficSocket::TrafficSocket(tcp::socket &&socket, telemetry::TelemetryMultiplexer &multiplexer,
                             std::string client_id, ConnectionHooks hooks)
    : ws_(std::move(socket)), multiplexer_(multiplexer), client_id_(std::move(client_id)), hooks_(std::move(hooks)) {}

TrafficSocket::~TrafficSocket() { LOG_DEBUG("[WS] " << client_id_ << ": socket released"); }

void TrafficSocket::run(Request request) {
    std::string path;
    std::map<std::string, std::string> query;
    split_target(std::string(request.target()), path, query);
    stream_request_ = streaming::parse_stream_request(get_param(query, "router_id"), get_param(query, "interface"),
                                                      get_param(query, "interfaces"));

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) { res.set(http::field::server, "routerlink-gateway"); }));

    upgrade_request_ = std::move(request);
    ws_.async_accept(upgrade_request_, beast::bind_front_handler(&TrafficSocket::on_accept, shared_from_this()));
}

void TrafficSocket::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("[WS] " << client_id_ << ": handshake failed: " << ec.message());
        finish("handshake failed");
        return;
    }

    open_.store(true);
    LOG_INFO("[WS] " << client_id_ << ": connected");

    start_worker();
    do_read();
}

void TrafficSocket::start_worker() {
    auto channel = std::make_shared<SocketChannel>(weak_from_this());
    session_ = std::make_shared<streaming::StreamingSession>(multiplexer_, channel, client_id_);

    if (hooks_.worker_started) hooks_.worker_started();

    std::thread([self = shared_from_this(), session = session_, request = stream_request_,
                 done = hooks_.worker_finished]() mutable {
        if (session->start(request)) {
            while (!session->wait_until_cancelled(std::chrono::seconds(1))) {
            }
        }
        session->stop();
        self->close();

        session.reset();
        self.reset();
        if (done) done();
    }).detach();
}

void TrafficSocket::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&TrafficSocket::on_read, shared_from_this()));
}

void TrafficSocket::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        finish(ec == websocket::error::closed ? "client closed" : ec.message());
        return;
    }

    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    if (session_) {
        session_->on_client_message(text);
    }

    do_read();
}

bool TrafficSocket::send(const std::string &text) {
    if (!open_.load()) {
        return false;
    }

    net::post(ws_.get_executor(), [self = shared_from_this(), text]() {
        if (self->closing_ || self->finished_) {
            return;
        }
        self->write_queue_.push_back(text);
        if (self->write_queue_.size() == 1) {
            self->do_write();
        }
    });
    return true;
}

void TrafficSocket::do_write() {
    ws_.text(true);
    ws_.async_write(net::buffer(write_queue_.front()),
                    beast::bind_front_handler(&TrafficSocket::on_write, shared_from_this()));
}

void TrafficSocket::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        LOG_WARN("[WS] " << client_id_ << ": write failed: " << ec.message());
        write_queue_.clear();
        finish("write failed");
        return;
    }

    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        do_write();
    } else if (closing_) {
        do_close();
    }
}

void TrafficSocket::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->closing_ || self->finished_) {
            return;
        }
        self->closing_ = true;
        // Pending frames drain first; on_write closes afterwards
        if (self->write_queue_.empty()) {
            self->do_close();
        }
    });
}

void TrafficSocket::do_close() {
    if (finished_) {
        return;
    }
    ws_.async_close(websocket::close_code::normal,
                    [self = shared_from_this()](beast::error_code) { self->finish("closed by server"); });
}

void TrafficSocket::finish(const std::string &reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    open_.store(false);

    LOG_INFO("[WS] " << client_id_ << ": disconnected (" << reason << ")");

    if (session_) {
        session_->on_client_disconnected();
    }
    if (hooks_.on_closed) {
        hooks_.on_closed(client_id_);
    }
}

}  // namespace ws
}  // namespace routerlink
