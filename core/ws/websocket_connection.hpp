#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "streaming/streaming_session.hpp"
#include "telemetry/telemetry_multiplexer.hpp"

namespace routerlink {
namespace ws {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using Request = beast::http::request<beast::http::string_body>;

class TrafficSocket;

// Hooks the owning server provides to its connections
struct ConnectionHooks {
    std::function<void(const std::shared_ptr<TrafficSocket> &socket)> on_upgraded;
    std::function<void(const std::string &client_id)> on_closed;
    std::function<void()> worker_started;
    std::function<void()> worker_finished;
};

// Splits "/path?a=1&b=x%20y" into path and decoded query parameters
void split_target(const std::string &target, std::string &path, std::map<std::string, std::string> &query);

/**
 * @brief Reads the first HTTP request of a TCP connection and routes it
 *
 * - /ws/traffic/monitor with an upgrade header -> TrafficSocket
 * - GET /ws/health -> envelope
 * - anything else -> 404 / 405 / 400 envelope
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket &&socket, telemetry::TelemetryMultiplexer &multiplexer, std::string client_id,
                ConnectionHooks hooks);

    void run();

private:
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void respond(beast::http::status status, const std::string &body);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    Request request_;
    telemetry::TelemetryMultiplexer &multiplexer_;
    const std::string client_id_;
    ConnectionHooks hooks_;
};

/**
 * @brief One upgraded client streaming live traffic
 *
 * All socket I/O runs on the connection's strand. send() and close() may be
 * called from any thread; they post onto the strand. The StreamingSession
 * runs on a worker thread: start(), wait for cancellation, stop().
 */
class TrafficSocket : public std::enable_shared_from_this<TrafficSocket> {
public:
    TrafficSocket(tcp::socket &&socket, telemetry::TelemetryMultiplexer &multiplexer, std::string client_id,
                  ConnectionHooks hooks);
    ~TrafficSocket();

    void run(Request request);

    // Queues a text frame; false once the socket is closing
    bool send(const std::string &text);
    void close();

    const std::string &client_id() const { return client_id_; }
    bool is_open() const { return open_.load(); }

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
    void finish(const std::string &reason);
    void start_worker();

    beast::websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    telemetry::TelemetryMultiplexer &multiplexer_;
    const std::string client_id_;
    ConnectionHooks hooks_;
    streaming::StreamRequest stream_request_;
    Request upgrade_request_;  // Kept alive until the handshake completes

    // Strand only
    std::deque<std::string> write_queue_;
    bool closing_ = false;
    bool finished_ = false;

    std::atomic<bool> open_{false};
    std::shared_ptr<streaming::StreamingSession> session_;
};

}  // namespace ws
}  // namespace routerlink
