#pragma once

/**
 * @file device_session.hpp
 * @brief Device-facing capability consumed by the connection layer
 *
 * A device session is one authenticated channel to a single router. It offers
 * two independent access paths:
 * - run(): synchronous command/response
 * - subscribe(): continuous reply stream, consumed as a lazy cancellable sequence
 *
 * Implementations must allow run() and subscription reads to proceed
 * concurrently. Serializing synchronous commands is the caller's job.
 */

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace routerlink {
namespace device {

// Ordered command words, e.g. {"/interface/print", "?name=ether1"}
using Command = std::vector<std::string>;

// Reply tags as sent by the device
constexpr const char *kReplyData = "!re";
constexpr const char *kReplyDone = "!done";
constexpr const char *kReplyTrap = "!trap";
constexpr const char *kReplyFatal = "!fatal";

/**
 * @brief One decoded reply sentence
 */
struct Sentence {
    std::string reply;                             // !re, !done, !trap, !fatal
    std::map<std::string, std::string> attributes;  // attribute name (without '=') -> value

    bool is_data() const { return reply == kReplyData; }
    bool is_trap() const { return reply == kReplyTrap || reply == kReplyFatal; }

    // Returns attribute value or empty string
    std::string get(const std::string &key) const {
        auto it = attributes.find(key);
        return it == attributes.end() ? std::string() : it->second;
    }
};

/**
 * @brief Complete reply to a synchronous command
 */
struct Reply {
    std::vector<Sentence> sentences;

    // Data sentences only (!re)
    std::vector<Sentence> records() const {
        std::vector<Sentence> out;
        for (const auto &sentence : sentences) {
            if (sentence.is_data()) {
                out.push_back(sentence);
            }
        }
        return out;
    }
};

/**
 * @brief Lazy, cancellable sequence of sentences from a device-side listen
 */
class IDeviceSubscription {
public:
    enum class NextResult {
        ITEM,       // out populated
        END,        // device or transport ended the stream (see last_error())
        CANCELLED,  // cancel() was called
    };

    virtual ~IDeviceSubscription() = default;

    // Blocks until the next sentence, end of stream, or cancellation
    virtual NextResult next(Sentence &out) = 0;

    // Unblocks next() and releases the device-side listen. Idempotent.
    virtual void cancel() = 0;

    virtual const std::string &last_error() const = 0;
};

/**
 * @brief Authenticated channel to one device
 */
class IDeviceSession {
public:
    virtual ~IDeviceSession() = default;

    // Runs a command to completion. A trap reply is a failure.
    virtual bool run(const Command &command, Reply &reply, std::string &error) = 0;

    // Opens a continuous stream. Returns nullptr on rejection.
    virtual std::unique_ptr<IDeviceSubscription> subscribe(const Command &command, std::string &error) = 0;

    // Ends every open subscription and releases the transport. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief Where and how to reach a device
 */
struct Endpoint {
    std::string address;
    int port = 8728;
    std::string username;
    std::string password;
    bool keepalive = true;
    int command_timeout_ms = 300000;
};

enum class DialError { NONE, AUTH_FAILED, TRANSPORT_ERROR };

struct DialResult {
    bool success = false;
    DialError error = DialError::NONE;
    std::string error_message;
    std::unique_ptr<IDeviceSession> session;
};

/**
 * @brief Creates authenticated sessions
 *
 * dial() may block up to (and possibly beyond) the given timeout. Callers that
 * need a hard bound race it against their own deadline.
 */
class IDeviceDialer {
public:
    virtual ~IDeviceDialer() = default;
    virtual DialResult dial(const Endpoint &endpoint, std::chrono::milliseconds timeout) = 0;
};

}  // namespace device
}  // namespace routerlink
