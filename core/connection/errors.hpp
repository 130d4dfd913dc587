#pragma once

#include <string>

namespace routerlink {
namespace connection {

/**
 * @brief Failure taxonomy shared by the connection, telemetry and streaming layers
 *
 * The façade maps these onto HTTP statuses (see http/errors.hpp).
 */
enum class ErrorCode {
    OK,
    NOT_FOUND,              // unknown router id
    INACTIVE,               // router deactivated in the registry
    DIAL_TIMEOUT,           // dial + login exceeded its bound
    AUTH_FAILED,            // device rejected credentials
    TRANSPORT_ERROR,        // I/O failure during dial or mid-session
    NOT_CONNECTED,          // no live session for the router
    SUBSCRIBE_FAILED,       // device rejected a stream request
    PARTIAL_START_FAILURE,  // some requested streams failed to start
    COMMAND_FAILED,         // device answered a command with an error
    INVALID_ARGUMENT,
    INTERNAL
};

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INACTIVE:
            return "INACTIVE";
        case ErrorCode::DIAL_TIMEOUT:
            return "DIAL_TIMEOUT";
        case ErrorCode::AUTH_FAILED:
            return "AUTH_FAILED";
        case ErrorCode::TRANSPORT_ERROR:
            return "TRANSPORT_ERROR";
        case ErrorCode::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case ErrorCode::SUBSCRIBE_FAILED:
            return "SUBSCRIBE_FAILED";
        case ErrorCode::PARTIAL_START_FAILURE:
            return "PARTIAL_START_FAILURE";
        case ErrorCode::COMMAND_FAILED:
            return "COMMAND_FAILED";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL:
        default:
            return "INTERNAL";
    }
}

// Result of an operation without payload
struct OperationResult {
    bool success = false;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;

    static OperationResult ok() { return {true, ErrorCode::OK, ""}; }
    static OperationResult fail(ErrorCode code, std::string message) { return {false, code, std::move(message)}; }
};

}  // namespace connection
}  // namespace routerlink
