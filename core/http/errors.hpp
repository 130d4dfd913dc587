#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "connection/errors.hpp"

namespace routerlink
{
    namespace http
    {

        /**
         * @brief Response status classes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - METHOD_NOT_ALLOWED -> HTTP 405
         * - REQUEST_TIMEOUT -> HTTP 408
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            METHOD_NOT_ALLOWED,
            REQUEST_TIMEOUT,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::METHOD_NOT_ALLOWED:
                return 405;
            case StatusCode::REQUEST_TIMEOUT:
                return 408;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Map a core failure onto an HTTP status class
         *
         * Anything raised on the device path (dial, auth, transport, command)
         * is a server-side failure; only argument errors, unknown routers and
         * dial timeouts get their own status.
         */
        inline StatusCode status_from_error(connection::ErrorCode code)
        {
            switch (code)
            {
            case connection::ErrorCode::OK:
                return StatusCode::OK;
            case connection::ErrorCode::INVALID_ARGUMENT:
                return StatusCode::INVALID_ARGUMENT;
            case connection::ErrorCode::NOT_FOUND:
                return StatusCode::NOT_FOUND;
            case connection::ErrorCode::DIAL_TIMEOUT:
                return StatusCode::REQUEST_TIMEOUT;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a success envelope
         *
         * {"success": true, "message"?: ..., "data"?: ...}
         */
        inline nlohmann::json make_success_response(const nlohmann::json &data = nullptr,
                                                    const std::string &message = "")
        {
            nlohmann::json response = {{"success", true}};
            if (!message.empty())
            {
                response["message"] = message;
            }
            if (!data.is_null())
            {
                response["data"] = data;
            }
            return response;
        }

        /**
         * @brief Build an error envelope
         *
         * {"success": false, "error": ...}
         */
        inline nlohmann::json make_error_response(const std::string &error)
        {
            return {
                {"success", false},
                {"error", error}};
        }

    } // namespace http
} // namespace routerlink
