#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"
#include "registry/router.hpp"

namespace routerlink
{
    namespace http
    {

        // Helper: Parse a positive integer id; false on anything else
        inline bool parse_router_id(const std::string &text, registry::RouterId &id)
        {
            if (text.empty())
            {
                return false;
            }
            try
            {
                size_t consumed = 0;
                long long value = std::stoll(text, &consumed);
                if (consumed != text.size() || value <= 0)
                {
                    return false;
                }
                id = value;
                return true;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }

        // Helper: Parse router id from the first regex capture
        inline bool parse_path_id(const httplib::Request &req, registry::RouterId &id)
        {
            if (req.matches.size() >= 2)
            {
                return parse_router_id(req.matches[1].str(), id);
            }
            return false;
        }

        // Helper: Query parameter or empty string
        inline std::string get_query(const httplib::Request &req, const std::string &key)
        {
            return req.has_param(key) ? req.get_param_value(key) : std::string();
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send an error envelope
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &error)
        {
            send_json(res, code, make_error_response(error));
        }

        // Helper: Send an error envelope for a failed core operation
        inline void send_failure(httplib::Response &res, const connection::OperationResult &result)
        {
            send_error(res, status_from_error(result.code), result.error_message);
        }

    } // namespace http
} // namespace routerlink
