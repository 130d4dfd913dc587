#include <initializer_list>

#include "../server.hpp"
#include "utils.hpp"
#include "../json.hpp"
#include "../../commands/router_commands.hpp"
#include "../../logging/logger.hpp"
#include "../../telemetry/traffic_sample.hpp"

namespace routerlink
{
    namespace http
    {

        namespace
        {
            // Sends 400 naming the first missing parameter; true when all are present
            bool require_params(const httplib::Request &req, httplib::Response &res,
                                std::initializer_list<const char *> names)
            {
                for (const char *name : names)
                {
                    if (get_query(req, name).empty())
                    {
                        send_error(res, StatusCode::INVALID_ARGUMENT,
                                   std::string("parameter '") + name + "' is required");
                        return false;
                    }
                }
                return true;
            }

            template <typename T, typename Encoder>
            nlohmann::json encode_list(const std::vector<T> &items, Encoder encode)
            {
                nlohmann::json list = nlohmann::json::array();
                for (const auto &item : items)
                {
                    list.push_back(encode(item));
                }
                return list;
            }
        } // namespace

        //=============================================================================
        // GET|POST /api/interfaces?router_id=
        //=============================================================================
        void HttpServer::handle_get_interfaces(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id))
            {
                return;
            }

            std::vector<commands::Interface> interfaces;
            auto result = commands_.list_interfaces(router_id, interfaces);
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(encode_list(interfaces, encode_interface)));
        }

        //=============================================================================
        // GET|POST /api/interfaces/list?router_id=
        //=============================================================================
        void HttpServer::handle_list_available_interfaces(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id))
            {
                return;
            }

            std::vector<commands::Interface> interfaces;
            auto result = commands_.list_available_interfaces(router_id, interfaces);
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            LOG_DEBUG("[HTTP] Found " << interfaces.size() << " available interface(s) on router " << router_id);
            send_json(res, StatusCode::OK,
                      make_success_response(encode_list(interfaces, encode_available_interface),
                                            "Found " + std::to_string(interfaces.size()) +
                                                " available interfaces"));
        }

        //=============================================================================
        // GET|POST /api/interfaces/enable?router_id=&name=
        //=============================================================================
        void HttpServer::handle_enable_interface(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"name"}))
            {
                return;
            }

            auto result = commands_.enable_interface(router_id, get_query(req, "name"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Interface enabled"));
        }

        //=============================================================================
        // GET|POST /api/interfaces/disable?router_id=&name=
        //=============================================================================
        void HttpServer::handle_disable_interface(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"name"}))
            {
                return;
            }

            auto result = commands_.disable_interface(router_id, get_query(req, "name"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Interface disabled"));
        }

        //=============================================================================
        // GET|POST /api/addresses?router_id=
        //=============================================================================
        void HttpServer::handle_get_addresses(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id))
            {
                return;
            }

            std::vector<commands::Address> addresses;
            auto result = commands_.list_addresses(router_id, addresses);
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(encode_list(addresses, encode_address)));
        }

        //=============================================================================
        // GET|POST /api/addresses/add?router_id=&interface=&address=
        //=============================================================================
        void HttpServer::handle_add_address(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"interface", "address"}))
            {
                return;
            }

            auto result = commands_.add_address(router_id, get_query(req, "interface"), get_query(req, "address"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Address added"));
        }

        //=============================================================================
        // GET|POST /api/addresses/remove?router_id=&id=
        //=============================================================================
        void HttpServer::handle_remove_address(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"id"}))
            {
                return;
            }

            auto result = commands_.remove_address(router_id, get_query(req, "id"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Address removed"));
        }

        //=============================================================================
        // GET|POST /api/queues?router_id=
        //=============================================================================
        void HttpServer::handle_get_queues(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id))
            {
                return;
            }

            std::vector<commands::Queue> queues;
            auto result = commands_.list_queues(router_id, queues);
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(encode_list(queues, encode_queue)));
        }

        //=============================================================================
        // GET|POST /api/queues/add?router_id=&name=&target=&max-limit=
        //=============================================================================
        void HttpServer::handle_add_queue(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"name", "target", "max-limit"}))
            {
                return;
            }

            auto result = commands_.add_queue(router_id, get_query(req, "name"), get_query(req, "target"),
                                              get_query(req, "max-limit"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Queue added"));
        }

        //=============================================================================
        // GET|POST /api/queues/remove?router_id=&id=
        //=============================================================================
        void HttpServer::handle_remove_queue(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"id"}))
            {
                return;
            }

            auto result = commands_.remove_queue(router_id, get_query(req, "id"));
            if (!result.success)
            {
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Queue removed"));
        }

        //=============================================================================
        // GET|POST /api/traffic/once?router_id=&interface=
        //=============================================================================
        void HttpServer::handle_traffic_once(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId router_id = 0;
            if (!require_router_id(req, res, router_id) || !require_params(req, res, {"interface"}))
            {
                return;
            }

            const std::string interface = get_query(req, "interface");
            LOG_DEBUG("[HTTP] Traffic sample for router " << router_id << ", interface " << interface);

            telemetry::TrafficSample sample;
            auto result = commands_.traffic_once(router_id, interface, sample);
            if (!result.success)
            {
                LOG_WARN("[HTTP] Traffic sample failed: " << result.error_message);
                send_failure(res, result);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(telemetry::sample_to_json(sample)));
        }

    } // namespace http
} // namespace routerlink
