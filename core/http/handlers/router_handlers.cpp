#include "../server.hpp"
#include "utils.hpp"
#include "../json.hpp"
#include "../../connection/connection_manager.hpp"
#include "../../registry/router_registry.hpp"
#include "../../logging/logger.hpp"

namespace routerlink
{
    namespace http
    {

        namespace
        {
            bool parse_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body)
            {
                body = nlohmann::json::parse(req.body, nullptr, false);
                if (body.is_discarded())
                {
                    send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid request body: malformed JSON");
                    return false;
                }
                return true;
            }

            bool require_path_id(const httplib::Request &req, httplib::Response &res, registry::RouterId &id)
            {
                if (!parse_path_id(req, id))
                {
                    send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid router ID");
                    return false;
                }
                return true;
            }

            nlohmann::json encode_routers(const std::vector<registry::Router> &routers)
            {
                nlohmann::json routers_json = nlohmann::json::array();
                for (const auto &router : routers)
                {
                    routers_json.push_back(encode_router(router));
                }
                return routers_json;
            }
        } // namespace

        //=============================================================================
        // GET /api/routers
        //=============================================================================
        void HttpServer::handle_get_routers(const httplib::Request &, httplib::Response &res)
        {
            send_json(res, StatusCode::OK, make_success_response(encode_routers(registry_.get_all_routers())));
        }

        //=============================================================================
        // GET /api/routers/active
        //=============================================================================
        void HttpServer::handle_get_active_routers(const httplib::Request &, httplib::Response &res)
        {
            send_json(res, StatusCode::OK, make_success_response(encode_routers(registry_.get_active_routers())));
        }

        //=============================================================================
        // POST /api/routers
        //=============================================================================
        void HttpServer::handle_post_router(const httplib::Request &req, httplib::Response &res)
        {
            nlohmann::json body;
            if (!parse_body(req, res, body))
            {
                return;
            }

            registry::RouterCreateRequest request;
            std::string error;
            if (!decode_router_create(body, request, error))
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid request body: " + error);
                return;
            }

            auto router = registry_.create_router(request, error);
            if (!router)
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, error);
                return;
            }

            LOG_INFO("[HTTP] Created router " << router->id << " (" << router->name << ")");
            send_json(res, StatusCode::OK, make_success_response(encode_router(*router), "Router created"));
        }

        //=============================================================================
        // GET /api/routers/{id}
        //=============================================================================
        void HttpServer::handle_get_router(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId id = 0;
            if (!require_path_id(req, res, id))
            {
                return;
            }

            auto router = registry_.get_router(id);
            if (!router)
            {
                send_error(res, StatusCode::NOT_FOUND, "router with ID " + std::to_string(id) + " not found");
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(encode_router(*router)));
        }

        //=============================================================================
        // PUT /api/routers/{id}
        //=============================================================================
        void HttpServer::handle_put_router(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId id = 0;
            if (!require_path_id(req, res, id))
            {
                return;
            }

            nlohmann::json body;
            if (!parse_body(req, res, body))
            {
                return;
            }

            registry::RouterUpdateRequest request;
            std::string error;
            if (!decode_router_update(body, request, error))
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid request body: " + error);
                return;
            }

            if (!registry_.get_router(id))
            {
                send_error(res, StatusCode::NOT_FOUND, "router with ID " + std::to_string(id) + " not found");
                return;
            }

            auto router = registry_.update_router(id, request, error);
            if (!router)
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, error);
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(encode_router(*router), "Router updated"));
        }

        //=============================================================================
        // DELETE /api/routers/{id}
        //=============================================================================
        void HttpServer::handle_delete_router(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId id = 0;
            if (!require_path_id(req, res, id))
            {
                return;
            }

            std::string error;
            if (!registry_.delete_router(id, error))
            {
                send_error(res, StatusCode::NOT_FOUND, "router with ID " + std::to_string(id) + " not found");
                return;
            }

            // A deleted router keeps no live session
            auto disconnected = connections_.disconnect(id);
            if (disconnected.success)
            {
                LOG_INFO("[HTTP] Closed session of deleted router " << id);
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Router deleted"));
        }

        //=============================================================================
        // PATCH /api/routers/{id}/status
        //=============================================================================
        void HttpServer::handle_patch_router_status(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId id = 0;
            if (!require_path_id(req, res, id))
            {
                return;
            }

            nlohmann::json body;
            if (!parse_body(req, res, body))
            {
                return;
            }

            registry::RouterStatusUpdate update;
            std::string error;
            if (!decode_status_update(body, update, error))
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid request body: " + error);
                return;
            }

            if (!registry_.update_status(id, update, error))
            {
                send_error(res, StatusCode::NOT_FOUND, "router with ID " + std::to_string(id) + " not found");
                return;
            }

            send_json(res, StatusCode::OK, make_success_response(nullptr, "Router status updated"));
        }

        //=============================================================================
        // PATCH /api/routers/{id}/active
        //=============================================================================
        void HttpServer::handle_patch_router_active(const httplib::Request &req, httplib::Response &res)
        {
            registry::RouterId id = 0;
            if (!require_path_id(req, res, id))
            {
                return;
            }

            nlohmann::json body;
            if (!parse_body(req, res, body))
            {
                return;
            }

            bool is_active = false;
            std::string error;
            if (!decode_active_flag(body, is_active, error))
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid request body: " + error);
                return;
            }

            if (!registry_.set_active(id, is_active, error))
            {
                send_error(res, StatusCode::NOT_FOUND, "router with ID " + std::to_string(id) + " not found");
                return;
            }

            send_json(res, StatusCode::OK,
                      make_success_response(nullptr, is_active ? "Router activated" : "Router deactivated"));
        }

    } // namespace http
} // namespace routerlink
