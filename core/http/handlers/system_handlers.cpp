#include "../../connection/connection_manager.hpp"
#include "../../logging/logger.hpp"
#include "../../registry/router_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace routerlink {
namespace http {

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    nlohmann::json data = {{"routers", registry_.get_all_routers().size()},
                           {"connections", connections_.connection_count()}};

    send_json(res, StatusCode::OK, make_success_response(data, "API is running"));
}

}  // namespace http
}  // namespace routerlink
