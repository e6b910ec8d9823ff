#include "dtmcp/router.hpp"
#include "dtmcp/error.hpp"
#include "dtmcp/logging.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace dtmcp {

void Router::on_request(const std::string& method, RequestHandler handler, ParamsPolicy policy) {
    routes_[method] = Route{std::move(handler), policy};
}

bool Router::has_handler(const std::string& method) const {
    return routes_.count(method) > 0;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const noexcept {
    auto it = routes_.find(req.method);
    if (it == routes_.end()
        || (it->second.policy == ParamsPolicy::Required && !req.params)) {
        LOG4CPLUS_DEBUG(server_logger(), "Method not found: " << req.method);
        return JsonRpcResponse::failure(req.id, error::MethodNotFound,
                                        "Method not found: " + req.method);
    }

    try {
        return invoke(it->second, req);
    } catch (const McpProtocolError& e) {
        LOG4CPLUS_WARN(server_logger(), req.method << " failed (" << e.code << "): " << e.what());
        return JsonRpcResponse::failure(req.id, e.code, e.what());
    } catch (const std::exception& e) {
        LOG4CPLUS_WARN(server_logger(), req.method << " failed: " << e.what());
        return JsonRpcResponse::failure(req.id, error::InternalError, e.what());
    } catch (...) {
        LOG4CPLUS_ERROR(server_logger(), req.method << " failed with a non-standard exception");
        return JsonRpcResponse::failure(req.id, error::InternalError, "Internal error");
    }
}

JsonRpcResponse Router::invoke(const Route& route, const JsonRpcRequest& req) const {
    LOG4CPLUS_DEBUG(server_logger(), "Dispatching " << req.method);

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    HandlerResult result = route.handler(params);

    if (auto* ok = std::get_if<nlohmann::json>(&result)) {
        return JsonRpcResponse::success(req.id, std::move(*ok));
    }
    return JsonRpcResponse{req.id, std::nullopt, std::get<JsonRpcError>(std::move(result))};
}

} // namespace dtmcp
