#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <unordered_map>
#include <string>
#include <variant>

namespace dtmcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// Whether a method is routable without a params member.
enum class ParamsPolicy {
    Optional,
    Required
};

class Router {
public:
    /// Register a request handler for a method. Absent params reach an
    /// Optional handler as an empty object; a Required handler is not
    /// matched at all when params are absent.
    void on_request(const std::string& method, RequestHandler handler,
                    ParamsPolicy policy = ParamsPolicy::Optional);

    /// Route a request and build its response. Never throws: handler
    /// exceptions become error responses carrying the request id.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const noexcept;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    struct Route {
        RequestHandler handler;
        ParamsPolicy policy;
    };

    JsonRpcResponse invoke(const Route& route, const JsonRpcRequest& req) const;

    std::unordered_map<std::string, Route> routes_;
};

} // namespace dtmcp
