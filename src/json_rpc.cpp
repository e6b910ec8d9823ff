#include "dtmcp/json_rpc.hpp"
#include "dtmcp/version.hpp"

namespace dtmcp {

namespace {

nlohmann::json id_to_json(const std::optional<RequestId>& id) {
    if (!id) return nullptr;
    nlohmann::json id_j;
    to_json(id_j, *id);
    return id_j;
}

std::optional<RequestId> id_from_json(const nlohmann::json& j) {
    if (!j.contains("id") || j.at("id").is_null()) return std::nullopt;
    RequestId id;
    from_json(j.at("id"), id);
    return id;
}

} // anonymous namespace

JsonRpcResponse JsonRpcResponse::success(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<RequestId> id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.id) j["id"] = id_to_json(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    r.id = id_from_json(j);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params") && !j.at("params").is_null()) r.params = j.at("params");
}

// The id member is mandatory in a response; an unknown id is written as null.
void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_to_json(r.id);
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    r.id = id_from_json(j);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

} // namespace dtmcp
