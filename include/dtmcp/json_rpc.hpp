#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace dtmcp {

using RequestId = std::variant<int64_t, std::string>;

// Helper to convert RequestId to json
inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()
        && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument("RequestId is out of the int64 range");
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

/// A request without an id is a notification. It is still answered,
/// with a null id in the response.
struct JsonRpcRequest {
    std::optional<RequestId> id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool is_notification() const { return !id.has_value(); }

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result and error is set once a response leaves the router.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(std::optional<RequestId> id, nlohmann::json result);
    static JsonRpcResponse failure(std::optional<RequestId> id, int code, std::string message);

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace dtmcp
