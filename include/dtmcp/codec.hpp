#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace dtmcp {

class Codec {
public:
    /// Parse one raw line into a request envelope.
    /// Throws McpParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static JsonRpcRequest parse_request(std::string_view raw);

    /// Serialize a response to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    /// Serialize a request (used by clients and tests driving the server).
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& req);

private:
    static JsonRpcRequest parse_object(const nlohmann::json& j);
};

} // namespace dtmcp
