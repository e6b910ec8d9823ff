#include "dtmcp/types.hpp"
#include <stdexcept>

namespace dtmcp {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.at("type").get<std::string>();
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    t.input_schema = j.at("inputSchema");
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            t.content.push_back(cj.get<TextContent>());
        }
    }
}

// ---------- ServerCapabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"serverInfo", t.server_info},
        {"capabilities", t.capabilities}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("capabilities")) t.capabilities = j.at("capabilities").get<ServerCapabilities>();
}

} // namespace dtmcp
