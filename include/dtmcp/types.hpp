#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace dtmcp {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

/// Tool results always travel as a list of text blocks.
struct CallToolResult {
    std::vector<TextContent> content;

    bool operator==(const CallToolResult& o) const { return content == o.content; }
};

// ---------- Handshake ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;

    bool operator==(const ServerCapabilities& o) const { return tools == o.tools; }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace dtmcp
