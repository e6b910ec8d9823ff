#pragma once
#include "calendar.hpp"
#include "tool_registry.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace dtmcp {

/// Raw tool output before MCP content wrapping.
using ToolOutput = std::variant<std::string, nlohmann::json>;

/// Text carried in the MCP content block: strings verbatim, structured
/// values as compact JSON.
std::string to_text(const ToolOutput& output);

class ToolDispatcher {
public:
    explicit ToolDispatcher(DateTimeTools tools);

    /// Throws UnknownToolError for names outside the catalog and
    /// InvalidArgumentError when an argument has the wrong type.
    [[nodiscard]] ToolOutput dispatch(std::string_view name, const nlohmann::json& arguments) const;
    [[nodiscard]] ToolOutput dispatch(ToolId id, const nlohmann::json& arguments) const;

private:
    DateTimeTools tools_;
};

} // namespace dtmcp
