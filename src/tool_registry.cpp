#include "dtmcp/tool_registry.hpp"
#include <array>
#include <utility>

namespace dtmcp {

namespace {

constexpr std::array<std::pair<std::string_view, ToolId>, 5> TOOL_NAMES = {{
    {"get_current_datetime", ToolId::GetCurrentDatetime},
    {"get_iso8601_timestamp", ToolId::GetIso8601Timestamp},
    {"add_days", ToolId::AddDays},
    {"is_weekend", ToolId::IsWeekend},
    {"get_week_number", ToolId::GetWeekNumber},
}};

const char* const DATE_DESCRIPTION = "Date in YYYY-MM-DD format (default: today)";

nlohmann::json date_only_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"date", {{"type", "string"}, {"description", DATE_DESCRIPTION}}}
        }}
    };
}

std::vector<ToolDefinition> build_catalog() {
    std::vector<ToolDefinition> tools;

    tools.push_back(ToolDefinition{
        "get_current_datetime",
        "Get current date and time in specified timezone (default: local)",
        {
            {"type", "object"},
            {"properties", {
                {"timezone", {{"type", "string"},
                              {"description", "Timezone name (e.g., 'Europe/Oslo', 'UTC')"}}}
            }}
        }
    });

    tools.push_back(ToolDefinition{
        "get_iso8601_timestamp",
        "Get current timestamp in ISO 8601 format (UTC)",
        {
            {"type", "object"},
            {"properties", nlohmann::json::object()}
        }
    });

    // "days" is listed as required even though a missing value defaults to 0.
    tools.push_back(ToolDefinition{
        "add_days",
        "Add or subtract days from a date",
        {
            {"type", "object"},
            {"properties", {
                {"date", {{"type", "string"}, {"description", DATE_DESCRIPTION}}},
                {"days", {{"type", "integer"},
                          {"description", "Number of days to add (negative to subtract)"}}}
            }},
            {"required", nlohmann::json::array({"days"})}
        }
    });

    tools.push_back(ToolDefinition{
        "is_weekend",
        "Check if a date is a weekend (Saturday or Sunday)",
        date_only_schema()
    });

    tools.push_back(ToolDefinition{
        "get_week_number",
        "Get ISO 8601 week number for a date",
        date_only_schema()
    });

    return tools;
}

} // anonymous namespace

const std::vector<ToolDefinition>& ToolRegistry::list() {
    static const std::vector<ToolDefinition> catalog = build_catalog();
    return catalog;
}

std::optional<ToolId> ToolRegistry::find(std::string_view name) {
    for (const auto& [tool_name, id] : TOOL_NAMES) {
        if (tool_name == name) return id;
    }
    return std::nullopt;
}

std::string_view ToolRegistry::name_of(ToolId id) {
    for (const auto& [tool_name, tool_id] : TOOL_NAMES) {
        if (tool_id == id) return tool_name;
    }
    return {};
}

} // namespace dtmcp
