#include "dtmcp/tool_dispatcher.hpp"
#include "dtmcp/error.hpp"
#include "dtmcp/logging.hpp"

#include <log4cplus/loggingmacros.h>

#include <limits>
#include <optional>

namespace dtmcp {

namespace {

// Absent and null both mean "use the default".
std::optional<std::string> optional_string(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw InvalidArgumentError(std::string("Argument '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<int> optional_int(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw InvalidArgumentError(std::string("Argument '") + key + "' must be an integer");
    }
    if (it->is_number_unsigned()) {
        if (it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw InvalidArgumentError(std::string("Argument '") + key + "' is out of range");
        }
        return static_cast<int>(it->get<uint64_t>());
    }
    const int64_t value = it->get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw InvalidArgumentError(std::string("Argument '") + key + "' is out of range");
    }
    return static_cast<int>(value);
}

} // anonymous namespace

std::string to_text(const ToolOutput& output) {
    if (const auto* text = std::get_if<std::string>(&output)) {
        return *text;
    }
    return std::get<nlohmann::json>(output).dump();
}

ToolDispatcher::ToolDispatcher(DateTimeTools tools)
    : tools_(std::move(tools)) {
}

ToolOutput ToolDispatcher::dispatch(std::string_view name, const nlohmann::json& arguments) const {
    auto id = ToolRegistry::find(name);
    if (!id) {
        throw UnknownToolError(std::string(name));
    }
    return dispatch(*id, arguments);
}

ToolOutput ToolDispatcher::dispatch(ToolId id, const nlohmann::json& arguments) const {
    LOG4CPLUS_DEBUG(tools_logger(), "Calling tool: " << ToolRegistry::name_of(id));

    if (!arguments.is_object()) {
        throw InvalidArgumentError("Tool arguments must be a JSON object");
    }

    switch (id) {
        case ToolId::GetCurrentDatetime:
            return nlohmann::json(tools_.current_datetime(optional_string(arguments, "timezone")));
        case ToolId::GetIso8601Timestamp:
            return tools_.iso8601_timestamp();
        case ToolId::AddDays: {
            auto date = optional_string(arguments, "date");
            auto days = optional_int(arguments, "days").value_or(0);
            return nlohmann::json(tools_.add_days(date, days));
        }
        case ToolId::IsWeekend:
            return nlohmann::json(tools_.is_weekend(optional_string(arguments, "date")));
        case ToolId::GetWeekNumber:
            return nlohmann::json(tools_.week_number(optional_string(arguments, "date")));
    }
    throw UnknownToolError(std::string(ToolRegistry::name_of(id)));
}

} // namespace dtmcp
