#pragma once
#include "types.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace dtmcp {

/// Closed set of callable tools. Order matches the discovery catalog.
enum class ToolId {
    GetCurrentDatetime,
    GetIso8601Timestamp,
    AddDays,
    IsWeekend,
    GetWeekNumber
};

class ToolRegistry {
public:
    /// The immutable catalog, built once on first use.
    [[nodiscard]] static const std::vector<ToolDefinition>& list();

    [[nodiscard]] static std::optional<ToolId> find(std::string_view name);

    [[nodiscard]] static std::string_view name_of(ToolId id);
};

} // namespace dtmcp
