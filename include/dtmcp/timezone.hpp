#pragma once
#include "civil_date.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dtmcp {

constexpr std::string_view DEFAULT_ZONEINFO_ROOT = "/usr/share/zoneinfo";
constexpr std::string_view UTC_ZONE = "UTC";

/// Wall-clock reading of an instant in a particular zone.
struct ZonedTime {
    CivilDate date;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int64_t ticks = 0;              // 100 ns units within the second
    int utc_offset_seconds = 0;
    std::string zone;
};

/// Resolves IANA zone identifiers against a TZif database on disk and
/// converts instants to local wall-clock time.
class TimeZoneDatabase {
public:
    TimeZoneDatabase();
    explicit TimeZoneDatabase(std::string zoneinfo_root,
                              std::optional<std::string> default_zone = std::nullopt);

    /// True for "UTC" and for any identifier naming a TZif file under the root.
    [[nodiscard]] bool is_known(std::string_view name) const;

    /// The zone used when none (or an unknown one) is requested.
    [[nodiscard]] const std::string& default_zone() const { return default_zone_; }

    /// Requested zone if known, otherwise the default zone. Never throws.
    [[nodiscard]] std::string resolve(const std::optional<std::string>& requested) const;

    /// `zone` must be a resolved identifier.
    [[nodiscard]] ZonedTime to_local(std::chrono::system_clock::time_point tp,
                                     const std::string& zone) const;

    [[nodiscard]] const std::string& zoneinfo_root() const { return root_; }

private:
    std::string detect_system_zone() const;
    std::string tz_spec(const std::string& zone) const;

    std::string root_;
    std::string default_zone_;
};

} // namespace dtmcp
