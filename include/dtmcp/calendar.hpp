#pragma once
#include "civil_date.hpp"
#include "timezone.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dtmcp {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// ---------- Results ----------

struct CurrentDateTime {
    std::string datetime;       // ISO 8601 with offset
    std::string date;
    std::string time;
    std::string timezone;
    std::string day_of_week;
    int week_number = 0;
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
};

struct DateShift {
    std::string original;
    std::string result;
    int days_added = 0;
    std::string day_of_week;
};

struct WeekendCheck {
    std::string date;
    std::string day_of_week;
    bool is_weekend = false;
};

struct WeekNumber {
    std::string date;
    int week_number = 0;
    int year = 0;
};

void to_json(nlohmann::json& j, const CurrentDateTime& t);
void to_json(nlohmann::json& j, const DateShift& t);
void to_json(nlohmann::json& j, const WeekendCheck& t);
void to_json(nlohmann::json& j, const WeekNumber& t);

// ---------- Tools ----------

/// Date/time operations behind the tool catalog. Unknown timezones and
/// unparsable dates never raise: they fall back to the default zone and to
/// today's date in that zone.
class DateTimeTools {
public:
    struct Options {
        Clock clock;
        std::string zoneinfo_root{DEFAULT_ZONEINFO_ROOT};
        std::optional<std::string> default_timezone;
    };

    DateTimeTools();
    explicit DateTimeTools(Options opts);

    [[nodiscard]] CurrentDateTime current_datetime(const std::optional<std::string>& timezone) const;
    [[nodiscard]] std::string iso8601_timestamp() const;
    [[nodiscard]] DateShift add_days(const std::optional<std::string>& date, int days) const;
    [[nodiscard]] WeekendCheck is_weekend(const std::optional<std::string>& date) const;
    [[nodiscard]] WeekNumber week_number(const std::optional<std::string>& date) const;

private:
    CivilDate date_or_today(const std::optional<std::string>& date) const;

    Clock clock_;
    TimeZoneDatabase zones_;
};

/// YYYY-MM-DDTHH:MM:SS.fffffff followed by "Z" for a zero offset in UTC,
/// otherwise "+HH:MM" / "-HH:MM".
std::string format_iso8601(const ZonedTime& zt, bool utc_designator);

} // namespace dtmcp
