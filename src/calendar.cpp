#include "dtmcp/calendar.hpp"
#include "dtmcp/logging.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdio>
#include <cstdlib>

namespace dtmcp {

// ---------- JSON ----------

void to_json(nlohmann::json& j, const CurrentDateTime& t) {
    j = {
        {"datetime", t.datetime},
        {"date", t.date},
        {"time", t.time},
        {"timezone", t.timezone},
        {"dayOfWeek", t.day_of_week},
        {"weekNumber", t.week_number},
        {"year", t.year},
        {"month", t.month},
        {"day", t.day}
    };
}

void to_json(nlohmann::json& j, const DateShift& t) {
    j = {
        {"original", t.original},
        {"result", t.result},
        {"daysAdded", t.days_added},
        {"dayOfWeek", t.day_of_week}
    };
}

void to_json(nlohmann::json& j, const WeekendCheck& t) {
    j = {{"date", t.date}, {"dayOfWeek", t.day_of_week}, {"isWeekend", t.is_weekend}};
}

void to_json(nlohmann::json& j, const WeekNumber& t) {
    j = {{"date", t.date}, {"weekNumber", t.week_number}, {"year", t.year}};
}

// ---------- Formatting ----------

std::string format_iso8601(const ZonedTime& zt, bool utc_designator) {
    char buf[48];
    int n = std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02d.%07lld",
                          format_iso_date(zt.date).c_str(), zt.hour, zt.minute, zt.second,
                          static_cast<long long>(zt.ticks));
    std::string out(buf, static_cast<size_t>(n));

    if (utc_designator && zt.utc_offset_seconds == 0) {
        out += 'Z';
        return out;
    }
    const int offset = zt.utc_offset_seconds;
    const int abs_minutes = std::abs(offset) / 60;
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", offset < 0 ? '-' : '+',
                  abs_minutes / 60, abs_minutes % 60);
    out += buf;
    return out;
}

// ---------- DateTimeTools ----------

DateTimeTools::DateTimeTools()
    : DateTimeTools(Options{}) {
}

DateTimeTools::DateTimeTools(Options opts)
    : clock_(opts.clock ? std::move(opts.clock) : Clock([] { return std::chrono::system_clock::now(); })),
      zones_(std::move(opts.zoneinfo_root), std::move(opts.default_timezone)) {
}

CivilDate DateTimeTools::date_or_today(const std::optional<std::string>& date) const {
    if (date) {
        if (auto parsed = parse_iso_date(*date)) return *parsed;
        LOG4CPLUS_DEBUG(tools_logger(), "Unparsable date '" << *date << "', using today");
    }
    return zones_.to_local(clock_(), zones_.default_zone()).date;
}

CurrentDateTime DateTimeTools::current_datetime(const std::optional<std::string>& timezone) const {
    const std::string zone = zones_.resolve(timezone);
    const ZonedTime now = zones_.to_local(clock_(), zone);

    char time_buf[16];
    std::snprintf(time_buf, sizeof(time_buf), "%02d:%02d:%02d", now.hour, now.minute, now.second);

    CurrentDateTime out;
    out.datetime = format_iso8601(now, false);
    out.date = format_iso_date(now.date);
    out.time = time_buf;
    out.timezone = zone;
    out.day_of_week = std::string(weekday_name(weekday_of(now.date)));
    out.week_number = iso_week_of(now.date).week;
    out.year = now.date.year;
    out.month = now.date.month;
    out.day = now.date.day;
    return out;
}

std::string DateTimeTools::iso8601_timestamp() const {
    return format_iso8601(zones_.to_local(clock_(), std::string(UTC_ZONE)), true);
}

DateShift DateTimeTools::add_days(const std::optional<std::string>& date, int days) const {
    const CivilDate base = date_or_today(date);
    const CivilDate shifted = dtmcp::add_days(base, days);

    DateShift out;
    out.original = format_iso_date(base);
    out.result = format_iso_date(shifted);
    out.days_added = days;
    out.day_of_week = std::string(weekday_name(weekday_of(shifted)));
    return out;
}

WeekendCheck DateTimeTools::is_weekend(const std::optional<std::string>& date) const {
    const CivilDate d = date_or_today(date);
    const Weekday wd = weekday_of(d);
    return WeekendCheck{format_iso_date(d), std::string(weekday_name(wd)), dtmcp::is_weekend(wd)};
}

WeekNumber DateTimeTools::week_number(const std::optional<std::string>& date) const {
    const CivilDate d = date_or_today(date);
    return WeekNumber{format_iso_date(d), iso_week_of(d).week, d.year};
}

} // namespace dtmcp
