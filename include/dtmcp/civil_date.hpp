#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dtmcp {

/// Proleptic Gregorian calendar date.
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const CivilDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const CivilDate& o) const { return !(*this == o); }
};

enum class Weekday { Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

struct IsoWeek {
    int week;
    int year;   // ISO week-numbering year, may differ from the calendar year
};

constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

bool is_leap_year(int year);
unsigned days_in_month(int year, unsigned month);
bool is_valid(const CivilDate& d);

/// Days since 1970-01-01.
int64_t days_from_civil(const CivilDate& d);
CivilDate civil_from_days(int64_t days);

Weekday weekday_of(const CivilDate& d);
std::string_view weekday_name(Weekday wd);
bool is_weekend(Weekday wd);

IsoWeek iso_week_of(const CivilDate& d);

/// Shift by a signed number of days. Throws std::out_of_range when the
/// result leaves years 0001..9999.
CivilDate add_days(const CivilDate& d, int64_t days);

/// Accepts "YYYY-M-D" with '-' or '/' separators and 1-2 digit month and day,
/// optionally followed by 'T' or ' ' and a "HH:MM[:SS[.f]]" time, then "Z" or a
/// "+HH:MM" offset. The time and offset are ignored. Surrounding whitespace is
/// allowed.
std::optional<CivilDate> parse_iso_date(std::string_view text);

/// YYYY-MM-DD
std::string format_iso_date(const CivilDate& d);

} // namespace dtmcp
