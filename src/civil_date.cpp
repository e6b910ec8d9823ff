#include "dtmcp/civil_date.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace dtmcp {

namespace {

constexpr std::array<std::string_view, 7> WEEKDAY_NAMES = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

// Forward-only reader over the text of a date.
class DateScanner {
public:
    explicit DateScanner(std::string_view s) : s_(s) {}

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
    bool done() const { return pos_ == s_.size(); }

    bool accept(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // Between min_digits and max_digits decimal digits, greedy.
    bool number(size_t min_digits, size_t max_digits, int& out) {
        size_t n = 0;
        int value = 0;
        while (n < max_digits && pos_ + n < s_.size()
               && std::isdigit(static_cast<unsigned char>(s_[pos_ + n]))) {
            value = value * 10 + (s_[pos_ + n] - '0');
            ++n;
        }
        if (n < min_digits) return false;
        if (pos_ + n < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_ + n]))) {
            return false;
        }
        pos_ += n;
        out = value;
        return true;
    }

    // Nothing, "Z", or "+HH[:MM]" / "-HH[:MM]".
    bool utc_offset() {
        if (accept('Z') || accept('z')) return true;
        if (!accept('+') && !accept('-')) return true;
        int hh = 0, mm = 0;
        if (!number(2, 2, hh)) return false;
        if (accept(':') && !number(2, 2, mm)) return false;
        return hh <= 14 && mm <= 59;
    }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// ISO weekday: Monday = 1 .. Sunday = 7
int iso_weekday(const CivilDate& d) {
    int wd = static_cast<int>(weekday_of(d));
    return wd == 0 ? 7 : wd;
}

int iso_weeks_in_year(int year) {
    int jan1 = iso_weekday(CivilDate{year, 1, 1});
    if (jan1 == 4 || (is_leap_year(year) && jan1 == 3)) return 53;
    return 52;
}

} // anonymous namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static constexpr std::array<unsigned, 12> DAYS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

bool is_valid(const CivilDate& d) {
    return d.year >= MIN_YEAR && d.year <= MAX_YEAR
           && d.month >= 1 && d.month <= 12
           && d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

// Era-based conversion: 400-year eras of 146097 days.
int64_t days_from_civil(const CivilDate& d) {
    const int64_t y = static_cast<int64_t>(d.year) - (d.month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (static_cast<int64_t>(d.month) + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(d.day) - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t day = doy - (153 * mp + 2) / 5 + 1;
    const int64_t month = mp < 10 ? mp + 3 : mp - 9;
    const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CivilDate{static_cast<int>(year), static_cast<unsigned>(month), static_cast<unsigned>(day)};
}

Weekday weekday_of(const CivilDate& d) {
    // 1970-01-01 was a Thursday
    const int64_t days = days_from_civil(d);
    const int64_t wd = ((days + 4) % 7 + 7) % 7;
    return static_cast<Weekday>(wd);
}

std::string_view weekday_name(Weekday wd) {
    return WEEKDAY_NAMES[static_cast<size_t>(wd)];
}

bool is_weekend(Weekday wd) {
    return wd == Weekday::Saturday || wd == Weekday::Sunday;
}

IsoWeek iso_week_of(const CivilDate& d) {
    const int ordinal = static_cast<int>(days_from_civil(d) - days_from_civil(CivilDate{d.year, 1, 1})) + 1;
    const int week = (ordinal - iso_weekday(d) + 10) / 7;
    if (week < 1) return IsoWeek{iso_weeks_in_year(d.year - 1), d.year - 1};
    if (week > iso_weeks_in_year(d.year)) return IsoWeek{1, d.year + 1};
    return IsoWeek{week, d.year};
}

CivilDate add_days(const CivilDate& d, int64_t days) {
    CivilDate result = civil_from_days(days_from_civil(d) + days);
    if (result.year < MIN_YEAR || result.year > MAX_YEAR) {
        throw std::out_of_range(
            "The added or subtracted value results in a date outside 0001-01-01..9999-12-31");
    }
    return result;
}

std::optional<CivilDate> parse_iso_date(std::string_view text) {
    DateScanner in(trim(text));

    int year = 0, month = 0, day = 0;
    if (!in.number(4, 4, year)) return std::nullopt;
    const char sep = in.peek();
    if ((sep != '-' && sep != '/') || !in.accept(sep)) return std::nullopt;
    if (!in.number(1, 2, month) || !in.accept(sep) || !in.number(1, 2, day)) return std::nullopt;

    // Optional time of day; its value is not used
    if (in.accept('T') || in.accept('t') || in.accept(' ')) {
        int hh = 0, mm = 0, ss = 0, frac = 0;
        if (!in.number(1, 2, hh) || !in.accept(':') || !in.number(2, 2, mm)) return std::nullopt;
        if (in.accept(':')) {
            if (!in.number(2, 2, ss)) return std::nullopt;
            if (in.accept('.') && !in.number(1, 9, frac)) return std::nullopt;
        }
        if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;
    }
    if (!in.utc_offset() || !in.done()) return std::nullopt;

    CivilDate d{year, static_cast<unsigned>(month), static_cast<unsigned>(day)};
    if (!is_valid(d)) return std::nullopt;
    return d;
}

std::string format_iso_date(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", d.year, d.month, d.day);
    return buf;
}

} // namespace dtmcp
