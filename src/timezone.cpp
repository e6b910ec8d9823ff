#include "dtmcp/timezone.hpp"
#include "dtmcp/logging.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace dtmcp {

namespace {

constexpr const char* ETC_TIMEZONE = "/etc/timezone";
constexpr const char* ETC_LOCALTIME = "/etc/localtime";

// Points TZ at one zone for the lifetime of the guard and restores the
// previous value afterwards. The server is single-threaded; the guard is not
// safe against concurrent localtime calls.
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const std::string& spec) {
        if (const char* old = std::getenv("TZ")) {
            saved_ = std::string(old);
        }
        ::setenv("TZ", spec.c_str(), 1);
        ::tzset();
    }

    ~ScopedTimeZone() {
        if (saved_) {
            ::setenv("TZ", saved_->c_str(), 1);
        } else {
            ::unsetenv("TZ");
        }
        ::tzset();
    }

    ScopedTimeZone(const ScopedTimeZone&) = delete;
    ScopedTimeZone& operator=(const ScopedTimeZone&) = delete;

private:
    std::optional<std::string> saved_;
};

bool is_safe_zone_name(std::string_view name) {
    if (name.empty() || name.front() == '/') return false;
    if (name.find('\0') != std::string_view::npos) return false;
    for (const auto& part : fs::path(std::string(name))) {
        if (part == "..") return false;
    }
    return true;
}

bool is_tzif_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    std::ifstream in(path, std::ios::binary);
    char magic[4] = {};
    if (!in.read(magic, sizeof(magic))) return false;
    return std::memcmp(magic, "TZif", sizeof(magic)) == 0;
}

std::string trim_line(std::string s) {
    const char* ws = " \t\r\n";
    s.erase(0, s.find_first_not_of(ws));
    auto end = s.find_last_not_of(ws);
    s.erase(end == std::string::npos ? 0 : end + 1);
    return s;
}

} // anonymous namespace

TimeZoneDatabase::TimeZoneDatabase()
    : TimeZoneDatabase(std::string(DEFAULT_ZONEINFO_ROOT)) {
}

TimeZoneDatabase::TimeZoneDatabase(std::string zoneinfo_root,
                                   std::optional<std::string> default_zone)
    : root_(std::move(zoneinfo_root)) {
    if (default_zone && is_known(*default_zone)) {
        default_zone_ = *default_zone;
    } else {
        if (default_zone) {
            LOG4CPLUS_WARN(tools_logger(), "Configured timezone '" << *default_zone
                           << "' is unknown, using system timezone");
        }
        default_zone_ = detect_system_zone();
    }
    LOG4CPLUS_DEBUG(tools_logger(), "Default timezone: " << default_zone_);
}

bool TimeZoneDatabase::is_known(std::string_view name) const {
    if (name == UTC_ZONE) return true;
    if (!is_safe_zone_name(name)) return false;
    return is_tzif_file(fs::path(root_) / std::string(name));
}

std::string TimeZoneDatabase::resolve(const std::optional<std::string>& requested) const {
    if (!requested || trim_line(*requested).empty()) return default_zone_;
    if (is_known(*requested)) return *requested;
    LOG4CPLUS_DEBUG(tools_logger(), "Unknown timezone '" << *requested
                    << "', falling back to " << default_zone_);
    return default_zone_;
}

std::string TimeZoneDatabase::detect_system_zone() const {
    if (const char* tz = std::getenv("TZ")) {
        std::string name(tz);
        if (!name.empty() && name.front() == ':') name.erase(0, 1);
        const std::string prefix = root_ + "/";
        if (name.compare(0, prefix.size(), prefix) == 0) name.erase(0, prefix.size());
        if (is_known(name)) return name;
    }

    std::ifstream etc_timezone(ETC_TIMEZONE);
    std::string line;
    if (etc_timezone && std::getline(etc_timezone, line)) {
        line = trim_line(line);
        if (is_known(line)) return line;
    }

    std::error_code ec;
    fs::path target = fs::read_symlink(ETC_LOCALTIME, ec);
    if (!ec) {
        const std::string s = target.string();
        const std::string marker = "zoneinfo/";
        auto pos = s.rfind(marker);
        if (pos != std::string::npos) {
            std::string name = s.substr(pos + marker.size());
            if (is_known(name)) return name;
        }
    }

    return std::string(UTC_ZONE);
}

std::string TimeZoneDatabase::tz_spec(const std::string& zone) const {
    fs::path file = fs::path(root_) / zone;
    if (zone != UTC_ZONE || is_tzif_file(file)) {
        return ":" + fs::absolute(file).string();
    }
    // POSIX rule string, valid without any database on disk
    return "UTC0";
}

ZonedTime TimeZoneDatabase::to_local(std::chrono::system_clock::time_point tp,
                                     const std::string& zone) const {
    using namespace std::chrono;

    const auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    if (secs > since_epoch) secs -= seconds(1);
    const int64_t ticks = (since_epoch - secs).count() / 100;

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    {
        ScopedTimeZone guard(tz_spec(zone));
        if (::localtime_r(&t, &tm) == nullptr) {
            throw std::runtime_error("Cannot convert time to zone " + zone);
        }
    }

    ZonedTime zt;
    zt.date = CivilDate{tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                        static_cast<unsigned>(tm.tm_mday)};
    zt.hour = tm.tm_hour;
    zt.minute = tm.tm_min;
    zt.second = tm.tm_sec;
    zt.ticks = ticks;
    zt.utc_offset_seconds = static_cast<int>(tm.tm_gmtoff);
    zt.zone = zone;
    return zt;
}

} // namespace dtmcp
