#include <gtest/gtest.h>
#include "dtmcp/tool_dispatcher.hpp"
#include "dtmcp/error.hpp"
#include <chrono>
#include <stdexcept>

using namespace dtmcp;
using json = nlohmann::json;

namespace {

ToolDispatcher make_dispatcher() {
    DateTimeTools::Options opts;
    opts.clock = [] {
        using namespace std::chrono;
        // 2025-11-29T00:00:00Z
        return system_clock::time_point(seconds(1764374400));
    };
    opts.zoneinfo_root = "/nonexistent/zoneinfo";
    opts.default_timezone = "UTC";
    return ToolDispatcher(DateTimeTools(opts));
}

json as_json(const ToolOutput& out) {
    return std::get<json>(out);
}

} // anonymous namespace

TEST(ToolDispatcher, AddDays) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("add_days", {{"date", "2025-11-29"}, {"days", 2}}));
    EXPECT_EQ(out["original"], "2025-11-29");
    EXPECT_EQ(out["result"], "2025-12-01");
    EXPECT_EQ(out["daysAdded"], 2);
    EXPECT_EQ(out["dayOfWeek"], "Monday");
}

TEST(ToolDispatcher, AddDaysWithoutArguments) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("add_days", json::object()));
    EXPECT_EQ(out["original"], "2025-11-29");
    EXPECT_EQ(out["result"], "2025-11-29");
    EXPECT_EQ(out["daysAdded"], 0);
}

TEST(ToolDispatcher, NullArgumentsUseDefaults) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("add_days", {{"date", nullptr}, {"days", nullptr}}));
    EXPECT_EQ(out["original"], "2025-11-29");
    EXPECT_EQ(out["daysAdded"], 0);
}

TEST(ToolDispatcher, UnknownArgumentsAreIgnored) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("is_weekend", {{"date", "2025-11-29"}, {"verbose", true}}));
    EXPECT_EQ(out["isWeekend"], true);
}

TEST(ToolDispatcher, IsWeekendAndWeekNumber) {
    auto d = make_dispatcher();

    auto weekend = as_json(d.dispatch("is_weekend", {{"date", "2025-11-29"}}));
    EXPECT_EQ(weekend["isWeekend"], true);
    EXPECT_EQ(weekend["dayOfWeek"], "Saturday");

    auto week = as_json(d.dispatch("get_week_number", {{"date", "2025-11-29"}}));
    EXPECT_EQ(week["weekNumber"], 48);
    EXPECT_EQ(week["year"], 2025);
}

TEST(ToolDispatcher, CurrentDatetime) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("get_current_datetime", {{"timezone", "UTC"}}));
    EXPECT_EQ(out["timezone"], "UTC");
    EXPECT_EQ(out["datetime"], "2025-11-29T00:00:00.0000000+00:00");
    EXPECT_EQ(out["time"], "00:00:00");
}

TEST(ToolDispatcher, TimezoneWithNulFallsBack) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch("get_current_datetime",
                                  {{"timezone", std::string("Etc/UTC\0x", 9)}}));
    EXPECT_EQ(out["timezone"], "UTC");
}

TEST(ToolDispatcher, TimestampIsPlainString) {
    auto d = make_dispatcher();
    auto out = d.dispatch("get_iso8601_timestamp", json::object());
    ASSERT_TRUE(std::holds_alternative<std::string>(out));
    EXPECT_EQ(std::get<std::string>(out), "2025-11-29T00:00:00.0000000Z");
    EXPECT_EQ(to_text(out), "2025-11-29T00:00:00.0000000Z");
}

TEST(ToolDispatcher, StructuredOutputIsCompactJsonText) {
    auto d = make_dispatcher();
    auto out = d.dispatch("get_week_number", {{"date", "2025-11-29"}});
    EXPECT_EQ(to_text(out), R"({"date":"2025-11-29","weekNumber":48,"year":2025})");
}

TEST(ToolDispatcher, DispatchById) {
    auto d = make_dispatcher();
    auto out = as_json(d.dispatch(ToolId::IsWeekend, {{"date", "2025-12-01"}}));
    EXPECT_EQ(out["isWeekend"], false);
}

TEST(ToolDispatcher, UnknownTool) {
    auto d = make_dispatcher();
    try {
        (void)d.dispatch("get_moon_phase", json::object());
        FAIL() << "expected UnknownToolError";
    } catch (const UnknownToolError& e) {
        EXPECT_STREQ(e.what(), "Unknown tool: get_moon_phase");
    }
}

TEST(ToolDispatcher, WrongArgumentTypes) {
    auto d = make_dispatcher();
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", "2"}}), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", 1.5}}), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", true}}), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("is_weekend", {{"date", 20251129}}), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("get_current_datetime", {{"timezone", json::array()}}),
                 InvalidArgumentError);
}

TEST(ToolDispatcher, DaysMustFitInt32) {
    auto d = make_dispatcher();
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", int64_t{1} << 31}}), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", -(int64_t{1} << 31) - 1}}),
                 InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("add_days", {{"days", uint64_t{1} << 40}}), InvalidArgumentError);
}

TEST(ToolDispatcher, DaysInRangeButResultOutOfRange) {
    auto d = make_dispatcher();
    EXPECT_THROW((void)d.dispatch("add_days", {{"date", "2025-11-29"}, {"days", 2147483647}}),
                 std::out_of_range);
}

TEST(ToolDispatcher, ArgumentsMustBeObject) {
    auto d = make_dispatcher();
    EXPECT_THROW((void)d.dispatch("add_days", json::array({1, 2})), InvalidArgumentError);
    EXPECT_THROW((void)d.dispatch("is_weekend", json("2025-11-29")), InvalidArgumentError);
}
