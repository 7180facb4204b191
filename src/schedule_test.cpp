#include <chrono>
#include <ctime>
#include <variant>

#include <gtest/gtest.h>
#include <mw/utils.hpp>

#include "schedule.hpp"
#include "test_utils.hpp"

namespace
{

// 2024-01-02T03:04:05Z
const mw::Time NOW = mw::secondsToTime(1704164645);

std::tm localTm(mw::Time t)
{
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm tm = {};
    localtime_r(&secs, &tm);
    return tm;
}

} // namespace

TEST(Schedule, CanParseRelativeTime)
{
    ASSIGN_OR_FAIL(mw::Time t, parseScheduleTime("in 5m", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), mw::timeToSeconds(NOW) + 300);

    ASSIGN_OR_FAIL(t, parseScheduleTime("  In 2 Hours ", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), mw::timeToSeconds(NOW) + 7200);

    ASSIGN_OR_FAIL(t, parseScheduleTime("in 1d", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), mw::timeToSeconds(NOW) + 86400);

    ASSIGN_OR_FAIL(t, parseScheduleTime("in 30 minutes", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), mw::timeToSeconds(NOW) + 1800);
}

TEST(Schedule, CanParseISOTime)
{
    ASSIGN_OR_FAIL(mw::Time t, parseScheduleTime("2030-01-15T14:30:00Z", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), 1894717800);

    ASSIGN_OR_FAIL(t, parseScheduleTime("2030-01-15T15:30:00+01:00", NOW));
    EXPECT_EQ(mw::timeToSeconds(t), 1894717800);
}

TEST(Schedule, DateWithoutZoneIsLocal)
{
    ASSIGN_OR_FAIL(mw::Time t, parseScheduleTime("2030-01-15 14:30", NOW));
    std::tm tm = localTm(t);
    EXPECT_EQ(tm.tm_year + 1900, 2030);
    EXPECT_EQ(tm.tm_mon + 1, 1);
    EXPECT_EQ(tm.tm_mday, 15);
    EXPECT_EQ(tm.tm_hour, 14);
    EXPECT_EQ(tm.tm_min, 30);
}

TEST(Schedule, TimeOfDayIsInTheNext24Hours)
{
    ASSIGN_OR_FAIL(mw::Time t, parseScheduleTime("15:00", NOW));
    EXPECT_GT(t, NOW);
    EXPECT_LE(t, NOW + std::chrono::hours(24));
    EXPECT_EQ(localTm(t).tm_hour, 15);
    EXPECT_EQ(localTm(t).tm_min, 0);

    ASSIGN_OR_FAIL(mw::Time pm, parseScheduleTime("3pm", NOW));
    EXPECT_EQ(pm, t);

    ASSIGN_OR_FAIL(t, parseScheduleTime("12:15 am", NOW));
    EXPECT_EQ(localTm(t).tm_hour, 0);
    EXPECT_EQ(localTm(t).tm_min, 15);
}

TEST(Schedule, RejectsGarbage)
{
    auto t = parseScheduleTime("whenever", NOW);
    ASSERT_FALSE(t.has_value());
    EXPECT_TRUE(std::holds_alternative<PreconditionError>(t.error()));

    t = parseScheduleTime("in 3 fortnights", NOW);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(errorMsg(t.error()), "Unknown time unit: fortnights");

    EXPECT_FALSE(parseScheduleTime("13pm", NOW).has_value());
    EXPECT_FALSE(parseScheduleTime("in soon", NOW).has_value());
}
