#include <chrono>

#include <gtest/gtest.h>
#include <mw/utils.hpp>

#include "http_utils.hpp"

TEST(HTTPUtils, CanParseRFC3339)
{
    auto t = http_utils::parseRFC3339("2024-01-02T03:04:05Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(mw::timeToSeconds(*t), 1704164645);

    auto frac = http_utils::parseRFC3339("2024-01-02T03:04:05.123Z");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(mw::timeToSeconds(*frac), 1704164645);

    auto offset = http_utils::parseRFC3339("2024-01-02T05:04:05.000+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(mw::timeToSeconds(*offset), 1704164645);
}

TEST(HTTPUtils, RejectsGarbageTimestamps)
{
    EXPECT_FALSE(http_utils::parseRFC3339("").has_value());
    EXPECT_FALSE(http_utils::parseRFC3339("yesterday").has_value());
    EXPECT_FALSE(http_utils::parseRFC3339("2024-01-02T03:04:05#").has_value());
}

TEST(HTTPUtils, FormatsISOTime)
{
    mw::Time t = mw::secondsToTime(1704164645) + std::chrono::milliseconds(7);
    EXPECT_EQ(http_utils::formatISOTime(t), "2024-01-02T03:04:05.007Z");
}

TEST(HTTPUtils, CanEncodeURL)
{
    EXPECT_EQ(http_utils::urlEncode("at://did:plc:abc/app.bsky.feed.post/x"),
              "at%3A%2F%2Fdid%3Aplc%3Aabc%2Fapp.bsky.feed.post%2Fx");
    EXPECT_EQ(http_utils::urlEncode("a-b_c.d~"), "a-b_c.d~");
}

TEST(HTTPUtils, PathHelpers)
{
    EXPECT_EQ(http_utils::lastPathSegment("at://did/app.bsky.feed.like/3k"),
              "3k");
    EXPECT_EQ(http_utils::lastPathSegment("abc"), "abc");
    EXPECT_EQ(http_utils::trimTrailingSlash("https://a.b//"), "https://a.b");
}
