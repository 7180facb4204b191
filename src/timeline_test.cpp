#include <gtest/gtest.h>

#include "timeline.hpp"

namespace
{

Post makePost(const std::string& native_id, uint32_t likes, bool liked)
{
    Post p;
    p.native_id = native_id;
    p.like_count = likes;
    p.liked = liked;
    p.content = "post " + native_id;
    return p;
}

} // namespace

TEST(Timeline, LikeDeltasApplyOnce)
{
    Timeline t;
    t.apply(TimelineRefreshed{{makePost("1", 4, false)}});

    t.apply(Liked{"1"});
    EXPECT_TRUE(t.posts()[0].liked);
    EXPECT_EQ(t.posts()[0].like_count, 5u);

    // A second like of an already liked post changes nothing.
    t.apply(Liked{"1"});
    EXPECT_EQ(t.posts()[0].like_count, 5u);

    t.apply(Unliked{"1"});
    EXPECT_FALSE(t.posts()[0].liked);
    EXPECT_EQ(t.posts()[0].like_count, 4u);
}

TEST(Timeline, UnrepostNeverGoesNegative)
{
    Post p = makePost("1", 0, false);
    p.reposted = true;
    p.repost_count = 0;
    Timeline t;
    t.apply(TimelineRefreshed{{p}});

    t.apply(Unreposted{"1"});
    EXPECT_FALSE(t.posts()[0].reposted);
    EXPECT_EQ(t.posts()[0].repost_count, 0u);

    t.apply(Reposted{"1"});
    EXPECT_EQ(t.posts()[0].repost_count, 1u);
}

TEST(Timeline, ThreadsAndDeltasInThreads)
{
    Timeline t;
    EXPECT_EQ(t.replies("1"), nullptr);
    t.apply(ContextFetched{"1", {ReplyItem{makePost("2", 0, false), 0}}});
    ASSERT_NE(t.replies("1"), nullptr);
    ASSERT_EQ(t.replies("1")->size(), 1u);

    t.apply(Liked{"2"});
    EXPECT_TRUE((*t.replies("1"))[0].post.liked);
    ASSERT_NE(t.find("2"), nullptr);
    EXPECT_EQ(t.find("2")->like_count, 1u);
    EXPECT_EQ(t.find("3"), nullptr);
}

TEST(Timeline, PostedGoesOnTop)
{
    Timeline t;
    t.apply(TimelineRefreshed{{makePost("1", 0, false)}});
    t.apply(Posted{{makePost("9", 0, false)}});
    ASSERT_EQ(t.posts().size(), 2u);
    EXPECT_EQ(t.posts()[0].native_id, "9");
}

TEST(Timeline, StatusLine)
{
    Timeline t;
    t.apply(ErrorResult{"Like failed: nope"});
    EXPECT_EQ(t.status(), "Like failed: nope");
    EXPECT_TRUE(t.statusIsError());
    t.apply(StatusResult{"Refreshing..."});
    EXPECT_EQ(t.status(), "Refreshing...");
    EXPECT_FALSE(t.statusIsError());
}

TEST(Timeline, ScheduledSetsStatus)
{
    Timeline t;
    t.apply(ErrorResult{"Refresh failed"});
    t.apply(Scheduled{"1a2b3c4d", "2030-01-15 14:30 UTC"});
    EXPECT_EQ(t.status(), "Scheduled [1a2b3c4d] for 2030-01-15 14:30 UTC");
    EXPECT_FALSE(t.statusIsError());
}
