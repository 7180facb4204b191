#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "data_types.hpp"

// Requests from the interactive side to the sync worker.

struct RefreshTimeline
{
    std::vector<Account> accounts;
};

struct FetchConversation
{
    Post post;
    Account account;
};

struct Like
{
    Post post;
    Account account;
};

struct Unlike
{
    Post post;
    Account account;
};

struct Repost
{
    Post post;
    Account account;
};

struct Unrepost
{
    Post post;
    Account account;
};

// Post to every account in “accounts”. With “reply_to”, accounts on
// the same network as that post reply to it instead.
struct SubmitPost
{
    std::string content;
    std::vector<Account> accounts;
    std::optional<Post> reply_to;
};

// Save a post to be published later on every account of “networks”.
// Publishing it is up to whoever reads the schedule store.
struct SchedulePost
{
    std::string content;
    std::vector<Network> networks;
    mw::Time scheduled_for;
};

// Exit after the command in progress. Commands queued behind this are
// not run, and no more are taken.
struct Shutdown {};

using Command = std::variant<RefreshTimeline, FetchConversation, Like, Unlike,
                             Repost, Unrepost, SubmitPost, SchedulePost,
                             Shutdown>;

// Outcomes from the sync worker.

struct TimelineRefreshed
{
    std::vector<Post> posts;
};

struct ContextFetched
{
    // Native ID of the root post.
    std::string post_id;
    std::vector<ReplyItem> replies;
};

struct Liked
{
    std::string post_id;
};

struct Unliked
{
    std::string post_id;
};

struct Reposted
{
    std::string post_id;
};

struct Unreposted
{
    std::string post_id;
};

struct Posted
{
    std::vector<Post> posts;
};

struct Scheduled
{
    // Short form of the ID of the scheduled post.
    std::string id;
    // Like “2030-01-15 14:30 UTC”.
    std::string scheduled_for;
};

struct ErrorResult
{
    std::string message;
};

struct StatusResult
{
    std::string message;
};

using Result = std::variant<TimelineRefreshed, ContextFetched, Liked, Unliked,
                            Reposted, Unreposted, Posted, Scheduled,
                            ErrorResult, StatusResult>;
