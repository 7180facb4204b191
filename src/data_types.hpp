#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/utils.hpp>

enum class Network { MASTODON, BLUESKY };

std::string_view networkName(Network n);
// Accepts “mastodon”, “masto”, “bluesky” and “bsky”, case
// insensitive.
std::optional<Network> networkFromStr(std::string_view s);

constexpr char DEFAULT_BLUESKY_SERVER[] = "https://bsky.social";

struct MediaAttachment
{
    enum Type { IMAGE, VIDEO, GIFV, AUDIO, UNKNOWN };

    std::string url;
    std::optional<std::string> preview_url;
    Type type = UNKNOWN;
    std::optional<std::string> alt_text;
};

// A post from either network.
struct Post
{
    // Generated locally for every post we build.
    std::string id;
    // ID of the post on its own network. For Bluesky this is the
    // record key, i.e. the last segment of the AT URI.
    std::string native_id;
    Network network = Network::MASTODON;
    std::string author_handle;
    std::string author_name;
    std::optional<std::string> author_avatar;
    // Plain text.
    std::string content;
    // HTML for Mastodon. Bluesky has no markup.
    std::optional<std::string> content_raw;
    mw::Time time_creation;
    std::optional<std::string> url;
    bool is_repost = false;
    // Display name of whoever reposted this, when is_repost.
    std::optional<std::string> repost_author;
    uint32_t like_count = 0;
    uint32_t repost_count = 0;
    uint32_t reply_count = 0;
    bool liked = false;
    bool reposted = false;
    // Mastodon: native ID of the parent. Bluesky: AT URI of the
    // parent.
    std::optional<std::string> reply_to;
    std::vector<MediaAttachment> media;

    // Bluesky only. Needed to like, repost or reply to the record.
    std::optional<std::string> cid;
    std::optional<std::string> uri;
    // Bluesky only, and only for replies: the root of the thread.
    std::optional<std::string> root_uri;
    std::optional<std::string> root_cid;

    // Single line, at most max_len bytes, with “...” when cut.
    std::string preview(size_t max_len) const;

    // These only touch the counters when the flag actually changes.
    void setLiked(bool value);
    void setReposted(bool value);
};

struct Account
{
    std::string id;
    Network network = Network::MASTODON;
    std::string display_name;
    // “alice” on Mastodon (the server is separate), “alice.bsky.social”
    // on Bluesky.
    std::string handle;
    // Instance URL for Mastodon, PDS URL for Bluesky.
    std::string server;
    bool is_default = false;
    std::optional<std::string> avatar_url;
    mw::Time time_creation;
    std::optional<mw::Time> time_last_used;

    // @alice@mastodon.social, or @alice.bsky.social.
    std::string fullHandle() const;
    // Key of this account’s secret in the secret store.
    std::string credentialKey() const;
};

struct ReplyItem
{
    Post post;
    // 0 for direct replies to the root.
    int depth;
};

// A post waiting to be published at a later time.
struct ScheduledPost
{
    enum Status { PENDING, POSTING, POSTED, FAILED, CANCELLED };

    std::string id;
    std::string content;
    std::vector<Network> networks;
    mw::Time scheduled_for;
    Status status = PENDING;
    // Why publishing failed, when status is FAILED.
    std::optional<std::string> error;
    mw::Time time_creation;

    bool isDue(mw::Time now) const;
    // Like “45m”, “2h 5m” or “3d 1h”. “now” when it is due.
    std::string timeUntil(mw::Time now) const;
    // Like “2030-01-15 14:30 UTC”.
    std::string scheduledTimeDisplay() const;
};

std::string_view scheduledStatusName(ScheduledPost::Status s);
std::optional<ScheduledPost::Status> scheduledStatusFromStr(std::string_view s);

// Random UUID v4 string, used as local post and account IDs.
std::string newLocalID();
