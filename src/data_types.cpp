#include "data_types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <string>
#include <string_view>

#include <mw/url.hpp>
#include <uuid/uuid.h>

std::string_view networkName(Network n)
{
    switch(n)
    {
    case Network::MASTODON:
        return "Mastodon";
    case Network::BLUESKY:
        return "Bluesky";
    }
    return "";
}

std::optional<Network> networkFromStr(std::string_view s)
{
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if(lower == "mastodon" || lower == "masto")
    {
        return Network::MASTODON;
    }
    if(lower == "bluesky" || lower == "bsky")
    {
        return Network::BLUESKY;
    }
    return std::nullopt;
}

std::string Post::preview(size_t max_len) const
{
    std::string line = content;
    std::replace(line.begin(), line.end(), '\n', ' ');
    if(line.size() <= max_len)
    {
        return line;
    }
    size_t keep = max_len > 3 ? max_len - 3 : 0;
    return line.substr(0, keep) + "...";
}

void Post::setLiked(bool value)
{
    if(liked == value)
    {
        return;
    }
    liked = value;
    if(value)
    {
        like_count++;
    }
    else if(like_count > 0)
    {
        like_count--;
    }
}

void Post::setReposted(bool value)
{
    if(reposted == value)
    {
        return;
    }
    reposted = value;
    if(value)
    {
        repost_count++;
    }
    else if(repost_count > 0)
    {
        repost_count--;
    }
}

std::string Account::fullHandle() const
{
    switch(network)
    {
    case Network::MASTODON:
    {
        if(handle.find('@') != std::string::npos)
        {
            return handle;
        }
        auto url = mw::URL::fromStr(server);
        std::string domain = url.has_value() ? url->host() : server;
        return std::format("@{}@{}", handle, domain);
    }
    case Network::BLUESKY:
        return "@" + handle;
    }
    return handle;
}

std::string Account::credentialKey() const
{
    std::string net(networkName(network));
    std::transform(net.begin(), net.end(), net.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return std::format("roost:{}:{}", net, id);
}

bool ScheduledPost::isDue(mw::Time now) const
{
    return status == PENDING && now >= scheduled_for;
}

std::string ScheduledPost::timeUntil(mw::Time now) const
{
    if(scheduled_for <= now)
    {
        return "now";
    }
    int64_t seconds = mw::timeToSeconds(scheduled_for) -
        mw::timeToSeconds(now);
    if(seconds < 60)
    {
        return std::format("{}s", seconds);
    }
    if(seconds < 3600)
    {
        return std::format("{}m", seconds / 60);
    }
    if(seconds < 86400)
    {
        int64_t minutes = (seconds % 3600) / 60;
        if(minutes > 0)
        {
            return std::format("{}h {}m", seconds / 3600, minutes);
        }
        return std::format("{}h", seconds / 3600);
    }
    int64_t hours = (seconds % 86400) / 3600;
    if(hours > 0)
    {
        return std::format("{}d {}h", seconds / 86400, hours);
    }
    return std::format("{}d", seconds / 86400);
}

std::string ScheduledPost::scheduledTimeDisplay() const
{
    std::time_t secs = std::chrono::system_clock::to_time_t(scheduled_for);
    std::tm tm = *std::gmtime(&secs);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M UTC", &tm);
    return buffer;
}

std::string_view scheduledStatusName(ScheduledPost::Status s)
{
    switch(s)
    {
    case ScheduledPost::PENDING:
        return "pending";
    case ScheduledPost::POSTING:
        return "posting";
    case ScheduledPost::POSTED:
        return "posted";
    case ScheduledPost::FAILED:
        return "failed";
    case ScheduledPost::CANCELLED:
        return "cancelled";
    }
    return "pending";
}

std::optional<ScheduledPost::Status> scheduledStatusFromStr(std::string_view s)
{
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for(ScheduledPost::Status status :
            {ScheduledPost::PENDING, ScheduledPost::POSTING,
             ScheduledPost::POSTED, ScheduledPost::FAILED,
             ScheduledPost::CANCELLED})
    {
        if(lower == scheduledStatusName(status))
        {
            return status;
        }
    }
    return std::nullopt;
}

std::string newLocalID()
{
    uuid_t id;
    uuid_generate_random(id);
    char buffer[37];
    uuid_unparse_lower(id, buffer);
    return buffer;
}
