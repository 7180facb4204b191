#include "scheduled_post_store.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "http_utils.hpp"
#include "json_fields.hpp"

namespace
{

nlohmann::json toJSON(const ScheduledPost& post)
{
    nlohmann::json networks = nlohmann::json::array();
    for(Network n : post.networks)
    {
        networks.push_back(std::string(networkName(n)));
    }
    nlohmann::json j = {
        {"id", post.id},
        {"content", post.content},
        {"networks", std::move(networks)},
        {"scheduled_for", http_utils::formatISOTime(post.scheduled_for)},
        {"status", std::string(scheduledStatusName(post.status))},
        {"created_at", http_utils::formatISOTime(post.time_creation)},
    };
    if(post.error.has_value())
    {
        j["error"] = *post.error;
    }
    return j;
}

E<ScheduledPost> fromJSON(const nlohmann::json& j)
{
    if(!j.is_object())
    {
        return std::unexpected(decodeError("Scheduled post is not an object"));
    }
    ScheduledPost post;
    post.id = JsonFields::getString(j, "id");
    if(post.id.empty())
    {
        return std::unexpected(decodeError("Scheduled post has no ID"));
    }
    post.content = JsonFields::getString(j, "content");
    if(j.contains("networks") && j["networks"].is_array())
    {
        for(const auto& n : j["networks"])
        {
            if(!n.is_string())
            {
                continue;
            }
            if(auto network = networkFromStr(n.get<std::string>());
               network.has_value())
            {
                post.networks.push_back(*network);
            }
        }
    }
    auto when = http_utils::parseRFC3339(
        JsonFields::getString(j, "scheduled_for"));
    if(!when.has_value())
    {
        return std::unexpected(decodeError(std::format(
            "Scheduled post {} has an invalid time", post.id)));
    }
    post.scheduled_for = *when;
    post.status = scheduledStatusFromStr(JsonFields::getString(j, "status"))
        .value_or(ScheduledPost::PENDING);
    post.error = JsonFields::optString(j, "error");
    post.time_creation = http_utils::parseRFC3339(
        JsonFields::getString(j, "created_at")).value_or(post.scheduled_for);
    return post;
}

} // namespace

E<std::vector<ScheduledPost>> FileScheduledPostStore::scheduledPosts()
{
    std::error_code ec;
    if(!std::filesystem::exists(path, ec))
    {
        spdlog::debug("Schedule file {} does not exist", path);
        return std::vector<ScheduledPost>();
    }

    std::string content;
    try
    {
        content = readFile(path);
    }
    catch(const std::runtime_error& e)
    {
        return std::unexpected(storageError(std::format(
            "Failed to read schedule from {}: {}", path, e.what())));
    }
    auto parsed = JsonFields::parse(content);
    if(!parsed.has_value())
    {
        return std::unexpected(withContext(
            parsed.error(), std::format("Schedule file {}", path)));
    }
    if(!parsed->is_array())
    {
        return std::unexpected(decodeError(std::format(
            "Schedule file {} is not a list", path)));
    }

    std::vector<ScheduledPost> posts;
    for(const auto& item : *parsed)
    {
        auto post = fromJSON(item);
        if(!post.has_value())
        {
            spdlog::warn("Skipping entry in {}: {}", path,
                         errorMsg(post.error()));
            continue;
        }
        posts.push_back(*std::move(post));
    }
    std::stable_sort(posts.begin(), posts.end(),
                     [](const ScheduledPost& a, const ScheduledPost& b)
                     { return a.scheduled_for < b.scheduled_for; });
    return posts;
}

E<void> FileScheduledPostStore::saveScheduledPost(const ScheduledPost& post)
{
    ASSIGN_OR_RETURN(std::vector<ScheduledPost> posts, scheduledPosts());
    auto same = std::find_if(posts.begin(), posts.end(),
                             [&](const ScheduledPost& p)
                             { return p.id == post.id; });
    if(same == posts.end())
    {
        posts.push_back(post);
    }
    else
    {
        *same = post;
    }

    nlohmann::json j = nlohmann::json::array();
    for(const ScheduledPost& p : posts)
    {
        j.push_back(toJSON(p));
    }
    std::ofstream f(path, std::ios::trunc);
    if(!f)
    {
        return std::unexpected(storageError(std::format(
            "Failed to open {} for writing", path)));
    }
    f << j.dump(2) << "\n";
    if(!f)
    {
        return std::unexpected(storageError(std::format(
            "Failed to write {}", path)));
    }
    spdlog::debug("Saved scheduled post {} to {}", post.id, path);
    return {};
}
