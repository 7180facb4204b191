#include "timeline.hpp"

#include <format>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

template<typename F>
void Timeline::forEachCopy(const std::string& native_id, F f)
{
    for(Post& p : timeline_posts)
    {
        if(p.native_id == native_id)
        {
            f(p);
        }
    }
    for(auto& [root_id, items] : threads)
    {
        for(ReplyItem& item : items)
        {
            if(item.post.native_id == native_id)
            {
                f(item.post);
            }
        }
    }
}

void Timeline::apply(const Result& result)
{
    std::visit([this](const auto& r)
    {
        using T = std::decay_t<decltype(r)>;
        if constexpr(std::is_same_v<T, TimelineRefreshed>)
        {
            timeline_posts = r.posts;
            spdlog::debug("Timeline has {} posts", timeline_posts.size());
        }
        else if constexpr(std::is_same_v<T, ContextFetched>)
        {
            threads[r.post_id] = r.replies;
        }
        else if constexpr(std::is_same_v<T, Liked>)
        {
            forEachCopy(r.post_id, [](Post& p) { p.setLiked(true); });
        }
        else if constexpr(std::is_same_v<T, Unliked>)
        {
            forEachCopy(r.post_id, [](Post& p) { p.setLiked(false); });
        }
        else if constexpr(std::is_same_v<T, Reposted>)
        {
            forEachCopy(r.post_id, [](Post& p) { p.setReposted(true); });
        }
        else if constexpr(std::is_same_v<T, Unreposted>)
        {
            forEachCopy(r.post_id, [](Post& p) { p.setReposted(false); });
        }
        else if constexpr(std::is_same_v<T, Posted>)
        {
            // New posts go on top. They are not replies shown in a
            // thread until that thread is fetched again.
            timeline_posts.insert(timeline_posts.begin(), r.posts.begin(),
                                  r.posts.end());
        }
        else if constexpr(std::is_same_v<T, Scheduled>)
        {
            status_line = std::format("Scheduled [{}] for {}", r.id,
                                      r.scheduled_for);
            status_is_error = false;
        }
        else if constexpr(std::is_same_v<T, ErrorResult>)
        {
            status_line = r.message;
            status_is_error = true;
        }
        else if constexpr(std::is_same_v<T, StatusResult>)
        {
            status_line = r.message;
            status_is_error = false;
        }
    }, result);
}

const std::vector<ReplyItem>* Timeline::replies(
    const std::string& native_id) const
{
    auto it = threads.find(native_id);
    if(it == threads.end())
    {
        return nullptr;
    }
    return &it->second;
}

const Post* Timeline::find(const std::string& native_id) const
{
    for(const Post& p : timeline_posts)
    {
        if(p.native_id == native_id)
        {
            return &p;
        }
    }
    for(const auto& [root_id, items] : threads)
    {
        for(const ReplyItem& item : items)
        {
            if(item.post.native_id == native_id)
            {
                return &item.post;
            }
        }
    }
    return nullptr;
}
