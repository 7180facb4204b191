#include "sync_worker.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "reply_tree.hpp"

namespace
{

std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
    std::string result;
    for(size_t i = 0; i < parts.size(); i++)
    {
        if(i > 0)
        {
            result += sep;
        }
        result += parts[i];
    }
    return result;
}

} // namespace

SyncWorker::SyncWorker(SecretStoreInterface& secrets,
                       ClientResolverInterface& resolver,
                       ScheduledPostStoreInterface& schedule, int post_limit,
                       size_t queue_capacity)
        : secrets(secrets), resolver(resolver), schedule(schedule),
          post_limit(post_limit), commands(queue_capacity),
          results(queue_capacity)
{
}

SyncWorker::~SyncWorker()
{
    commands.close();
    results.close();
    if(worker_thread.joinable())
    {
        worker_thread.join();
    }
}

void SyncWorker::start()
{
    if(running)
    {
        return;
    }
    // The previous run ended on a Shutdown command.
    if(worker_thread.joinable())
    {
        worker_thread.join();
    }
    if(commands.isClosed())
    {
        commands.reopen();
    }
    running = true;
    worker_thread = std::thread(&SyncWorker::workerLoop, this);
    spdlog::info("SyncWorker started");
}

void SyncWorker::stop()
{
    if(!worker_thread.joinable())
    {
        return;
    }
    commands.close();
    worker_thread.join();
}

bool SyncWorker::submit(Command cmd)
{
    if(!commands.push(std::move(cmd)))
    {
        spdlog::warn("SyncWorker is not taking commands");
        return false;
    }
    return true;
}

std::optional<Result> SyncWorker::pollResult()
{
    return results.tryPop();
}

std::optional<Result> SyncWorker::waitResult(std::chrono::milliseconds timeout)
{
    return results.pop(timeout);
}

void SyncWorker::workerLoop()
{
    while(true)
    {
        std::optional<Command> cmd = commands.pop();
        // Closed and drained, or nobody takes the results any more.
        if(!cmd.has_value() || results.isClosed())
        {
            break;
        }
        if(std::holds_alternative<Shutdown>(*cmd))
        {
            commands.close();
            break;
        }
        try
        {
            processCommand(*cmd);
        }
        catch(const std::exception& e)
        {
            spdlog::error("Command failed: {}", e.what());
            emit(ErrorResult{std::format("Internal error: {}", e.what())});
        }
    }
    running = false;
    spdlog::info("SyncWorker stopped");
}

void SyncWorker::emit(Result result)
{
    if(!results.push(std::move(result)))
    {
        spdlog::debug("Result dropped, the worker is going away");
    }
}

template<typename Success, typename Call>
void SyncWorker::interact(const Post& post, const Account& account,
                          std::string_view what, Call call)
{
    auto secret = secrets.getCredentials(account);
    if(!secret.has_value())
    {
        emit(ErrorResult{errorMsg(secret.error())});
        return;
    }
    if(!secret->has_value())
    {
        emit(ErrorResult{std::format("No credentials for @{}",
                                     account.handle)});
        return;
    }
    auto client = resolver.resolve(account, **secret);
    if(!client.has_value())
    {
        emit(ErrorResult{errorMsg(client.error())});
        return;
    }

    auto result = call(**client, post);
    if(!result.has_value())
    {
        spdlog::warn("{} of {} failed: {}", what, post.native_id,
                     errorMsg(result.error()));
        emit(ErrorResult{std::format("{} failed: {}", what,
                                     errorMsg(result.error()))});
        return;
    }
    emit(Success{post.native_id});
}

void SyncWorker::processCommand(const Command& cmd)
{
    std::visit([this](const auto& c)
    {
        using T = std::decay_t<decltype(c)>;
        if constexpr(std::is_same_v<T, RefreshTimeline>)
        {
            refreshTimeline(c);
        }
        else if constexpr(std::is_same_v<T, FetchConversation>)
        {
            fetchConversation(c);
        }
        else if constexpr(std::is_same_v<T, Like>)
        {
            interact<Liked>(c.post, c.account, "Like",
                            [](SocialApiInterface& api, const Post& p)
                            { return api.like(p); });
        }
        else if constexpr(std::is_same_v<T, Unlike>)
        {
            interact<Unliked>(c.post, c.account, "Unlike",
                              [](SocialApiInterface& api, const Post& p)
                              { return api.unlike(p); });
        }
        else if constexpr(std::is_same_v<T, Repost>)
        {
            interact<Reposted>(c.post, c.account, "Repost",
                               [](SocialApiInterface& api, const Post& p)
                               { return api.repost(p); });
        }
        else if constexpr(std::is_same_v<T, Unrepost>)
        {
            interact<Unreposted>(c.post, c.account, "Unrepost",
                                 [](SocialApiInterface& api, const Post& p)
                                 { return api.unrepost(p); });
        }
        else if constexpr(std::is_same_v<T, SubmitPost>)
        {
            submitPost(c);
        }
        else if constexpr(std::is_same_v<T, SchedulePost>)
        {
            schedulePost(c);
        }
        // Shutdown is handled by the loop.
    }, cmd);
}

void SyncWorker::refreshTimeline(const RefreshTimeline& cmd)
{
    emit(StatusResult{"Refreshing..."});
    if(cmd.accounts.empty())
    {
        emit(ErrorResult{"No accounts configured"});
        return;
    }

    std::vector<Post> posts;
    std::vector<std::string> errors;
    for(const Account& account : cmd.accounts)
    {
        auto secret = secrets.getCredentials(account);
        if(!secret.has_value())
        {
            errors.push_back(std::format("Auth error for @{}: {}",
                                         account.handle,
                                         errorMsg(secret.error())));
            continue;
        }
        if(!secret->has_value())
        {
            errors.push_back(std::format("No credentials for @{}",
                                         account.handle));
            continue;
        }

        auto client = resolver.resolve(account, **secret);
        if(!client.has_value())
        {
            errors.push_back(std::format("@{}: {}", account.handle,
                                         errorMsg(client.error())));
            continue;
        }
        auto fetched = (*client)->timeline(post_limit);
        if(!fetched.has_value())
        {
            errors.push_back(std::format("@{}: {}", account.handle,
                                         errorMsg(fetched.error())));
            continue;
        }
        spdlog::debug("Fetched {} posts for {}", fetched->size(),
                      account.fullHandle());
        posts.insert(posts.end(), std::make_move_iterator(fetched->begin()),
                     std::make_move_iterator(fetched->end()));
    }

    for(const std::string& e : errors)
    {
        spdlog::warn("Refresh: {}", e);
    }
    std::stable_sort(posts.begin(), posts.end(),
                     [](const Post& a, const Post& b)
                     { return a.time_creation > b.time_creation; });

    if(posts.empty() && !errors.empty())
    {
        emit(ErrorResult{join(errors, "; ")});
        return;
    }
    emit(TimelineRefreshed{std::move(posts)});
    if(!errors.empty())
    {
        emit(StatusResult{"Partial refresh: " + join(errors, "; ")});
    }
}

void SyncWorker::fetchConversation(const FetchConversation& cmd)
{
    auto secret = secrets.getCredentials(cmd.account);
    if(!secret.has_value() || !secret->has_value())
    {
        spdlog::debug("No credentials to fetch thread of {}",
                      cmd.post.native_id);
        return;
    }
    auto client = resolver.resolve(cmd.account, **secret);
    if(!client.has_value())
    {
        spdlog::debug("Failed to get client: {}", errorMsg(client.error()));
        return;
    }
    auto replies = (*client)->conversation(cmd.post);
    if(!replies.has_value())
    {
        spdlog::debug("Failed to fetch thread: {}",
                      errorMsg(replies.error()));
        return;
    }
    std::vector<ReplyItem> items = buildReplyTree(cmd.post, *replies);
    spdlog::debug("Got {} replies for {}, {} in the tree", replies->size(),
                  cmd.post.native_id, items.size());
    emit(ContextFetched{cmd.post.native_id, std::move(items)});
}

void SyncWorker::submitPost(const SubmitPost& cmd)
{
    const bool is_reply = cmd.reply_to.has_value();
    emit(StatusResult{std::format("{} (to {} accounts)",
                                  is_reply ? "Replying..." : "Posting...",
                                  cmd.accounts.size())});

    std::vector<Post> posted;
    std::vector<std::string> errors;
    for(const Account& account : cmd.accounts)
    {
        std::string_view net = networkName(account.network);
        auto secret = secrets.getCredentials(account);
        if(!secret.has_value())
        {
            errors.push_back(std::format("Auth error for {}: {}", net,
                                         errorMsg(secret.error())));
            continue;
        }
        if(!secret->has_value())
        {
            errors.push_back(std::format("No credentials for {} (@{})", net,
                                         account.handle));
            continue;
        }
        auto client = resolver.resolve(account, **secret);
        if(!client.has_value())
        {
            errors.push_back(std::format("{}: {}", net,
                                         errorMsg(client.error())));
            continue;
        }

        E<Post> result;
        if(is_reply && cmd.reply_to->network == account.network)
        {
            result = (*client)->reply(cmd.content, *cmd.reply_to);
        }
        else
        {
            result = (*client)->post(cmd.content);
        }
        if(!result.has_value())
        {
            errors.push_back(std::format("{}: {}", net,
                                         errorMsg(result.error())));
            continue;
        }
        posted.push_back(*std::move(result));
    }

    if(!posted.empty())
    {
        emit(Posted{std::move(posted)});
    }
    if(errors.empty())
    {
        emit(StatusResult{is_reply ? "Replied successfully!"
                                   : "Posted successfully!"});
    }
    else
    {
        spdlog::warn("Posting failed on some accounts: {}",
                     join(errors, "; "));
        emit(ErrorResult{join(errors, "; ")});
    }
}

void SyncWorker::schedulePost(const SchedulePost& cmd)
{
    emit(StatusResult{"Scheduling post..."});

    ScheduledPost post;
    post.id = newLocalID();
    post.content = cmd.content;
    post.networks = cmd.networks;
    post.scheduled_for = cmd.scheduled_for;
    post.time_creation = mw::Clock::now();

    auto saved = schedule.saveScheduledPost(post);
    if(!saved.has_value())
    {
        spdlog::warn("Failed to save scheduled post: {}",
                     errorMsg(saved.error()));
        emit(ErrorResult{std::format("Failed to schedule: {}",
                                     errorMsg(saved.error()))});
        return;
    }

    std::string when = post.scheduledTimeDisplay();
    emit(Scheduled{post.id.substr(0, 8), when});
    emit(StatusResult{std::format("Scheduled for {} (in {})", when,
                                  post.timeUntil(post.time_creation))});
}
