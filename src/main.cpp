#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <mw/http_client.hpp>
#include <spdlog/spdlog.h>

#include "account_registry.hpp"
#include "client_resolver.hpp"
#include "command.hpp"
#include "config.hpp"
#include "http_utils.hpp"
#include "schedule.hpp"
#include "scheduled_post_store.hpp"
#include "secret_store.hpp"
#include "sync_worker.hpp"
#include "timeline.hpp"

namespace
{

// Run one command on the worker and apply everything it produces.
void runCommand(SyncWorker& worker, Timeline& timeline, Command cmd)
{
    worker.start();
    if(!worker.submit(std::move(cmd)))
    {
        spdlog::error("The sync worker is not taking commands");
        return;
    }
    // stop() lets the worker finish the command first.
    auto stopped = std::async(std::launch::async, [&worker] { worker.stop(); });
    while(stopped.wait_for(std::chrono::seconds(0)) !=
          std::future_status::ready)
    {
        auto result = worker.waitResult(std::chrono::milliseconds(100));
        if(result.has_value())
        {
            timeline.apply(*result);
        }
    }
    while(auto result = worker.pollResult())
    {
        timeline.apply(*result);
    }
}

void printPost(const Post& p, int indent = 0)
{
    std::string pad(static_cast<size_t>(indent) * 4, ' ');
    if(p.is_repost)
    {
        std::cout << pad << "Reposted by " << p.repost_author.value_or("")
                  << "\n";
    }
    std::cout << pad << std::format("[{}] {} (@{}) {}  id:{}\n",
                                    networkName(p.network), p.author_name,
                                    p.author_handle,
                                    http_utils::formatISOTime(p.time_creation),
                                    p.native_id);
    std::string line;
    for(char c : p.content)
    {
        if(c == '\n')
        {
            std::cout << pad << "  " << line << "\n";
            line.clear();
        }
        else
        {
            line += c;
        }
    }
    std::cout << pad << "  " << line << "\n";
    for(const MediaAttachment& m : p.media)
    {
        std::cout << pad << "  [media] " << m.url << "\n";
    }
    std::cout << pad << std::format("  {} replies, {} reposts{}, {} likes{}\n",
                                    p.reply_count, p.repost_count,
                                    p.reposted ? " (you)" : "", p.like_count,
                                    p.liked ? " (you)" : "");
    std::cout << "\n";
}

// The account to act on a post with: the default one if it is on the
// post’s network, otherwise the first one on that network.
std::optional<Account> accountFor(const AccountRegistry& accounts,
                                  const Post& post)
{
    auto def = accounts.defaultAccount();
    if(def.has_value() && def->network == post.network)
    {
        return def;
    }
    auto on_network = accounts.accountsOn(post.network);
    if(on_network.empty())
    {
        return std::nullopt;
    }
    return on_network.front();
}

int finish(const Timeline& timeline)
{
    if(!timeline.status().empty())
    {
        std::cerr << timeline.status() << std::endl;
    }
    return timeline.statusIsError() ? 1 : 0;
}

int listScheduled(ScheduledPostStoreInterface& schedule)
{
    auto posts = schedule.scheduledPosts();
    if(!posts.has_value())
    {
        std::cerr << errorMsg(posts.error()) << std::endl;
        return 1;
    }
    const mw::Time now = mw::Clock::now();
    for(const ScheduledPost& p : *posts)
    {
        std::string networks;
        for(Network n : p.networks)
        {
            if(!networks.empty())
            {
                networks += ",";
            }
            networks += networkName(n);
        }
        std::cout << std::format("[{}] {}  {} (in {})  {}\n  {}\n",
                                 scheduledStatusName(p.status),
                                 p.id.substr(0, 8), p.scheduledTimeDisplay(),
                                 p.timeUntil(now), networks, p.content);
        if(p.error.has_value())
        {
            std::cout << "  Error: " << *p.error << "\n";
        }
    }
    return 0;
}

int verifyAccounts(const AccountRegistry& accounts,
                   SecretStoreInterface& secrets,
                   ClientResolverInterface& resolver)
{
    int status = 0;
    for(const Account& account : accounts.accounts())
    {
        auto secret = secrets.getCredentials(account);
        if(!secret.has_value() || !secret->has_value())
        {
            std::cout << account.fullHandle() << ": "
                      << (secret.has_value() ? "no credentials"
                          : errorMsg(secret.error())) << "\n";
            status = 1;
            continue;
        }
        auto client = resolver.resolve(account, **secret);
        if(!client.has_value())
        {
            std::cout << account.fullHandle() << ": "
                      << errorMsg(client.error()) << "\n";
            status = 1;
            continue;
        }
        auto who = (*client)->verifyCredentials();
        if(!who.has_value())
        {
            std::cout << account.fullHandle() << ": "
                      << errorMsg(who.error()) << "\n";
            status = 1;
            continue;
        }
        std::cout << account.fullHandle() << ": OK, "
                  << who->display_name << "\n";
    }
    return status;
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("roost", "Mastodon and Bluesky in one place");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value("roost.yaml"))
        ("v,verbose", "Print debug messages")
        ("h,help", "Print this message.")
        ("command", "timeline, thread, post, reply, like, unlike, repost, "
         "unrepost, schedule, scheduled, accounts or verify",
         cxxopts::value<std::string>())
        ("args", "Arguments of the command",
         cxxopts::value<std::vector<std::string>>());
    cmd_options.parse_positional({"command", "args"});
    cmd_options.positional_help("COMMAND [ARGS...]");

    std::string command;
    std::vector<std::string> args;
    std::string config_path;
    bool verbose = false;
    try
    {
        auto opts = cmd_options.parse(argc, argv);
        if(opts.count("help") || !opts.count("command"))
        {
            std::cout << cmd_options.help() << std::endl;
            return opts.count("help") ? 0 : 1;
        }
        command = opts["command"].as<std::string>();
        if(opts.count("args"))
        {
            args = opts["args"].as<std::vector<std::string>>();
        }
        config_path = opts["config"].as<std::string>();
        verbose = opts.count("verbose") > 0;
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Config& config = Config::get();
    try
    {
        config.load(config_path);
    }
    catch(const std::runtime_error& e)
    {
        spdlog::error("Failed to load config: {}", e.what());
        return 2;
    }
    spdlog::set_level(verbose ? spdlog::level::debug
                      : spdlog::level::from_str(config.log_level));

    AccountRegistry accounts(config.accounts);
    FileSecretStore secrets(config.secrets_path);
    mw::HTTPSession http;
    ClientResolver resolver(http);
    FileScheduledPostStore schedule(config.schedule_path);
    SyncWorker worker(secrets, resolver, schedule, config.post_limit,
                      static_cast<size_t>(config.queue_capacity));
    Timeline timeline;

    if(command == "accounts")
    {
        for(const Account& a : accounts.accounts())
        {
            std::cout << std::format("{}  {}  {}{}\n", a.id,
                                     networkName(a.network), a.fullHandle(),
                                     a.is_default ? "  (default)" : "");
        }
        return 0;
    }
    if(command == "verify")
    {
        return verifyAccounts(accounts, secrets, resolver);
    }
    if(command == "scheduled")
    {
        return listScheduled(schedule);
    }
    if(command == "schedule")
    {
        if(args.size() < 2)
        {
            spdlog::error("schedule needs a time and the text to post");
            return 1;
        }
        auto when = parseScheduleTime(args[0], mw::Clock::now());
        if(!when.has_value())
        {
            spdlog::error("{}", errorMsg(when.error()));
            return 1;
        }
        std::set<Network> seen;
        std::vector<Network> networks;
        for(const Account& a : accounts.accounts())
        {
            if(seen.insert(a.network).second)
            {
                networks.push_back(a.network);
            }
        }
        if(networks.empty())
        {
            spdlog::error("No accounts configured");
            return 1;
        }
        runCommand(worker, timeline, SchedulePost{args[1], networks, *when});
        return finish(timeline);
    }
    if(command == "post")
    {
        if(args.empty())
        {
            spdlog::error("Nothing to post");
            return 1;
        }
        runCommand(worker, timeline, SubmitPost{args[0], accounts.accounts(),
                                                std::nullopt});
        return finish(timeline);
    }

    runCommand(worker, timeline, RefreshTimeline{accounts.accounts()});
    if(command == "timeline")
    {
        for(const Post& p : timeline.posts())
        {
            printPost(p);
        }
        return finish(timeline);
    }

    if(args.empty())
    {
        spdlog::error("{} needs the ID of a post", command);
        return 1;
    }
    const Post* found = timeline.find(args[0]);
    if(found == nullptr)
    {
        spdlog::error("Post {} is not in the timeline", args[0]);
        finish(timeline);
        return 1;
    }
    Post post = *found;
    auto account = accountFor(accounts, post);
    if(!account.has_value())
    {
        spdlog::error("No {} account for post {}", networkName(post.network),
                      post.native_id);
        return 1;
    }
    if(auto touched = accounts.touch(account->id); !touched.has_value())
    {
        spdlog::warn("{}", errorMsg(touched.error()));
    }

    if(command == "thread")
    {
        runCommand(worker, timeline, FetchConversation{post, *account});
        printPost(post);
        const std::vector<ReplyItem>* replies =
            timeline.replies(post.native_id);
        if(replies == nullptr)
        {
            std::cerr << "Failed to fetch the thread" << std::endl;
            return 1;
        }
        for(const ReplyItem& item : *replies)
        {
            printPost(item.post, item.depth + 1);
        }
        return finish(timeline);
    }
    if(command == "reply")
    {
        if(args.size() < 2)
        {
            spdlog::error("Nothing to reply");
            return 1;
        }
        runCommand(worker, timeline, SubmitPost{args[1], {*account}, post});
        return finish(timeline);
    }
    if(command == "like")
    {
        runCommand(worker, timeline, Like{post, *account});
    }
    else if(command == "unlike")
    {
        runCommand(worker, timeline, Unlike{post, *account});
    }
    else if(command == "repost")
    {
        runCommand(worker, timeline, Repost{post, *account});
    }
    else if(command == "unrepost")
    {
        runCommand(worker, timeline, Unrepost{post, *account});
    }
    else
    {
        spdlog::error("Unknown command: {}", command);
        return 1;
    }
    if(const Post* updated = timeline.find(post.native_id))
    {
        printPost(*updated);
    }
    return finish(timeline);
}
