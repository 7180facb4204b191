#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "bounded_queue.hpp"
#include "client_resolver.hpp"
#include "command.hpp"
#include "scheduled_post_store.hpp"
#include "secret_store.hpp"

// Runs commands one at a time on a background thread, so that the
// interactive side never waits on the network. Commands go in
// through submit(), results come out through pollResult() and
// waitResult().
class SyncWorker
{
public:
    SyncWorker(SecretStoreInterface& secrets, ClientResolverInterface& resolver,
               ScheduledPostStoreInterface& schedule, int post_limit = 50,
               size_t queue_capacity = 32);
    // Commands still queued are dropped, and so are results nobody
    // took.
    ~SyncWorker();

    // Also restarts a worker that exited on a Shutdown command.
    void start();
    // Stop taking commands, run every command already queued, then
    // exit.
    void stop();

    // Blocks while the command queue is full. Returns false once the
    // worker takes no more commands, i.e. after a Shutdown command or
    // stop().
    bool submit(Command cmd);
    std::optional<Result> pollResult();
    std::optional<Result> waitResult(std::chrono::milliseconds timeout);

protected:
    void processCommand(const Command& cmd);
    void refreshTimeline(const RefreshTimeline& cmd);
    void fetchConversation(const FetchConversation& cmd);
    void submitPost(const SubmitPost& cmd);
    void schedulePost(const SchedulePost& cmd);

    // Like, Unlike, Repost and Unrepost only differ in the call and
    // in the result.
    template<typename Success, typename Call>
    void interact(const Post& post, const Account& account,
                  std::string_view what, Call call);

private:
    void workerLoop();
    void emit(Result result);

    SecretStoreInterface& secrets;
    ClientResolverInterface& resolver;
    ScheduledPostStoreInterface& schedule;
    const int post_limit;
    BoundedQueue<Command> commands;
    BoundedQueue<Result> results;
    std::thread worker_thread;
    std::atomic<bool> running{false};
};
