#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "command.hpp"
#include "data_types.hpp"

// What the interactive side shows: the merged timeline, the threads
// opened so far, and one line of status. It only changes by applying
// results from the sync worker.
class Timeline
{
public:
    void apply(const Result& result);

    const std::vector<Post>& posts() const { return timeline_posts; }
    // Replies of a post from its last ContextFetched, or nullptr if
    // the thread was never fetched.
    const std::vector<ReplyItem>* replies(const std::string& native_id) const;
    // Find a post in the timeline or any fetched thread.
    const Post* find(const std::string& native_id) const;

    const std::string& status() const { return status_line; }
    bool statusIsError() const { return status_is_error; }

private:
    template<typename F>
    void forEachCopy(const std::string& native_id, F f);

    std::vector<Post> timeline_posts;
    std::unordered_map<std::string, std::vector<ReplyItem>> threads;
    std::string status_line;
    bool status_is_error = false;
};
