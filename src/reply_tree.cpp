#include "reply_tree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace
{

constexpr int MAX_DEPTH = 256;

bool isChildOf(const Post& reply, const std::string& native_id,
               const std::optional<std::string>& uri)
{
    if(!reply.reply_to.has_value())
    {
        return false;
    }
    return *reply.reply_to == native_id ||
        (uri.has_value() && *reply.reply_to == *uri);
}

void appendChildren(const std::string& native_id,
                    const std::optional<std::string>& uri, int depth,
                    const std::vector<Post>& replies,
                    std::vector<bool>& visited, std::vector<ReplyItem>& out)
{
    if(depth >= MAX_DEPTH)
    {
        return;
    }
    for(size_t i = 0; i < replies.size(); i++)
    {
        if(visited[i] || !isChildOf(replies[i], native_id, uri))
        {
            continue;
        }
        visited[i] = true;
        out.push_back({replies[i], depth});
        appendChildren(replies[i].native_id, replies[i].uri, depth + 1,
                       replies, visited, out);
    }
}

} // namespace

std::vector<ReplyItem> buildReplyTree(const Post& root,
                                      const std::vector<Post>& replies)
{
    std::vector<ReplyItem> items;
    std::vector<bool> visited(replies.size(), false);
    appendChildren(root.native_id, root.uri, 0, replies, visited, items);
    return items;
}
