#pragma once

#include <string>
#include <vector>

#include "data_types.hpp"
#include "error.hpp"

// The operations every network supports. There are exactly two
// implementations, MastodonClient and BlueskyClient.
class SocialApiInterface
{
public:
    virtual ~SocialApiInterface() = default;

    virtual Network network() const = 0;

    // The home timeline, newest first as the server returns it.
    virtual E<std::vector<Post>> timeline(int limit) = 0;
    // Replies under a post, as a flat list. Each item has its
    // parent in “reply_to”.
    virtual E<std::vector<Post>> conversation(const Post& post) = 0;
    virtual E<Post> post(const std::string& text) = 0;
    virtual E<Post> reply(const std::string& text, const Post& target) = 0;
    virtual E<void> like(const Post& post) = 0;
    virtual E<void> unlike(const Post& post) = 0;
    virtual E<void> repost(const Post& post) = 0;
    virtual E<void> unrepost(const Post& post) = 0;
    virtual E<Account> verifyCredentials() = 0;
};
