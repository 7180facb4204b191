#pragma once

#include <vector>

#include "data_types.hpp"

// Arrange a flat list of replies under “root” in display order. A
// reply belongs under a post when its reply_to is either the native
// ID or the URI of that post; Mastodon uses the former, Bluesky the
// latter. Children keep their order in “replies”. Each reply appears
// at most once even if the IDs form a cycle.
std::vector<ReplyItem> buildReplyTree(const Post& root,
                                      const std::vector<Post>& replies);
