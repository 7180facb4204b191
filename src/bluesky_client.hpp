#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/http_client.hpp>
#include <nlohmann/json.hpp>

#include "data_types.hpp"
#include "error.hpp"
#include "social_api.hpp"

constexpr char BSKY_COLLECTION_POST[] = "app.bsky.feed.post";
constexpr char BSKY_COLLECTION_LIKE[] = "app.bsky.feed.like";
constexpr char BSKY_COLLECTION_REPOST[] = "app.bsky.feed.repost";

// Client of an AT Protocol PDS. Records we create are addressed by
// their AT URI and CID, both of which the server returns on creation.
class BlueskyClient : public SocialApiInterface
{
public:
    // Where a record lives and which version of it we mean.
    struct RecordRef
    {
        std::string uri;
        std::string cid;
    };

    // Exchange a handle and an app password for a session.
    static E<std::unique_ptr<BlueskyClient>>
    login(mw::HTTPSessionInterface& http, std::string_view handle,
          std::string_view app_password,
          std::string_view server = DEFAULT_BLUESKY_SERVER);

    BlueskyClient(mw::HTTPSessionInterface& http, std::string_view server,
                  std::string access_jwt, std::string did,
                  std::string handle);

    Network network() const override { return Network::BLUESKY; }

    E<std::vector<Post>> timeline(int limit) override;
    E<std::vector<Post>> conversation(const Post& post) override;
    E<Post> post(const std::string& text) override;
    E<Post> reply(const std::string& text, const Post& target) override;
    E<void> like(const Post& post) override;
    // Finds our like record of the post and deletes it. If there is
    // none the post is already not liked, and this succeeds.
    E<void> unlike(const Post& post) override;
    E<void> repost(const Post& post) override;
    E<void> unrepost(const Post& post) override;
    E<Account> verifyCredentials() override;

    // Convert an app.bsky.feed.defs#feedViewPost.
    static E<Post> feedItemToPost(const nlohmann::json& item);
    // Convert an app.bsky.feed.defs#postView.
    static E<Post> postViewToPost(const nlohmann::json& view);

private:
    std::string xrpcURL(std::string_view method) const;
    mw::HTTPRequest makeRequest(const std::string& url) const;
    E<nlohmann::json> getJSON(const std::string& url);
    E<nlohmann::json> postJSON(const std::string& url,
                               const nlohmann::json& body);
    E<RecordRef> createRecord(std::string_view collection,
                              nlohmann::json record);
    E<Post> submitPost(const std::string& text,
                       const std::optional<nlohmann::json>& reply_refs,
                       std::string_view what);
    E<void> createSubjectRecord(const Post& post, std::string_view collection,
                                std::string_view verb);
    E<void> deleteSubjectRecord(const Post& post, std::string_view collection,
                                std::string_view verb);

    mw::HTTPSessionInterface& http;
    std::string server_url;
    std::string access_jwt;
    std::string account_did;
    std::string account_handle;
};
