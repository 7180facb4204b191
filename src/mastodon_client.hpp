#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mw/http_client.hpp>
#include <nlohmann/json.hpp>

#include "data_types.hpp"
#include "error.hpp"
#include "social_api.hpp"

// Client of the Mastodon REST API. Every request carries the access
// token as a bearer token.
class MastodonClient : public SocialApiInterface
{
public:
    MastodonClient(mw::HTTPSessionInterface& http, std::string_view server,
                   std::string access_token);

    Network network() const override { return Network::MASTODON; }

    E<std::vector<Post>> timeline(int limit) override;
    // Only the descendants. Ancestors are dropped.
    E<std::vector<Post>> conversation(const Post& post) override;
    E<Post> post(const std::string& text) override;
    E<Post> reply(const std::string& text, const Post& target) override;
    E<void> like(const Post& post) override;
    E<void> unlike(const Post& post) override;
    E<void> repost(const Post& post) override;
    E<void> unrepost(const Post& post) override;
    E<Account> verifyCredentials() override;

    // Convert a status entity. A reblog is unwrapped into the original
    // status, marked as a repost by the reblogging account.
    static E<Post> statusToPost(const nlohmann::json& status);

private:
    std::string apiURL(std::string_view endpoint) const;
    mw::HTTPRequest makeRequest(const std::string& url) const;
    E<nlohmann::json> getJSON(const std::string& url);
    E<nlohmann::json> postJSON(const std::string& url,
                               const std::optional<nlohmann::json>& body);
    E<nlohmann::json> checkResponse(
        const mw::E<const mw::HTTPResponse*>& res) const;
    E<Post> submitStatus(const std::string& text,
                         const std::optional<std::string>& reply_to_id);
    E<void> statusAction(const Post& post, std::string_view action,
                         std::string_view verb);

    mw::HTTPSessionInterface& http;
    std::string server_url;
    std::string token;
};
