#include "mastodon_client.hpp"

#include <format>
#include <string>
#include <utility>

#include <mw/http_client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "html_text.hpp"
#include "http_utils.hpp"
#include "json_fields.hpp"

namespace
{

MediaAttachment::Type mediaTypeFromStr(const std::string& type)
{
    if(type == "image") return MediaAttachment::IMAGE;
    if(type == "video") return MediaAttachment::VIDEO;
    if(type == "gifv") return MediaAttachment::GIFV;
    if(type == "audio") return MediaAttachment::AUDIO;
    return MediaAttachment::UNKNOWN;
}

} // namespace

MastodonClient::MastodonClient(mw::HTTPSessionInterface& http,
                               std::string_view server,
                               std::string access_token)
        : http(http), server_url(http_utils::trimTrailingSlash(server)),
          token(std::move(access_token))
{
}

E<std::vector<Post>> MastodonClient::timeline(int limit)
{
    auto statuses = getJSON(apiURL(std::format("/timelines/home?limit={}",
                                               limit)));
    if(!statuses.has_value())
    {
        return std::unexpected(withContext(statuses.error(),
                                           "Failed to fetch timeline"));
    }
    if(!statuses->is_array())
    {
        return std::unexpected(decodeError(
            "Failed to parse timeline response: not a list"));
    }

    std::vector<Post> posts;
    for(const nlohmann::json& status : *statuses)
    {
        ASSIGN_OR_RETURN(Post p, statusToPost(status));
        posts.push_back(std::move(p));
    }
    return posts;
}

E<std::vector<Post>> MastodonClient::conversation(const Post& post)
{
    auto context = getJSON(apiURL(std::format("/statuses/{}/context",
                                              post.native_id)));
    if(!context.has_value())
    {
        return std::unexpected(withContext(context.error(),
                                           "Failed to fetch context"));
    }
    if(!context->contains("descendants") ||
       !(*context)["descendants"].is_array())
    {
        return std::unexpected(decodeError(
            "Failed to parse context response: no descendants"));
    }

    std::vector<Post> replies;
    for(const nlohmann::json& status : (*context)["descendants"])
    {
        ASSIGN_OR_RETURN(Post p, statusToPost(status));
        replies.push_back(std::move(p));
    }
    return replies;
}

E<Post> MastodonClient::post(const std::string& text)
{
    return submitStatus(text, std::nullopt);
}

E<Post> MastodonClient::reply(const std::string& text, const Post& target)
{
    return submitStatus(text, target.native_id);
}

E<void> MastodonClient::like(const Post& post)
{
    return statusAction(post, "favourite", "like");
}

E<void> MastodonClient::unlike(const Post& post)
{
    return statusAction(post, "unfavourite", "unlike");
}

E<void> MastodonClient::repost(const Post& post)
{
    return statusAction(post, "reblog", "repost");
}

E<void> MastodonClient::unrepost(const Post& post)
{
    return statusAction(post, "unreblog", "unrepost");
}

E<Account> MastodonClient::verifyCredentials()
{
    auto account = getJSON(apiURL("/accounts/verify_credentials"));
    if(!account.has_value())
    {
        return std::unexpected(withContext(account.error(),
                                           "Failed to verify credentials"));
    }
    auto username = JsonFields::optString(*account, "username");
    if(!username.has_value())
    {
        return std::unexpected(decodeError(
            "Failed to parse account response: no username"));
    }

    Account result;
    result.id = newLocalID();
    result.network = Network::MASTODON;
    result.display_name = JsonFields::getString(*account, "display_name");
    result.handle = *username;
    result.server = server_url;
    result.avatar_url = JsonFields::optString(*account, "avatar");
    result.time_creation = mw::Clock::now();
    return result;
}

E<Post> MastodonClient::statusToPost(const nlohmann::json& status)
{
    if(!status.is_object())
    {
        return std::unexpected(decodeError("Status is not an object"));
    }
    if(status.contains("reblog") && status["reblog"].is_object())
    {
        ASSIGN_OR_RETURN(Post inner, statusToPost(status["reblog"]));
        inner.is_repost = true;
        const nlohmann::json& booster = status.value("account",
                                                     nlohmann::json::object());
        std::string name = JsonFields::getString(booster, "display_name");
        if(name.empty())
        {
            name = JsonFields::getString(booster, "username");
        }
        inner.repost_author = std::move(name);
        return inner;
    }

    auto id = JsonFields::optString(status, "id");
    if(!id.has_value() || !status.contains("account") ||
       !status["account"].is_object())
    {
        return std::unexpected(decodeError("Status lacks id or account"));
    }
    const nlohmann::json& account = status["account"];

    Post p;
    p.id = newLocalID();
    p.native_id = *id;
    p.network = Network::MASTODON;
    p.author_handle = JsonFields::getString(account, "acct");
    if(p.author_handle.empty())
    {
        p.author_handle = JsonFields::getString(account, "username");
    }
    p.author_name = JsonFields::getString(account, "display_name");
    p.author_avatar = JsonFields::optString(account, "avatar");

    std::string html = JsonFields::getString(status, "content");
    p.content = HtmlText::toPlainText(html);
    p.content_raw = std::move(html);

    p.time_creation = http_utils::parseRFC3339(
        JsonFields::getString(status, "created_at")).value_or(
            mw::Clock::now());
    p.url = JsonFields::optString(status, "url");
    p.like_count = JsonFields::getCount(status, "favourites_count");
    p.repost_count = JsonFields::getCount(status, "reblogs_count");
    p.reply_count = JsonFields::getCount(status, "replies_count");
    p.liked = JsonFields::getBool(status, "favourited");
    p.reposted = JsonFields::getBool(status, "reblogged");
    p.reply_to = JsonFields::optString(status, "in_reply_to_id");

    if(status.contains("media_attachments") &&
       status["media_attachments"].is_array())
    {
        for(const nlohmann::json& m : status["media_attachments"])
        {
            MediaAttachment media;
            media.url = JsonFields::getString(m, "url");
            media.preview_url = JsonFields::optString(m, "preview_url");
            media.type = mediaTypeFromStr(JsonFields::getString(m, "type"));
            media.alt_text = JsonFields::optString(m, "description");
            p.media.push_back(std::move(media));
        }
    }
    return p;
}

// ========== Privates ==============================================>

std::string MastodonClient::apiURL(std::string_view endpoint) const
{
    return std::format("{}/api/v1{}", server_url, endpoint);
}

mw::HTTPRequest MastodonClient::makeRequest(const std::string& url) const
{
    mw::HTTPRequest req(url);
    req.addHeader("Authorization", "Bearer " + token);
    req.addHeader("Accept", "application/json");
    return req;
}

E<nlohmann::json> MastodonClient::getJSON(const std::string& url)
{
    spdlog::debug("Mastodon GET {}", url);
    return checkResponse(http.get(makeRequest(url)));
}

E<nlohmann::json> MastodonClient::postJSON(
    const std::string& url, const std::optional<nlohmann::json>& body)
{
    spdlog::debug("Mastodon POST {}", url);
    mw::HTTPRequest req = makeRequest(url);
    if(body.has_value())
    {
        req.setPayload(body->dump());
        req.setContentType("application/json");
    }
    return checkResponse(http.post(req));
}

E<nlohmann::json> MastodonClient::checkResponse(
    const mw::E<const mw::HTTPResponse*>& res) const
{
    if(!res.has_value())
    {
        return std::unexpected(fromHTTPError(res.error()));
    }
    const mw::HTTPResponse* response = *res;
    std::string payload(response->payloadAsStr());
    if(!http_utils::isSuccess(response->status))
    {
        return std::unexpected(protocolError(
            response->status,
            std::format("Mastodon error {}: {}", response->status,
                        JsonFields::errorText(payload))));
    }
    if(payload.empty())
    {
        return nlohmann::json::object();
    }
    return JsonFields::parse(payload);
}

E<Post> MastodonClient::submitStatus(
    const std::string& text, const std::optional<std::string>& reply_to_id)
{
    nlohmann::json body = {{"status", text}, {"visibility", "public"}};
    if(reply_to_id.has_value())
    {
        body["in_reply_to_id"] = *reply_to_id;
    }
    const char* what = reply_to_id.has_value() ? "Failed to post reply"
                                               : "Failed to post status";
    auto status = postJSON(apiURL("/statuses"), body);
    if(!status.has_value())
    {
        return std::unexpected(withContext(status.error(), what));
    }
    auto p = statusToPost(*status);
    if(!p.has_value())
    {
        return std::unexpected(withContext(p.error(), what));
    }
    return p;
}

E<void> MastodonClient::statusAction(const Post& post, std::string_view action,
                                     std::string_view verb)
{
    auto res = postJSON(apiURL(std::format("/statuses/{}/{}", post.native_id,
                                           action)), std::nullopt);
    if(!res.has_value())
    {
        return std::unexpected(withContext(
            res.error(), std::format("Failed to {} post", verb)));
    }
    return {};
}
