#include "bluesky_client.hpp"

#include <format>
#include <string>
#include <utility>

#include <mw/http_client.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "http_utils.hpp"
#include "json_fields.hpp"

namespace
{

constexpr char REASON_REPOST[] = "app.bsky.feed.defs#reasonRepost";
constexpr int THREAD_DEPTH = 10;
constexpr int LIST_RECORDS_LIMIT = 100;

E<nlohmann::json> checkResponse(const mw::E<const mw::HTTPResponse*>& res)
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
            response->status, JsonFields::errorText(payload)));
    }
    if(payload.empty())
    {
        return nlohmann::json::object();
    }
    return JsonFields::parse(payload);
}

// The addressing pair of a post, or a precondition error naming the
// missing half.
E<BlueskyClient::RecordRef> addressOf(const Post& post, std::string_view verb)
{
    if(!post.cid.has_value())
    {
        return std::unexpected(preconditionError(
            std::format("Post missing CID for {}", verb)));
    }
    if(!post.uri.has_value())
    {
        return std::unexpected(preconditionError(
            std::format("Post missing URI for {}", verb)));
    }
    return BlueskyClient::RecordRef{*post.uri, *post.cid};
}

nlohmann::json refToJSON(const BlueskyClient::RecordRef& ref)
{
    return {{"uri", ref.uri}, {"cid", ref.cid}};
}

void flattenReplies(const nlohmann::json& node, const std::string& parent_uri,
                    std::vector<Post>& out)
{
    if(!node.is_object() || !node.contains("replies") ||
       !node["replies"].is_array())
    {
        return;
    }
    for(const nlohmann::json& child : node["replies"])
    {
        // Blocked and deleted replies have no post view.
        if(!child.is_object() || !child.contains("post"))
        {
            continue;
        }
        auto p = BlueskyClient::postViewToPost(child["post"]);
        if(!p.has_value())
        {
            spdlog::debug("Skipping reply that failed to parse: {}",
                          errorMsg(p.error()));
            continue;
        }
        if(!p->reply_to.has_value())
        {
            p->reply_to = parent_uri;
        }
        std::string uri = *p->uri;
        out.push_back(*std::move(p));
        flattenReplies(child, uri, out);
    }
}

} // namespace

E<std::unique_ptr<BlueskyClient>>
BlueskyClient::login(mw::HTTPSessionInterface& http, std::string_view handle,
                     std::string_view app_password, std::string_view server)
{
    std::string base = http_utils::trimTrailingSlash(
        server.empty() ? std::string_view(DEFAULT_BLUESKY_SERVER) : server);
    std::string url = std::format("{}/xrpc/com.atproto.server.createSession",
                                  base);
    spdlog::debug("Bluesky POST {}", url);

    nlohmann::json body = {{"identifier", std::string(handle)},
                           {"password", std::string(app_password)}};
    mw::HTTPRequest req(url);
    req.setPayload(body.dump());
    req.setContentType("application/json");

    auto session = checkResponse(http.post(req));
    if(!session.has_value())
    {
        return std::unexpected(withContext(session.error(),
                                           "Bluesky login failed"));
    }
    auto jwt = JsonFields::optString(*session, "accessJwt");
    auto did = JsonFields::optString(*session, "did");
    if(!jwt.has_value() || !did.has_value())
    {
        return std::unexpected(decodeError(
            "Failed to parse login response: no accessJwt or did"));
    }
    std::string session_handle = JsonFields::getString(*session, "handle");
    if(session_handle.empty())
    {
        session_handle = std::string(handle);
    }
    spdlog::debug("Logged in to {} as {}", base, *did);
    return std::make_unique<BlueskyClient>(http, base, *std::move(jwt),
                                           *std::move(did),
                                           std::move(session_handle));
}

BlueskyClient::BlueskyClient(mw::HTTPSessionInterface& http,
                             std::string_view server, std::string access_jwt,
                             std::string did, std::string handle)
        : http(http), server_url(http_utils::trimTrailingSlash(server)),
          access_jwt(std::move(access_jwt)), account_did(std::move(did)),
          account_handle(std::move(handle))
{
}

E<std::vector<Post>> BlueskyClient::timeline(int limit)
{
    auto timeline = getJSON(xrpcURL(std::format(
        "app.bsky.feed.getTimeline?limit={}", limit)));
    if(!timeline.has_value())
    {
        return std::unexpected(withContext(timeline.error(),
                                           "Failed to fetch timeline"));
    }
    if(!timeline->contains("feed") || !(*timeline)["feed"].is_array())
    {
        return std::unexpected(decodeError(
            "Failed to parse timeline response: no feed"));
    }

    std::vector<Post> posts;
    for(const nlohmann::json& item : (*timeline)["feed"])
    {
        ASSIGN_OR_RETURN(Post p, feedItemToPost(item));
        posts.push_back(std::move(p));
    }
    return posts;
}

E<std::vector<Post>> BlueskyClient::conversation(const Post& post)
{
    if(!post.uri.has_value())
    {
        return std::unexpected(preconditionError(
            "Post missing URI for thread"));
    }
    auto thread = getJSON(xrpcURL(std::format(
        "app.bsky.feed.getPostThread?uri={}&depth={}",
        http_utils::urlEncode(*post.uri), THREAD_DEPTH)));
    if(!thread.has_value())
    {
        return std::unexpected(withContext(thread.error(),
                                           "Failed to fetch thread"));
    }
    if(!thread->contains("thread"))
    {
        return std::unexpected(decodeError(
            "Failed to parse thread response: no thread"));
    }

    std::vector<Post> replies;
    flattenReplies((*thread)["thread"], *post.uri, replies);
    return replies;
}

E<Post> BlueskyClient::post(const std::string& text)
{
    return submitPost(text, std::nullopt, "Failed to post");
}

E<Post> BlueskyClient::reply(const std::string& text, const Post& target)
{
    ASSIGN_OR_RETURN(RecordRef parent, addressOf(target, "reply"));
    RecordRef root = parent;
    if(target.root_uri.has_value() && target.root_cid.has_value())
    {
        root = RecordRef{*target.root_uri, *target.root_cid};
    }
    nlohmann::json refs = {{"root", refToJSON(root)},
                           {"parent", refToJSON(parent)}};
    ASSIGN_OR_RETURN(Post p, submitPost(text, refs, "Failed to post reply"));
    p.reply_to = parent.uri;
    p.root_uri = root.uri;
    p.root_cid = root.cid;
    return p;
}

E<void> BlueskyClient::like(const Post& post)
{
    return createSubjectRecord(post, BSKY_COLLECTION_LIKE, "like");
}

E<void> BlueskyClient::unlike(const Post& post)
{
    return deleteSubjectRecord(post, BSKY_COLLECTION_LIKE, "unlike");
}

E<void> BlueskyClient::repost(const Post& post)
{
    return createSubjectRecord(post, BSKY_COLLECTION_REPOST, "repost");
}

E<void> BlueskyClient::unrepost(const Post& post)
{
    return deleteSubjectRecord(post, BSKY_COLLECTION_REPOST, "unrepost");
}

E<Account> BlueskyClient::verifyCredentials()
{
    auto profile = getJSON(xrpcURL(std::format(
        "app.bsky.actor.getProfile?actor={}",
        http_utils::urlEncode(account_did))));
    if(!profile.has_value())
    {
        return std::unexpected(withContext(profile.error(),
                                           "Failed to get profile"));
    }
    auto handle = JsonFields::optString(*profile, "handle");
    if(!handle.has_value())
    {
        return std::unexpected(decodeError(
            "Failed to parse profile response: no handle"));
    }

    Account result;
    result.id = newLocalID();
    result.network = Network::BLUESKY;
    result.display_name = JsonFields::optString(*profile, "displayName")
        .value_or(*handle);
    result.handle = *handle;
    result.server = server_url;
    result.avatar_url = JsonFields::optString(*profile, "avatar");
    result.time_creation = mw::Clock::now();
    return result;
}

E<Post> BlueskyClient::feedItemToPost(const nlohmann::json& item)
{
    if(!item.is_object() || !item.contains("post"))
    {
        return std::unexpected(decodeError("Feed item has no post"));
    }
    ASSIGN_OR_RETURN(Post p, postViewToPost(item["post"]));

    if(item.contains("reason") && item["reason"].is_object())
    {
        const nlohmann::json& reason = item["reason"];
        if(JsonFields::getString(reason, "$type") == REASON_REPOST)
        {
            const nlohmann::json& by = reason.value("by",
                                                    nlohmann::json::object());
            p.is_repost = true;
            p.repost_author = JsonFields::optString(by, "displayName")
                .value_or(JsonFields::getString(by, "handle"));
        }
    }
    return p;
}

E<Post> BlueskyClient::postViewToPost(const nlohmann::json& view)
{
    auto uri = JsonFields::optString(view, "uri");
    auto cid = JsonFields::optString(view, "cid");
    if(!uri.has_value() || !cid.has_value())
    {
        return std::unexpected(decodeError("Post view lacks uri or cid"));
    }
    const nlohmann::json& author = view.value("author",
                                               nlohmann::json::object());
    const nlohmann::json& record = view.value("record",
                                              nlohmann::json::object());

    Post p;
    p.id = newLocalID();
    p.native_id = http_utils::lastPathSegment(*uri);
    p.network = Network::BLUESKY;
    p.author_handle = JsonFields::getString(author, "handle");
    p.author_name = JsonFields::getString(author, "displayName");
    p.author_avatar = JsonFields::optString(author, "avatar");
    p.content = JsonFields::getString(record, "text");

    auto created = http_utils::parseRFC3339(
        JsonFields::getString(record, "createdAt"));
    if(!created.has_value())
    {
        created = http_utils::parseRFC3339(
            JsonFields::getString(view, "indexedAt"));
    }
    p.time_creation = created.value_or(mw::Clock::now());

    p.url = std::format("https://bsky.app/profile/{}/post/{}",
                        p.author_handle, p.native_id);
    p.like_count = JsonFields::getCount(view, "likeCount");
    p.repost_count = JsonFields::getCount(view, "repostCount");
    p.reply_count = JsonFields::getCount(view, "replyCount");

    if(view.contains("viewer") && view["viewer"].is_object())
    {
        p.liked = JsonFields::optString(view["viewer"], "like").has_value();
        p.reposted = JsonFields::optString(view["viewer"], "repost")
            .has_value();
    }

    if(record.contains("reply") && record["reply"].is_object())
    {
        const nlohmann::json& reply = record["reply"];
        if(reply.contains("parent"))
        {
            p.reply_to = JsonFields::optString(reply["parent"], "uri");
        }
        if(reply.contains("root"))
        {
            p.root_uri = JsonFields::optString(reply["root"], "uri");
            p.root_cid = JsonFields::optString(reply["root"], "cid");
        }
    }

    if(view.contains("embed") && view["embed"].is_object() &&
       view["embed"].contains("images") && view["embed"]["images"].is_array())
    {
        for(const nlohmann::json& img : view["embed"]["images"])
        {
            MediaAttachment media;
            media.url = JsonFields::getString(img, "fullsize");
            media.preview_url = JsonFields::optString(img, "thumb");
            media.type = MediaAttachment::IMAGE;
            media.alt_text = JsonFields::optString(img, "alt");
            p.media.push_back(std::move(media));
        }
    }

    p.uri = *std::move(uri);
    p.cid = *std::move(cid);
    return p;
}

// ========== Privates ==============================================>

std::string BlueskyClient::xrpcURL(std::string_view method) const
{
    return std::format("{}/xrpc/{}", server_url, method);
}

mw::HTTPRequest BlueskyClient::makeRequest(const std::string& url) const
{
    mw::HTTPRequest req(url);
    req.addHeader("Authorization", "Bearer " + access_jwt);
    req.addHeader("Accept", "application/json");
    return req;
}

E<nlohmann::json> BlueskyClient::getJSON(const std::string& url)
{
    spdlog::debug("Bluesky GET {}", url);
    return checkResponse(http.get(makeRequest(url)));
}

E<nlohmann::json> BlueskyClient::postJSON(const std::string& url,
                                          const nlohmann::json& body)
{
    spdlog::debug("Bluesky POST {}", url);
    mw::HTTPRequest req = makeRequest(url);
    req.setPayload(body.dump());
    req.setContentType("application/json");
    return checkResponse(http.post(req));
}

E<BlueskyClient::RecordRef> BlueskyClient::createRecord(
    std::string_view collection, nlohmann::json record)
{
    record["$type"] = std::string(collection);
    record["createdAt"] = http_utils::getISOTime();
    nlohmann::json body = {{"repo", account_did},
                           {"collection", std::string(collection)},
                           {"record", std::move(record)}};
    ASSIGN_OR_RETURN(nlohmann::json result,
                     postJSON(xrpcURL("com.atproto.repo.createRecord"), body));
    auto uri = JsonFields::optString(result, "uri");
    auto cid = JsonFields::optString(result, "cid");
    if(!uri.has_value() || !cid.has_value())
    {
        return std::unexpected(decodeError(
            "Create record response lacks uri or cid"));
    }
    return RecordRef{*std::move(uri), *std::move(cid)};
}

E<Post> BlueskyClient::submitPost(
    const std::string& text, const std::optional<nlohmann::json>& reply_refs,
    std::string_view what)
{
    nlohmann::json record = {{"text", text}};
    if(reply_refs.has_value())
    {
        record["reply"] = *reply_refs;
    }
    auto ref = createRecord(BSKY_COLLECTION_POST, std::move(record));
    if(!ref.has_value())
    {
        return std::unexpected(withContext(ref.error(), what));
    }

    Post p;
    p.id = newLocalID();
    p.native_id = http_utils::lastPathSegment(ref->uri);
    p.network = Network::BLUESKY;
    p.author_handle = account_handle;
    p.content = text;
    p.time_creation = mw::Clock::now();
    p.url = std::format("https://bsky.app/profile/{}/post/{}",
                        account_handle, p.native_id);
    p.uri = ref->uri;
    p.cid = ref->cid;
    return p;
}

E<void> BlueskyClient::createSubjectRecord(
    const Post& post, std::string_view collection, std::string_view verb)
{
    ASSIGN_OR_RETURN(RecordRef subject, addressOf(post, verb));
    auto ref = createRecord(collection, {{"subject", refToJSON(subject)}});
    if(!ref.has_value())
    {
        return std::unexpected(withContext(
            ref.error(), std::format("Failed to {} post", verb)));
    }
    return {};
}

E<void> BlueskyClient::deleteSubjectRecord(
    const Post& post, std::string_view collection, std::string_view verb)
{
    if(!post.uri.has_value())
    {
        return std::unexpected(preconditionError(
            std::format("Post missing URI for {}", verb)));
    }
    const std::string context = std::format("Failed to {} post", verb);

    auto records = getJSON(xrpcURL(std::format(
        "com.atproto.repo.listRecords?repo={}&collection={}&limit={}",
        http_utils::urlEncode(account_did), collection, LIST_RECORDS_LIMIT)));
    if(!records.has_value())
    {
        return std::unexpected(withContext(records.error(), context));
    }
    if(!records->contains("records") || !(*records)["records"].is_array())
    {
        return std::unexpected(decodeError(
            context + ": list records response has no records"));
    }

    const nlohmann::json* match = nullptr;
    for(const nlohmann::json& record : (*records)["records"])
    {
        if(!record.is_object() || !record.contains("value") ||
           !record["value"].is_object())
        {
            spdlog::debug("Skipping malformed {} record", collection);
            continue;
        }
        const nlohmann::json& value = record["value"];
        if(!value.contains("subject"))
        {
            continue;
        }
        if(JsonFields::optString(value["subject"], "uri") == post.uri)
        {
            match = &record;
            break;
        }
    }
    if(match == nullptr)
    {
        spdlog::debug("No {} record for {}, nothing to {}.", collection,
                      *post.uri, verb);
        return {};
    }
    std::optional<std::string> record_uri = JsonFields::optString(*match,
                                                                  "uri");
    if(!record_uri.has_value())
    {
        return std::unexpected(decodeError(
            context + ": matching record has no URI"));
    }

    nlohmann::json body = {{"repo", account_did},
                           {"collection", std::string(collection)},
                           {"rkey", http_utils::lastPathSegment(*record_uri)}};
    auto res = postJSON(xrpcURL("com.atproto.repo.deleteRecord"), body);
    if(!res.has_value())
    {
        return std::unexpected(withContext(res.error(), context));
    }
    return {};
}
