#include "client_resolver.hpp"

#include <format>
#include <memory>

#include <mw/url.hpp>
#include <spdlog/spdlog.h>

#include "bluesky_client.hpp"
#include "mastodon_client.hpp"

E<std::unique_ptr<SocialApiInterface>>
ClientResolver::resolve(const Account& account, const std::string& secret)
{
    switch(account.network)
    {
    case Network::MASTODON:
    {
        auto url = mw::URL::fromStr(account.server);
        if(!url.has_value() || url->host().empty())
        {
            return std::unexpected(preconditionError(std::format(
                "Invalid server URL: {}", account.server)));
        }
        spdlog::debug("Using Mastodon client for {}", account.fullHandle());
        return std::make_unique<MastodonClient>(http, account.server, secret);
    }
    case Network::BLUESKY:
    {
        std::string server = account.server.empty() ?
            std::string(DEFAULT_BLUESKY_SERVER) : account.server;
        spdlog::debug("Logging in {} at {}", account.fullHandle(), server);
        ASSIGN_OR_RETURN(std::unique_ptr<BlueskyClient> client,
                         BlueskyClient::login(http, account.handle, secret,
                                              server));
        return client;
    }
    }
    return std::unexpected(preconditionError("Unknown network"));
}
