#pragma once

#include <memory>
#include <string>

#include <mw/http_client.hpp>

#include "data_types.hpp"
#include "error.hpp"
#include "social_api.hpp"

class ClientResolverInterface
{
public:
    virtual ~ClientResolverInterface() = default;

    // Build the client that services “account”, given its secret (an
    // access token for Mastodon, an app password for Bluesky). For
    // Bluesky this logs in.
    virtual E<std::unique_ptr<SocialApiInterface>>
    resolve(const Account& account, const std::string& secret) = 0;
};

class ClientResolver : public ClientResolverInterface
{
public:
    // The session must outlive every client this resolves.
    explicit ClientResolver(mw::HTTPSessionInterface& http) : http(http) {}

    E<std::unique_ptr<SocialApiInterface>>
    resolve(const Account& account, const std::string& secret) override;

private:
    mw::HTTPSessionInterface& http;
};
