#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <mw/http_client_mock.hpp>

#include "client_resolver.hpp"
#include "test_utils.hpp"

using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;

TEST(ClientResolver, MastodonNeedsNoRequest)
{
    NiceMock<mw::HTTPSessionMock> http;
    EXPECT_CALL(http, post(_)).Times(0);
    EXPECT_CALL(http, get(testing::A<const mw::HTTPRequest&>())).Times(0);

    Account account;
    account.network = Network::MASTODON;
    account.handle = "alice";
    account.server = "https://mastodon.social";

    ClientResolver resolver(http);
    ASSIGN_OR_FAIL(auto client, resolver.resolve(account, "TOKEN"));
    EXPECT_EQ(client->network(), Network::MASTODON);
}

TEST(ClientResolver, InvalidMastodonServer)
{
    NiceMock<mw::HTTPSessionMock> http;
    Account account;
    account.network = Network::MASTODON;
    account.server = "";

    ClientResolver resolver(http);
    auto client = resolver.resolve(account, "TOKEN");
    ASSERT_FALSE(client.has_value());
    EXPECT_TRUE(std::holds_alternative<PreconditionError>(client.error()));
}

TEST(ClientResolver, BlueskyLogsInAtDefaultServer)
{
    NiceMock<mw::HTTPSessionMock> http;
    mw::HTTPResponse resp = makeResponse(
        200, R"({"accessJwt": "JWT", "handle": "bob.bsky.social",
                 "did": "did:plc:bob"})");
    EXPECT_CALL(http, post(Field(&mw::HTTPRequest::url,
                                 "https://bsky.social/xrpc/"
                                 "com.atproto.server.createSession")))
        .WillOnce(Return(&resp));

    Account account;
    account.network = Network::BLUESKY;
    account.handle = "bob.bsky.social";

    ClientResolver resolver(http);
    ASSIGN_OR_FAIL(auto client, resolver.resolve(account, "app-pass"));
    EXPECT_EQ(client->network(), Network::BLUESKY);
}

TEST(ClientResolver, BlueskyLoginFailureIsReported)
{
    NiceMock<mw::HTTPSessionMock> http;
    EXPECT_CALL(http, post(_))
        .WillOnce(Return(std::unexpected(mw::runtimeError("DNS failure"))));

    Account account;
    account.network = Network::BLUESKY;
    account.handle = "bob.bsky.social";
    account.server = "https://pds.example";

    ClientResolver resolver(http);
    auto client = resolver.resolve(account, "app-pass");
    ASSERT_FALSE(client.has_value());
    EXPECT_TRUE(std::holds_alternative<TransportError>(client.error()));
    EXPECT_EQ(errorMsg(client.error()), "Bluesky login failed: DNS failure");
}
