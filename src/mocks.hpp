#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "client_resolver.hpp"
#include "scheduled_post_store.hpp"
#include "secret_store.hpp"
#include "social_api.hpp"

class SocialApiMock : public SocialApiInterface
{
public:
    MOCK_METHOD(Network, network, (), (const, override));
    MOCK_METHOD(E<std::vector<Post>>, timeline, (int), (override));
    MOCK_METHOD(E<std::vector<Post>>, conversation, (const Post&), (override));
    MOCK_METHOD(E<Post>, post, (const std::string&), (override));
    MOCK_METHOD(E<Post>, reply, (const std::string&, const Post&), (override));
    MOCK_METHOD(E<void>, like, (const Post&), (override));
    MOCK_METHOD(E<void>, unlike, (const Post&), (override));
    MOCK_METHOD(E<void>, repost, (const Post&), (override));
    MOCK_METHOD(E<void>, unrepost, (const Post&), (override));
    MOCK_METHOD(E<Account>, verifyCredentials, (), (override));
};

class ClientResolverMock : public ClientResolverInterface
{
public:
    MOCK_METHOD(E<std::unique_ptr<SocialApiInterface>>, resolve,
                (const Account&, const std::string&), (override));
};

class SecretStoreMock : public SecretStoreInterface
{
public:
    MOCK_METHOD(E<std::optional<std::string>>, getCredentials,
                (const Account&), (override));
};

class ScheduledPostStoreMock : public ScheduledPostStoreInterface
{
public:
    MOCK_METHOD(E<void>, saveScheduledPost, (const ScheduledPost&),
                (override));
    MOCK_METHOD(E<std::vector<ScheduledPost>>, scheduledPosts, (),
                (override));
};
