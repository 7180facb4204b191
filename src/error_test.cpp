#include <variant>

#include <gtest/gtest.h>
#include <mw/error.hpp>

#include "error.hpp"

TEST(Error, CanGetMessageOfEveryKind)
{
    EXPECT_EQ(errorMsg(credentialError("a")), "a");
    EXPECT_EQ(errorMsg(transportError("b")), "b");
    EXPECT_EQ(errorMsg(protocolError(404, "c")), "c");
    EXPECT_EQ(errorMsg(decodeError("d")), "d");
    EXPECT_EQ(errorMsg(preconditionError("e")), "e");
    EXPECT_EQ(errorMsg(storageError("f")), "f");
}

TEST(Error, ContextKeepsKind)
{
    Error e = withContext(protocolError(500, "boom"), "Failed to post");
    ASSERT_TRUE(std::holds_alternative<ProtocolError>(e));
    EXPECT_EQ(std::get<ProtocolError>(e).status, 500);
    EXPECT_EQ(errorMsg(e), "Failed to post: boom");
}

TEST(Error, HTTPLayerErrorsAreTransportErrors)
{
    Error e = fromHTTPError(mw::runtimeError("Could not resolve host"));
    ASSERT_TRUE(std::holds_alternative<TransportError>(e));
    EXPECT_EQ(errorMsg(e), "Could not resolve host");
}

TEST(Error, Retryable)
{
    EXPECT_TRUE(isRetryable(transportError("timeout")));
    EXPECT_TRUE(isRetryable(protocolError(503, "")));
    EXPECT_TRUE(isRetryable(protocolError(429, "")));
    EXPECT_FALSE(isRetryable(protocolError(401, "")));
    EXPECT_FALSE(isRetryable(decodeError("")));
    EXPECT_FALSE(isRetryable(preconditionError("")));
    EXPECT_FALSE(isRetryable(credentialError("")));
    EXPECT_FALSE(isRetryable(storageError("")));
}
