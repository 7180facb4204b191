#include <cstdint>
#include <variant>

#include <gtest/gtest.h>

#include "json_fields.hpp"

TEST(JsonFieldsTest, Parse)
{
    auto j = JsonFields::parse(R"({"a": 1})");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ((*j)["a"], 1);

    auto bad = JsonFields::parse("<html>");
    ASSERT_FALSE(bad.has_value());
    EXPECT_TRUE(std::holds_alternative<DecodeError>(bad.error()));
}

TEST(JsonFieldsTest, OptionalFields)
{
    nlohmann::json j = {{"s", "x"}, {"n", nullptr}, {"i", 3}, {"neg", -2},
                        {"b", true}};
    EXPECT_EQ(JsonFields::optString(j, "s"), "x");
    EXPECT_FALSE(JsonFields::optString(j, "n").has_value());
    EXPECT_FALSE(JsonFields::optString(j, "i").has_value());
    EXPECT_EQ(JsonFields::getString(j, "missing"), "");
    EXPECT_EQ(JsonFields::getCount(j, "i"), 3u);
    EXPECT_EQ(JsonFields::getCount(j, "neg"), 0u);
    EXPECT_EQ(JsonFields::getCount(j, "n"), 0u);
    EXPECT_TRUE(JsonFields::getBool(j, "b"));
    EXPECT_FALSE(JsonFields::getBool(j, "n"));
}

TEST(JsonFieldsTest, HugeCountsAreClamped)
{
    auto j = JsonFields::parse(
        R"({"big": 4294967296, "huge": 18446744073709551615, "max": 4294967295})");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(JsonFields::getCount(*j, "big"), 4294967295u);
    EXPECT_EQ(JsonFields::getCount(*j, "huge"), 4294967295u);
    EXPECT_EQ(JsonFields::getCount(*j, "max"), 4294967295u);

    nlohmann::json signed_big = {{"n", int64_t(1) << 40}};
    EXPECT_EQ(JsonFields::getCount(signed_big, "n"), 4294967295u);
}

TEST(JsonFieldsTest, ErrorText)
{
    EXPECT_EQ(JsonFields::errorText(R"({"error": "Record not found"})"),
              "Record not found");
    EXPECT_EQ(JsonFields::errorText(
                  R"({"error": "AuthenticationRequired", "message": "Invalid identifier or password"})"),
              "AuthenticationRequired: Invalid identifier or password");
    EXPECT_EQ(JsonFields::errorText("Bad Gateway"), "Bad Gateway");
}
