#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "error.hpp"

// Lenient accessors for API responses, where optional fields may be
// absent or null.
class JsonFields
{
public:
    // Parse a response body. Failure is a decode error.
    static E<nlohmann::json> parse(std::string_view payload);

    // The string at “key”, or nothing if absent, null or not a string.
    static std::optional<std::string> optString(const nlohmann::json& j,
                                                const std::string& key);
    // Like optString(), but empty instead of nothing.
    static std::string getString(const nlohmann::json& j,
                                 const std::string& key);
    static uint32_t getCount(const nlohmann::json& j, const std::string& key);
    // False if absent or null.
    static bool getBool(const nlohmann::json& j, const std::string& key);

    // Extract a human readable error from an error response. Both
    // networks put it in “error”, Bluesky adds “message”. Falls back
    // to the raw body.
    static std::string errorText(std::string_view payload);
};
