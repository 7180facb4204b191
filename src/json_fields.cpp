#include "json_fields.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <string>

E<nlohmann::json> JsonFields::parse(std::string_view payload)
{
    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if(j.is_discarded())
    {
        return std::unexpected(decodeError("Response is not valid JSON"));
    }
    return j;
}

std::optional<std::string> JsonFields::optString(const nlohmann::json& j,
                                                 const std::string& key)
{
    if(!j.is_object() || !j.contains(key))
    {
        return std::nullopt;
    }
    const auto& val = j[key];
    if(val.is_string())
    {
        return val.get<std::string>();
    }
    return std::nullopt;
}

std::string JsonFields::getString(const nlohmann::json& j,
                                  const std::string& key)
{
    return optString(j, key).value_or("");
}

uint32_t JsonFields::getCount(const nlohmann::json& j, const std::string& key)
{
    if(!j.is_object() || !j.contains(key))
    {
        return 0;
    }
    const auto& val = j[key];
    // Counts too large for 32 bits are clamped.
    if(val.is_number_unsigned())
    {
        return static_cast<uint32_t>(std::min<uint64_t>(
            val.get<uint64_t>(), std::numeric_limits<uint32_t>::max()));
    }
    if(val.is_number_integer() && val.get<int64_t>() > 0)
    {
        return static_cast<uint32_t>(std::min<int64_t>(
            val.get<int64_t>(), std::numeric_limits<uint32_t>::max()));
    }
    return 0;
}

bool JsonFields::getBool(const nlohmann::json& j, const std::string& key)
{
    if(!j.is_object() || !j.contains(key))
    {
        return false;
    }
    const auto& val = j[key];
    return val.is_boolean() && val.get<bool>();
}

std::string JsonFields::errorText(std::string_view payload)
{
    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if(j.is_discarded() || !j.is_object())
    {
        return std::string(payload);
    }
    auto error = optString(j, "error");
    auto message = optString(j, "message");
    if(error && message)
    {
        return std::format("{}: {}", *error, *message);
    }
    if(message)
    {
        return *message;
    }
    if(error)
    {
        return *error;
    }
    return std::string(payload);
}
