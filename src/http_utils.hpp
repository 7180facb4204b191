#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <mw/utils.hpp>

namespace http_utils
{
// Current time like “2024-01-02T03:04:05.678Z”.
std::string getISOTime();
std::string formatISOTime(mw::Time t);
// Parse an RFC 3339 timestamp. Fractional seconds are accepted and
// dropped. Offsets other than “Z” are applied.
std::optional<mw::Time> parseRFC3339(std::string_view s);

// Percent-encode everything except unreserved characters.
std::string urlEncode(std::string_view s);
// “at://did:plc:x/app.bsky.feed.post/abc” -> “abc”.
std::string lastPathSegment(std::string_view s);
std::string trimTrailingSlash(std::string_view s);

inline bool isSuccess(int status)
{
    return status >= 200 && status < 300;
}
} // namespace http_utils
