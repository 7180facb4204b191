#include "schedule.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "http_utils.hpp"

namespace
{

std::string_view trim(std::string_view s)
{
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    {
        s.remove_prefix(1);
    }
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<int64_t> parseInt(std::string_view s)
{
    int64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc() || end != s.data() + s.size())
    {
        return std::nullopt;
    }
    return value;
}

// The whole of “s” has to match “format”.
bool parseTm(const std::string& s, const char* format, std::tm& tm)
{
    std::istringstream ss(s);
    ss >> std::get_time(&tm, format);
    return !ss.fail() && ss.peek() == std::char_traits<char>::eof();
}

std::optional<mw::Time> fromLocalTm(std::tm tm)
{
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if(t == -1)
    {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

// “5m”, “2h”, “1d”...
std::optional<std::chrono::seconds> parseShortDuration(std::string_view s)
{
    if(s.size() < 2)
    {
        return std::nullopt;
    }
    auto amount = parseInt(s.substr(0, s.size() - 1));
    if(!amount.has_value())
    {
        return std::nullopt;
    }
    switch(s.back())
    {
    case 's':
        return std::chrono::seconds(*amount);
    case 'm':
        return std::chrono::minutes(*amount);
    case 'h':
        return std::chrono::hours(*amount);
    case 'd':
        return std::chrono::days(*amount);
    case 'w':
        return std::chrono::weeks(*amount);
    }
    return std::nullopt;
}

E<mw::Time> parseRelative(std::string_view s, mw::Time now)
{
    s = trim(s);
    if(auto d = parseShortDuration(s); d.has_value())
    {
        return now + *d;
    }

    std::vector<std::string> parts;
    std::istringstream ss{std::string(s)};
    std::string word;
    while(ss >> word)
    {
        parts.push_back(word);
    }
    std::optional<int64_t> amount;
    if(parts.size() >= 2)
    {
        amount = parseInt(parts[0]);
    }
    if(!amount.has_value())
    {
        return std::unexpected(preconditionError(std::format(
            "Could not parse relative time: '{}'. Examples: '5m', '2h', "
            "'1d', '30 minutes', '2 hours'", s)));
    }

    std::string unit = parts[1];
    while(!unit.empty() && unit.back() == 's')
    {
        unit.pop_back();
    }
    if(unit == "second" || unit == "sec")
    {
        return now + std::chrono::seconds(*amount);
    }
    if(unit == "minute" || unit == "min")
    {
        return now + std::chrono::minutes(*amount);
    }
    if(unit == "hour" || unit == "hr")
    {
        return now + std::chrono::hours(*amount);
    }
    if(unit == "day")
    {
        return now + std::chrono::days(*amount);
    }
    if(unit == "week")
    {
        return now + std::chrono::weeks(*amount);
    }
    return std::unexpected(preconditionError(
        std::format("Unknown time unit: {}", parts[1])));
}

// “15:00”, “15:00:30”, “3pm”, “3:30pm”. Fills in hour, minute and
// second of “tm”.
bool parseTimeOfDay(const std::string& s, std::tm& tm)
{
    std::tm parsed = {};
    if(parseTm(s, "%H:%M:%S", parsed) || parseTm(s, "%H:%M", parsed))
    {
        tm.tm_hour = parsed.tm_hour;
        tm.tm_min = parsed.tm_min;
        tm.tm_sec = parsed.tm_sec;
        return true;
    }

    std::string compact;
    std::copy_if(s.begin(), s.end(), std::back_inserter(compact),
                 [](char c) { return c != ' '; });
    if(compact.size() < 3)
    {
        return false;
    }
    std::string_view suffix = std::string_view(compact).substr(
        compact.size() - 2);
    if(suffix != "am" && suffix != "pm")
    {
        return false;
    }
    std::string_view clock = std::string_view(compact).substr(
        0, compact.size() - 2);
    std::optional<int64_t> hour;
    int64_t minute = 0;
    if(size_t colon = clock.find(':'); colon != std::string_view::npos)
    {
        hour = parseInt(clock.substr(0, colon));
        minute = parseInt(clock.substr(colon + 1)).value_or(0);
    }
    else
    {
        hour = parseInt(clock);
    }
    if(!hour.has_value() || *hour < 0)
    {
        return false;
    }
    if(suffix == "pm" && *hour != 12)
    {
        *hour += 12;
    }
    else if(suffix == "am" && *hour == 12)
    {
        *hour = 0;
    }
    if(*hour > 23 || minute < 0 || minute > 59)
    {
        return false;
    }
    tm.tm_hour = static_cast<int>(*hour);
    tm.tm_min = static_cast<int>(minute);
    tm.tm_sec = 0;
    return true;
}

bool hasZone(std::string_view s)
{
    if(s.size() < 20)
    {
        return false;
    }
    if(s.back() == 'Z' || s.back() == 'z')
    {
        return true;
    }
    char sign = s[s.size() - 6];
    return (sign == '+' || sign == '-') && s[s.size() - 3] == ':';
}

} // namespace

E<mw::Time> parseScheduleTime(std::string_view input, mw::Time now)
{
    std::string text(trim(input));
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if(lower.starts_with("in "))
    {
        return parseRelative(std::string_view(lower).substr(3), now);
    }

    if(hasZone(text))
    {
        if(auto t = http_utils::parseRFC3339(text); t.has_value())
        {
            return *t;
        }
    }

    for(const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M",
                              "%Y-%m-%dT%H:%M:%S", "%Y-%m-%dT%H:%M"})
    {
        std::tm tm = {};
        if(parseTm(text, format, tm))
        {
            if(auto t = fromLocalTm(tm); t.has_value())
            {
                return *t;
            }
            return std::unexpected(preconditionError(
                std::format("Invalid local time: '{}'", text)));
        }
    }

    std::time_t now_secs = std::chrono::system_clock::to_time_t(now);
    std::tm today = {};
    localtime_r(&now_secs, &today);
    if(parseTimeOfDay(lower, today))
    {
        auto t = fromLocalTm(today);
        if(t.has_value() && *t <= now)
        {
            today.tm_mday += 1;
            t = fromLocalTm(today);
        }
        if(t.has_value())
        {
            return *t;
        }
    }

    return std::unexpected(preconditionError(std::format(
        "Could not parse schedule time: '{}'. Try 'in 5m', '15:00', '3pm' "
        "or 'YYYY-MM-DD 15:00'", text)));
}
