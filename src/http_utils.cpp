#include "http_utils.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace http_utils {

std::string getISOTime()
{
    return formatISOTime(mw::Clock::now());
}

std::string formatISOTime(mw::Time t)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count() % 1000;
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&secs);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setw(3) << std::setfill('0') << ms << "Z";
    return ss.str();
}

std::optional<mw::Time> parseRFC3339(std::string_view s)
{
    if(s.size() < 19)
    {
        return std::nullopt;
    }
    std::tm tm = {};
    std::stringstream ss{std::string(s.substr(0, 19))};
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(ss.fail())
    {
        return std::nullopt;
    }
    std::time_t time = timegm(&tm);

    size_t pos = 19;
    if(pos < s.size() && s[pos] == '.')
    {
        pos++;
        while(pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
        {
            pos++;
        }
    }
    if(pos >= s.size())
    {
        // No zone designator. Treat as UTC.
        return std::chrono::system_clock::from_time_t(time);
    }
    if(s[pos] == 'Z' || s[pos] == 'z')
    {
        return std::chrono::system_clock::from_time_t(time);
    }
    if((s[pos] == '+' || s[pos] == '-') && s.size() >= pos + 6 &&
       s[pos + 3] == ':')
    {
        int sign = s[pos] == '+' ? 1 : -1;
        int hours = 0;
        int minutes = 0;
        try
        {
            hours = std::stoi(std::string(s.substr(pos + 1, 2)));
            minutes = std::stoi(std::string(s.substr(pos + 4, 2)));
        }
        catch(const std::exception&)
        {
            return std::nullopt;
        }
        time -= sign * (hours * 3600 + minutes * 60);
        return std::chrono::system_clock::from_time_t(time);
    }
    return std::nullopt;
}

std::string urlEncode(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for(unsigned char c : s)
    {
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            result += static_cast<char>(c);
        }
        else
        {
            result += std::format("%{:02X}", c);
        }
    }
    return result;
}

std::string lastPathSegment(std::string_view s)
{
    size_t slash = s.rfind('/');
    if(slash == std::string_view::npos)
    {
        return std::string(s);
    }
    return std::string(s.substr(slash + 1));
}

std::string trimTrailingSlash(std::string_view s)
{
    while(!s.empty() && s.back() == '/')
    {
        s.remove_suffix(1);
    }
    return std::string(s);
}

}
