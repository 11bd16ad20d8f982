#include "Utils.h"

/* System */
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>

bool o2::StrToDouble(const std::string& str, double& number)
{
    try {
        size_t idx;
        const double nr = std::stod(str, &idx);
        if (idx == str.length() && std::isfinite(nr))
        {
            number = nr;
            return true;
        }
    }
    catch (const std::logic_error&) {
        // Not a number or out of range
    }
    return false;
}

bool o2::StrToBool(const std::string& str, bool& value)
{
    if (str.empty())
        return false;

    static const std::map<std::string, bool> validValues = {
        { "0",      false },
        { "false",  false },
        { "off",    false },
        { "no",     false },
        { "1",      true },
        { "true",   true },
        { "on",     true },
        { "yes",    true }
    };

    const auto it = validValues.find(ToLower(str));
    if (it == validValues.end())
        return false;

    value = it->second;
    return true;
}

std::string o2::ToLower(const std::string& str)
{
    std::string lower = str;
    // Without ICU library we can only assume the string contains ASCII chars only
    std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return (char)std::tolower(c); });
    return lower;
}

std::string o2::TrimString(const std::string& str)
{
    const std::string::size_type first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const std::string::size_type last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> o2::SplitString(const std::string& string, char delimiter)
{
    std::vector<std::string> items;
    std::istringstream ss(string);
    std::string item;
    while (std::getline(ss, item, delimiter))
        items.push_back(item);
    return items;
}

std::string o2::JoinStrings(const std::vector<std::string>& strings, char delimiter,
        const std::string& prefix, const std::string& suffix)
{
    std::string string;
    for (size_t n = 0; n < strings.size(); n++)
    {
        if (n > 0)
            string += delimiter;
        string += prefix + strings[n] + suffix;
    }
    return string;
}

std::string o2::FormatFileTimeStamp(std::time_t time)
{
    std::tm tm;
    localtime_r(&time, &tm);

    char buffer[sizeof("YYYYMMDD_HHMMSS")];
    if (0 == std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm))
        return "00000000_000000";
    return buffer;
}
