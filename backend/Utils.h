#pragma once
#ifndef O2_UTILS_H
#define O2_UTILS_H

/* System */
#include <cstdint>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/* Platform independent macro to avoid compiler warnings for unreferenced
   function parameters.
   Usage example:
       void do_magic(int count)
       {
           UNUSED(count);
       }
*/
#define UNUSED(expr) do { (void)(expr); } while (0)

namespace o2 {

// Converts string to integral number of given type
template<typename T>
bool StrToNumber(const std::string& str,
        typename std::enable_if<
            std::is_integral<T>::value && std::is_signed<T>::value,
            T>::type& number)
{
    try {
        size_t idx;
        const long long nr = std::stoll(str, &idx);
        if (idx == str.length()
                && nr >= (long long)(std::numeric_limits<T>::min)()
                && nr <= (long long)(std::numeric_limits<T>::max)())
        {
            number = (T)nr;
            return true;
        }
    }
    catch (const std::logic_error&) {
        // Not a number or out of range
    }
    return false;
}

// Converts string to integral number of given type
template<typename T>
bool StrToNumber(const std::string& str,
        typename std::enable_if<
            std::is_integral<T>::value && std::is_unsigned<T>::value,
            T>::type& number)
{
    // std::stoull silently wraps negative numbers
    if (str.find('-') != std::string::npos)
        return false;

    try {
        size_t idx;
        const unsigned long long nr = std::stoull(str, &idx);
        if (idx == str.length()
                && nr <= (unsigned long long)(std::numeric_limits<T>::max)())
        {
            number = (T)nr;
            return true;
        }
    }
    catch (const std::logic_error&) {
        // Not a number or out of range
    }
    return false;
}

// Converts string to real number
bool StrToDouble(const std::string& str, double& number);

// Converts string to boolean value
bool StrToBool(const std::string& str, bool& value);

// Converts ASCII string to lower case
std::string ToLower(const std::string& str);

// Removes leading and trailing spaces, tabs and line ends
std::string TrimString(const std::string& str);

// Splits string into sub-strings separated by given delimiter
std::vector<std::string> SplitString(const std::string& string, char delimiter);

// Joins strings using given delimiter, each item wrapped in prefix and suffix
std::string JoinStrings(const std::vector<std::string>& strings, char delimiter,
        const std::string& prefix = "", const std::string& suffix = "");

// Local time formatted as YYYYMMDD_HHMMSS, used in file names
std::string FormatFileTimeStamp(std::time_t time);

} // namespace o2

#endif /* O2_UTILS_H */
