/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/StringUtils>
#include <algorithm>
#include <cctype>

using namespace osgWeather;
using namespace osgWeather::Util;

void
osgWeather::Util::trim2(std::string& str)
{
    static const std::string whitespace(" \t\f\v\n\r");
    std::string::size_type pos = str.find_last_not_of(whitespace);
    if (pos != std::string::npos)
    {
        str.erase(pos + 1);
        pos = str.find_first_not_of(whitespace);
        if (pos != std::string::npos)
            str.erase(0, pos);
    }
    else
    {
        str.clear();
    }
}

std::string
osgWeather::Util::trim(const std::string& in)
{
    std::string str = in;
    trim2(str);
    return str;
}

std::string
osgWeather::Util::toLower(const std::string& input)
{
    std::string output = input;
    std::transform(output.begin(), output.end(), output.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return output;
}

StringVector
osgWeather::Util::split(const std::string& input, char delim)
{
    StringVector output;
    std::string::size_type start = 0;
    while (start <= input.size())
    {
        std::string::size_type end = input.find(delim, start);
        if (end == std::string::npos)
            end = input.size();

        std::string token = trim(input.substr(start, end - start));
        if (!token.empty())
            output.push_back(token);

        start = end + 1;
    }
    return output;
}

bool
osgWeather::Util::ciEquals(const std::string& lhs, const std::string& rhs, const std::locale& loc)
{
    if (lhs.length() != rhs.length())
        return false;

    for (unsigned i = 0; i < lhs.length(); ++i)
    {
        if (std::toupper(lhs[i], loc) != std::toupper(rhs[i], loc))
            return false;
    }

    return true;
}

bool
osgWeather::Util::startsWith(const std::string& ref, const std::string& pattern, bool caseSensitive, const std::locale& loc)
{
    if (pattern.length() > ref.length())
        return false;

    for (unsigned i = 0; i < pattern.length(); ++i)
    {
        bool same = caseSensitive ?
            ref[i] == pattern[i] :
            std::toupper(ref[i], loc) == std::toupper(pattern[i], loc);

        if (!same)
            return false;
    }
    return true;
}

bool
osgWeather::Util::endsWith(const std::string& ref, const std::string& pattern, bool caseSensitive, const std::locale& loc)
{
    if (pattern.length() > ref.length())
        return false;

    std::string::size_type offset = ref.size() - pattern.length();
    for (unsigned i = 0; i < pattern.length(); ++i)
    {
        bool same = caseSensitive ?
            ref[i + offset] == pattern[i] :
            std::toupper(ref[i + offset], loc) == std::toupper(pattern[i], loc);

        if (!same)
            return false;
    }
    return true;
}
