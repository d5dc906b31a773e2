#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fnmatch.h>

namespace delf::text
{

inline std::string trimCopy(std::string_view value)
{
    std::size_t start = 0;
    std::size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])))
        --end;
    return std::string(value.substr(start, end - start));
}

inline std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Splits on separator, trims every piece and drops the empty ones.
inline std::vector<std::string> splitList(const std::string &value, char separator = ',')
{
    std::vector<std::string> items;
    std::string current;
    std::istringstream stream(value);
    while (std::getline(stream, current, separator))
    {
        std::string trimmed = trimCopy(current);
        if (!trimmed.empty())
            items.push_back(std::move(trimmed));
    }
    return items;
}

inline bool hasWildcard(std::string_view pattern)
{
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

// Shell-style match; '*' also crosses '/'.
inline bool globMatch(const std::string &pattern, const std::string &value)
{
    return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

} // namespace delf::text
