#include "delf/search/filters.hpp"

#include "delf/text_utils.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>

namespace delf::search
{

std::optional<std::uint64_t> parseSize(const std::string &input)
{
    std::string trimmed = text::trimCopy(input);
    if (trimmed.empty())
        return std::nullopt;

    std::size_t pos = 0;
    if (trimmed[pos] == '+')
        ++pos;
    if (pos >= trimmed.size() || !std::isdigit(static_cast<unsigned char>(trimmed[pos])))
        return std::nullopt;

    std::uint64_t value = 0;
    while (pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[pos])))
    {
        unsigned digit = static_cast<unsigned>(trimmed[pos] - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
        ++pos;
    }

    std::uint64_t multiplier = 1;
    if (pos < trimmed.size())
    {
        char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(trimmed[pos])));
        switch (suffix)
        {
        case 'k':
            multiplier = 1024ull;
            break;
        case 'm':
            multiplier = 1024ull * 1024ull;
            break;
        case 'g':
            multiplier = 1024ull * 1024ull * 1024ull;
            break;
        case 't':
            multiplier = 1024ull * 1024ull * 1024ull * 1024ull;
            break;
        case 'b':
            multiplier = 1;
            break;
        default:
            return std::nullopt;
        }
        ++pos;
    }

    if (pos != trimmed.size())
        return std::nullopt;
    if (value != 0 && multiplier > std::numeric_limits<std::uint64_t>::max() / value)
        return std::nullopt;
    return value * multiplier;
}

std::optional<int> parseDays(const std::string &input)
{
    std::string trimmed = text::trimCopy(input);
    if (trimmed.empty())
        return std::nullopt;

    long long value = 0;
    for (char ch : trimmed)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            return std::nullopt;
        value = value * 10 + (ch - '0');
        if (value > std::numeric_limits<int>::max())
            return std::nullopt;
    }
    return static_cast<int>(value);
}

std::string formatSize(std::uintmax_t bytes)
{
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024)
        return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4)
    {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    if (value >= 100)
        out << std::fixed << std::setprecision(0);
    else if (value >= 10)
        out << std::fixed << std::setprecision(1);
    else
        out << std::fixed << std::setprecision(2);
    out << value << ' ' << units[unit];
    return out.str();
}

std::filesystem::file_time_type ageCutoff(int days, std::filesystem::file_time_type now)
{
    using Duration = std::filesystem::file_time_type::duration;
    constexpr auto kDay = std::chrono::duration_cast<Duration>(std::chrono::hours(24));
    const auto oldest = std::filesystem::file_time_type::min();

    // Saturates at the oldest representable time; nothing is older than that.
    if (days <= 0)
        return now;
    if (days > Duration::max() / kDay)
        return oldest;
    const Duration span = kDay * days;
    if (now < oldest + span)
        return oldest;
    return now - span;
}

} // namespace delf::search
