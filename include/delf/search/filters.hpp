#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace delf::search
{

// "100", "512B", "10K", "100M", "2G", "1T". Case-insensitive, binary multiples.
std::optional<std::uint64_t> parseSize(const std::string &input);

// Non-negative whole number of days.
std::optional<int> parseDays(const std::string &input);

// Renders "512 B", "1.50 KB", "12.3 MB", "100 GB".
std::string formatSize(std::uintmax_t bytes);

std::filesystem::file_time_type ageCutoff(int days,
                                          std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now());

inline bool isOlderThan(std::filesystem::file_time_type modified, std::filesystem::file_time_type cutoff) noexcept
{
    return modified < cutoff;
}

// Files only: strictly greater than the threshold.
inline bool isLargerThan(std::uintmax_t size, std::uint64_t threshold) noexcept
{
    return size > threshold;
}

} // namespace delf::search
