#pragma once

#include "delf/search/search_model.hpp"

#include <string>
#include <vector>

namespace delf::search
{

struct ExclusionPartition
{
    std::vector<SearchResult> kept;
    std::vector<SearchResult> excluded;
};

// One comma-separated line into trimmed, non-empty patterns.
std::vector<std::string> parseExclusionPatterns(const std::string &line);

// Wildcard patterns glob against the base name, then the full path. Plain
// patterns are case-insensitive substrings of the full path.
bool matchesExclusion(const std::filesystem::path &path, const std::vector<std::string> &patterns);

// Every result lands in exactly one side, relative order kept.
ExclusionPartition partition(const std::vector<SearchResult> &results, const std::vector<std::string> &patterns);

} // namespace delf::search
