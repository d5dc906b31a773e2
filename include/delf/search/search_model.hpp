#pragma once

#include "delf/safety/path_classifier.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace delf::search
{

using safety::Category;

struct SearchResult
{
    std::filesystem::path path;
    Category category = Category::Safe;
    bool isDirectory = false;
};

enum class TypeFilter
{
    Any,
    Files,
    Directories
};

// Resolved once per run, then passed by const reference.
struct RunOptions
{
    std::string pattern;
    std::filesystem::path searchRoot = ".";
    bool dryRun = false;
    bool force = false;
    bool ignoreCase = false;
    TypeFilter type = TypeFilter::Any;
    bool autoExclude = true;
    bool showSize = false;
    std::optional<int> olderThanDays;
    std::optional<std::uint64_t> largerThanBytes;
    bool emptyDirsOnly = false;
    std::size_t maxDisplay = 100;
    std::size_t previewLimit = 10;
};

struct CategoryCounts
{
    std::size_t critical = 0;
    std::size_t warning = 0;
    std::size_t safe = 0;

    std::size_t total() const noexcept { return critical + warning + safe; }
};

// Accepts "f"/"file" and "d"/"dir"/"directory"; empty means Any.
std::optional<TypeFilter> parseTypeFilter(const std::string &value);
const char *typeFilterName(TypeFilter type) noexcept;

CategoryCounts countByCategory(const std::vector<SearchResult> &results);

// Copies every non-Critical entry, order preserved.
std::vector<SearchResult> withoutCritical(const std::vector<SearchResult> &results);

} // namespace delf::search
