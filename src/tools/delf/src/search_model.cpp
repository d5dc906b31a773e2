#include "delf/search/search_model.hpp"

#include "delf/text_utils.hpp"

namespace delf::search
{

std::optional<TypeFilter> parseTypeFilter(const std::string &value)
{
    std::string lower = text::toLower(text::trimCopy(value));
    if (lower.empty())
        return TypeFilter::Any;
    if (lower == "f" || lower == "file")
        return TypeFilter::Files;
    if (lower == "d" || lower == "dir" || lower == "directory")
        return TypeFilter::Directories;
    return std::nullopt;
}

const char *typeFilterName(TypeFilter type) noexcept
{
    switch (type)
    {
    case TypeFilter::Files:
        return "files";
    case TypeFilter::Directories:
        return "directories";
    case TypeFilter::Any:
        break;
    }
    return "any";
}

CategoryCounts countByCategory(const std::vector<SearchResult> &results)
{
    CategoryCounts counts;
    for (const auto &result : results)
    {
        switch (result.category)
        {
        case Category::Critical:
            ++counts.critical;
            break;
        case Category::Warning:
            ++counts.warning;
            break;
        case Category::Safe:
            ++counts.safe;
            break;
        }
    }
    return counts;
}

std::vector<SearchResult> withoutCritical(const std::vector<SearchResult> &results)
{
    std::vector<SearchResult> filtered;
    filtered.reserve(results.size());
    for (const auto &result : results)
    {
        if (result.category != Category::Critical)
            filtered.push_back(result);
    }
    return filtered;
}

} // namespace delf::search
