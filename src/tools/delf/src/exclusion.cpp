#include "delf/search/exclusion.hpp"

#include "delf/text_utils.hpp"

namespace delf::search
{

std::vector<std::string> parseExclusionPatterns(const std::string &line)
{
    return text::splitList(line, ',');
}

bool matchesExclusion(const std::filesystem::path &path, const std::vector<std::string> &patterns)
{
    const std::string full = path.string();
    const std::string name = path.filename().string();
    for (const auto &raw : patterns)
    {
        std::string pattern = text::trimCopy(raw);
        if (pattern.empty())
            continue;

        if (text::hasWildcard(pattern))
        {
            if (text::globMatch(pattern, name) || text::globMatch(pattern, full))
                return true;
        }
        else if (text::toLower(full).find(text::toLower(pattern)) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

ExclusionPartition partition(const std::vector<SearchResult> &results, const std::vector<std::string> &patterns)
{
    ExclusionPartition split;
    for (const auto &result : results)
    {
        if (matchesExclusion(result.path, patterns))
            split.excluded.push_back(result);
        else
            split.kept.push_back(result);
    }
    return split;
}

} // namespace delf::search
