#include <gtest/gtest.h>

#include "delf/search/exclusion.hpp"

#include <string>
#include <vector>

using namespace delf::search;

namespace
{

std::vector<SearchResult> resultsFor(const std::vector<std::string> &paths)
{
    std::vector<SearchResult> results;
    for (const auto &path : paths)
        results.push_back({path, Category::Safe, false});
    return results;
}

std::vector<std::string> pathsOf(const std::vector<SearchResult> &results)
{
    std::vector<std::string> paths;
    for (const auto &result : results)
        paths.push_back(result.path.string());
    return paths;
}

} // namespace

TEST(Exclusion, ParsesCommaSeparatedLine)
{
    EXPECT_EQ(parseExclusionPatterns(" *.tmp,  important.txt ,, "),
              (std::vector<std::string>{"*.tmp", "important.txt"}));
    EXPECT_TRUE(parseExclusionPatterns("").empty());
    EXPECT_TRUE(parseExclusionPatterns(" , ").empty());
}

TEST(Exclusion, GlobAndSubstringPatterns)
{
    auto results = resultsFor({"/w/a.tmp", "/w/important.txt", "/w/b.log"});
    auto split = partition(results, parseExclusionPatterns("*.tmp, important.txt"));
    EXPECT_EQ(pathsOf(split.excluded), (std::vector<std::string>{"/w/a.tmp", "/w/important.txt"}));
    EXPECT_EQ(pathsOf(split.kept), (std::vector<std::string>{"/w/b.log"}));
}

TEST(Exclusion, GlobFallsBackToFullPath)
{
    EXPECT_TRUE(matchesExclusion("/data/backup/file.bin", {"*/backup/*"}));
    EXPECT_FALSE(matchesExclusion("/data/current/file.bin", {"*/backup/*"}));
    EXPECT_TRUE(matchesExclusion("/data/file1.bin", {"file?.bin"}));
}

TEST(Exclusion, SubstringIsCaseInsensitive)
{
    EXPECT_TRUE(matchesExclusion("/Projects/KEEP/notes.md", {"keep"}));
    EXPECT_FALSE(matchesExclusion("/Projects/other/notes.md", {"keep", "  "}));
}

TEST(Exclusion, PartitionIsTotalAndOrderPreserving)
{
    auto results = resultsFor({"/x/1.log", "/x/keep/2.log", "/x/3.log", "/x/keep/4.log", "/x/5.log"});
    auto split = partition(results, {"keep"});

    EXPECT_EQ(split.kept.size() + split.excluded.size(), results.size());
    EXPECT_EQ(pathsOf(split.kept), (std::vector<std::string>{"/x/1.log", "/x/3.log", "/x/5.log"}));
    EXPECT_EQ(pathsOf(split.excluded), (std::vector<std::string>{"/x/keep/2.log", "/x/keep/4.log"}));

    auto untouched = partition(results, {});
    EXPECT_EQ(pathsOf(untouched.kept), pathsOf(results));
    EXPECT_TRUE(untouched.excluded.empty());
}
