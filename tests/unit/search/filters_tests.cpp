#include <gtest/gtest.h>

#include "delf/search/filters.hpp"
#include "delf/search/search_model.hpp"

#include <chrono>
#include <limits>

using namespace delf::search;

TEST(SizeFilter, ParsesSuffixes)
{
    EXPECT_EQ(parseSize("100"), 100u);
    EXPECT_EQ(parseSize("512B"), 512u);
    EXPECT_EQ(parseSize("10k"), 10u * 1024u);
    EXPECT_EQ(parseSize(" 100M "), 100ull * 1024 * 1024);
    EXPECT_EQ(parseSize("2G"), 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(parseSize("+1T"), 1ull << 40);
}

TEST(SizeFilter, RejectsMalformedInput)
{
    EXPECT_FALSE(parseSize("").has_value());
    EXPECT_FALSE(parseSize("M").has_value());
    EXPECT_FALSE(parseSize("10X").has_value());
    EXPECT_FALSE(parseSize("10MB").has_value());
    EXPECT_FALSE(parseSize("-5").has_value());
    EXPECT_FALSE(parseSize("99999999999999999999").has_value());
}

TEST(SizeFilter, ThresholdIsStrict)
{
    EXPECT_TRUE(isLargerThan(1025, 1024));
    EXPECT_FALSE(isLargerThan(1024, 1024));
}

TEST(AgeFilter, ParsesDays)
{
    EXPECT_EQ(parseDays("30"), 30);
    EXPECT_EQ(parseDays("0"), 0);
    EXPECT_FALSE(parseDays("-1").has_value());
    EXPECT_FALSE(parseDays("3d").has_value());
    EXPECT_FALSE(parseDays("").has_value());
}

TEST(AgeFilter, CutoffIsNowMinusDays)
{
    auto now = std::filesystem::file_time_type::clock::now();
    auto cutoff = ageCutoff(2, now);
    EXPECT_EQ(now - cutoff, std::chrono::hours(48));
    EXPECT_TRUE(isOlderThan(now - std::chrono::hours(49), cutoff));
    EXPECT_FALSE(isOlderThan(now - std::chrono::hours(47), cutoff));
}

TEST(AgeFilter, HugeDayCountsNeverMatchFreshFiles)
{
    auto now = std::filesystem::file_time_type::clock::now();
    auto days = parseDays("200000");
    ASSERT_TRUE(days.has_value());

    auto cutoff = ageCutoff(*days, now);
    EXPECT_LE(cutoff, now);
    EXPECT_FALSE(isOlderThan(now, cutoff));
    EXPECT_FALSE(isOlderThan(now - std::chrono::hours(24 * 365), cutoff));

    auto widest = ageCutoff(std::numeric_limits<int>::max(), now);
    EXPECT_EQ(widest, std::filesystem::file_time_type::min());
    EXPECT_FALSE(isOlderThan(now, widest));
}

TEST(SizeFilter, FormatsHumanReadable)
{
    EXPECT_EQ(formatSize(0), "0 B");
    EXPECT_EQ(formatSize(512), "512 B");
    EXPECT_EQ(formatSize(1536), "1.50 KB");
    EXPECT_EQ(formatSize(10ull * 1024 * 1024), "10.0 MB");
    EXPECT_EQ(formatSize(200ull * 1024 * 1024 * 1024), "200 GB");
}

TEST(SearchModel, ParsesTypeFilter)
{
    EXPECT_EQ(parseTypeFilter("f"), TypeFilter::Files);
    EXPECT_EQ(parseTypeFilter("D"), TypeFilter::Directories);
    EXPECT_EQ(parseTypeFilter(""), TypeFilter::Any);
    EXPECT_FALSE(parseTypeFilter("x").has_value());
}

TEST(SearchModel, CountsAndDropsCritical)
{
    std::vector<SearchResult> results = {
        {"/etc/a", Category::Critical, false},
        {"/home/b", Category::Warning, false},
        {"/work/c", Category::Safe, true},
        {"/usr/bin/d", Category::Critical, false},
    };
    auto counts = countByCategory(results);
    EXPECT_EQ(counts.critical, 2u);
    EXPECT_EQ(counts.warning, 1u);
    EXPECT_EQ(counts.safe, 1u);
    EXPECT_EQ(counts.total(), 4u);

    auto filtered = withoutCritical(results);
    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0].path, "/home/b");
    EXPECT_EQ(filtered[1].path, "/work/c");
    EXPECT_EQ(countByCategory(filtered).critical, 0u);
}
