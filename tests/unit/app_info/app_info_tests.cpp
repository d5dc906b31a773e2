#include <gtest/gtest.h>

#include "delf/app_info.hpp"

#include <stdexcept>

TEST(AppInfo, DescribesDelf)
{
    const auto &info = delf::appinfo::requireTool("delf");
    EXPECT_EQ(info.id, "delf");
    EXPECT_EQ(info.displayName, "Delete Folder/File");
    EXPECT_EQ(info.version, "2.0.0");
    EXPECT_FALSE(info.shortDescription.empty());
    EXPECT_FALSE(info.longDescription.empty());
}

TEST(AppInfo, FindToolReturnsNullForUnknownId)
{
    EXPECT_NE(delf::appinfo::findTool("delf"), nullptr);
    EXPECT_EQ(delf::appinfo::findTool("ck-du"), nullptr);
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_EQ(delf::appinfo::requireTool("delf").executable, "delf");
    EXPECT_THROW(delf::appinfo::requireTool("does-not-exist"), std::runtime_error);
}
