#include <gtest/gtest.h>

#include "delf/cli/cli_options.hpp"
#include "delf/cli/delf_options.hpp"

#include <string>
#include <vector>

using namespace delf::cli;

namespace
{

std::optional<CommandLine> parse(std::vector<const char *> args, std::string *error = nullptr)
{
    args.insert(args.begin(), "delf");
    return parseCommandLine(static_cast<int>(args.size()), args.data(), error);
}

delf::config::OptionRegistry makeRegistry()
{
    delf::config::OptionRegistry registry("delf");
    registerDelfOptions(registry);
    return registry;
}

} // namespace

TEST(CommandLine, ReadsPositionalsAndFlags)
{
    auto parsed = parse({"-n", "--force", "-i", "*.log", "/var/tmp"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->dryRun);
    EXPECT_TRUE(parsed->force);
    EXPECT_TRUE(parsed->ignoreCase);
    EXPECT_EQ(parsed->pattern, "*.log");
    EXPECT_EQ(parsed->path, "/var/tmp");
}

TEST(CommandLine, BundlesShortFlags)
{
    auto parsed = parse({"-nfa", "-td", "dist"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->dryRun);
    EXPECT_TRUE(parsed->force);
    EXPECT_TRUE(parsed->disableAutoExclude);
    EXPECT_EQ(parsed->type, "d");
    EXPECT_EQ(parsed->pattern, "dist");
    EXPECT_FALSE(parsed->path.has_value());
}

TEST(CommandLine, LongOptionsTakeSeparateOrInlineValues)
{
    auto parsed = parse({"--older-than", "30", "--larger-than=100M", "--max-display=5", "--type", "f",
                         "--load-options", "a.json", "--load-options=b.json", "--no-default-options",
                         "--show-size", "--empty-dirs"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->olderThan, "30");
    EXPECT_EQ(parsed->largerThan, "100M");
    EXPECT_EQ(parsed->maxDisplay, "5");
    EXPECT_EQ(parsed->type, "f");
    EXPECT_EQ(parsed->optionFiles, (std::vector<std::filesystem::path>{"a.json", "b.json"}));
    EXPECT_FALSE(parsed->loadDefaults);
    EXPECT_TRUE(parsed->showSize);
    EXPECT_TRUE(parsed->emptyDirs);
}

TEST(CommandLine, ReadsOptionFileCommands)
{
    auto parsed = parse({"--save-options=out.json", "--show-options"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->saveOptionsFile, std::filesystem::path("out.json"));
    EXPECT_TRUE(parsed->showOptions);

    std::string error;
    EXPECT_FALSE(parse({"--save-options"}, &error).has_value());
    EXPECT_NE(error.find("requires a value"), std::string::npos);
}

TEST(CommandLine, DoubleDashEndsOptions)
{
    auto parsed = parse({"--", "-weird-name", "."});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->pattern, "-weird-name");
    EXPECT_EQ(parsed->path, ".");
}

TEST(CommandLine, RejectsUnknownOrIncompleteOptions)
{
    std::string error;
    EXPECT_FALSE(parse({"--bogus"}, &error).has_value());
    EXPECT_NE(error.find("--bogus"), std::string::npos);

    EXPECT_FALSE(parse({"-x"}, &error).has_value());
    EXPECT_FALSE(parse({"--older-than"}, &error).has_value());
    EXPECT_NE(error.find("requires a value"), std::string::npos);
    EXPECT_FALSE(parse({"-t"}, &error).has_value());
    EXPECT_FALSE(parse({"a", "b", "c"}, &error).has_value());
}

TEST(CommandLine, HelpAndVersion)
{
    EXPECT_TRUE(parse({"-h"})->showHelp);
    EXPECT_TRUE(parse({"--help"})->showHelp);
    EXPECT_TRUE(parse({"-V"})->showVersion);
    EXPECT_TRUE(parse({"--version"})->showVersion);
}

TEST(RunOptions, ResolvesAgainstRegistry)
{
    auto registry = makeRegistry();
    registry.set(kOptionMaxDisplay, delf::config::OptionValue(std::int64_t{7}));
    registry.set(kOptionPreviewLimit, delf::config::OptionValue(std::int64_t{3}));

    auto parsed = parse({"-t", "f", "--older-than", "30", "--larger-than", "1K", "*.mp4"});
    ASSERT_TRUE(parsed.has_value());
    auto options = resolveRunOptions(*parsed, registry);
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->type, delf::search::TypeFilter::Files);
    EXPECT_EQ(options->olderThanDays, 30);
    EXPECT_EQ(options->largerThanBytes, 1024u);
    EXPECT_EQ(options->maxDisplay, 7u);
    EXPECT_EQ(options->previewLimit, 3u);
    EXPECT_EQ(options->searchRoot, ".");
    EXPECT_TRUE(options->autoExclude);

    auto overridden = resolveRunOptions(*parse({"-a", "--max-display", "2", "x"}), registry);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_FALSE(overridden->autoExclude);
    EXPECT_EQ(overridden->maxDisplay, 2u);
}

TEST(RunOptions, RejectsInvalidValues)
{
    auto registry = makeRegistry();
    std::string error;

    EXPECT_FALSE(resolveRunOptions(*parse({"-t", "x", "p"}), registry, &error).has_value());
    EXPECT_NE(error.find("Type must be"), std::string::npos);
    EXPECT_FALSE(resolveRunOptions(*parse({"--older-than", "soon", "p"}), registry, &error).has_value());
    EXPECT_FALSE(resolveRunOptions(*parse({"--larger-than", "10Q", "p"}), registry, &error).has_value());
    EXPECT_FALSE(resolveRunOptions(*parse({"--max-display", "-1", "p"}), registry, &error).has_value());
}

TEST(RunOptions, ZeroDaysDisablesAgeFilter)
{
    auto registry = makeRegistry();
    auto options = resolveRunOptions(*parse({"--older-than", "0", "p"}), registry);
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->olderThanDays.has_value());
}

TEST(RunOptions, EmptyDirsTakesLoneArgumentAsRoot)
{
    auto registry = makeRegistry();
    auto options = resolveRunOptions(*parse({"--empty-dirs", "/srv/data"}), registry);
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->emptyDirsOnly);
    EXPECT_TRUE(options->pattern.empty());
    EXPECT_EQ(options->searchRoot, "/srv/data");
}
