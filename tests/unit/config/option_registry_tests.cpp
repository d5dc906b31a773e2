#include <gtest/gtest.h>

#include "delf/cli/delf_options.hpp"
#include "delf/options.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using delf::config::OptionKind;
using delf::config::OptionRegistry;
using delf::config::OptionValue;

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("delf_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "delf_options_test.json";
}

void writeFile(const std::filesystem::path &path, const std::string &contents)
{
    std::ofstream out(path);
    out << contents;
}

OptionRegistry makeDelfRegistry()
{
    OptionRegistry registry("delf");
    delf::cli::registerDelfOptions(registry);
    return registry;
}

} // namespace

TEST(OptionRegistry, SetLayersOverDefaults)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"featureEnabled", OptionKind::Boolean, OptionValue(true), "Enables a feature."});
    registry.registerOption({"limit", OptionKind::Integer, OptionValue(std::int64_t{3}), "Limit."});

    ASSERT_EQ(registry.definitions().size(), 2u);
    EXPECT_EQ(registry.definitions()[1].key, "limit");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
    EXPECT_FALSE(registry.isOverridden("featureEnabled"));

    EXPECT_TRUE(registry.set("featureEnabled", OptionValue(false)));
    EXPECT_FALSE(registry.getBool("featureEnabled"));
    EXPECT_TRUE(registry.isOverridden("featureEnabled"));
    EXPECT_FALSE(registry.isOverridden("limit"));
}

TEST(OptionRegistry, RefusesValuesOfTheWrongKind)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"threshold", OptionKind::Integer, OptionValue(std::int64_t{10}), "Threshold"});

    EXPECT_FALSE(registry.set("threshold", OptionValue(std::string("42"))));
    EXPECT_FALSE(registry.set("missing", OptionValue(std::int64_t{1})));
    EXPECT_EQ(registry.getInteger("threshold"), 10);

    EXPECT_THROW(registry.getBool("threshold"), std::out_of_range);
    EXPECT_THROW(registry.getString("missing"), std::out_of_range);
    EXPECT_THROW(registry.registerOption({"bad", OptionKind::Boolean, OptionValue(std::int64_t{0}), ""}),
                 std::invalid_argument);
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths"});
    registry.registerOption({"label", OptionKind::String, OptionValue(std::string("x")), "Label"});

    std::vector<std::string> expected{"/tmp/a", "/tmp/b"};
    ASSERT_TRUE(registry.set("paths", OptionValue(expected)));

    const auto filePath = makeTempFilePath();
    std::string error;
    ASSERT_TRUE(registry.saveToFile(filePath, &error)) << error;

    OptionRegistry loaded("test-app");
    loaded.registerOption({"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths"});
    loaded.registerOption({"label", OptionKind::String, OptionValue(std::string("y")), "Label"});
    ASSERT_TRUE(loaded.loadFromFile(filePath, &error)) << error;

    EXPECT_EQ(loaded.getStringList("paths"), expected);
    EXPECT_EQ(loaded.getString("label"), "x");

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, RejectsMalformedJson)
{
    const auto filePath = makeTempFilePath();
    writeFile(filePath, "{ \"maxDisplay\": ");

    auto registry = makeDelfRegistry();
    std::string error;
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));
    EXPECT_NE(error.find("not valid JSON"), std::string::npos);
    EXPECT_EQ(registry.getInteger(delf::cli::kOptionMaxDisplay), 100);

    writeFile(filePath, "[1, 2]");
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST(OptionRegistry, WrongTypeRejectsWholeFile)
{
    const auto filePath = makeTempFilePath();
    writeFile(filePath, R"({"maxDisplay": 5, "autoExclude": "off"})");

    auto registry = makeDelfRegistry();
    std::string error;
    EXPECT_FALSE(registry.loadFromFile(filePath, &error));
    EXPECT_NE(error.find("autoExclude"), std::string::npos);
    EXPECT_EQ(registry.getInteger(delf::cli::kOptionMaxDisplay), 100);
    EXPECT_TRUE(registry.getBool(delf::cli::kOptionAutoExclude));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DelfDefaults)
{
    auto registry = makeDelfRegistry();

    EXPECT_EQ(registry.getInteger(delf::cli::kOptionMaxDisplay), 100);
    EXPECT_EQ(registry.getInteger(delf::cli::kOptionPreviewLimit), 10);
    EXPECT_TRUE(registry.getBool(delf::cli::kOptionAutoExclude));
    EXPECT_TRUE(registry.getBool(delf::cli::kOptionUseFastSearch));
    EXPECT_TRUE(registry.getString(delf::cli::kOptionFastSearchExecutable).empty());
    EXPECT_EQ(registry.getString(delf::cli::kOptionLogLevel), "info");
    EXPECT_EQ(registry.getStringList(delf::cli::kOptionAutoExcludePatterns),
              (std::vector<std::string>{"node_modules", ".git", ".npm", ".cache", ".vscode", ".idea"}));
    EXPECT_TRUE(registry.getStringList(delf::cli::kOptionExtraCriticalPaths).empty());
    EXPECT_EQ(registry.defaultOptionsPath().filename(), "delf.json");
    EXPECT_EQ(registry.definitions().front().key, delf::cli::kOptionMaxDisplay);
}

TEST(OptionRegistry, LoadedFileOverridesDefaults)
{
    const auto filePath = makeTempFilePath();
    writeFile(filePath, R"({"maxDisplay": 5, "autoExclude": false, "extraWarningPaths": "/data", "unknownKey": 1})");

    auto registry = makeDelfRegistry();
    ASSERT_TRUE(registry.loadFromFile(filePath));

    EXPECT_EQ(registry.getInteger(delf::cli::kOptionMaxDisplay), 5);
    EXPECT_FALSE(registry.getBool(delf::cli::kOptionAutoExclude));
    EXPECT_EQ(registry.getStringList(delf::cli::kOptionExtraWarningPaths), std::vector<std::string>{"/data"});
    EXPECT_THROW(registry.getInteger("unknownKey"), std::out_of_range);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}
