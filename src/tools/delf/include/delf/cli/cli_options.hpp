#pragma once

#include "delf/options.hpp"
#include "delf/search/search_model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace delf::cli
{

// Raw flags as typed. Values are validated later by resolveRunOptions().
struct CommandLine
{
    bool showHelp = false;
    bool showVersion = false;
    bool loadDefaults = true;
    std::vector<std::filesystem::path> optionFiles;
    std::optional<std::filesystem::path> saveOptionsFile;
    bool showOptions = false;

    bool dryRun = false;
    bool force = false;
    bool ignoreCase = false;
    bool disableAutoExclude = false;
    bool showSize = false;
    bool emptyDirs = false;
    std::optional<std::string> type;
    std::optional<std::string> olderThan;
    std::optional<std::string> largerThan;
    std::optional<std::string> maxDisplay;

    std::optional<std::string> pattern;
    std::optional<std::string> path;
};

std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv, std::string *error = nullptr);

// Layers the command line over the registry values.
std::optional<search::RunOptions> resolveRunOptions(const CommandLine &commandLine,
                                                    const config::OptionRegistry &registry,
                                                    std::string *error = nullptr);

} // namespace delf::cli
