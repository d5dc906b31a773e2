#include "delf/cli/cli_options.hpp"

#include "delf/cli/delf_options.hpp"
#include "delf/search/filters.hpp"

#include <cctype>
#include <limits>
#include <string_view>
#include <utility>

namespace delf::cli
{
namespace
{

bool fail(std::string *error, std::string message)
{
    if (error)
        *error = std::move(message);
    return false;
}

std::optional<std::size_t> parseCount(const std::string &value)
{
    if (value.empty())
        return std::nullopt;
    std::size_t parsed = 0;
    for (char ch : value)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            return std::nullopt;
        std::size_t digit = static_cast<std::size_t>(ch - '0');
        if (parsed > (std::numeric_limits<std::size_t>::max() - digit) / 10)
            return std::nullopt;
        parsed = parsed * 10 + digit;
    }
    return parsed;
}

std::size_t clampCount(std::int64_t value, std::size_t fallback)
{
    if (value < 0)
        return fallback;
    return static_cast<std::size_t>(value);
}

} // namespace

std::optional<CommandLine> parseCommandLine(int argc, const char *const *argv, std::string *error)
{
    if (error)
        error->clear();

    CommandLine result;
    std::vector<std::string> positionals;
    bool optionsEnded = false;

    // "--name VALUE" or "--name=VALUE"
    auto takeLongValue = [&](const std::string &arg, std::string_view name, int &i, std::string &value) {
        std::string prefix = std::string(name) + "=";
        if (arg == name)
        {
            if (i + 1 >= argc)
                return fail(error, std::string(name) + " requires a value");
            value = argv[++i];
            return true;
        }
        if (arg.rfind(prefix, 0) == 0)
        {
            value = arg.substr(prefix.size());
            return true;
        }
        return false;
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string value;

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-")
        {
            positionals.push_back(arg);
            continue;
        }

        if (arg == "--")
        {
            optionsEnded = true;
        }
        else if (arg == "--help")
        {
            result.showHelp = true;
        }
        else if (arg == "--version")
        {
            result.showVersion = true;
        }
        else if (arg == "--dry-run")
        {
            result.dryRun = true;
        }
        else if (arg == "--force")
        {
            result.force = true;
        }
        else if (arg == "--ignore-case")
        {
            result.ignoreCase = true;
        }
        else if (arg == "--all")
        {
            result.disableAutoExclude = true;
        }
        else if (arg == "--show-size")
        {
            result.showSize = true;
        }
        else if (arg == "--empty-dirs")
        {
            result.emptyDirs = true;
        }
        else if (arg == "--no-default-options")
        {
            result.loadDefaults = false;
        }
        else if (arg == "--show-options")
        {
            result.showOptions = true;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            if (takeLongValue(arg, "--type", i, value))
                result.type = value;
            else if (takeLongValue(arg, "--older-than", i, value))
                result.olderThan = value;
            else if (takeLongValue(arg, "--larger-than", i, value))
                result.largerThan = value;
            else if (takeLongValue(arg, "--max-display", i, value))
                result.maxDisplay = value;
            else if (takeLongValue(arg, "--load-options", i, value))
                result.optionFiles.emplace_back(value);
            else if (takeLongValue(arg, "--save-options", i, value))
                result.saveOptionsFile = value;
            else
            {
                if (error && error->empty())
                    *error = "unknown option " + arg;
                return std::nullopt;
            }
        }
        else
        {
            for (std::size_t j = 1; j < arg.size(); ++j)
            {
                char opt = arg[j];
                switch (opt)
                {
                case 'h':
                    result.showHelp = true;
                    break;
                case 'V':
                    result.showVersion = true;
                    break;
                case 'n':
                    result.dryRun = true;
                    break;
                case 'f':
                    result.force = true;
                    break;
                case 'i':
                    result.ignoreCase = true;
                    break;
                case 'a':
                    result.disableAutoExclude = true;
                    break;
                case 't':
                {
                    if (j + 1 < arg.size())
                    {
                        value = arg.substr(j + 1);
                        j = arg.size();
                    }
                    else
                    {
                        if (i + 1 >= argc)
                        {
                            fail(error, "-t requires a value");
                            return std::nullopt;
                        }
                        value = argv[++i];
                    }
                    result.type = value;
                    break;
                }
                default:
                    fail(error, std::string("unknown option -") + opt);
                    return std::nullopt;
                }
            }
        }

        if (error && !error->empty())
            return std::nullopt;
    }

    if (positionals.size() > 2)
    {
        fail(error, "unexpected argument " + positionals[2]);
        return std::nullopt;
    }
    if (!positionals.empty())
        result.pattern = positionals[0];
    if (positionals.size() > 1)
        result.path = positionals[1];
    return result;
}

std::optional<search::RunOptions> resolveRunOptions(const CommandLine &commandLine,
                                                    const config::OptionRegistry &registry,
                                                    std::string *error)
{
    search::RunOptions options;
    options.pattern = commandLine.pattern.value_or(std::string());
    options.searchRoot = commandLine.path.value_or(std::string("."));
    // Empty-directory mode takes no pattern, so a lone argument is the root.
    if (commandLine.emptyDirs && commandLine.pattern && !commandLine.path)
    {
        options.searchRoot = *commandLine.pattern;
        options.pattern.clear();
    }
    options.dryRun = commandLine.dryRun;
    options.force = commandLine.force;
    options.ignoreCase = commandLine.ignoreCase;
    options.showSize = commandLine.showSize;
    options.emptyDirsOnly = commandLine.emptyDirs;
    options.autoExclude = registry.getBool(kOptionAutoExclude) && !commandLine.disableAutoExclude;
    options.maxDisplay = clampCount(registry.getInteger(kOptionMaxDisplay), 100);
    options.previewLimit = clampCount(registry.getInteger(kOptionPreviewLimit), 10);

    if (commandLine.type)
    {
        auto type = search::parseTypeFilter(*commandLine.type);
        if (!type || *type == search::TypeFilter::Any)
        {
            fail(error, "Type must be 'f' (file) or 'd' (directory)");
            return std::nullopt;
        }
        options.type = *type;
    }

    if (commandLine.olderThan)
    {
        auto days = search::parseDays(*commandLine.olderThan);
        if (!days)
        {
            fail(error, "invalid number of days: " + *commandLine.olderThan);
            return std::nullopt;
        }
        if (*days > 0)
            options.olderThanDays = *days;
    }

    if (commandLine.largerThan)
    {
        auto bytes = search::parseSize(*commandLine.largerThan);
        if (!bytes)
        {
            fail(error, "invalid size: " + *commandLine.largerThan);
            return std::nullopt;
        }
        options.largerThanBytes = *bytes;
    }

    if (commandLine.maxDisplay)
    {
        auto count = parseCount(*commandLine.maxDisplay);
        if (!count)
        {
            fail(error, "invalid display limit: " + *commandLine.maxDisplay);
            return std::nullopt;
        }
        options.maxDisplay = *count;
    }

    return options;
}

} // namespace delf::cli
