#include "delf/cli/app.hpp"

#include "delf/cli/cli_options.hpp"
#include "delf/cli/console_view.hpp"
#include "delf/cli/delf_options.hpp"
#include "delf/cli/interactive.hpp"
#include "delf/logging.hpp"
#include "delf/remove/deleter.hpp"
#include "delf/remove/deletion_gate.hpp"
#include "delf/safety/path_classifier.hpp"
#include "delf/search/search_backend.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace delf::cli
{
namespace
{

constexpr int kValidationError = static_cast<int>(remove::ExitCode::NoMatches);

safety::PathClassifier makeClassifier(const config::OptionRegistry &registry)
{
    safety::SafetyPathList lists = safety::environmentSafetyPaths();
    for (const auto &extra : registry.getStringList(kOptionExtraCriticalPaths))
        lists.critical.push_back(extra);
    for (const auto &extra : registry.getStringList(kOptionExtraWarningPaths))
        lists.warning.push_back(extra);
    return safety::PathClassifier(std::move(lists), registry.getStringList(kOptionAutoExcludePatterns));
}

std::filesystem::path resolveRoot(const std::filesystem::path &root)
{
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(root, ec);
    if (ec)
        return root;
    absolute = absolute.lexically_normal();
    std::string text = absolute.string();
    while (text.size() > 1 && text.back() == '/')
        text.pop_back();
    return text;
}

} // namespace

bool processIsElevated()
{
    return geteuid() == 0;
}

int run(int argc, const char *const *argv, const AppEnvironment &environment)
{
    std::ostream &out = environment.out;
    std::ostream &err = environment.err;

    config::OptionRegistry registry("delf");
    registerDelfOptions(registry);

    std::string error;
    auto commandLine = parseCommandLine(argc, argv, &error);
    if (!commandLine)
    {
        err << "delf: " << error << "\nTry 'delf --help' for more information." << std::endl;
        return kValidationError;
    }

    if (commandLine->showHelp)
    {
        printHelp(out);
        return 0;
    }
    if (commandLine->showVersion)
    {
        printVersion(out);
        return 0;
    }

    if (commandLine->loadDefaults && !registry.loadDefaults(&error))
        err << "delf: ignoring saved options: " << error << std::endl;
    for (const auto &file : commandLine->optionFiles)
    {
        if (!registry.loadFromFile(file, &error))
        {
            err << "delf: failed to load options: " << error << std::endl;
            return kValidationError;
        }
    }

    if (commandLine->saveOptionsFile)
    {
        if (!registry.saveToFile(*commandLine->saveOptionsFile, &error))
        {
            err << "delf: failed to save options: " << error << std::endl;
            return kValidationError;
        }
        out << "Options saved to " << commandLine->saveOptionsFile->string() << '\n';
        return 0;
    }
    if (commandLine->showOptions)
    {
        printOptions(out, registry);
        return 0;
    }

    auto resolved = resolveRunOptions(*commandLine, registry, &error);
    if (!resolved)
    {
        err << "ERROR: " << error << std::endl;
        return kValidationError;
    }
    search::RunOptions options = *resolved;

    if (registry.getBool(kOptionLogEnabled))
        logging::initRunLog(logging::defaultLogPath(), registry.getString(kOptionLogLevel));
    else
        logging::disableRunLog();
    auto log = logging::runLog();

    remove::StreamPrompter prompter(environment.in, out);

    if (options.pattern.empty() && !options.emptyDirsOnly)
    {
        printHeader(out);
        auto root = promptSearchRoot(prompter, out, err);
        if (!root)
            return kValidationError;
        auto pattern = promptPattern(prompter, out, err);
        if (!pattern)
            return kValidationError;
        options.searchRoot = *root;
        options.pattern = *pattern;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(options.searchRoot, ec))
    {
        err << "ERROR: Directory '" << options.searchRoot.string() << "' does not exist" << std::endl;
        return kValidationError;
    }

    options.searchRoot = resolveRoot(options.searchRoot);
    if (options.searchRoot == "/" && !environment.elevated)
    {
        err << "ERROR: Searching from the filesystem root requires root privileges." << std::endl;
        err << "Please run with sudo: sudo delf ..." << std::endl;
        log->warn("refused to search / without elevation");
        return static_cast<int>(remove::ExitCode::PermissionRequired);
    }

    log->info("run: pattern='{}' root={} type={} dry-run={} force={} auto-exclude={} older-than={} larger-than={} empty-dirs={}",
              options.pattern, options.searchRoot.string(), search::typeFilterName(options.type), options.dryRun,
              options.force, options.autoExclude, options.olderThanDays.value_or(0),
              options.largerThanBytes.value_or(0), options.emptyDirsOnly);

    safety::PathClassifier classifier = makeClassifier(registry);
    auto searcher = search::selectSearcher(options,
                                           registry.getBool(kOptionUseFastSearch),
                                           registry.getString(kOptionFastSearchExecutable));

    printSearchInfo(out,
                    options.searchRoot,
                    options.emptyDirsOnly ? std::string("(empty directories)") : options.pattern,
                    searcher->name() == "fd");

    ResultListing listing(out, options.maxDisplay, options.showSize);
    search::SearchRun found = search::runSearch(*searcher, options, classifier,
                                                [&listing](const search::SearchResult &result) { listing(result); });

    remove::FilesystemDeleter deleter;
    remove::DeletionGate gate(options, environment.elevated, prompter, deleter, out);
    remove::GateReport report = gate.run(std::move(found.results));

    log->info("outcome: {} (exit {})", remove::outcomeName(report.outcome), static_cast<int>(report.exitCode()));
    log->flush();
    return static_cast<int>(report.exitCode());
}

} // namespace delf::cli
