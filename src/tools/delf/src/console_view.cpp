#include "delf/cli/console_view.hpp"

#include "delf/app_info.hpp"
#include "delf/search/filters.hpp"

#include <system_error>

namespace delf::cli
{
namespace
{

std::string displayPath(const search::SearchResult &result)
{
    std::string text = result.path.string();
    if (result.isDirectory && (text.empty() || text.back() != '/'))
        text.push_back('/');
    return text;
}

const char *categoryMarker(search::Category category)
{
    switch (category)
    {
    case search::Category::Critical:
        return "!!!";
    case search::Category::Warning:
        return "!  ";
    case search::Category::Safe:
        break;
    }
    return "   ";
}

const appinfo::ToolInfo &toolInfo()
{
    return appinfo::requireTool("delf");
}

} // namespace

void printHeader(std::ostream &out)
{
    const auto &info = toolInfo();
    out << info.executable << " - " << info.displayName << " v" << info.version << '\n';
    out << info.shortDescription << '\n';
    out << kRule << "\n\n";
}

void printVersion(std::ostream &out)
{
    const auto &info = toolInfo();
    out << info.executable << ' ' << info.version << '\n';
}

void printHelp(std::ostream &out)
{
    const auto &info = toolInfo();
    out << info.executable << " - " << info.displayName << " v" << info.version << "\n\n"
        << "USAGE:\n"
        << "    delf [OPTIONS] [PATTERN] [PATH]\n\n"
        << "DESCRIPTION:\n"
        << "    " << info.longDescription << "\n\n"
        << "OPTIONS:\n"
        << "    -h, --help               Show this help message\n"
        << "    -V, --version            Show the version and exit\n"
        << "    -n, --dry-run            Preview only, don't delete anything\n"
        << "    -f, --force              Skip all confirmations (dangerous!)\n"
        << "    -i, --ignore-case        Case-insensitive pattern matching\n"
        << "    -t, --type TYPE          Filter by type: f (file) or d (directory)\n"
        << "    -a, --all                Disable auto-exclusion of common directories\n"
        << "        --show-size          Display sizes of matched files\n"
        << "        --older-than DAYS    Only match entries older than DAYS days\n"
        << "        --larger-than SIZE   Only match files larger than SIZE (K, M, G)\n"
        << "        --empty-dirs         Find and delete empty directories only\n"
        << "        --max-display NUM    Maximum results to display (default: 100)\n"
        << "        --load-options FILE  Load options from a JSON file\n"
        << "        --no-default-options Ignore the saved default options\n"
        << "        --save-options FILE  Write the effective options to FILE and exit\n"
        << "        --show-options       List the effective options and exit\n\n"
        << "EXAMPLES:\n"
        << "    # Delete all .log files\n"
        << "    delf \"*.log\"\n\n"
        << "    # Preview what would be deleted (dry-run)\n"
        << "    delf -n \"*.tmp\"\n\n"
        << "    # Delete large video files older than 30 days\n"
        << "    delf --older-than 30 --larger-than 100M \"*.mp4\"\n\n"
        << "    # Delete only directories named 'dist'\n"
        << "    delf -t d dist\n\n"
        << "    # Delete empty directories\n"
        << "    delf --empty-dirs\n\n"
        << "AUTO-EXCLUDED DIRECTORIES:\n"
        << "    By default, these patterns are protected (use -a to disable):\n"
        << "    - node_modules, .git, .npm, .cache, .vscode, .idea\n\n"
        << "SAFETY FEATURES:\n"
        << "    - Critical system path protection (/etc, /usr/bin, /boot, ...)\n"
        << "    - Auto-exclusion of important directories\n"
        << "    - Preview before deletion\n"
        << "    - Dry-run mode for testing\n\n"
        << "PERFORMANCE:\n"
        << "    - Uses 'fd' (or 'fdfind') for fast searching when installed\n"
        << "    - Falls back to a built-in directory walk otherwise\n";
}

void printOptions(std::ostream &out, const config::OptionRegistry &registry)
{
    for (const auto &definition : registry.definitions())
    {
        out << definition.key << " = ";
        switch (definition.kind)
        {
        case config::OptionKind::Boolean:
            out << (registry.getBool(definition.key) ? "true" : "false");
            break;
        case config::OptionKind::Integer:
            out << registry.getInteger(definition.key);
            break;
        case config::OptionKind::String:
            out << '"' << registry.getString(definition.key) << '"';
            break;
        case config::OptionKind::StringList:
        {
            out << '[';
            const char *separator = "";
            for (const auto &item : registry.getStringList(definition.key))
            {
                out << separator << item;
                separator = ", ";
            }
            out << ']';
            break;
        }
        }
        if (registry.isOverridden(definition.key))
            out << "  (set)";
        out << "\n    " << definition.description << '\n';
    }
}

void printSearchInfo(std::ostream &out,
                     const std::filesystem::path &root,
                     const std::string &patternLabel,
                     bool usingFastSearch)
{
    out << "\nSearching...\n";
    out << "Path: " << root.string() << '\n';
    out << "Pattern: " << patternLabel << '\n';
    if (usingFastSearch)
        out << "Method: fd (parallel search)\n";
    else
        out << "Method: walk (install 'fd' for faster search)\n";
    out << "\nMatches:\n";
}

ResultListing::ResultListing(std::ostream &out, std::size_t maxDisplay, bool showSize)
    : out(out), maxDisplay(maxDisplay), showSize(showSize)
{
}

void ResultListing::operator()(const search::SearchResult &result)
{
    ++count;
    if (count > maxDisplay)
    {
        if (count == maxDisplay + 1)
            out << "  ... (more results, display limit reached)\n";
        return;
    }

    out << "  " << categoryMarker(result.category) << ' ' << displayPath(result);
    if (showSize && !result.isDirectory)
    {
        std::error_code ec;
        std::uintmax_t size = std::filesystem::file_size(result.path, ec);
        if (!ec)
            out << " (" << search::formatSize(size) << ')';
    }
    out << '\n';
}

void printMatchSummary(std::ostream &out, const search::CategoryCounts &counts)
{
    out << '\n' << kRule << '\n';
    out << "Found " << counts.total() << " total matches\n";
    if (counts.critical > 0)
        out << "  !!! Critical system files: " << counts.critical << '\n';
    if (counts.warning > 0)
        out << "  !   Warning-level files: " << counts.warning << '\n';
    if (counts.safe > 0)
        out << "  OK  Safe files: " << counts.safe << '\n';
}

void printNoMatches(std::ostream &out, const std::string &pattern, bool autoExclude)
{
    out << "\nNo matches found for pattern: " << pattern << '\n';
    if (autoExclude)
        out << "Note: Auto-exclusions are enabled. Use -a flag to disable.\n";
}

void printNoPermissionNotice(std::ostream &out, std::size_t criticalCount)
{
    out << '\n' << kRule << '\n';
    out << "!!! DANGER: " << criticalCount << " files are CRITICAL SYSTEM FILES!\n";
    out << "X Cannot delete (insufficient permissions)\n";
    out << "Run as root if you really need to delete system files\n";
    out << kRule << '\n';
}

void printTotalSize(std::ostream &out, std::uintmax_t bytes)
{
    out << "Total size: " << search::formatSize(bytes) << '\n';
}

void printExcluded(std::ostream &out, const std::vector<search::SearchResult> &excluded)
{
    if (excluded.empty())
        return;
    out << "\nExcluded (" << excluded.size() << " items):\n";
    for (const auto &result : excluded)
        out << "  OK " << result.path.string() << '\n';
}

void printPreview(std::ostream &out, const std::vector<search::SearchResult> &results, std::size_t limit)
{
    out << '\n' << kRule << '\n';
    out << "Will delete " << results.size() << " items:\n\n";
    std::size_t shown = 0;
    for (const auto &result : results)
    {
        if (shown >= limit)
        {
            out << "  ... and " << (results.size() - limit) << " more\n";
            break;
        }
        out << (result.isDirectory ? "  [D] " : "  [F] ") << displayPath(result) << '\n';
        ++shown;
    }
}

void printDryRunNotice(std::ostream &out)
{
    out << "\nDRY-RUN MODE: No files were deleted\n";
    out << "Remove -n flag to actually delete these files\n";
}

void printCriticalWarning(std::ostream &out, std::size_t criticalCount)
{
    out << "\n!!! CRITICAL DANGER WARNING !!!\n";
    out << kRule << '\n';
    out << "You are about to delete " << criticalCount << " SYSTEM FILES!\n\n";
    out << "CONSEQUENCES:\n";
    out << "  - May break the boot process\n";
    out << "  - May break critical services\n";
    out << "  - May make the system unrecoverable\n";
    out << "  - May require reinstalling the operating system\n\n";
}

void printDeletionSummary(std::ostream &out, std::size_t deleted, std::size_t failed)
{
    out << '\n' << kRule << '\n';
    out << "OK Deleted: " << deleted << " items\n";
    if (failed > 0)
        out << "X Failed: " << failed << " items (try running as root)\n";
    out << kRule << '\n';
}

} // namespace delf::cli
