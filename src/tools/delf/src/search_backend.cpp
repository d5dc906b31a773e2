#include "delf/search/search_backend.hpp"

#include "delf/logging.hpp"
#include "delf/search/filters.hpp"
#include "delf/text_utils.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/fmt/ranges.h>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace delf::search
{
namespace fs = std::filesystem;

namespace
{

int waitForChild(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
            return -1;
    }
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return status;
}

bool lstatIsDirectory(const std::string &path)
{
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0)
        return false;
    return S_ISDIR(sb.st_mode);
}

// fd 9 prints directories with a trailing separator.
std::string stripTrailingSeparator(std::string line)
{
    while (line.size() > 1 && line.back() == '/')
        line.pop_back();
    return line;
}

bool matchesName(const RunOptions &options, const fs::path &path)
{
    if (options.pattern.empty())
        return true;
    std::string name = path.filename().string();
    if (options.ignoreCase)
        return text::globMatch(text::toLower(options.pattern), text::toLower(std::move(name)));
    return text::globMatch(options.pattern, name);
}

bool isExecutableFile(const fs::path &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
    return access(path.c_str(), X_OK) == 0;
}

// Returns false to keep the walk out of a directory entry.
using EntryVisitor = std::function<bool(const fs::directory_entry &, bool isDirectory)>;

// Entries come before their contents. False when directory cannot be opened;
// a subdirectory that fails to open only loses its own subtree.
bool walkDirectory(const fs::path &directory, const EntryVisitor &visit)
{
    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        logging::runLog()->debug("skipping {}: {}", directory.string(), ec.message());
        return false;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            logging::runLog()->debug("stopped reading {}: {}", directory.string(), ec.message());
            break;
        }

        const fs::directory_entry &entry = *it;
        std::error_code typeEc;
        bool isDirectory = entry.is_directory(typeEc) && !entry.is_symlink(typeEc);
        if (visit(entry, isDirectory) && isDirectory)
            walkDirectory(entry.path(), visit);
    }
    return true;
}

} // namespace

FdSearcher::FdSearcher(std::string executable)
    : program(std::move(executable))
{
}

SearchStatus FdSearcher::search(const RunOptions &options,
                                const safety::PathClassifier &classifier,
                                const ResultSink &sink)
{
    SearchStatus status;
    std::vector<std::string> excludes;
    if (options.autoExclude)
        excludes = classifier.autoExcludePatterns();
    status.command = buildFdCommand(program, options, excludes);

    int stdoutPipe[2]{-1, -1};
    if (pipe(stdoutPipe) == -1)
    {
        status.available = false;
        status.exitCode = -1;
        return status;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<char *> argv;
    argv.reserve(status.command.size() + 1);
    for (const auto &token : status.command)
        argv.push_back(const_cast<char *>(token.c_str()));
    argv.push_back(nullptr);

    pid_t childPid = -1;
    int spawnStatus = posix_spawnp(&childPid, status.command.front().c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(stdoutPipe[1]);

    if (spawnStatus != 0)
    {
        close(stdoutPipe[0]);
        status.available = false;
        status.exitCode = spawnStatus;
        return status;
    }

    auto emitLine = [&](std::string line) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            return;
        line = stripTrailingSeparator(std::move(line));
        SearchResult result;
        result.isDirectory = lstatIsDirectory(line);
        result.category = classifier.classify(line);
        result.path = std::move(line);
        ++status.emitted;
        if (sink)
            sink(result);
    };

    constexpr std::size_t kBufferSize = 8192;
    std::array<char, kBufferSize> buffer{};
    std::string pending;
    while (true)
    {
        ssize_t bytesRead = read(stdoutPipe[0], buffer.data(), buffer.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
            break;
        pending.append(buffer.data(), static_cast<std::size_t>(bytesRead));
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos)
        {
            emitLine(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
    close(stdoutPipe[0]);
    if (!pending.empty())
        emitLine(std::move(pending));

    status.exitCode = waitForChild(childPid);
    if (status.exitCode != 0 && status.emitted == 0)
        status.available = false;
    return status;
}

SearchStatus WalkSearcher::search(const RunOptions &options,
                                  const safety::PathClassifier &classifier,
                                  const ResultSink &sink)
{
    if (options.emptyDirsOnly)
        return searchEmptyDirectories(options, classifier, sink);

    SearchStatus status;
    std::optional<fs::file_time_type> cutoff;
    if (options.olderThanDays)
        cutoff = ageCutoff(*options.olderThanDays);

    auto visit = [&](const fs::directory_entry &entry, bool isDirectory) {
        if (options.autoExclude && classifier.isAutoExcluded(entry.path()))
            return false;

        if (options.type == TypeFilter::Files && isDirectory)
            return true;
        if (options.type == TypeFilter::Directories && !isDirectory)
            return true;
        if (!matchesName(options, entry.path()))
            return true;

        if (cutoff)
        {
            std::error_code timeEc;
            fs::file_time_type modified = entry.last_write_time(timeEc);
            if (timeEc || !isOlderThan(modified, *cutoff))
                return true;
        }

        if (options.largerThanBytes && !isDirectory)
        {
            std::error_code sizeEc;
            std::uintmax_t size = entry.file_size(sizeEc);
            if (sizeEc || !isLargerThan(size, *options.largerThanBytes))
                return true;
        }

        SearchResult result{entry.path(), classifier.classify(entry.path()), isDirectory};
        ++status.emitted;
        if (sink)
            sink(result);
        return true;
    };

    if (!walkDirectory(options.searchRoot, visit))
        status.exitCode = 1;
    return status;
}

SearchStatus WalkSearcher::searchEmptyDirectories(const RunOptions &options,
                                                  const safety::PathClassifier &classifier,
                                                  const ResultSink &sink)
{
    SearchStatus status;
    auto visit = [&](const fs::directory_entry &entry, bool isDirectory) {
        if (!isDirectory)
            return false;
        if (options.autoExclude && classifier.isAutoExcluded(entry.path()))
            return false;

        std::error_code emptyEc;
        bool empty = fs::is_empty(entry.path(), emptyEc);
        if (emptyEc || !empty)
            return true;

        SearchResult result{entry.path(), classifier.classify(entry.path()), true};
        ++status.emitted;
        if (sink)
            sink(result);
        return true;
    };

    if (!walkDirectory(options.searchRoot, visit))
        status.exitCode = 1;
    return status;
}

std::vector<std::string> buildFdCommand(const std::string &executable,
                                        const RunOptions &options,
                                        const std::vector<std::string> &autoExcludePatterns)
{
    std::vector<std::string> command = {executable, "--color", "never", "--hidden", "--no-ignore"};

    if (options.type == TypeFilter::Files)
    {
        command.emplace_back("-t");
        command.emplace_back("f");
    }
    else if (options.type == TypeFilter::Directories)
    {
        command.emplace_back("-t");
        command.emplace_back("d");
    }

    command.emplace_back(options.ignoreCase ? "-i" : "-s");

    if (options.olderThanDays && *options.olderThanDays > 0)
    {
        command.emplace_back("--changed-before");
        command.emplace_back(std::to_string(*options.olderThanDays) + "d");
    }

    // fd's "+N" keeps sizes >= N; the threshold itself must not match.
    if (options.largerThanBytes)
    {
        std::uint64_t minimum = *options.largerThanBytes;
        if (minimum < std::numeric_limits<std::uint64_t>::max())
            ++minimum;
        command.emplace_back("-S");
        command.emplace_back("+" + std::to_string(minimum) + "b");
    }

    for (const auto &pattern : autoExcludePatterns)
    {
        if (pattern.empty())
            continue;
        command.emplace_back("-E");
        command.emplace_back("*" + pattern + "*");
    }

    command.emplace_back("-g");
    command.emplace_back(options.pattern.empty() ? std::string("*") : options.pattern);
    command.emplace_back(options.searchRoot.string());
    return command;
}

std::optional<fs::path> locateProgramOnPath(std::string_view name)
{
    if (name.empty())
        return std::nullopt;

    fs::path candidate(name);
    if (candidate.has_parent_path())
    {
        if (isExecutableFile(candidate))
            return candidate;
        return std::nullopt;
    }

    const char *pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;

    for (const auto &directory : text::splitList(pathEnv, ':'))
    {
        fs::path programPath = (fs::path(directory) / candidate).lexically_normal();
        if (isExecutableFile(programPath))
            return programPath;
    }
    return std::nullopt;
}

std::optional<std::string> findFastSearchExecutable(const std::string &configured)
{
    std::string trimmed = text::trimCopy(configured);
    if (!trimmed.empty())
    {
        if (auto located = locateProgramOnPath(trimmed))
            return located->string();
        return std::nullopt;
    }

    for (const char *probe : {"fd", "fdfind"})
    {
        if (auto located = locateProgramOnPath(probe))
            return located->string();
    }
    return std::nullopt;
}

std::unique_ptr<Searcher> selectSearcher(const RunOptions &options,
                                         bool useFastSearch,
                                         const std::string &configuredExecutable)
{
    if (!options.emptyDirsOnly && useFastSearch)
    {
        if (auto executable = findFastSearchExecutable(configuredExecutable))
            return std::make_unique<FdSearcher>(*executable);
    }
    return std::make_unique<WalkSearcher>();
}

SearchRun runSearch(Searcher &searcher,
                    const RunOptions &options,
                    const safety::PathClassifier &classifier,
                    const ResultSink &subscriber)
{
    SearchRun run;
    run.method = std::string(searcher.name());

    auto collect = [&](const SearchResult &result) {
        run.results.push_back(result);
        if (subscriber)
            subscriber(result);
    };

    auto log = logging::runLog();
    SearchStatus status = searcher.search(options, classifier, collect);
    if (!status.command.empty())
        log->debug("ran: {} (exit {})", fmt::join(status.command, " "), status.exitCode);
    if (!status.available)
    {
        log->debug("{} unavailable (status {}), falling back to walk", run.method, status.exitCode);
        WalkSearcher walker;
        run.results.clear();
        run.fellBack = true;
        run.method = std::string(walker.name());
        status = walker.search(options, classifier, collect);
    }

    log->info("search via {} in {} found {} entries", run.method, options.searchRoot.string(), run.results.size());
    return run;
}

std::uintmax_t totalSize(const std::vector<SearchResult> &results)
{
    std::uintmax_t total = 0;
    for (const auto &result : results)
    {
        std::error_code ec;
        fs::file_status linkStatus = fs::symlink_status(result.path, ec);
        if (ec)
            continue;

        if (fs::is_directory(linkStatus))
        {
            walkDirectory(result.path, [&total](const fs::directory_entry &entry, bool isDirectory) {
                if (isDirectory)
                    return true;
                std::error_code entryEc;
                if (entry.is_symlink(entryEc) || !entry.is_regular_file(entryEc))
                    return false;
                std::uintmax_t size = entry.file_size(entryEc);
                if (!entryEc)
                    total += size;
                return false;
            });
        }
        else if (fs::is_regular_file(linkStatus))
        {
            std::uintmax_t size = fs::file_size(result.path, ec);
            if (!ec)
                total += size;
        }
    }
    return total;
}

} // namespace delf::search
