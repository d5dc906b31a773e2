#pragma once

#include "delf/search/search_model.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace delf::search
{

using ResultSink = std::function<void(const SearchResult &)>;

struct SearchStatus
{
    // False when the backend could not run at all; nothing was emitted.
    bool available = true;
    int exitCode = 0;
    std::size_t emitted = 0;
    // Argument vector of the spawned program; empty for in-process searches.
    std::vector<std::string> command;
};

class Searcher
{
public:
    virtual ~Searcher() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual SearchStatus search(const RunOptions &options,
                                const safety::PathClassifier &classifier,
                                const ResultSink &sink) = 0;
};

// Delegates enumeration to an external `fd` binary and parses its stdout.
class FdSearcher : public Searcher
{
public:
    explicit FdSearcher(std::string executable);

    std::string_view name() const noexcept override { return "fd"; }
    SearchStatus search(const RunOptions &options,
                        const safety::PathClassifier &classifier,
                        const ResultSink &sink) override;

private:
    std::string program;
};

// In-process recursive walk. Symlinks are not followed. A directory that
// cannot be opened is skipped and the walk goes on with its siblings.
class WalkSearcher : public Searcher
{
public:
    std::string_view name() const noexcept override { return "walk"; }
    SearchStatus search(const RunOptions &options,
                        const safety::PathClassifier &classifier,
                        const ResultSink &sink) override;

private:
    SearchStatus searchEmptyDirectories(const RunOptions &options,
                                        const safety::PathClassifier &classifier,
                                        const ResultSink &sink);
};

std::vector<std::string> buildFdCommand(const std::string &executable,
                                        const RunOptions &options,
                                        const std::vector<std::string> &autoExcludePatterns);

std::optional<std::filesystem::path> locateProgramOnPath(std::string_view name);

// A configured name or path wins; otherwise probes "fd", then "fdfind".
std::optional<std::string> findFastSearchExecutable(const std::string &configured);

// Empty-directory runs always walk. Without a usable fd binary, walks too.
std::unique_ptr<Searcher> selectSearcher(const RunOptions &options,
                                         bool useFastSearch,
                                         const std::string &configuredExecutable);

struct SearchRun
{
    std::vector<SearchResult> results;
    std::string method;
    bool fellBack = false;
};

// Runs the chosen searcher, falling back to a walk when it turns out to be
// unavailable. Every result reaches both the returned list and the subscriber.
SearchRun runSearch(Searcher &searcher,
                    const RunOptions &options,
                    const safety::PathClassifier &classifier,
                    const ResultSink &subscriber = {});

// Files count their own size, directories the sum of the files below them.
std::uintmax_t totalSize(const std::vector<SearchResult> &results);

} // namespace delf::search
