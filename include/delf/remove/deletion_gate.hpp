#pragma once

#include "delf/remove/deleter.hpp"
#include "delf/search/search_model.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace delf::remove
{

constexpr std::string_view kCriticalConfirmationPhrase = "YES DELETE SYSTEM FILES";

enum class ExitCode : int
{
    Success = 0,
    NoMatches = 1,
    Cancelled = 2,
    PermissionRequired = 3
};

enum class GateOutcome
{
    NoCandidates,
    NothingDeletableWithoutElevation,
    AllExcluded,
    DryRun,
    Cancelled,
    Completed
};

const char *outcomeName(GateOutcome outcome) noexcept;
ExitCode exitCodeFor(GateOutcome outcome) noexcept;

class Prompter
{
public:
    virtual ~Prompter() = default;

    // Returns the answer with surrounding whitespace removed; empty on EOF.
    virtual std::string ask(std::string_view prompt) = 0;
};

class StreamPrompter : public Prompter
{
public:
    StreamPrompter(std::istream &in, std::ostream &out);

    std::string ask(std::string_view prompt) override;

private:
    std::istream &in;
    std::ostream &out;
};

struct GateReport
{
    GateOutcome outcome = GateOutcome::NoCandidates;
    search::CategoryCounts found;
    std::size_t blockedCritical = 0;
    std::vector<search::SearchResult> excluded;
    std::vector<search::SearchResult> candidates;
    std::size_t attempted = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;

    ExitCode exitCode() const noexcept { return exitCodeFor(outcome); }
};

/**
 * Walks a candidate set from summary to deletion. Critical entries are
 * dropped when the process is not elevated; under force no question is
 * asked; a dry run stops after the preview. Deletion failures are reported
 * and counted, never thrown.
 */
class DeletionGate
{
public:
    DeletionGate(const search::RunOptions &options,
                 bool elevated,
                 Prompter &prompter,
                 Deleter &deleter,
                 std::ostream &out);

    GateReport run(std::vector<search::SearchResult> results);

private:
    bool confirmCritical(std::size_t criticalCount);
    bool confirmFinal();
    void deleteAll(GateReport &report);

    const search::RunOptions &options;
    bool elevated;
    Prompter &prompter;
    Deleter &deleter;
    std::ostream &out;
};

} // namespace delf::remove
