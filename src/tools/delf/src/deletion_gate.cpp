#include "delf/remove/deletion_gate.hpp"

#include "delf/cli/console_view.hpp"
#include "delf/logging.hpp"
#include "delf/search/exclusion.hpp"
#include "delf/search/search_backend.hpp"
#include "delf/text_utils.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace delf::remove
{

const char *outcomeName(GateOutcome outcome) noexcept
{
    switch (outcome)
    {
    case GateOutcome::NoCandidates:
        return "no-candidates";
    case GateOutcome::NothingDeletableWithoutElevation:
        return "nothing-deletable-without-elevation";
    case GateOutcome::AllExcluded:
        return "all-excluded";
    case GateOutcome::DryRun:
        return "dry-run";
    case GateOutcome::Cancelled:
        return "cancelled";
    case GateOutcome::Completed:
        return "completed";
    }
    return "unknown";
}

ExitCode exitCodeFor(GateOutcome outcome) noexcept
{
    switch (outcome)
    {
    case GateOutcome::NoCandidates:
    case GateOutcome::NothingDeletableWithoutElevation:
        return ExitCode::NoMatches;
    case GateOutcome::Cancelled:
        return ExitCode::Cancelled;
    case GateOutcome::AllExcluded:
    case GateOutcome::DryRun:
    case GateOutcome::Completed:
        break;
    }
    return ExitCode::Success;
}

StreamPrompter::StreamPrompter(std::istream &in, std::ostream &out)
    : in(in), out(out)
{
}

std::string StreamPrompter::ask(std::string_view prompt)
{
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line))
        return {};
    return text::trimCopy(line);
}

DeletionGate::DeletionGate(const search::RunOptions &options,
                           bool elevated,
                           Prompter &prompter,
                           Deleter &deleter,
                           std::ostream &out)
    : options(options), elevated(elevated), prompter(prompter), deleter(deleter), out(out)
{
}

GateReport DeletionGate::run(std::vector<search::SearchResult> results)
{
    auto log = logging::runLog();
    GateReport report;

    if (results.empty())
    {
        cli::printNoMatches(out, options.pattern, options.autoExclude);
        report.outcome = GateOutcome::NoCandidates;
        log->info("no matches for '{}' in {}", options.pattern, options.searchRoot.string());
        return report;
    }

    report.found = search::countByCategory(results);
    cli::printMatchSummary(out, report.found);
    log->info("matches: {} critical, {} warning, {} safe",
              report.found.critical, report.found.warning, report.found.safe);

    if (report.found.critical > 0 && !elevated)
    {
        cli::printNoPermissionNotice(out, report.found.critical);
        report.blockedCritical = report.found.critical;
        results = search::withoutCritical(results);
        log->warn("dropped {} critical entries, process is not elevated", report.blockedCritical);
        if (results.empty())
        {
            out << "All matched files are system files. Nothing can be deleted without root.\n";
            report.outcome = GateOutcome::NothingDeletableWithoutElevation;
            return report;
        }
        out << "Proceeding with " << results.size() << " safe/warning-level files only...\n";
    }

    if (options.showSize)
    {
        out << "\nCalculating total size...\n";
        cli::printTotalSize(out, search::totalSize(results));
    }

    if (!options.force)
    {
        out << '\n' << cli::kRule << '\n';
        out << "Enter exclusion patterns (comma-separated, or press Enter to skip):\n";
        out << "Examples: */important/*, *.txt, backup\n";
        auto patterns = search::parseExclusionPatterns(prompter.ask("> "));
        if (!patterns.empty())
        {
            auto split = search::partition(results, patterns);
            cli::printExcluded(out, split.excluded);
            log->info("excluded {} entries by user patterns", split.excluded.size());
            report.excluded = std::move(split.excluded);
            results = std::move(split.kept);
        }
    }

    if (results.empty())
    {
        out << "\nAll files excluded. Nothing to delete.\n";
        report.outcome = GateOutcome::AllExcluded;
        return report;
    }

    report.candidates = std::move(results);
    cli::printPreview(out, report.candidates, options.previewLimit);
    if (options.showSize)
        cli::printTotalSize(out, search::totalSize(report.candidates));

    if (options.dryRun)
    {
        cli::printDryRunNotice(out);
        report.outcome = GateOutcome::DryRun;
        log->info("dry run, {} entries would be deleted", report.candidates.size());
        return report;
    }

    if (!options.force)
    {
        std::size_t critical = search::countByCategory(report.candidates).critical;
        if (elevated && critical > 0 && !confirmCritical(critical))
        {
            out << "\nOperation cancelled. System is safe.\n";
            report.outcome = GateOutcome::Cancelled;
            log->info("cancelled at critical confirmation");
            return report;
        }
        if (!confirmFinal())
        {
            out << "\nOperation cancelled\n";
            report.outcome = GateOutcome::Cancelled;
            log->info("cancelled at final confirmation");
            return report;
        }
    }

    deleteAll(report);
    cli::printDeletionSummary(out, report.deleted, report.failed);
    report.outcome = GateOutcome::Completed;
    log->info("deleted {}, failed {}", report.deleted, report.failed);
    return report;
}

bool DeletionGate::confirmCritical(std::size_t criticalCount)
{
    cli::printCriticalWarning(out, criticalCount);
    out << "To proceed, type exactly: " << kCriticalConfirmationPhrase << '\n';
    return prompter.ask("> ") == kCriticalConfirmationPhrase;
}

bool DeletionGate::confirmFinal()
{
    out << '\n' << cli::kRule << '\n';
    std::string answer = prompter.ask("Proceed with deletion? (y/N) ");
    return answer == "y" || answer == "Y";
}

void DeletionGate::deleteAll(GateReport &report)
{
    auto log = logging::runLog();
    out << "\nDeleting...\n\n";
    for (const auto &result : report.candidates)
    {
        std::error_code ec;
        if (std::filesystem::symlink_status(result.path, ec).type() == std::filesystem::file_type::not_found)
            continue;

        ++report.attempted;
        DeleteOutcome outcome = deleter.remove(result.path);
        if (outcome.success)
        {
            ++report.deleted;
            out << "OK Deleted: " << result.path.string() << '\n';
            log->info("deleted {}", result.path.string());
        }
        else
        {
            ++report.failed;
            out << "X Failed: " << result.path.string() << " (" << outcome.message << ")\n";
            log->error("failed to delete {}: {}", result.path.string(), outcome.message);
        }
    }
}

} // namespace delf::remove
