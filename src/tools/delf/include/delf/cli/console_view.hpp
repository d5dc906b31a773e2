#pragma once

#include "delf/options.hpp"
#include "delf/search/search_model.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace delf::cli
{

constexpr const char *kRule = "----------------------------------------";

void printHeader(std::ostream &out);
void printVersion(std::ostream &out);
void printHelp(std::ostream &out);

// One "key = value" line per option, marked when the value is not the default.
void printOptions(std::ostream &out, const config::OptionRegistry &registry);

void printSearchInfo(std::ostream &out,
                     const std::filesystem::path &root,
                     const std::string &patternLabel,
                     bool usingFastSearch);

// Display subscriber for the streamed search. Prints at most maxDisplay
// entries, then a single "display limit reached" line.
class ResultListing
{
public:
    ResultListing(std::ostream &out, std::size_t maxDisplay, bool showSize);

    void operator()(const search::SearchResult &result);

    std::size_t seen() const noexcept { return count; }

private:
    std::ostream &out;
    std::size_t maxDisplay;
    bool showSize;
    std::size_t count = 0;
};

void printMatchSummary(std::ostream &out, const search::CategoryCounts &counts);
void printNoMatches(std::ostream &out, const std::string &pattern, bool autoExclude);
void printNoPermissionNotice(std::ostream &out, std::size_t criticalCount);
void printTotalSize(std::ostream &out, std::uintmax_t bytes);
void printExcluded(std::ostream &out, const std::vector<search::SearchResult> &excluded);
void printPreview(std::ostream &out, const std::vector<search::SearchResult> &results, std::size_t limit);
void printDryRunNotice(std::ostream &out);
void printCriticalWarning(std::ostream &out, std::size_t criticalCount);
void printDeletionSummary(std::ostream &out, std::size_t deleted, std::size_t failed);

} // namespace delf::cli
