#include "delf/cli/delf_options.hpp"

#include "delf/safety/path_classifier.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace delf::cli
{

void registerDelfOptions(config::OptionRegistry &registry)
{
    using config::OptionKind;
    using config::OptionValue;
    using StringList = std::vector<std::string>;

    registry.registerOption({kOptionMaxDisplay, OptionKind::Integer, OptionValue(std::int64_t{100}),
                             "Maximum number of matches listed while searching."});
    registry.registerOption({kOptionPreviewLimit, OptionKind::Integer, OptionValue(std::int64_t{10}),
                             "Number of entries shown in the deletion preview."});
    registry.registerOption({kOptionAutoExclude, OptionKind::Boolean, OptionValue(true),
                             "Skip dependency and metadata directories while searching."});
    registry.registerOption({kOptionAutoExcludePatterns, OptionKind::StringList,
                             OptionValue(safety::defaultAutoExcludePatterns()),
                             "Substrings or globs that are never searched."});
    registry.registerOption({kOptionExtraCriticalPaths, OptionKind::StringList, OptionValue(StringList{}),
                             "Additional path prefixes that require root to delete."});
    registry.registerOption({kOptionExtraWarningPaths, OptionKind::StringList, OptionValue(StringList{}),
                             "Additional path prefixes flagged as warnings."});
    registry.registerOption({kOptionUseFastSearch, OptionKind::Boolean, OptionValue(true),
                             "Delegate searching to fd when it is installed."});
    registry.registerOption({kOptionFastSearchExecutable, OptionKind::String, OptionValue(std::string()),
                             "Name or path of the fd binary. Empty probes fd, then fdfind."});
    registry.registerOption({kOptionLogEnabled, OptionKind::Boolean, OptionValue(true),
                             "Append a record of each run to the log file."});
    registry.registerOption({kOptionLogLevel, OptionKind::String, OptionValue(std::string("info")),
                             "One of trace, debug, info, warn, error, off."});
}

} // namespace delf::cli
