#pragma once

#include "delf/options.hpp"

namespace delf::cli
{

inline constexpr const char *kOptionMaxDisplay = "maxDisplay";
inline constexpr const char *kOptionPreviewLimit = "previewLimit";
inline constexpr const char *kOptionAutoExclude = "autoExclude";
inline constexpr const char *kOptionAutoExcludePatterns = "autoExcludePatterns";
inline constexpr const char *kOptionExtraCriticalPaths = "extraCriticalPaths";
inline constexpr const char *kOptionExtraWarningPaths = "extraWarningPaths";
inline constexpr const char *kOptionUseFastSearch = "useFastSearch";
inline constexpr const char *kOptionFastSearchExecutable = "fastSearchExecutable";
inline constexpr const char *kOptionLogEnabled = "logEnabled";
inline constexpr const char *kOptionLogLevel = "logLevel";

void registerDelfOptions(config::OptionRegistry &registry);

} // namespace delf::cli
