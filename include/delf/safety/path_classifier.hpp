#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace delf::safety
{

enum class Category : unsigned short
{
    Safe = 0,
    Warning,
    Critical
};

struct SafetyPathList
{
    std::vector<std::string> critical;
    std::vector<std::string> warning;
};

// Operating-system locations only, no environment lookups.
SafetyPathList builtinSafetyPaths();

// builtinSafetyPaths() plus temp and home locations taken from the environment.
SafetyPathList environmentSafetyPaths();

std::vector<std::string> defaultAutoExcludePatterns();

// Absolute, lexically normal, no trailing separator. Case-folded where the
// platform file system is case-insensitive.
std::string normalizePath(const std::filesystem::path &path);

const char *categoryName(Category category) noexcept;

/**
 * Assigns a safety tier to a path by plain string-prefix comparison of
 * normalized forms. Critical prefixes are tested before warning prefixes.
 * The test is not segment aware: "/etc" also matches "/etcetera".
 */
class PathClassifier
{
public:
    explicit PathClassifier(SafetyPathList lists,
                            std::vector<std::string> autoExcludePatterns = defaultAutoExcludePatterns());

    Category classify(const std::filesystem::path &path) const;

    // Case-insensitive. Glob patterns match the full path, plain ones match
    // as substrings.
    bool isAutoExcluded(const std::filesystem::path &path) const;

    const SafetyPathList &paths() const noexcept { return lists; }
    const std::vector<std::string> &autoExcludePatterns() const noexcept { return excludes; }

private:
    static bool hasPrefix(const std::string &candidate, const std::vector<std::string> &prefixes);

    SafetyPathList lists;
    std::vector<std::string> excludes;
};

} // namespace delf::safety
