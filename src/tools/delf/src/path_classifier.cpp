#include "delf/safety/path_classifier.hpp"

#include "delf/text_utils.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>

namespace delf::safety
{
namespace
{

void appendFromEnvironment(std::vector<std::string> &target, const char *variable)
{
    const char *value = std::getenv(variable);
    if (value && value[0] != '\0')
        target.emplace_back(value);
}

std::vector<std::string> normalizeAll(const std::vector<std::string> &entries)
{
    std::vector<std::string> normalized;
    normalized.reserve(entries.size());
    for (const auto &entry : entries)
    {
        std::string trimmed = text::trimCopy(entry);
        if (trimmed.empty())
            continue;
        normalized.push_back(normalizePath(trimmed));
    }
    return normalized;
}

} // namespace

SafetyPathList builtinSafetyPaths()
{
    SafetyPathList lists;
    lists.critical = {
        "/bin",
        "/sbin",
        "/usr/bin",
        "/usr/sbin",
        "/usr/lib",
        "/usr/lib64",
        "/lib",
        "/lib64",
        "/etc",
        "/boot",
        "/sys",
        "/proc",
        "/dev",
        "/root",
        "/var/lib/dpkg",
        "/var/lib/apt",
        "/usr/share",
    };
    lists.warning = {
        "/opt",
        "/srv",
        "/var/log",
        "/var/www",
        "/var/cache",
        "/home",
    };
    return lists;
}

SafetyPathList environmentSafetyPaths()
{
    SafetyPathList lists = builtinSafetyPaths();
    appendFromEnvironment(lists.warning, "TMPDIR");
    appendFromEnvironment(lists.warning, "TEMP");
    appendFromEnvironment(lists.warning, "TMP");
    appendFromEnvironment(lists.warning, "HOME");
    return lists;
}

std::vector<std::string> defaultAutoExcludePatterns()
{
    return {"node_modules", ".git", ".npm", ".cache", ".vscode", ".idea"};
}

std::string normalizePath(const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec)
        absolute = path;

    std::string normalized = absolute.lexically_normal().string();
    const std::string rootName = absolute.root_path().string();
    while (normalized.size() > rootName.size() && normalized.size() > 1 &&
           normalized.back() == '/')
    {
        normalized.pop_back();
    }
    return normalized;
}

const char *categoryName(Category category) noexcept
{
    switch (category)
    {
    case Category::Safe:
        return "safe";
    case Category::Warning:
        return "warning";
    case Category::Critical:
        return "critical";
    }
    return "";
}

PathClassifier::PathClassifier(SafetyPathList paths, std::vector<std::string> autoExcludePatterns)
{
    lists.critical = normalizeAll(paths.critical);
    lists.warning = normalizeAll(paths.warning);
    excludes.reserve(autoExcludePatterns.size());
    for (const auto &pattern : autoExcludePatterns)
    {
        std::string trimmed = text::trimCopy(pattern);
        if (!trimmed.empty())
            excludes.push_back(text::toLower(std::move(trimmed)));
    }
}

Category PathClassifier::classify(const std::filesystem::path &path) const
{
    const std::string normalized = normalizePath(path);
    if (hasPrefix(normalized, lists.critical))
        return Category::Critical;
    if (hasPrefix(normalized, lists.warning))
        return Category::Warning;
    return Category::Safe;
}

bool PathClassifier::isAutoExcluded(const std::filesystem::path &path) const
{
    if (excludes.empty())
        return false;
    const std::string folded = text::toLower(path.string());
    for (const auto &pattern : excludes)
    {
        if (text::hasWildcard(pattern))
        {
            if (text::globMatch(pattern, folded))
                return true;
        }
        else if (folded.find(pattern) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool PathClassifier::hasPrefix(const std::string &candidate, const std::vector<std::string> &prefixes)
{
    for (const auto &prefix : prefixes)
    {
        if (candidate.compare(0, prefix.size(), prefix) == 0)
            return true;
    }
    return false;
}

} // namespace delf::safety
