#include "delf/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace delf::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "delf",
                "delf",
                "Delete Folder/File",
                "2.0.0",
                "Find and delete files or folders by pattern, with safety checks.",
                "delf locates files and directories by glob pattern and removes them after a preview. "
                "Matches under operating-system locations are classified as critical and cannot be removed "
                "without elevated privileges, dependency and metadata folders are skipped by default, and "
                "every destructive step is preceded by a confirmation unless --force is given."},
        }};

    } // namespace

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

} // namespace delf::appinfo
