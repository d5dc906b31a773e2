#pragma once

#include <string_view>

namespace delf::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view version;
    std::string_view shortDescription;
    std::string_view longDescription;
};

const ToolInfo *findTool(std::string_view id) noexcept;
const ToolInfo &requireTool(std::string_view id);

} // namespace delf::appinfo
