#pragma once

#include <span>
#include <string_view>

namespace sn::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view usage;
    std::string_view aboutDescription;
};

std::span<const ToolInfo> tools() noexcept;

const ToolInfo *findTool(std::string_view id) noexcept;
// Throws std::runtime_error for unknown ids.
const ToolInfo &requireTool(std::string_view id);

const ToolInfo *findToolByExecutable(std::string_view executable) noexcept;
const ToolInfo &requireToolByExecutable(std::string_view executable);

} // namespace sn::appinfo
