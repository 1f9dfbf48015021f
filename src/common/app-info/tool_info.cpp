#include "sn/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace sn::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "sn-edit",
                "sn-edit",
                "Notes Editor",
                "Edit Markdown notes with live, cursor-aware formatting.",
                "sn-edit [--load-options FILE] [FILE]\n"
                "sn-edit --dump FILE [--cursor OFFSET] [--load-options FILE]",
                "Notes Editor renders Markdown as you type while the file on disk stays plain text. Syntax is hidden on every line except the one under the cursor, task boxes toggle with a click, and Enter, Tab and Shift-Tab keep lists going. Use --dump to print the decorations of a file as JSON."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

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

    const ToolInfo *findToolByExecutable(std::string_view executable) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.executable == executable; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireToolByExecutable(std::string_view executable)
    {
        if (const ToolInfo *info = findToolByExecutable(executable))
            return *info;
        throw std::runtime_error("Unknown tool executable: " + std::string{executable});
    }

} // namespace sn::appinfo
