#include "sn/markdown/decoration.hpp"

#include <algorithm>
#include <array>

namespace sn::markdown
{

std::string styleTagName(StyleTag tag)
{
    switch (tag)
    {
    case StyleTag::SyntaxMark:
        return "syntax";
    case StyleTag::HeadingMark:
        return "heading-mark";
    case StyleTag::Heading1:
        return "heading-1";
    case StyleTag::Heading2:
        return "heading-2";
    case StyleTag::Heading3:
        return "heading-3";
    case StyleTag::Heading4:
        return "heading-4";
    case StyleTag::Heading5:
        return "heading-5";
    case StyleTag::Heading6:
        return "heading-6";
    case StyleTag::Blockquote:
        return "blockquote";
    case StyleTag::HorizontalRuleActive:
        return "hr-active";
    case StyleTag::ListIndent1:
        return "list-indent-1";
    case StyleTag::ListIndent2:
        return "list-indent-2";
    case StyleTag::ListIndent3:
        return "list-indent-3";
    case StyleTag::ListIndent4:
        return "list-indent-4";
    case StyleTag::ListMarker:
        return "list-marker";
    case StyleTag::TaskDone:
        return "task-done";
    case StyleTag::CodeBlock:
        return "code-block";
    case StyleTag::FenceLine:
        return "fence-line";
    case StyleTag::FenceText:
        return "fence-text";
    case StyleTag::TableHeader:
        return "table-header";
    case StyleTag::TableSeparator:
        return "table-separator";
    case StyleTag::TableRow:
        return "table-row";
    case StyleTag::TablePipe:
        return "table-pipe";
    case StyleTag::InlineCode:
        return "inline-code";
    case StyleTag::Strong:
        return "strong";
    case StyleTag::Emphasis:
        return "emphasis";
    case StyleTag::Strikethrough:
        return "strikethrough";
    case StyleTag::Link:
        return "link";
    case StyleTag::Url:
        return "url";
    }
    return "unknown";
}

std::string widgetKindName(WidgetKind kind)
{
    switch (kind)
    {
    case WidgetKind::Checkbox:
        return "checkbox";
    case WidgetKind::Bullet:
        return "bullet";
    case WidgetKind::HorizontalRule:
        return "horizontal-rule";
    }
    return "unknown";
}

std::string actionName(const DecorationAction &action)
{
    if (std::holds_alternative<Hide>(action))
        return "hide";
    if (std::holds_alternative<Mark>(action))
        return "mark";
    if (std::holds_alternative<ReplaceWithWidget>(action))
        return "widget";
    return "line";
}

StyleTag headingStyle(int level) noexcept
{
    static constexpr std::array<StyleTag, 6> styles = {StyleTag::Heading1, StyleTag::Heading2, StyleTag::Heading3,
                                                       StyleTag::Heading4, StyleTag::Heading5, StyleTag::Heading6};
    int index = std::clamp(level, 1, 6) - 1;
    return styles[static_cast<std::size_t>(index)];
}

StyleTag listIndentStyle(int indentLevel) noexcept
{
    switch (std::clamp(indentLevel, 1, 4))
    {
    case 1:
        return StyleTag::ListIndent1;
    case 2:
        return StyleTag::ListIndent2;
    case 3:
        return StyleTag::ListIndent3;
    default:
        return StyleTag::ListIndent4;
    }
}

double headingScale(int level) noexcept
{
    switch (level)
    {
    case 1:
        return 1.8;
    case 2:
        return 1.5;
    case 3:
        return 1.3;
    case 4:
        return 1.2;
    case 5:
        return 1.1;
    default:
        return 1.0;
    }
}

} // namespace sn::markdown
