#pragma once

#include "sn/markdown/document.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sn::markdown
{

enum class StyleTag
{
    SyntaxMark,
    HeadingMark,
    Heading1,
    Heading2,
    Heading3,
    Heading4,
    Heading5,
    Heading6,
    Blockquote,
    HorizontalRuleActive,
    ListIndent1,
    ListIndent2,
    ListIndent3,
    ListIndent4,
    ListMarker,
    TaskDone,
    CodeBlock,
    FenceLine,
    FenceText,
    TableHeader,
    TableSeparator,
    TableRow,
    TablePipe,
    InlineCode,
    Strong,
    Emphasis,
    Strikethrough,
    Link,
    Url
};

enum class WidgetKind
{
    Checkbox,
    Bullet,
    HorizontalRule
};

struct WidgetState
{
    bool checked = false;
    int indentLevel = 0;
    int lineNumber = 0;
    // Exact "[ ]"/"[x]" range in the document; empty for bullets and rules.
    TextRange toggleRange;

    bool operator==(const WidgetState &other) const noexcept = default;
};

struct Hide
{
    bool operator==(const Hide &) const noexcept = default;
};

struct Mark
{
    StyleTag style = StyleTag::SyntaxMark;

    bool operator==(const Mark &) const noexcept = default;
};

struct ReplaceWithWidget
{
    WidgetKind widget = WidgetKind::Bullet;
    WidgetState state;

    bool operator==(const ReplaceWithWidget &) const noexcept = default;
};

struct LineStyle
{
    StyleTag style = StyleTag::Heading1;

    bool operator==(const LineStyle &) const noexcept = default;
};

using DecorationAction = std::variant<Hide, Mark, ReplaceWithWidget, LineStyle>;

// Ranges are absolute offsets into the document.
struct Decoration
{
    TextRange range;
    DecorationAction action;

    bool isLineStyle() const noexcept { return std::holds_alternative<LineStyle>(action); }
    bool operator==(const Decoration &other) const noexcept = default;
};

using DecorationList = std::vector<Decoration>;

std::string styleTagName(StyleTag tag);
std::string widgetKindName(WidgetKind kind);
std::string actionName(const DecorationAction &action);

StyleTag headingStyle(int level) noexcept;
StyleTag listIndentStyle(int indentLevel) noexcept;
// Relative font scale for heading levels 1-6, 1.0 for anything else.
double headingScale(int level) noexcept;

} // namespace sn::markdown
