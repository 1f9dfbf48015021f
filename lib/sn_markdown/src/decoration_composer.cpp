#include "sn/markdown/decoration_composer.hpp"

#include "sn/markdown/inline_scanner.hpp"

#include <algorithm>

namespace sn::markdown
{

ActiveRegion::ActiveRegion(int firstLine, int lastLine) noexcept : firstLine_(firstLine), lastLine_(lastLine)
{
}

ActiveRegion ActiveRegion::fromSelection(const std::vector<Line> &lines, TextRange selection) noexcept
{
    if (selection.end < selection.start)
        return {};
    auto first = lineIndexAt(lines, selection.start);
    auto last = lineIndexAt(lines, selection.end);
    if (!first || !last)
        return {};
    return ActiveRegion(lines[*first].number, lines[*last].number);
}

namespace
{
class LineComposer
{
public:
    LineComposer(std::string_view text, const Line &line, const LineClassification &classification, bool active,
                 DecorationList &out)
        : text_(text), line_(line), classification_(classification), active_(active), out_(out)
    {
    }

    void compose()
    {
        std::visit([this](const auto &kind) { composeBlock(kind); }, classification_.kind);
    }

private:
    std::size_t base() const noexcept { return line_.range.start; }
    TextRange absolute(TextRange relative) const noexcept { return relative.shifted(base()); }
    TextRange wholeLine() const noexcept { return line_.range; }
    std::string_view content() const
    {
        std::string_view line = lineText(text_, line_);
        return line.substr(std::min(classification_.contentStart, line.size()));
    }

    void emit(TextRange range, DecorationAction action)
    {
        if (range.empty())
            return;
        out_.push_back(Decoration{range, std::move(action)});
    }

    void lineStyle(StyleTag tag) { emit(wholeLine(), LineStyle{tag}); }

    void syntax(TextRange relative, StyleTag activeTag = StyleTag::SyntaxMark)
    {
        if (active_)
            emit(absolute(relative), Mark{activeTag});
        else
            emit(absolute(relative), Hide{});
    }

    void composeBlock(const Paragraph &) { composeInline(); }

    void composeBlock(const Heading &heading)
    {
        lineStyle(headingStyle(heading.level));
        syntax(classification_.markerRange, StyleTag::HeadingMark);
        composeInline();
    }

    void composeBlock(const Blockquote &)
    {
        lineStyle(StyleTag::Blockquote);
        syntax(classification_.markerRange);
        composeInline();
    }

    void composeBlock(const HorizontalRule &)
    {
        if (active_)
        {
            lineStyle(StyleTag::HorizontalRuleActive);
            emit(wholeLine(), Mark{StyleTag::SyntaxMark});
            return;
        }
        WidgetState state;
        state.lineNumber = line_.number;
        emit(wholeLine(), ReplaceWithWidget{WidgetKind::HorizontalRule, state});
    }

    void composeBlock(const UnorderedItem &item)
    {
        composeIndent(item.indent);
        if (active_)
        {
            emit(absolute(classification_.markerRange), Mark{StyleTag::ListMarker});
        }
        else
        {
            WidgetState state;
            state.indentLevel = item.indent;
            state.lineNumber = line_.number;
            emit(absolute(classification_.markerRange), ReplaceWithWidget{WidgetKind::Bullet, state});
        }
        composeInline();
    }

    void composeBlock(const OrderedItem &item)
    {
        composeIndent(item.indent);
        emit(absolute(classification_.markerRange), Mark{StyleTag::ListMarker});
        composeInline();
    }

    void composeBlock(const ChecklistItem &item)
    {
        composeIndent(item.indent);
        if (item.checked)
            lineStyle(StyleTag::TaskDone);
        if (active_)
        {
            emit(absolute(classification_.markerRange), Mark{StyleTag::ListMarker});
        }
        else
        {
            WidgetState state;
            state.checked = item.checked;
            state.indentLevel = item.indent;
            state.lineNumber = line_.number;
            state.toggleRange = absolute(classification_.checkboxRange);
            emit(absolute(classification_.markerRange), ReplaceWithWidget{WidgetKind::Checkbox, state});
        }
        composeInline();
    }

    void composeBlock(const CodeFenceBoundary &)
    {
        lineStyle(StyleTag::CodeBlock);
        lineStyle(StyleTag::FenceLine);
        emit(wholeLine(), Mark{StyleTag::FenceText});
    }

    void composeBlock(const CodeFenceBody &) { lineStyle(StyleTag::CodeBlock); }

    void composeBlock(const TableHeader &)
    {
        lineStyle(StyleTag::TableHeader);
        composePipes();
    }

    void composeBlock(const TableSeparator &)
    {
        lineStyle(StyleTag::TableSeparator);
        if (active_)
            emit(wholeLine(), Mark{StyleTag::SyntaxMark});
    }

    void composeBlock(const TableRow &)
    {
        lineStyle(StyleTag::TableRow);
        composePipes();
    }

    void composeIndent(int indentLevel)
    {
        if (indentLevel <= 0)
            return;
        lineStyle(listIndentStyle(indentLevel));
        if (!active_)
            emit(absolute(classification_.indentRange()), Hide{});
    }

    void composePipes()
    {
        std::string_view line = lineText(text_, line_);
        for (std::size_t i = 0; i < line.size(); ++i)
        {
            if (line[i] == '|')
                emit(absolute(TextRange{i, i + 1}), Mark{StyleTag::TablePipe});
        }
    }

    void composeInline()
    {
        std::size_t offset = base() + std::min(classification_.contentStart, line_.range.length());
        for (const auto &span : scanInline(content()))
        {
            TextRange range = span.range.shifted(offset);
            TextRange inner = span.contentRange.shifted(offset);
            switch (span.kind)
            {
            case InlineSpanKind::Code:
                composeDelimited(range, inner, StyleTag::InlineCode);
                break;
            case InlineSpanKind::Strong:
                composeDelimited(range, inner, StyleTag::Strong);
                break;
            case InlineSpanKind::Emphasis:
                composeDelimited(range, inner, StyleTag::Emphasis);
                break;
            case InlineSpanKind::Strikethrough:
                composeDelimited(range, inner, StyleTag::Strikethrough);
                break;
            case InlineSpanKind::Link:
            case InlineSpanKind::Image:
                composeLink(range, inner, span.urlRange.shifted(offset));
                break;
            }
        }
    }

    void composeDelimited(TextRange range, TextRange inner, StyleTag style)
    {
        inlineSyntax(TextRange{range.start, inner.start});
        emit(inner, Mark{style});
        inlineSyntax(TextRange{inner.end, range.end});
    }

    void composeLink(TextRange range, TextRange inner, TextRange url)
    {
        inlineSyntax(TextRange{range.start, inner.start});
        emit(inner, Mark{StyleTag::Link});
        if (active_)
        {
            emit(TextRange{inner.end, url.start}, Mark{StyleTag::SyntaxMark});
            emit(url, Mark{StyleTag::Url});
            emit(TextRange{url.end, range.end}, Mark{StyleTag::SyntaxMark});
        }
        else
        {
            emit(TextRange{inner.end, range.end}, Hide{});
        }
    }

    void inlineSyntax(TextRange range)
    {
        if (active_)
            emit(range, Mark{StyleTag::SyntaxMark});
        else
            emit(range, Hide{});
    }

    std::string_view text_;
    const Line &line_;
    const LineClassification &classification_;
    bool active_;
    DecorationList &out_;
};

} // namespace

DecorationList composeDecorations(std::string_view text, const DocumentStructure &structure,
                                  const ActiveRegion &active)
{
    DecorationList candidates;
    for (std::size_t i = 0; i < structure.lines.size() && i < structure.classifications.size(); ++i)
    {
        const Line &line = structure.lines[i];
        LineComposer(text, line, structure.classifications[i], active.contains(line.number), candidates).compose();
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Decoration &a, const Decoration &b) {
        if (a.range.start != b.range.start)
            return a.range.start < b.range.start;
        if (a.isLineStyle() != b.isLineStyle())
            return a.isLineStyle();
        return a.range.end < b.range.end;
    });

    DecorationList decorations;
    decorations.reserve(candidates.size());
    std::size_t claimedEnd = 0;
    for (auto &decoration : candidates)
    {
        if (decoration.isLineStyle())
        {
            decorations.push_back(std::move(decoration));
            continue;
        }
        if (decoration.range.start < claimedEnd)
            continue;
        claimedEnd = decoration.range.end;
        decorations.push_back(std::move(decoration));
    }
    return decorations;
}

DecorationList buildDecorations(std::string_view text, const ActiveRegion &active)
{
    return composeDecorations(text, analyzeDocument(text), active);
}

} // namespace sn::markdown
