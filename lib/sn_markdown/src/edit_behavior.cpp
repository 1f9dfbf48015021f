#include "sn/markdown/edit_behavior.hpp"

#include "sn/markdown/line_classifier.hpp"
#include "sn/markdown/region_detector.hpp"

#include <algorithm>
#include <string>

namespace sn::markdown
{
namespace
{
bool isBlank(std::string_view view) noexcept
{
    for (char ch : view)
    {
        if (ch != ' ' && ch != '\t')
            return false;
    }
    return true;
}

EditOutcome makeOutcome(std::string_view text, TextRange replaced, std::string insertion, TextRange selection)
{
    EditOutcome outcome;
    outcome.replaced = replaced;
    outcome.text.reserve(text.size() + insertion.size());
    outcome.text.append(text.substr(0, replaced.start));
    outcome.text.append(insertion);
    outcome.text.append(text.substr(replaced.end));
    outcome.insertion = std::move(insertion);
    outcome.selection = selection;
    return outcome;
}

// The last line break of the document belongs to the line before it.
bool endsDocument(std::string_view text, const Line &line) noexcept
{
    return line.next == text.size() && line.next > line.range.end;
}

std::string nextMarker(std::string_view line, const LineClassification &classification)
{
    std::string_view marker = line.substr(classification.markerRange.start, classification.markerRange.length());
    std::string result(line.substr(0, classification.leadingSpaces));

    if (const auto *ordered = std::get_if<OrderedItem>(&classification.kind))
    {
        std::size_t delimiter = marker.find(ordered->delimiter);
        result += std::to_string(ordered->number + 1);
        result += marker.substr(delimiter);
    }
    else if (std::holds_alternative<ChecklistItem>(classification.kind))
    {
        std::size_t box = classification.checkboxRange.start - classification.markerRange.start;
        result += marker.substr(0, box);
        result += "[ ] ";
    }
    else
    {
        result += marker;
    }
    return result;
}

struct CursorLine
{
    DocumentStructure structure;
    std::size_t index = 0;

    const Line &line() const { return structure.lines[index]; }
    const LineClassification &classification() const { return structure.classifications[index]; }
};

std::optional<CursorLine> locate(std::string_view text, std::size_t offset)
{
    if (offset > text.size())
        return std::nullopt;
    CursorLine cursor;
    cursor.structure = analyzeDocument(text);
    auto index = lineIndexAt(cursor.structure.lines, offset);
    if (!index)
        return std::nullopt;
    cursor.index = *index;
    if (!isListItem(cursor.classification().kind))
        return std::nullopt;
    return cursor;
}

} // namespace

std::optional<EditOutcome> continueList(const CursorContext &context)
{
    if (!context.selection.empty() || context.selection.end < context.selection.start)
        return std::nullopt;
    std::size_t cursor = context.selection.start;
    auto located = locate(context.text, cursor);
    if (!located)
        return std::nullopt;

    const Line &line = located->line();
    const LineClassification &classification = located->classification();
    std::string_view lineView = lineText(context.text, line);
    if (cursor < line.range.start + classification.contentStart)
        return std::nullopt;

    if (isBlank(lineView.substr(classification.contentStart)))
    {
        std::size_t end = endsDocument(context.text, line) ? line.next : line.range.end;
        TextRange removed{line.range.start, end};
        return makeOutcome(context.text, removed, std::string(), TextRange{line.range.start, line.range.start});
    }

    std::string insertion = "\n" + nextMarker(lineView, classification);
    TextRange replaced{cursor, cursor};
    if (cursor == line.range.end && endsDocument(context.text, line))
        replaced.end = line.next;
    std::size_t caret = cursor + insertion.size();
    return makeOutcome(context.text, replaced, std::move(insertion), TextRange{caret, caret});
}

std::optional<EditOutcome> indentListItem(const CursorContext &context, bool outdent)
{
    if (context.selection.end < context.selection.start)
        return std::nullopt;
    auto located = locate(context.text, context.selection.start);
    if (!located)
        return std::nullopt;

    std::size_t lineStart = located->line().range.start;
    if (!outdent)
    {
        auto shift = [&](std::size_t offset) { return offset >= lineStart ? offset + 2 : offset; };
        TextRange selection{shift(context.selection.start), shift(context.selection.end)};
        return makeOutcome(context.text, TextRange{lineStart, lineStart}, "  ", selection);
    }

    std::size_t removed = std::min<std::size_t>(2, located->classification().leadingSpaces);
    if (removed == 0)
        return std::nullopt;
    auto shift = [&](std::size_t offset) {
        if (offset >= lineStart + removed)
            return offset - removed;
        return offset > lineStart ? lineStart : offset;
    };
    TextRange selection{shift(context.selection.start), shift(context.selection.end)};
    return makeOutcome(context.text, TextRange{lineStart, lineStart + removed}, std::string(), selection);
}

std::optional<EditOutcome> handleCommand(EditCommand command, const CursorContext &context,
                                         const EditSettings &settings)
{
    switch (command)
    {
    case EditCommand::Enter:
        if (!settings.smartListContinuation)
            return std::nullopt;
        return continueList(context);
    case EditCommand::Tab:
        if (!settings.tabIndentsLists)
            return std::nullopt;
        return indentListItem(context, false);
    case EditCommand::ShiftTab:
        if (!settings.tabIndentsLists)
            return std::nullopt;
        return indentListItem(context, true);
    }
    return std::nullopt;
}

std::optional<EditOutcome> toggleCheckbox(std::string_view text, TextRange range, TextRange selection)
{
    if (range.length() != 3 || range.end > text.size())
        return std::nullopt;

    std::vector<Line> lines = splitLines(text);
    auto index = lineIndexAt(lines, range.start);
    if (!index)
        return std::nullopt;
    const Line &line = lines[*index];
    LineClassification classification = classifyLine(lineText(text, line));
    const auto *item = std::get_if<ChecklistItem>(&classification.kind);
    if (item == nullptr || classification.checkboxRange.shifted(line.range.start) != range)
        return std::nullopt;

    std::string mark(1, item->checked ? ' ' : 'x');
    return makeOutcome(text, TextRange{range.start + 1, range.start + 2}, std::move(mark), selection);
}

} // namespace sn::markdown
