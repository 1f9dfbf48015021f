#include "sn/markdown/line_classifier.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace sn::markdown
{
namespace
{
bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

bool isDigit(char ch) noexcept
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isBullet(char ch) noexcept
{
    return ch == '-' || ch == '*' || ch == '+';
}

std::string_view trimRight(std::string_view view) noexcept
{
    std::size_t end = view.size();
    while (end > 0 && isWhitespace(view[end - 1]))
        --end;
    return view.substr(0, end);
}

std::string_view trim(std::string_view view) noexcept
{
    std::size_t start = 0;
    while (start < view.size() && isWhitespace(view[start]))
        ++start;
    return trimRight(view.substr(start));
}

std::size_t skipWhitespace(std::string_view line, std::size_t pos) noexcept
{
    while (pos < line.size() && isWhitespace(line[pos]))
        ++pos;
    return pos;
}

bool isHorizontalRule(std::string_view trimmed) noexcept
{
    if (trimmed.size() < 3)
        return false;
    char first = trimmed.front();
    if (first != '-' && first != '*' && first != '_')
        return false;
    for (char ch : trimmed)
    {
        if (ch != first)
            return false;
    }
    return true;
}

bool isSeparatorCell(std::string_view cell) noexcept
{
    cell = trim(cell);
    if (!cell.empty() && cell.front() == ':')
        cell.remove_prefix(1);
    if (!cell.empty() && cell.back() == ':')
        cell.remove_suffix(1);
    if (cell.empty())
        return false;
    for (char ch : cell)
    {
        if (ch != '-')
            return false;
    }
    return true;
}

bool classifyHeading(std::string_view line, LineClassification &result)
{
    std::string_view trimmed = trimRight(line);
    std::size_t level = 0;
    while (level < trimmed.size() && trimmed[level] == '#')
        ++level;
    if (level == 0 || level > 6)
        return false;
    if (level < trimmed.size() && trimmed[level] != ' ')
        return false;

    std::size_t markerEnd = level;
    if (markerEnd < line.size() && line[markerEnd] == ' ')
        ++markerEnd;
    result.kind = Heading{static_cast<int>(level)};
    result.markerRange = TextRange{0, markerEnd};
    result.contentStart = markerEnd;
    return true;
}

bool classifyBlockquote(std::string_view line, LineClassification &result)
{
    std::size_t pos = skipWhitespace(line, 0);
    if (pos >= line.size() || line[pos] != '>')
        return false;

    int depth = 0;
    while (pos < line.size() && (line[pos] == '>' || isWhitespace(line[pos])))
    {
        if (line[pos] == '>')
            ++depth;
        ++pos;
    }
    result.kind = Blockquote{depth};
    result.markerRange = TextRange{0, pos};
    result.contentStart = pos;
    return true;
}

// "- [ ] ", "* [x] " and friends. Requires whitespace after the closing bracket.
bool classifyChecklist(std::string_view line, LineClassification &result)
{
    std::size_t pos = result.leadingSpaces;
    if (pos >= line.size() || !isBullet(line[pos]))
        return false;
    char bullet = line[pos];
    std::size_t afterBullet = skipWhitespace(line, pos + 1);
    if (afterBullet == pos + 1)
        return false;
    if (afterBullet + 3 >= line.size())
        return false;
    if (line[afterBullet] != '[' || line[afterBullet + 2] != ']')
        return false;
    char mark = line[afterBullet + 1];
    if (mark != ' ' && mark != 'x' && mark != 'X')
        return false;
    if (!isWhitespace(line[afterBullet + 3]))
        return false;

    std::size_t markerEnd = afterBullet + 4;
    result.kind = ChecklistItem{mark != ' ', result.indentLevel, bullet};
    result.markerRange = TextRange{pos, markerEnd};
    result.checkboxRange = TextRange{afterBullet, afterBullet + 3};
    result.contentStart = markerEnd;
    return true;
}

bool classifyUnordered(std::string_view line, LineClassification &result)
{
    std::size_t pos = result.leadingSpaces;
    if (pos >= line.size() || !isBullet(line[pos]))
        return false;
    std::size_t markerEnd = skipWhitespace(line, pos + 1);
    if (markerEnd == pos + 1)
        return false;

    result.kind = UnorderedItem{result.indentLevel, line[pos]};
    result.markerRange = TextRange{pos, markerEnd};
    result.contentStart = markerEnd;
    return true;
}

constexpr std::size_t kMaxOrderedDigits = 9;

bool classifyOrdered(std::string_view line, LineClassification &result)
{
    std::size_t pos = result.leadingSpaces;
    std::size_t digitsEnd = pos;
    while (digitsEnd < line.size() && isDigit(line[digitsEnd]))
        ++digitsEnd;
    if (digitsEnd == pos || digitsEnd >= line.size())
        return false;
    // Keeps the continued number well inside long.
    if (digitsEnd - pos > kMaxOrderedDigits)
        return false;
    char delimiter = line[digitsEnd];
    if (delimiter != '.' && delimiter != ')')
        return false;
    std::size_t markerEnd = skipWhitespace(line, digitsEnd + 1);
    if (markerEnd == digitsEnd + 1)
        return false;

    long number = 0;
    auto parsed = std::from_chars(line.data() + pos, line.data() + digitsEnd, number);
    if (parsed.ec != std::errc())
        return false;

    result.kind = OrderedItem{number, result.indentLevel, delimiter};
    result.markerRange = TextRange{pos, markerEnd};
    result.contentStart = markerEnd;
    return true;
}

} // namespace

LineClassification classifyLine(std::string_view line)
{
    LineClassification result;
    result.kind = Paragraph{};

    std::size_t leading = 0;
    while (leading < line.size() && (line[leading] == ' ' || line[leading] == '\t'))
        ++leading;
    result.leadingSpaces = leading;
    result.indentLevel = static_cast<int>(leading / 2);

    if (classifyHeading(line, result))
        return result;
    if (classifyBlockquote(line, result))
        return result;

    if (isHorizontalRule(trim(line)))
    {
        result.kind = HorizontalRule{};
        result.markerRange = TextRange{0, line.size()};
        result.contentStart = line.size();
        return result;
    }

    if (classifyChecklist(line, result))
        return result;
    if (classifyUnordered(line, result))
        return result;
    if (classifyOrdered(line, result))
        return result;

    return result;
}

bool isFenceLine(std::string_view line) noexcept
{
    return line.size() >= 3 && line.substr(0, 3) == "```";
}

bool isPipeLine(std::string_view line) noexcept
{
    std::string_view trimmed = trim(line);
    return trimmed.size() >= 2 && trimmed.front() == '|' && trimmed.back() == '|';
}

bool isTableSeparatorLine(std::string_view line) noexcept
{
    std::string_view trimmed = trim(line);
    if (!trimmed.empty() && trimmed.front() == '|')
        trimmed.remove_prefix(1);
    if (!trimmed.empty() && trimmed.back() == '|')
        trimmed.remove_suffix(1);
    if (trimmed.find('|') == std::string_view::npos)
        return false;

    std::size_t start = 0;
    while (true)
    {
        std::size_t end = trimmed.find('|', start);
        std::string_view cell = trimmed.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!isSeparatorCell(cell))
            return false;
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return true;
}

bool isHeading(const BlockKind &kind) noexcept
{
    return std::holds_alternative<Heading>(kind);
}

bool isListItem(const BlockKind &kind) noexcept
{
    return std::holds_alternative<UnorderedItem>(kind) || std::holds_alternative<OrderedItem>(kind) ||
           std::holds_alternative<ChecklistItem>(kind);
}

bool isCodeFence(const BlockKind &kind) noexcept
{
    return std::holds_alternative<CodeFenceBoundary>(kind) || std::holds_alternative<CodeFenceBody>(kind);
}

bool isTableLine(const BlockKind &kind) noexcept
{
    return std::holds_alternative<TableHeader>(kind) || std::holds_alternative<TableSeparator>(kind) ||
           std::holds_alternative<TableRow>(kind);
}

std::string blockTypeName(const BlockKind &kind)
{
    if (const auto *heading = std::get_if<Heading>(&kind))
    {
        std::ostringstream out;
        out << "Heading " << heading->level;
        return out.str();
    }
    if (const auto *quote = std::get_if<Blockquote>(&kind))
    {
        if (quote->depth > 1)
        {
            std::ostringstream out;
            out << "Block Quote (" << quote->depth << ')';
            return out.str();
        }
        return "Block Quote";
    }
    if (std::holds_alternative<HorizontalRule>(kind))
        return "Horizontal Rule";
    if (std::holds_alternative<UnorderedItem>(kind))
        return "Bullet List";
    if (const auto *ordered = std::get_if<OrderedItem>(&kind))
    {
        std::ostringstream out;
        out << "Numbered List " << ordered->number;
        return out.str();
    }
    if (const auto *task = std::get_if<ChecklistItem>(&kind))
        return task->checked ? "Task Item (done)" : "Task Item";
    if (std::holds_alternative<CodeFenceBoundary>(kind))
        return "Code Fence";
    if (std::holds_alternative<CodeFenceBody>(kind))
        return "Code";
    if (std::holds_alternative<TableHeader>(kind))
        return "Table Header";
    if (std::holds_alternative<TableSeparator>(kind))
        return "Table Alignments";
    if (std::holds_alternative<TableRow>(kind))
        return "Table Row";
    return "Paragraph";
}

} // namespace sn::markdown
