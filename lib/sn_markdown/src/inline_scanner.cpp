#include "sn/markdown/inline_scanner.hpp"

#include <algorithm>

namespace sn::markdown
{
namespace
{
bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

// Content of an emphasis run: non-empty, and neither end is whitespace or
// the delimiter itself. Interior delimiters are allowed.
bool isEmphasisContent(std::string_view content, char delimiter) noexcept
{
    if (content.empty())
        return false;
    auto edgeOk = [delimiter](char ch) { return !isWhitespace(ch) && ch != delimiter; };
    return edgeOk(content.front()) && edgeOk(content.back());
}

// A lone delimiter: not directly preceded or followed by the same character.
bool isSingleDelimiter(std::string_view text, std::size_t pos, char delimiter) noexcept
{
    if (text[pos] != delimiter)
        return false;
    if (pos > 0 && text[pos - 1] == delimiter)
        return false;
    return pos + 1 >= text.size() || text[pos + 1] != delimiter;
}

InlineSpan makeSpan(InlineSpanKind kind, std::size_t start, std::size_t end, std::size_t delimiter)
{
    InlineSpan span;
    span.kind = kind;
    span.range = TextRange{start, end};
    span.contentRange = TextRange{start + delimiter, end - delimiter};
    return span;
}

void collectCode(std::string_view text, std::vector<InlineSpan> &out)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '`')
        {
            ++i;
            continue;
        }
        std::size_t close = text.find('`', i + 1);
        if (close == std::string_view::npos)
            break;
        if (close == i + 1)
        {
            ++i;
            continue;
        }
        out.push_back(makeSpan(InlineSpanKind::Code, i, close + 1, 1));
        i = close + 1;
    }
}

// Parses "[text](url)" starting at the '[' at position open. Returns the
// offset one past ')' or npos.
std::size_t matchBracketAndUrl(std::string_view text, std::size_t open, bool allowEmptyText, InlineSpan &span)
{
    std::size_t closeBracket = text.find(']', open + 1);
    if (closeBracket == std::string_view::npos)
        return std::string_view::npos;
    if (!allowEmptyText && closeBracket == open + 1)
        return std::string_view::npos;
    if (closeBracket + 1 >= text.size() || text[closeBracket + 1] != '(')
        return std::string_view::npos;
    std::size_t urlStart = closeBracket + 2;
    std::size_t closeParen = text.find(')', urlStart);
    if (closeParen == std::string_view::npos || closeParen == urlStart)
        return std::string_view::npos;

    span.contentRange = TextRange{open + 1, closeBracket};
    span.urlRange = TextRange{urlStart, closeParen};
    return closeParen + 1;
}

void collectLinks(std::string_view text, InlineSpanKind kind, std::vector<InlineSpan> &out)
{
    bool image = kind == InlineSpanKind::Image;
    std::size_t i = 0;
    while (i < text.size())
    {
        std::size_t open = i;
        if (image)
        {
            if (text[i] != '!' || i + 1 >= text.size() || text[i + 1] != '[')
            {
                ++i;
                continue;
            }
            open = i + 1;
        }
        else if (text[i] != '[')
        {
            ++i;
            continue;
        }

        InlineSpan span;
        span.kind = kind;
        std::size_t end = matchBracketAndUrl(text, open, image, span);
        if (end == std::string_view::npos)
        {
            ++i;
            continue;
        }
        span.range = TextRange{i, end};
        out.push_back(span);
        i = end;
    }
}

// Closers are matched lazily: the first later pair that leaves valid
// content wins.
void collectStrong(std::string_view text, char delimiter, std::vector<InlineSpan> &out)
{
    std::size_t i = 0;
    while (i + 1 < text.size())
    {
        if (text[i] != delimiter || text[i + 1] != delimiter)
        {
            ++i;
            continue;
        }
        std::size_t close = std::string_view::npos;
        for (std::size_t j = i + 3; j + 1 < text.size(); ++j)
        {
            if (text[j] != delimiter || text[j + 1] != delimiter)
                continue;
            if (isEmphasisContent(text.substr(i + 2, j - i - 2), delimiter))
            {
                close = j;
                break;
            }
        }
        if (close == std::string_view::npos)
        {
            ++i;
            continue;
        }
        out.push_back(makeSpan(InlineSpanKind::Strong, i, close + 2, 2));
        i = close + 2;
    }
}

void collectEmphasis(std::string_view text, char delimiter, std::vector<InlineSpan> &out)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        if (!isSingleDelimiter(text, i, delimiter))
        {
            ++i;
            continue;
        }
        std::size_t close = std::string_view::npos;
        for (std::size_t j = i + 2; j < text.size(); ++j)
        {
            if (!isSingleDelimiter(text, j, delimiter))
                continue;
            if (isEmphasisContent(text.substr(i + 1, j - i - 1), delimiter))
            {
                close = j;
                break;
            }
        }
        if (close == std::string_view::npos)
        {
            ++i;
            continue;
        }
        out.push_back(makeSpan(InlineSpanKind::Emphasis, i, close + 1, 1));
        i = close + 1;
    }
}

void collectStrikethrough(std::string_view text, std::vector<InlineSpan> &out)
{
    std::size_t i = 0;
    while (i + 1 < text.size())
    {
        if (text[i] != '~' || text[i + 1] != '~')
        {
            ++i;
            continue;
        }
        std::size_t close = text.find("~~", i + 3);
        if (close == std::string_view::npos)
            break;
        out.push_back(makeSpan(InlineSpanKind::Strikethrough, i, close + 2, 2));
        i = close + 2;
    }
}

} // namespace

std::vector<InlineSpan> scanInline(std::string_view text)
{
    std::vector<InlineSpan> candidates;
    collectCode(text, candidates);
    collectLinks(text, InlineSpanKind::Image, candidates);
    collectLinks(text, InlineSpanKind::Link, candidates);
    collectStrong(text, '*', candidates);
    collectStrong(text, '_', candidates);
    collectEmphasis(text, '*', candidates);
    collectEmphasis(text, '_', candidates);
    collectStrikethrough(text, candidates);

    std::stable_sort(candidates.begin(), candidates.end(), [](const InlineSpan &a, const InlineSpan &b) {
        if (a.range.start != b.range.start)
            return a.range.start < b.range.start;
        if (a.range.length() != b.range.length())
            return a.range.length() > b.range.length();
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });

    std::vector<InlineSpan> spans;
    std::size_t claimedEnd = 0;
    for (const auto &candidate : candidates)
    {
        if (!spans.empty() && candidate.range.start < claimedEnd)
            continue;
        spans.push_back(candidate);
        claimedEnd = candidate.range.end;
    }
    return spans;
}

const InlineSpan *spanAtOffset(const std::vector<InlineSpan> &spans, std::size_t offset) noexcept
{
    for (const auto &span : spans)
    {
        if (span.range.contains(offset))
            return &span;
    }
    return nullptr;
}

std::string spanKindName(InlineSpanKind kind)
{
    switch (kind)
    {
    case InlineSpanKind::Code:
        return "Inline Code";
    case InlineSpanKind::Image:
        return "Image";
    case InlineSpanKind::Link:
        return "Link";
    case InlineSpanKind::Strong:
        return "Bold";
    case InlineSpanKind::Emphasis:
        return "Italic";
    case InlineSpanKind::Strikethrough:
        return "Strikethrough";
    }
    return "Text";
}

} // namespace sn::markdown
