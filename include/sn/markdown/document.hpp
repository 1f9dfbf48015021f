#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace sn::markdown
{

struct TextRange
{
    std::size_t start = 0;
    std::size_t end = 0;

    bool empty() const noexcept { return end <= start; }
    std::size_t length() const noexcept { return empty() ? 0 : end - start; }
    bool contains(std::size_t offset) const noexcept { return offset >= start && offset < end; }
    bool intersects(const TextRange &other) const noexcept { return start < other.end && other.start < end; }

    TextRange shifted(std::size_t offset) const noexcept { return TextRange{start + offset, end + offset}; }

    bool operator==(const TextRange &other) const noexcept = default;
};

struct Line
{
    int number = 0;
    TextRange range;
    // Offset one past the line break, or range.end for the last line.
    std::size_t next = 0;
};

// Splits on '\n'. A trailing '\r' is kept out of the line range. A document
// ending in a line break has a final empty line; an empty document has one.
std::vector<Line> splitLines(std::string_view text);

std::optional<std::size_t> lineIndexAt(const std::vector<Line> &lines, std::size_t offset) noexcept;

inline std::string_view lineText(std::string_view text, const Line &line)
{
    return text.substr(line.range.start, line.range.length());
}

} // namespace sn::markdown
