#include "sn/markdown/document.hpp"

namespace sn::markdown
{

std::vector<Line> splitLines(std::string_view text)
{
    std::vector<Line> lines;
    std::size_t offset = 0;
    int number = 1;
    while (true)
    {
        std::size_t end = text.find('\n', offset);
        Line line;
        line.number = number++;
        if (end == std::string_view::npos)
        {
            line.range = TextRange{offset, text.size()};
            line.next = text.size();
            if (!line.range.empty() && text[line.range.end - 1] == '\r')
                --line.range.end;
            lines.push_back(line);
            break;
        }
        line.range = TextRange{offset, end};
        line.next = end + 1;
        if (!line.range.empty() && text[end - 1] == '\r')
            --line.range.end;
        lines.push_back(line);
        offset = end + 1;
    }
    return lines;
}

std::optional<std::size_t> lineIndexAt(const std::vector<Line> &lines, std::size_t offset) noexcept
{
    if (lines.empty() || offset > lines.back().next)
        return std::nullopt;

    std::size_t low = 0;
    std::size_t high = lines.size();
    while (high - low > 1)
    {
        std::size_t mid = low + (high - low) / 2;
        if (lines[mid].range.start <= offset)
            low = mid;
        else
            high = mid;
    }
    return low;
}

} // namespace sn::markdown
