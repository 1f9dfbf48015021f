#pragma once

#include "sn/markdown/decoration.hpp"
#include "sn/markdown/region_detector.hpp"

#include <string_view>
#include <vector>

namespace sn::markdown
{

// Inclusive range of 1-based line numbers touched by the selection.
class ActiveRegion
{
public:
    ActiveRegion() = default;
    ActiveRegion(int firstLine, int lastLine) noexcept;

    static ActiveRegion fromSelection(const std::vector<Line> &lines, TextRange selection) noexcept;

    bool empty() const noexcept { return lastLine_ < firstLine_; }
    bool contains(int lineNumber) const noexcept { return lineNumber >= firstLine_ && lineNumber <= lastLine_; }
    int firstLine() const noexcept { return firstLine_; }
    int lastLine() const noexcept { return lastLine_; }

    bool operator==(const ActiveRegion &other) const noexcept = default;

private:
    int firstLine_ = 1;
    int lastLine_ = 0;
};

// Ordered by start offset. Non-LineStyle decorations never overlap and
// zero-length decorations are never produced.
DecorationList composeDecorations(std::string_view text, const DocumentStructure &structure,
                                  const ActiveRegion &active);
DecorationList buildDecorations(std::string_view text, const ActiveRegion &active);

} // namespace sn::markdown
