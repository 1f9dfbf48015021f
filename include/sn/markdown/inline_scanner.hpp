#pragma once

#include "sn/markdown/document.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sn::markdown
{

enum class InlineSpanKind
{
    Code,
    Image,
    Link,
    Strong,
    Emphasis,
    Strikethrough
};

// Offsets are relative to the scanned text. range includes the delimiters,
// contentRange excludes them. urlRange is set for links and images only.
struct InlineSpan
{
    InlineSpanKind kind = InlineSpanKind::Code;
    TextRange range;
    TextRange contentRange;
    TextRange urlRange;

    bool operator==(const InlineSpan &other) const noexcept = default;
};

// Returns non-overlapping spans ordered by start offset. Overlapping
// candidates resolve to the leftmost start, then the longest match, then
// the pattern order of InlineSpanKind.
std::vector<InlineSpan> scanInline(std::string_view text);

const InlineSpan *spanAtOffset(const std::vector<InlineSpan> &spans, std::size_t offset) noexcept;
std::string spanKindName(InlineSpanKind kind);

} // namespace sn::markdown
