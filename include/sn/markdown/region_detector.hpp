#pragma once

#include "sn/markdown/document.hpp"
#include "sn/markdown/line_classifier.hpp"

#include <string_view>
#include <vector>

namespace sn::markdown
{

// One classification per line, with code fence and table context applied
// on top of the per-line classifier.
struct DocumentStructure
{
    std::vector<Line> lines;
    std::vector<LineClassification> classifications;
};

DocumentStructure analyzeDocument(std::string_view text);

} // namespace sn::markdown
