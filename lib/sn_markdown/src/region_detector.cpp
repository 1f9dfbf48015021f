#include "sn/markdown/region_detector.hpp"

namespace sn::markdown
{
namespace
{
enum class TableRole
{
    None,
    Pending,
    Header,
    Separator,
    Row
};

LineClassification contextual(BlockKind kind)
{
    LineClassification classification;
    classification.kind = kind;
    return classification;
}

} // namespace

DocumentStructure analyzeDocument(std::string_view text)
{
    DocumentStructure structure;
    structure.lines = splitLines(text);
    structure.classifications.reserve(structure.lines.size());

    std::vector<TableRole> roles(structure.lines.size(), TableRole::None);
    bool inFence = false;
    TableRole previous = TableRole::None;

    for (std::size_t i = 0; i < structure.lines.size(); ++i)
    {
        std::string_view line = lineText(text, structure.lines[i]);

        if (isFenceLine(line))
        {
            inFence = !inFence;
            LineClassification boundary = contextual(CodeFenceBoundary{});
            boundary.markerRange = TextRange{0, 3};
            boundary.contentStart = 3;
            structure.classifications.push_back(boundary);
            previous = TableRole::None;
            continue;
        }
        if (inFence)
        {
            structure.classifications.push_back(contextual(CodeFenceBody{}));
            continue;
        }

        structure.classifications.push_back(classifyLine(line));

        TableRole role = TableRole::None;
        bool separator = isTableSeparatorLine(line);
        if (separator && (previous == TableRole::Pending || previous == TableRole::Row))
        {
            roles[i - 1] = TableRole::Header;
            role = TableRole::Separator;
        }
        else if (separator || isPipeLine(line))
        {
            role = (previous == TableRole::Separator || previous == TableRole::Row) ? TableRole::Row
                                                                                    : TableRole::Pending;
        }
        roles[i] = role;
        previous = role;
    }

    for (std::size_t i = 0; i < roles.size(); ++i)
    {
        switch (roles[i])
        {
        case TableRole::Header:
            structure.classifications[i] = contextual(TableHeader{});
            break;
        case TableRole::Separator:
            structure.classifications[i] = contextual(TableSeparator{});
            break;
        case TableRole::Row:
            structure.classifications[i] = contextual(TableRow{});
            break;
        case TableRole::Pending:
            structure.classifications[i] = contextual(Paragraph{});
            break;
        case TableRole::None:
            break;
        }
    }
    return structure;
}

} // namespace sn::markdown
