#include "sn/edit/decoration_dump.hpp"

#include "sn/markdown/decoration_composer.hpp"
#include "sn/markdown/region_detector.hpp"

namespace sn::edit
{

nlohmann::json decorationToJson(std::string_view text, const sn::markdown::Decoration &decoration)
{
    using namespace sn::markdown;

    nlohmann::json out = nlohmann::json::object();
    out["start"] = decoration.range.start;
    out["end"] = decoration.range.end;
    out["action"] = actionName(decoration.action);
    if (decoration.range.end <= text.size())
        out["text"] = std::string(text.substr(decoration.range.start, decoration.range.length()));

    if (const auto *mark = std::get_if<Mark>(&decoration.action))
        out["style"] = styleTagName(mark->style);
    else if (const auto *line = std::get_if<LineStyle>(&decoration.action))
        out["style"] = styleTagName(line->style);
    else if (const auto *widget = std::get_if<ReplaceWithWidget>(&decoration.action))
    {
        out["widget"] = widgetKindName(widget->widget);
        out["line"] = widget->state.lineNumber;
        out["indent"] = widget->state.indentLevel;
        if (widget->widget == WidgetKind::Checkbox)
        {
            out["checked"] = widget->state.checked;
            out["toggle"] = nlohmann::json::array({widget->state.toggleRange.start, widget->state.toggleRange.end});
        }
    }
    return out;
}

nlohmann::json dumpDocument(std::string_view text, std::optional<std::size_t> cursor,
                            const sn::markdown::EngineSettings &settings)
{
    using namespace sn::markdown;

    DocumentStructure structure = analyzeDocument(text);
    ActiveRegion active;
    if (cursor && settings.revealActiveLine)
        active = ActiveRegion::fromSelection(structure.lines, TextRange{*cursor, *cursor});

    nlohmann::json out = nlohmann::json::object();
    nlohmann::json lines = nlohmann::json::array();
    for (std::size_t i = 0; i < structure.lines.size(); ++i)
    {
        const auto &classification = structure.classifications[i];
        lines.push_back({{"number", structure.lines[i].number},
                         {"block", blockTypeName(classification.kind)},
                         {"indent", classification.indentLevel}});
    }
    out["lines"] = std::move(lines);

    if (active.empty())
        out["active"] = nullptr;
    else
        out["active"] = nlohmann::json::array({active.firstLine(), active.lastLine()});

    nlohmann::json decorations = nlohmann::json::array();
    for (const auto &decoration : composeDecorations(text, structure, active))
        decorations.push_back(decorationToJson(text, decoration));
    out["decorations"] = std::move(decorations);
    return out;
}

} // namespace sn::edit
