#include "sn/markdown/engine.hpp"

#include "sn/markdown/region_detector.hpp"

namespace sn::markdown
{

MarkdownEngine::MarkdownEngine(EditorHost &host, EngineSettings settings)
    : host_(host), settings_(settings), scheduler_(settings.debounce)
{
}

void MarkdownEngine::setSettings(const EngineSettings &settings)
{
    settings_ = settings;
    scheduler_.setDebounce(settings.debounce);
    recompute();
}

RecomputeMode MarkdownEngine::onTextChanged(const std::string &newText, Clock::time_point now)
{
    if (textChanged_)
        textChanged_(newText);

    TextRange selection = host_.currentSelection();
    RecomputeMode mode = scheduler_.onTextChanged(newText, selection.end, now);
    if (mode == RecomputeMode::Immediate)
        recompute(newText, selection);
    return mode;
}

void MarkdownEngine::onSelectionChanged(TextRange selection)
{
    scheduler_.onSelectionChanged();
    recompute(host_.currentText(), selection);
}

bool MarkdownEngine::handleCommand(EditCommand command)
{
    std::string text = host_.currentText();
    CursorContext context{text, host_.currentSelection()};
    auto outcome = markdown::handleCommand(command, context, settings_.editSettings());
    if (!outcome)
        return false;
    applyOutcome(*outcome);
    return true;
}

std::optional<TextRange> MarkdownEngine::hitTestWidget(std::size_t offset) const
{
    for (const auto &decoration : decorations_)
    {
        const auto *widget = std::get_if<ReplaceWithWidget>(&decoration.action);
        if (widget == nullptr || widget->widget != WidgetKind::Checkbox)
            continue;
        if (decoration.range.contains(offset))
            return widget->state.toggleRange;
    }
    return std::nullopt;
}

bool MarkdownEngine::toggleCheckbox(TextRange range)
{
    std::string text = host_.currentText();
    auto outcome = markdown::toggleCheckbox(text, range, host_.currentSelection());
    if (!outcome)
        return false;

    applyOutcome(*outcome);
    if (checkboxToggled_)
    {
        std::vector<Line> lines = splitLines(outcome->text);
        auto index = lineIndexAt(lines, range.start);
        if (index)
            checkboxToggled_(lines[*index].number, outcome->insertion == "x");
    }
    return true;
}

bool MarkdownEngine::poll(Clock::time_point now)
{
    if (!scheduler_.poll(now))
        return false;
    recompute();
    return true;
}

void MarkdownEngine::recompute()
{
    recompute(host_.currentText(), host_.currentSelection());
}

void MarkdownEngine::recompute(std::string_view text, TextRange selection)
{
    DocumentStructure structure = analyzeDocument(text);
    activeRegion_ = settings_.revealActiveLine ? ActiveRegion::fromSelection(structure.lines, selection)
                                               : ActiveRegion();
    decorations_ = composeDecorations(text, structure, activeRegion_);
    host_.applyDecorations(decorations_);
}

void MarkdownEngine::applyOutcome(const EditOutcome &outcome)
{
    host_.replaceRange(outcome.replaced, outcome.insertion);
    host_.setSelection(outcome.selection);
    if (textChanged_)
        textChanged_(outcome.text);
    scheduler_.cancel();
    recompute(outcome.text, outcome.selection);
}

} // namespace sn::markdown
