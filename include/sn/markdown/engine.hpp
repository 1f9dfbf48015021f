#pragma once

#include "sn/markdown/decoration.hpp"
#include "sn/markdown/decoration_composer.hpp"
#include "sn/markdown/edit_behavior.hpp"
#include "sn/markdown/recompute_scheduler.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sn::markdown
{

struct EngineSettings
{
    std::chrono::milliseconds debounce = RecomputeScheduler::kDefaultDebounce;
    bool smartListContinuation = true;
    bool tabIndentsLists = true;
    bool revealActiveLine = true;

    EditSettings editSettings() const noexcept { return EditSettings{smartListContinuation, tabIndentsLists}; }
};

// The text surface the engine decorates. The engine only reads snapshots
// and never keeps the host's text between calls.
class EditorHost
{
public:
    virtual ~EditorHost() = default;

    virtual std::string currentText() const = 0;
    virtual TextRange currentSelection() const = 0;
    virtual void replaceRange(TextRange range, std::string_view text) = 0;
    virtual void setSelection(TextRange range) = 0;
    // Called once per pass with the complete decoration set.
    virtual void applyDecorations(const DecorationList &decorations) = 0;
};

class MarkdownEngine
{
public:
    using Clock = RecomputeScheduler::Clock;
    using TextChangedCallback = std::function<void(const std::string &)>;
    using CheckboxToggledCallback = std::function<void(int lineNumber, bool checked)>;

    explicit MarkdownEngine(EditorHost &host, EngineSettings settings = {});

    RecomputeMode onTextChanged(const std::string &newText, Clock::time_point now);
    void onSelectionChanged(TextRange selection);

    // Applies the outcome through the host and recomputes at once. Returns
    // false when the host should run its default key behavior.
    bool handleCommand(EditCommand command);

    // Toggle range of the checkbox widget covering offset in the last pass.
    std::optional<TextRange> hitTestWidget(std::size_t offset) const;
    bool toggleCheckbox(TextRange range);

    bool poll(Clock::time_point now);
    void recompute();

    const DecorationList &decorations() const noexcept { return decorations_; }
    const ActiveRegion &activeRegion() const noexcept { return activeRegion_; }
    bool recomputePending() const noexcept { return scheduler_.pending(); }

    const EngineSettings &settings() const noexcept { return settings_; }
    void setSettings(const EngineSettings &settings);

    void setTextChangedCallback(TextChangedCallback callback) { textChanged_ = std::move(callback); }
    void setCheckboxToggledCallback(CheckboxToggledCallback callback) { checkboxToggled_ = std::move(callback); }

private:
    void recompute(std::string_view text, TextRange selection);
    void applyOutcome(const EditOutcome &outcome);

    EditorHost &host_;
    EngineSettings settings_;
    RecomputeScheduler scheduler_;
    DecorationList decorations_;
    ActiveRegion activeRegion_;
    TextChangedCallback textChanged_;
    CheckboxToggledCallback checkboxToggled_;
};

} // namespace sn::markdown
