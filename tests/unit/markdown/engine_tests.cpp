#include <gtest/gtest.h>

#include "sn/markdown/engine.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace sn::markdown;
using namespace std::chrono_literals;

namespace
{

class FakeHost : public EditorHost
{
public:
    explicit FakeHost(std::string initial, TextRange selection = {}) : text(std::move(initial)), selection(selection)
    {
    }

    std::string currentText() const override { return text; }
    TextRange currentSelection() const override { return selection; }

    void replaceRange(TextRange range, std::string_view replacement) override
    {
        text.replace(range.start, range.length(), replacement);
    }

    void setSelection(TextRange range) override { selection = range; }

    void applyDecorations(const DecorationList &decorations) override
    {
        applied.push_back(decorations);
    }

    std::string text;
    TextRange selection;
    std::vector<DecorationList> applied;
};

MarkdownEngine::Clock::time_point at(std::chrono::milliseconds offset)
{
    return MarkdownEngine::Clock::time_point{} + offset;
}

} // namespace

TEST(MarkdownEngine, SelectionChangeRecomputesAtOnce)
{
    FakeHost host("# Title\nbody");
    MarkdownEngine engine(host);

    engine.onSelectionChanged(TextRange{0, 0});
    ASSERT_EQ(host.applied.size(), 1u);
    EXPECT_EQ(engine.activeRegion(), ActiveRegion(1, 1));
    ASSERT_EQ(engine.decorations().size(), 2u);
    EXPECT_EQ(engine.decorations()[1].action, DecorationAction(Mark{StyleTag::HeadingMark}));

    engine.onSelectionChanged(TextRange{9, 9});
    ASSERT_EQ(host.applied.size(), 2u);
    EXPECT_EQ(engine.decorations()[1].action, DecorationAction(Hide{}));
}

TEST(MarkdownEngine, PlainTypingWaitsForDebounce)
{
    FakeHost host("hello", TextRange{5, 5});
    MarkdownEngine engine(host);
    std::vector<std::string> forwarded;
    engine.setTextChangedCallback([&](const std::string &text) { forwarded.push_back(text); });

    EXPECT_EQ(engine.onTextChanged("hello", at(0ms)), RecomputeMode::Debounced);
    EXPECT_TRUE(host.applied.empty());
    EXPECT_TRUE(engine.recomputePending());
    ASSERT_EQ(forwarded.size(), 1u);

    EXPECT_FALSE(engine.poll(at(10ms)));
    EXPECT_TRUE(engine.poll(at(60ms)));
    EXPECT_EQ(host.applied.size(), 1u);
    EXPECT_FALSE(engine.poll(at(200ms)));
}

TEST(MarkdownEngine, ListEditsRecomputeImmediately)
{
    FakeHost host("- it", TextRange{4, 4});
    MarkdownEngine engine(host);
    EXPECT_EQ(engine.onTextChanged(host.text, at(0ms)), RecomputeMode::Immediate);
    EXPECT_EQ(host.applied.size(), 1u);
    EXPECT_FALSE(engine.recomputePending());
}

TEST(MarkdownEngine, EnterContinuesListThroughHost)
{
    FakeHost host("- a", TextRange{3, 3});
    MarkdownEngine engine(host);
    std::string lastForwarded;
    engine.setTextChangedCallback([&](const std::string &text) { lastForwarded = text; });

    EXPECT_TRUE(engine.handleCommand(EditCommand::Enter));
    EXPECT_EQ(host.text, "- a\n- ");
    EXPECT_EQ(host.selection, (TextRange{6, 6}));
    EXPECT_EQ(lastForwarded, host.text);
    EXPECT_EQ(host.applied.size(), 1u);
    EXPECT_EQ(engine.activeRegion(), ActiveRegion(2, 2));
}

TEST(MarkdownEngine, UnhandledCommandLeavesHostAlone)
{
    FakeHost host("plain", TextRange{5, 5});
    MarkdownEngine engine(host);
    EXPECT_FALSE(engine.handleCommand(EditCommand::Enter));
    EXPECT_FALSE(engine.handleCommand(EditCommand::Tab));
    EXPECT_EQ(host.text, "plain");
    EXPECT_TRUE(host.applied.empty());
}

TEST(MarkdownEngine, ClickingCheckboxTogglesIt)
{
    FakeHost host("- [ ] task\nnext", TextRange{12, 12});
    MarkdownEngine engine(host);
    std::vector<std::pair<int, bool>> toggles;
    engine.setCheckboxToggledCallback([&](int line, bool checked) { toggles.emplace_back(line, checked); });
    engine.recompute();

    auto range = engine.hitTestWidget(1);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(*range, (TextRange{2, 5}));
    EXPECT_FALSE(engine.hitTestWidget(8).has_value());

    EXPECT_TRUE(engine.toggleCheckbox(*range));
    EXPECT_EQ(host.text, "- [x] task\nnext");
    EXPECT_EQ(host.selection, (TextRange{12, 12}));
    ASSERT_EQ(toggles.size(), 1u);
    EXPECT_EQ(toggles[0], std::make_pair(1, true));

    EXPECT_TRUE(engine.toggleCheckbox(*range));
    EXPECT_EQ(host.text, "- [ ] task\nnext");
    EXPECT_EQ(toggles.back(), std::make_pair(1, false));

    EXPECT_FALSE(engine.toggleCheckbox(TextRange{11, 14}));
}

TEST(MarkdownEngine, HiddenSyntaxWhenRevealIsOff)
{
    FakeHost host("**b**");
    EngineSettings settings;
    settings.revealActiveLine = false;
    MarkdownEngine engine(host, settings);
    engine.onSelectionChanged(TextRange{1, 1});
    EXPECT_TRUE(engine.activeRegion().empty());
    ASSERT_EQ(engine.decorations().size(), 3u);
    EXPECT_EQ(engine.decorations()[0].action, DecorationAction(Hide{}));
}

TEST(MarkdownEngine, SettingsChangeRecomputes)
{
    FakeHost host("text", TextRange{4, 4});
    MarkdownEngine engine(host);
    EngineSettings settings;
    settings.debounce = 0ms;
    engine.setSettings(settings);
    EXPECT_EQ(host.applied.size(), 1u);
    EXPECT_EQ(engine.onTextChanged("text", at(0ms)), RecomputeMode::Immediate);
    EXPECT_EQ(host.applied.size(), 2u);
}
