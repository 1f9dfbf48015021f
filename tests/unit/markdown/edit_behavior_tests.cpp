#include <gtest/gtest.h>

#include "sn/markdown/edit_behavior.hpp"

#include <string>

using namespace sn::markdown;

namespace
{

CursorContext caretAt(std::string_view text, std::size_t offset)
{
    return CursorContext{text, TextRange{offset, offset}};
}

} // namespace

TEST(EditBehavior, ContinuesChecklistOnEnter)
{
    const std::string text = "- [ ] buy milk\n";
    auto outcome = handleCommand(EditCommand::Enter, caretAt(text, 14));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "- [ ] buy milk\n- [ ] ");
    EXPECT_EQ(outcome->selection, (TextRange{21, 21}));
    EXPECT_EQ(outcome->replaced, (TextRange{14, 15}));
    EXPECT_EQ(outcome->insertion, "\n- [ ] ");
}

TEST(EditBehavior, ContinuedChecklistStartsUnchecked)
{
    const std::string text = "  * [x] done";
    auto outcome = continueList(caretAt(text, text.size()));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "  * [x] done\n  * [ ] ");
}

TEST(EditBehavior, EmptyItemEndsTheList)
{
    const std::string text = "- \n";
    auto outcome = handleCommand(EditCommand::Enter, caretAt(text, 2));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "");
    EXPECT_EQ(outcome->selection, (TextRange{0, 0}));
}

TEST(EditBehavior, EmptyItemInsideDocumentKeepsFollowingText)
{
    const std::string text = "- a\n- \nmore";
    auto outcome = continueList(caretAt(text, 6));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "- a\n\nmore");
    EXPECT_EQ(outcome->selection, (TextRange{4, 4}));
}

TEST(EditBehavior, IncrementsOrderedMarkers)
{
    const std::string text = "3. third\n";
    auto outcome = continueList(caretAt(text, 8));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "3. third\n4. ");

    const std::string paren = "9) nine";
    auto parenOutcome = continueList(caretAt(paren, paren.size()));
    ASSERT_TRUE(parenOutcome.has_value());
    EXPECT_EQ(parenOutcome->text, "9) nine\n10) ");
    EXPECT_EQ(parenOutcome->selection, (TextRange{12, 12}));
}

TEST(EditBehavior, OrderedNumbersStayWithinRange)
{
    const std::string widest = "999999999. x";
    auto outcome = continueList(caretAt(widest, widest.size()));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "999999999. x\n1000000000. ");

    const std::string huge = "9223372036854775807. x";
    EXPECT_FALSE(continueList(caretAt(huge, huge.size())).has_value());
}

TEST(EditBehavior, SplitsItemAtCursor)
{
    const std::string text = "- abc";
    auto outcome = continueList(caretAt(text, 3));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "- a\n- bc");
    EXPECT_EQ(outcome->selection, (TextRange{6, 6}));
}

TEST(EditBehavior, LeavesNonListEnterToHost)
{
    EXPECT_FALSE(continueList(caretAt("plain text", 5)).has_value());
    EXPECT_FALSE(continueList(caretAt("- abc", 1)).has_value());
    EXPECT_FALSE(continueList(CursorContext{"- abc", TextRange{2, 4}}).has_value());
    EXPECT_FALSE(continueList(caretAt("- abc", 99)).has_value());

    const std::string fenced = "```\n- a\n```";
    EXPECT_FALSE(continueList(caretAt(fenced, 7)).has_value());
}

TEST(EditBehavior, SettingsDisableCommands)
{
    EditSettings settings;
    settings.smartListContinuation = false;
    settings.tabIndentsLists = false;
    EXPECT_FALSE(handleCommand(EditCommand::Enter, caretAt("- a", 3), settings).has_value());
    EXPECT_FALSE(handleCommand(EditCommand::Tab, caretAt("- a", 3), settings).has_value());
    EXPECT_FALSE(handleCommand(EditCommand::ShiftTab, caretAt("  - a", 5), settings).has_value());
}

TEST(EditBehavior, TabIndentsListItem)
{
    const std::string text = "x\n- a";
    auto outcome = handleCommand(EditCommand::Tab, caretAt(text, 5));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, "x\n  - a");
    EXPECT_EQ(outcome->replaced, (TextRange{2, 2}));
    EXPECT_EQ(outcome->selection, (TextRange{7, 7}));

    EXPECT_FALSE(handleCommand(EditCommand::Tab, caretAt(text, 1)).has_value());
}

TEST(EditBehavior, ShiftTabOutdentsListItem)
{
    const std::string text = "   - a";
    auto outcome = handleCommand(EditCommand::ShiftTab, caretAt(text, 6));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->text, " - a");
    EXPECT_EQ(outcome->selection, (TextRange{4, 4}));

    auto clamped = handleCommand(EditCommand::ShiftTab, caretAt(text, 1));
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(clamped->selection, (TextRange{0, 0}));

    EXPECT_FALSE(handleCommand(EditCommand::ShiftTab, caretAt("- a", 3)).has_value());
}

TEST(EditBehavior, TogglesCheckboxBothWays)
{
    const std::string text = "- [ ] task";
    auto checked = toggleCheckbox(text, TextRange{2, 5});
    ASSERT_TRUE(checked.has_value());
    EXPECT_EQ(checked->text, "- [x] task");
    EXPECT_EQ(checked->replaced, (TextRange{3, 4}));
    EXPECT_EQ(checked->insertion, "x");

    auto restored = toggleCheckbox(checked->text, TextRange{2, 5});
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->text, text);
}

TEST(EditBehavior, RejectsStaleCheckboxRanges)
{
    EXPECT_FALSE(toggleCheckbox("- [ ] task", TextRange{1, 4}).has_value());
    EXPECT_FALSE(toggleCheckbox("- [ ] task", TextRange{2, 4}).has_value());
    EXPECT_FALSE(toggleCheckbox("plain [ ] text", TextRange{6, 9}).has_value());
    EXPECT_FALSE(toggleCheckbox("- [ ]", TextRange{40, 43}).has_value());
}
