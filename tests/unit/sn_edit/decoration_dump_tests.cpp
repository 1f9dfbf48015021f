#include <gtest/gtest.h>

#include "sn/edit/decoration_dump.hpp"

#include <string>

using sn::edit::decorationToJson;
using sn::edit::dumpDocument;

TEST(DecorationDump, ListsBlocksPerLine)
{
    auto json = dumpDocument("# Title\n- [ ] task", std::nullopt, {});
    ASSERT_EQ(json["lines"].size(), 2u);
    EXPECT_EQ(json["lines"][0]["block"], "Heading 1");
    EXPECT_EQ(json["lines"][1]["block"], "Task Item");
    EXPECT_EQ(json["lines"][1]["number"], 2);
    EXPECT_TRUE(json["active"].is_null());
}

TEST(DecorationDump, DescribesCheckboxWidgets)
{
    auto json = dumpDocument("- [x] done", std::nullopt, {});
    const auto &decorations = json["decorations"];
    ASSERT_EQ(decorations.size(), 2u);
    EXPECT_EQ(decorations[0]["action"], "line");
    EXPECT_EQ(decorations[0]["style"], "task-done");

    const auto &widget = decorations[1];
    EXPECT_EQ(widget["action"], "widget");
    EXPECT_EQ(widget["widget"], "checkbox");
    EXPECT_EQ(widget["checked"], true);
    EXPECT_EQ(widget["text"], "- [x] ");
    EXPECT_EQ(widget["toggle"], nlohmann::json::array({2, 5}));
}

TEST(DecorationDump, CursorRevealsItsLine)
{
    auto json = dumpDocument("a\n**b**", 3, {});
    EXPECT_EQ(json["active"], nlohmann::json::array({2, 2}));
    ASSERT_EQ(json["decorations"].size(), 3u);
    EXPECT_EQ(json["decorations"][0]["action"], "mark");
    EXPECT_EQ(json["decorations"][0]["style"], "syntax");
    EXPECT_EQ(json["decorations"][1]["style"], "strong");
    EXPECT_EQ(json["decorations"][1]["text"], "b");
}

TEST(DecorationDump, RevealCanBeSwitchedOff)
{
    sn::markdown::EngineSettings settings;
    settings.revealActiveLine = false;
    auto json = dumpDocument("**b**", 0, settings);
    EXPECT_TRUE(json["active"].is_null());
    EXPECT_EQ(json["decorations"][0]["action"], "hide");
}

TEST(DecorationDump, OmitsTextForStaleRanges)
{
    sn::markdown::Decoration decoration{sn::markdown::TextRange{4, 9}, sn::markdown::Hide{}};
    auto json = decorationToJson("abc", decoration);
    EXPECT_EQ(json["start"], 4);
    EXPECT_FALSE(json.contains("text"));
}
