#include <gtest/gtest.h>

#include "sn/markdown/line_classifier.hpp"

#include <variant>

using namespace sn::markdown;

TEST(LineClassifier, DetectsHeadingLevels)
{
    auto heading = classifyLine("## Title");
    ASSERT_TRUE(std::holds_alternative<Heading>(heading.kind));
    EXPECT_EQ(std::get<Heading>(heading.kind).level, 2);
    EXPECT_EQ(heading.markerRange, (TextRange{0, 3}));
    EXPECT_EQ(heading.contentStart, 3u);

    auto bare = classifyLine("###");
    ASSERT_TRUE(std::holds_alternative<Heading>(bare.kind));
    EXPECT_EQ(std::get<Heading>(bare.kind).level, 3);
}

TEST(LineClassifier, RejectsMalformedHeadings)
{
    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("#hashtag").kind));
    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("####### seven").kind));
    EXPECT_FALSE(isHeading(classifyLine("  # indented").kind));
}

TEST(LineClassifier, DetectsBlockquoteDepth)
{
    auto quote = classifyLine("> > nested");
    ASSERT_TRUE(std::holds_alternative<Blockquote>(quote.kind));
    EXPECT_EQ(std::get<Blockquote>(quote.kind).depth, 2);
    EXPECT_EQ(quote.contentStart, 4u);
}

TEST(LineClassifier, DetectsHorizontalRules)
{
    EXPECT_TRUE(std::holds_alternative<HorizontalRule>(classifyLine("---").kind));
    EXPECT_TRUE(std::holds_alternative<HorizontalRule>(classifyLine("*****").kind));
    EXPECT_TRUE(std::holds_alternative<HorizontalRule>(classifyLine("___").kind));
    EXPECT_FALSE(std::holds_alternative<HorizontalRule>(classifyLine("--").kind));
    EXPECT_FALSE(std::holds_alternative<HorizontalRule>(classifyLine("-*-").kind));
}

TEST(LineClassifier, DetectsChecklistBeforeBullets)
{
    auto open = classifyLine("- [ ] buy milk");
    ASSERT_TRUE(std::holds_alternative<ChecklistItem>(open.kind));
    EXPECT_FALSE(std::get<ChecklistItem>(open.kind).checked);
    EXPECT_EQ(open.checkboxRange, (TextRange{2, 5}));
    EXPECT_EQ(open.markerRange, (TextRange{0, 6}));
    EXPECT_EQ(open.contentStart, 6u);

    auto done = classifyLine("  * [X] shipped");
    ASSERT_TRUE(std::holds_alternative<ChecklistItem>(done.kind));
    const auto &item = std::get<ChecklistItem>(done.kind);
    EXPECT_TRUE(item.checked);
    EXPECT_EQ(item.indent, 1);
    EXPECT_EQ(item.bullet, '*');
    EXPECT_EQ(done.checkboxRange, (TextRange{4, 7}));
}

TEST(LineClassifier, DetectsUnorderedItems)
{
    auto item = classifyLine("    + deep");
    ASSERT_TRUE(std::holds_alternative<UnorderedItem>(item.kind));
    EXPECT_EQ(std::get<UnorderedItem>(item.kind).indent, 2);
    EXPECT_EQ(std::get<UnorderedItem>(item.kind).bullet, '+');
    EXPECT_EQ(item.leadingSpaces, 4u);
    EXPECT_EQ(item.markerRange, (TextRange{4, 6}));
    EXPECT_EQ(item.indentRange(), (TextRange{0, 4}));

    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("-dash").kind));
}

TEST(LineClassifier, DetectsOrderedItems)
{
    auto item = classifyLine("12) twelve");
    ASSERT_TRUE(std::holds_alternative<OrderedItem>(item.kind));
    EXPECT_EQ(std::get<OrderedItem>(item.kind).number, 12);
    EXPECT_EQ(std::get<OrderedItem>(item.kind).delimiter, ')');
    EXPECT_EQ(item.markerRange, (TextRange{0, 4}));

    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("3.14 is pi").kind));
    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("99999999999999999999999. big").kind));
    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("9223372036854775807. max").kind));
    EXPECT_TRUE(std::holds_alternative<Paragraph>(classifyLine("1234567890. ten digits").kind));

    auto widest = classifyLine("999999999. nine digits");
    ASSERT_TRUE(std::holds_alternative<OrderedItem>(widest.kind));
    EXPECT_EQ(std::get<OrderedItem>(widest.kind).number, 999999999);
}

TEST(LineClassifier, RecognizesFencesAndTables)
{
    EXPECT_TRUE(isFenceLine("```cpp"));
    EXPECT_FALSE(isFenceLine(" ```"));
    EXPECT_TRUE(isPipeLine("| a | b |"));
    EXPECT_FALSE(isPipeLine("| a | b"));
    EXPECT_TRUE(isTableSeparatorLine("|---|:--:|"));
    EXPECT_TRUE(isTableSeparatorLine("--- | ---"));
    EXPECT_FALSE(isTableSeparatorLine("|---|"));
    EXPECT_FALSE(isTableSeparatorLine("| a | - |"));
}

TEST(LineClassifier, NamesBlockTypes)
{
    EXPECT_EQ(blockTypeName(Heading{3}), "Heading 3");
    EXPECT_EQ(blockTypeName(Blockquote{2}), "Block Quote (2)");
    EXPECT_EQ(blockTypeName(OrderedItem{4, 0, '.'}), "Numbered List 4");
    EXPECT_EQ(blockTypeName(ChecklistItem{true, 0, '-'}), "Task Item (done)");
    EXPECT_EQ(blockTypeName(TableSeparator{}), "Table Alignments");
    EXPECT_EQ(blockTypeName(Paragraph{}), "Paragraph");
}
