#include <gtest/gtest.h>

#include "sn/markdown/region_detector.hpp"

#include <variant>

using namespace sn::markdown;

namespace
{

template <typename Kind>
bool lineIs(const DocumentStructure &structure, std::size_t index)
{
    return std::holds_alternative<Kind>(structure.classifications.at(index).kind);
}

} // namespace

TEST(Document, SplitsLinesWithOffsets)
{
    auto lines = splitLines("ab\r\ncd\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].range, (TextRange{0, 2}));
    EXPECT_EQ(lines[0].next, 4u);
    EXPECT_EQ(lines[1].range, (TextRange{4, 6}));
    EXPECT_EQ(lines[1].number, 2);
    EXPECT_EQ(lines[2].range, (TextRange{7, 7}));

    EXPECT_EQ(splitLines("").size(), 1u);
}

TEST(Document, LocatesLineForOffset)
{
    auto lines = splitLines("ab\ncd");
    EXPECT_EQ(lineIndexAt(lines, 0), std::optional<std::size_t>(0));
    EXPECT_EQ(lineIndexAt(lines, 2), std::optional<std::size_t>(0));
    EXPECT_EQ(lineIndexAt(lines, 3), std::optional<std::size_t>(1));
    EXPECT_EQ(lineIndexAt(lines, 5), std::optional<std::size_t>(1));
    EXPECT_EQ(lineIndexAt(lines, 6), std::nullopt);
}

TEST(RegionDetector, MarksFenceInteriorAsCode)
{
    auto structure = analyzeDocument("# Title\n```\n# not a heading\n- nor a list\n```\n- item");
    ASSERT_EQ(structure.classifications.size(), 6u);
    EXPECT_TRUE(lineIs<Heading>(structure, 0));
    EXPECT_TRUE(lineIs<CodeFenceBoundary>(structure, 1));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 2));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 3));
    EXPECT_TRUE(lineIs<CodeFenceBoundary>(structure, 4));
    EXPECT_TRUE(lineIs<UnorderedItem>(structure, 5));
}

TEST(RegionDetector, UnclosedFenceRunsToEnd)
{
    auto structure = analyzeDocument("```python\nx = 1\n\n| a | b |");
    EXPECT_TRUE(lineIs<CodeFenceBoundary>(structure, 0));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 1));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 2));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 3));
}

TEST(RegionDetector, PromotesHeaderAboveSeparator)
{
    auto structure = analyzeDocument("| a | b |\n|---|---|\n| 1 | 2 |\n| 3 | 4 |\ntext");
    EXPECT_TRUE(lineIs<TableHeader>(structure, 0));
    EXPECT_TRUE(lineIs<TableSeparator>(structure, 1));
    EXPECT_TRUE(lineIs<TableRow>(structure, 2));
    EXPECT_TRUE(lineIs<TableRow>(structure, 3));
    EXPECT_TRUE(lineIs<Paragraph>(structure, 4));
}

TEST(RegionDetector, PipeLinesWithoutSeparatorStayParagraphs)
{
    auto structure = analyzeDocument("| just | pipes |\n| more | pipes |");
    EXPECT_TRUE(lineIs<Paragraph>(structure, 0));
    EXPECT_TRUE(lineIs<Paragraph>(structure, 1));
}

TEST(RegionDetector, FenceEndsTableContext)
{
    auto structure = analyzeDocument("| a |\n```\n|---|---|");
    EXPECT_TRUE(lineIs<Paragraph>(structure, 0));
    EXPECT_TRUE(lineIs<CodeFenceBoundary>(structure, 1));
    EXPECT_TRUE(lineIs<CodeFenceBody>(structure, 2));
}
