#pragma once

#include "sn/markdown/document.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace sn::markdown
{

struct Paragraph
{
};

struct Heading
{
    int level = 1;
};

struct Blockquote
{
    int depth = 1;
};

struct HorizontalRule
{
};

struct UnorderedItem
{
    int indent = 0;
    char bullet = '-';
};

struct OrderedItem
{
    long number = 0;
    int indent = 0;
    char delimiter = '.';
};

struct ChecklistItem
{
    bool checked = false;
    int indent = 0;
    char bullet = '-';
};

struct CodeFenceBoundary
{
};

struct CodeFenceBody
{
};

struct TableHeader
{
};

struct TableSeparator
{
};

struct TableRow
{
};

using BlockKind = std::variant<Paragraph, Heading, Blockquote, HorizontalRule, UnorderedItem, OrderedItem,
                               ChecklistItem, CodeFenceBoundary, CodeFenceBody, TableHeader, TableSeparator,
                               TableRow>;

// All ranges are relative to the start of the classified line.
struct LineClassification
{
    BlockKind kind;
    int indentLevel = 0;
    std::size_t leadingSpaces = 0;
    TextRange markerRange;
    std::size_t contentStart = 0;
    TextRange checkboxRange;

    TextRange indentRange() const noexcept { return TextRange{0, leadingSpaces}; }
};

LineClassification classifyLine(std::string_view line);

bool isFenceLine(std::string_view line) noexcept;
bool isPipeLine(std::string_view line) noexcept;
bool isTableSeparatorLine(std::string_view line) noexcept;

bool isHeading(const BlockKind &kind) noexcept;
bool isListItem(const BlockKind &kind) noexcept;
bool isCodeFence(const BlockKind &kind) noexcept;
bool isTableLine(const BlockKind &kind) noexcept;
std::string blockTypeName(const BlockKind &kind);

} // namespace sn::markdown
