#pragma once

#include "sn/markdown/document.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sn::markdown
{

enum class EditCommand
{
    Enter,
    Tab,
    ShiftTab
};

struct CursorContext
{
    std::string_view text;
    TextRange selection;
};

// The host applies replaced -> insertion; text and selection describe the
// buffer once that is done.
struct EditOutcome
{
    TextRange replaced;
    std::string insertion;
    std::string text;
    TextRange selection;
};

struct EditSettings
{
    bool smartListContinuation = true;
    bool tabIndentsLists = true;
};

// std::nullopt means the command is not handled and the host should fall
// back to its default key behavior.
std::optional<EditOutcome> handleCommand(EditCommand command, const CursorContext &context,
                                         const EditSettings &settings = {});

std::optional<EditOutcome> continueList(const CursorContext &context);
std::optional<EditOutcome> indentListItem(const CursorContext &context, bool outdent);

// Flips "[ ]" to "[x]" and "[x]"/"[X]" back to "[ ]". The range must still
// be the checkbox of a task item. The selection is carried through as is.
std::optional<EditOutcome> toggleCheckbox(std::string_view text, TextRange range, TextRange selection = {});

} // namespace sn::markdown
