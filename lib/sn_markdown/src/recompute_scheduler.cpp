#include "sn/markdown/recompute_scheduler.hpp"

#include "sn/markdown/document.hpp"
#include "sn/markdown/line_classifier.hpp"

#include <cctype>

namespace sn::markdown
{
namespace
{
bool startsWithCompletedPrefix(std::string_view line) noexcept
{
    std::size_t start = 0;
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t'))
        ++start;
    line.remove_prefix(start);
    if (line.empty())
        return false;

    if (line.front() == '#')
    {
        std::size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#')
            ++hashes;
        return hashes <= 6 && hashes < line.size() && line[hashes] == ' ';
    }
    if (line.front() == '-' || line.front() == '*' || line.front() == '+')
        return line.size() > 1 && line[1] == ' ';

    std::size_t digits = 0;
    while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits])))
        ++digits;
    return digits > 0 && digits + 1 < line.size() && (line[digits] == '.' || line[digits] == ')') &&
           line[digits + 1] == ' ';
}

} // namespace

RecomputeScheduler::RecomputeScheduler(std::chrono::milliseconds debounce) noexcept
{
    setDebounce(debounce);
}

RecomputeMode RecomputeScheduler::classifyEdit(std::string_view text, std::size_t cursor)
{
    std::vector<Line> lines = splitLines(text);
    auto index = lineIndexAt(lines, cursor);
    if (!index)
        return RecomputeMode::Debounced;

    std::string_view line = lineText(text, lines[*index]);
    LineClassification classification = classifyLine(line);
    if (isHeading(classification.kind) || isListItem(classification.kind))
        return RecomputeMode::Immediate;
    return startsWithCompletedPrefix(line) ? RecomputeMode::Immediate : RecomputeMode::Debounced;
}

RecomputeMode RecomputeScheduler::onTextChanged(std::string_view text, std::size_t cursor, Clock::time_point now)
{
    if (debounce_.count() == 0 || classifyEdit(text, cursor) == RecomputeMode::Immediate)
    {
        deadline_.reset();
        return RecomputeMode::Immediate;
    }
    deadline_ = now + debounce_;
    return RecomputeMode::Debounced;
}

RecomputeMode RecomputeScheduler::onSelectionChanged() noexcept
{
    deadline_.reset();
    return RecomputeMode::Immediate;
}

bool RecomputeScheduler::poll(Clock::time_point now) noexcept
{
    if (!deadline_ || now < *deadline_)
        return false;
    deadline_.reset();
    return true;
}

void RecomputeScheduler::cancel() noexcept
{
    deadline_.reset();
}

void RecomputeScheduler::setDebounce(std::chrono::milliseconds debounce) noexcept
{
    debounce_ = debounce.count() < 0 ? std::chrono::milliseconds(0) : debounce;
}

} // namespace sn::markdown
