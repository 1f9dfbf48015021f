#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace sn::markdown
{

enum class RecomputeMode
{
    Immediate,
    Debounced
};

// Single outstanding debounce timer. A new edit replaces any pending
// deadline; the host polls from its idle loop.
class RecomputeScheduler
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultDebounce{50};

    explicit RecomputeScheduler(std::chrono::milliseconds debounce = kDefaultDebounce) noexcept;

    // Immediate when the cursor line is a heading or list item, or when its
    // text starts with a just completed heading or list prefix.
    static RecomputeMode classifyEdit(std::string_view text, std::size_t cursor);

    RecomputeMode onTextChanged(std::string_view text, std::size_t cursor, Clock::time_point now);
    RecomputeMode onSelectionChanged() noexcept;

    // True exactly once when the pending deadline has passed.
    bool poll(Clock::time_point now) noexcept;
    void cancel() noexcept;

    bool pending() const noexcept { return deadline_.has_value(); }
    std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    std::chrono::milliseconds debounce() const noexcept { return debounce_; }
    void setDebounce(std::chrono::milliseconds debounce) noexcept;

private:
    std::chrono::milliseconds debounce_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace sn::markdown
