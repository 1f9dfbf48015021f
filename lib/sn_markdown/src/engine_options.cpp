#include "sn/markdown/engine_options.hpp"

#include <algorithm>

namespace sn::markdown
{

void registerEngineOptions(config::OptionRegistry &registry)
{
    using config::OptionDefinition;
    using config::OptionKind;
    using config::OptionValue;

    OptionDefinition debounce{kOptionDebounceMilliseconds,
                              OptionKind::Integer,
                              OptionValue(static_cast<std::int64_t>(RecomputeScheduler::kDefaultDebounce.count())),
                              "Formatting delay (ms)",
                              "Delay before plain-text edits are re-formatted. Headings and list items always update at once."};
    debounce.minimum = 0;
    debounce.maximum = 5000;
    registry.registerOption(debounce);

    registry.registerOption({kOptionSmartListContinuation,
                             OptionKind::Boolean,
                             OptionValue(true),
                             "Continue lists on Enter",
                             "Enter in a list item starts the next item; Enter on an empty item ends the list."});
    registry.registerOption({kOptionTabIndentsLists,
                             OptionKind::Boolean,
                             OptionValue(true),
                             "Tab indents list items",
                             "Tab and Shift-Tab change the nesting of the list item under the cursor."});
    registry.registerOption({kOptionRevealActiveLine,
                             OptionKind::Boolean,
                             OptionValue(true),
                             "Reveal syntax on cursor line",
                             "Show raw Markdown syntax on the lines touched by the selection."});
}

EngineSettings engineSettingsFrom(const config::OptionRegistry &registry)
{
    EngineSettings settings;
    std::int64_t debounce = registry.getInteger(kOptionDebounceMilliseconds, settings.debounce.count());
    settings.debounce = std::chrono::milliseconds(std::max<std::int64_t>(0, debounce));
    settings.smartListContinuation = registry.getBool(kOptionSmartListContinuation, true);
    settings.tabIndentsLists = registry.getBool(kOptionTabIndentsLists, true);
    settings.revealActiveLine = registry.getBool(kOptionRevealActiveLine, true);
    return settings;
}

} // namespace sn::markdown
