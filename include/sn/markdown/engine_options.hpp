#pragma once

#include "sn/markdown/engine.hpp"
#include "sn/options.hpp"

namespace sn::markdown
{

inline constexpr const char *kOptionDebounceMilliseconds = "debounceMilliseconds";
inline constexpr const char *kOptionSmartListContinuation = "smartListContinuation";
inline constexpr const char *kOptionTabIndentsLists = "tabIndentsLists";
inline constexpr const char *kOptionRevealActiveLine = "revealActiveLine";

void registerEngineOptions(config::OptionRegistry &registry);
EngineSettings engineSettingsFrom(const config::OptionRegistry &registry);

} // namespace sn::markdown
