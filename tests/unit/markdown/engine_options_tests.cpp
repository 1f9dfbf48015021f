#include <gtest/gtest.h>

#include "sn/markdown/engine_options.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST(EngineOptions, RegistersDefaults)
{
    sn::config::OptionRegistry registry("sn-edit");
    sn::markdown::registerEngineOptions(registry);

    EXPECT_TRUE(registry.hasOption(sn::markdown::kOptionDebounceMilliseconds));
    EXPECT_TRUE(registry.hasOption(sn::markdown::kOptionSmartListContinuation));
    EXPECT_TRUE(registry.hasOption(sn::markdown::kOptionTabIndentsLists));
    EXPECT_TRUE(registry.hasOption(sn::markdown::kOptionRevealActiveLine));
    EXPECT_EQ(registry.listRegisteredOptions().size(), 4u);

    auto settings = sn::markdown::engineSettingsFrom(registry);
    EXPECT_EQ(settings.debounce, 50ms);
    EXPECT_TRUE(settings.smartListContinuation);
    EXPECT_TRUE(settings.tabIndentsLists);
    EXPECT_TRUE(settings.revealActiveLine);
}

TEST(EngineOptions, BuildsSettingsFromOverrides)
{
    sn::config::OptionRegistry registry("sn-edit");
    sn::markdown::registerEngineOptions(registry);
    registry.set(sn::markdown::kOptionDebounceMilliseconds, sn::config::OptionValue(-10));
    registry.set(sn::markdown::kOptionTabIndentsLists, sn::config::OptionValue(false));
    registry.set(sn::markdown::kOptionRevealActiveLine, sn::config::OptionValue("off"));

    auto settings = sn::markdown::engineSettingsFrom(registry);
    EXPECT_EQ(settings.debounce, 0ms);
    EXPECT_TRUE(settings.smartListContinuation);
    EXPECT_FALSE(settings.tabIndentsLists);
    EXPECT_FALSE(settings.revealActiveLine);
    EXPECT_FALSE(settings.editSettings().tabIndentsLists);

    registry.set(sn::markdown::kOptionDebounceMilliseconds, sn::config::OptionValue(99999));
    EXPECT_EQ(sn::markdown::engineSettingsFrom(registry).debounce, 5000ms);
}
