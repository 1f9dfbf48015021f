#include <gtest/gtest.h>

#include "sn/app_info.hpp"

#include <stdexcept>

TEST(AppInfo, ListsTheEditor)
{
    auto tools = sn::appinfo::tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools.front().id, "sn-edit");
    EXPECT_FALSE(tools.front().usage.empty());
}

TEST(AppInfo, RequireToolReturnsMatchingExecutable)
{
    const auto &info = sn::appinfo::requireTool("sn-edit");
    EXPECT_EQ(info.id, "sn-edit");
    EXPECT_EQ(info.executable, "sn-edit");

    const auto &byExecutable = sn::appinfo::requireToolByExecutable("sn-edit");
    EXPECT_EQ(byExecutable.id, "sn-edit");
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_EQ(sn::appinfo::findTool("ck-edit"), nullptr);
    EXPECT_THROW(sn::appinfo::requireTool("does-not-exist"), std::runtime_error);
    EXPECT_THROW(sn::appinfo::requireToolByExecutable("missing"), std::runtime_error);
}
