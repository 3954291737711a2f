#include "LaneVisibility.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using ::testing::UnorderedElementsAreArray;

class LaneVisibilityTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const char* lanes[] = { "main", "io", "worker" };
        for (size_t i = 0; i < 24; ++i)
        {
            Task t;
            t.start = double(i % 5);
            t.end = t.start + 2.5;
            t.lane = lanes[i % 3];
            t.label = "task" + std::to_string(i);
            t.sequenceIndex = i;
            tasks.push_back(t);
        }
        scene = SceneBuilder{ LayoutConfig{} }.build(tasks);
    }

    std::vector<size_t> HiddenByScan(const LaneVisibility& vis) const
    {
        std::vector<size_t> out;
        for (const SceneItem& it : scene.items)
            if (vis.isHidden(it)) out.push_back(it.id);
        return out;
    }

    std::vector<Task> tasks;
    Scene scene;
};

TEST_F(LaneVisibilityTest, StartsExpanded)
{
    const LaneVisibility vis(scene);
    ASSERT_EQ(vis.laneCount(), 3u);
    for (size_t i = 0; i < vis.laneCount(); ++i)
    {
        EXPECT_EQ(vis.state(i), LaneState::Expanded);
        EXPECT_STREQ(vis.indicator(i), "\xE2\x96\xBC");
    }
    EXPECT_TRUE(vis.hiddenItems().empty());
}

TEST_F(LaneVisibilityTest, CollapseHidesExactlyThatLane)
{
    LaneVisibility vis(scene);
    vis.toggle(1);

    EXPECT_EQ(vis.state(1), LaneState::Collapsed);
    EXPECT_STREQ(vis.indicator(1), "\xE2\x96\xB6");

    const LaneBlock& lane = scene.lanes[1];
    EXPECT_THAT(vis.hiddenItems(), UnorderedElementsAreArray(lane.taskItems));
    EXPECT_THAT(HiddenByScan(vis), UnorderedElementsAreArray(lane.taskItems));
    EXPECT_FALSE(vis.isHidden(scene.items[lane.headerItem]));
}

TEST_F(LaneVisibilityTest, ToggleTwiceRestores)
{
    LaneVisibility vis(scene);
    vis.toggle(0);
    vis.toggle(0);
    EXPECT_EQ(vis.state(0), LaneState::Expanded);
    EXPECT_TRUE(HiddenByScan(vis).empty());
}

TEST_F(LaneVisibilityTest, CollapseAllMatchesPerLaneToggles)
{
    LaneVisibility bulk(scene);
    bulk.setAll(LaneState::Collapsed);

    LaneVisibility single(scene);
    for (size_t i = 0; i < single.laneCount(); ++i) single.toggle(i);

    std::vector<size_t> a = HiddenByScan(bulk);
    std::vector<size_t> b = HiddenByScan(single);
    EXPECT_EQ(a, b);

    size_t taskItems = 0;
    for (const SceneItem& it : scene.items)
        if (it.kind == ItemKind::Task) ++taskItems;
    EXPECT_EQ(a.size(), taskItems);

    bulk.setAll(LaneState::Expanded);
    EXPECT_TRUE(HiddenByScan(bulk).empty());
}

TEST_F(LaneVisibilityTest, HeadersNeverHidden)
{
    LaneVisibility vis(scene);
    vis.setAll(LaneState::Collapsed);
    for (const LaneBlock& b : scene.lanes)
        EXPECT_FALSE(vis.isHidden(scene.items[b.headerItem]));
}

TEST_F(LaneVisibilityTest, UnknownLaneThrows)
{
    LaneVisibility vis(scene);
    EXPECT_THROW(vis.toggle(7), std::out_of_range);
    EXPECT_THROW(vis.state(3), std::out_of_range);
}

}  // namespace
