#include "Viewport.hpp"

#include <limits>

#include <gtest/gtest.h>

namespace {

TEST(ViewportTest, StartsFitted)
{
    const Viewport v;
    EXPECT_DOUBLE_EQ(v.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(v.normStart(), 0.0);
    EXPECT_DOUBLE_EQ(v.normEnd(), 1.0);
}

TEST(ViewportTest, ZoomKeepsTimeUnderCursor)
{
    Viewport v;
    v.zoomAt(4.0, 0.25);
    EXPECT_DOUBLE_EQ(v.zoom(), 4.0);
    // t under the cursor was 0.25 before and after
    EXPECT_DOUBLE_EQ(v.offset() + 0.25 / v.zoom(), 0.25);

    v.zoomAt(2.0, 0.75);
    EXPECT_DOUBLE_EQ(v.zoom(), 8.0);
    EXPECT_DOUBLE_EQ(v.offset() + 0.75 / v.zoom(), 0.1875 + 0.75 / 4.0);
}

TEST(ViewportTest, ZoomIsClamped)
{
    Viewport v{ 16.0 };
    v.zoomAt(1000.0, 0.5);
    EXPECT_DOUBLE_EQ(v.zoom(), 16.0);
    v.zoomAt(1e-6, 0.5);
    EXPECT_DOUBLE_EQ(v.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.0);

    const Viewport bad{ 0.25 };
    EXPECT_DOUBLE_EQ(bad.maxZoom(), 1.0);
}

TEST(ViewportTest, InvalidFactorIgnored)
{
    Viewport v;
    v.zoomAt(2.0, 0.5);
    v.zoomAt(0.0, 0.5);
    v.zoomAt(-3.0, 0.5);
    v.zoomAt(std::numeric_limits<double>::infinity(), 0.5);
    EXPECT_DOUBLE_EQ(v.zoom(), 2.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.25);
}

TEST(ViewportTest, PanStaysInsideRange)
{
    Viewport v;
    v.zoomAt(4.0, 0.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.0);

    // dragging content left moves the window right
    v.panBy(-1.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.25);
    v.panBy(-100.0);
    EXPECT_DOUBLE_EQ(v.normEnd(), 1.0);
    v.panBy(100.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.0);

    Viewport whole;
    whole.panBy(0.5);
    EXPECT_DOUBLE_EQ(whole.offset(), 0.0);
}

TEST(ViewportTest, CenterOnAndFit)
{
    Viewport v;
    v.zoomAt(10.0, 0.5);
    v.centerOn(0.3);
    EXPECT_DOUBLE_EQ(v.offset(), 0.25);
    v.centerOn(0.99);
    EXPECT_DOUBLE_EQ(v.offset(), 0.9);

    v.fit();
    EXPECT_DOUBLE_EQ(v.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(v.offset(), 0.0);
}

TEST(ViewportTest, VisibleMapsToAbsoluteTime)
{
    Viewport v;
    v.zoomAt(4.0, 0.0);
    v.panBy(-2.0);

    const TimeRange r = v.visible({ 100.0, 500.0 });
    EXPECT_DOUBLE_EQ(r.start, 300.0);
    EXPECT_DOUBLE_EQ(r.end, 400.0);
}

}  // namespace
