#include <gtest/gtest.h>

#include "DotmatrixExceptions.h"
#include "LayoutEngine.h"

TEST(LayoutEngineTest, RightLegendGeometry) {
    const FigureLayout layout = LayoutEngine(3, 2, false, LegendLoc::Right).layout();
    EXPECT_NEAR(layout.width, 1.5, 1e-12);
    EXPECT_NEAR(layout.height, 0.9, 1e-12);
    EXPECT_EQ(layout.columnCount, 3u);
    EXPECT_EQ(layout.rowCount, 2u);
    EXPECT_NEAR(layout.main.width, 0.8, 1e-12);
    EXPECT_NEAR(layout.legend.left, 0.84, 1e-12);
    EXPECT_NEAR(layout.legend.width, 0.16, 1e-12);
    EXPECT_DOUBLE_EQ(layout.main.height, 1.0);
    EXPECT_NEAR(layout.splitGap, 0.25 / 3.0, 1e-12);
}

TEST(LayoutEngineTest, BottomLegendSwapped) {
    const FigureLayout layout = LayoutEngine(3, 2, true, LegendLoc::Bottom).layout();
    EXPECT_NEAR(layout.width, 1.0, 1e-12);
    EXPECT_NEAR(layout.height, 1.35, 1e-12);
    EXPECT_EQ(layout.columnCount, 2u);
    EXPECT_EQ(layout.rowCount, 3u);
    EXPECT_DOUBLE_EQ(layout.legend.bottom, 0.0);
    EXPECT_GT(layout.main.bottom, layout.legend.height);
    EXPECT_NEAR(layout.main.bottom + layout.main.height, 1.0, 1e-12);
}

TEST(LayoutEngineTest, NoLegendHasNoExtraExtent) {
    const FigureLayout layout = LayoutEngine(4, 1, false, LegendLoc::None).layout();
    EXPECT_NEAR(layout.width, 1.5, 1e-12);
    EXPECT_NEAR(layout.height, 0.7, 1e-12);
    EXPECT_FALSE(layout.hasLegendPanel());
}

TEST(LayoutEngineTest, SwapTransposesPositions) {
    const LayoutEngine plain(4, 3, false, LegendLoc::None);
    const LayoutEngine swapped(4, 3, true, LegendLoc::None);
    for (size_t g = 0; g < 4; ++g) {
        for (size_t f = 0; f < 3; ++f) {
            const GridPosition a = plain.position(g, f);
            const GridPosition b = swapped.position(g, f);
            EXPECT_EQ(a.column, b.row);
            EXPECT_EQ(a.row, b.column);
            EXPECT_EQ(a, (GridPosition{static_cast<int>(g), static_cast<int>(f)}));
        }
    }
}

TEST(LayoutEngineTest, AxesFollowOrientation) {
    const std::vector<std::string> groups = {"A", "B", "C"};
    const std::vector<std::string> features = {"x", "y"};

    const LayoutEngine plain(3, 2, false, LegendLoc::Right);
    const AxisSpec x = plain.xAxis(groups, features);
    const AxisSpec y = plain.yAxis(groups, features);
    EXPECT_EQ(x.labels, groups);
    EXPECT_EQ(y.labels, features);
    EXPECT_DOUBLE_EQ(x.lo, -0.5);
    EXPECT_DOUBLE_EQ(x.hi, 2.5);
    EXPECT_EQ(x.labelRotation, 270);
    EXPECT_FALSE(y.reversed);

    const LayoutEngine swapped(3, 2, true, LegendLoc::Right);
    EXPECT_EQ(swapped.xAxis(groups, features).labels, features);
    const AxisSpec sy = swapped.yAxis(groups, features);
    EXPECT_EQ(sy.labels, groups);
    EXPECT_TRUE(sy.reversed);
    EXPECT_DOUBLE_EQ(sy.hi, 2.5);
}

TEST(LayoutEngineTest, PlaceWithinScalesIntoOuter) {
    const PanelRect r = placeWithin({0.1, 0.2, 0.5, 0.4}, {0.5, 0.5, 0.5, 0.5});
    EXPECT_NEAR(r.left, 0.35, 1e-12);
    EXPECT_NEAR(r.bottom, 0.4, 1e-12);
    EXPECT_NEAR(r.width, 0.25, 1e-12);
    EXPECT_NEAR(r.height, 0.2, 1e-12);
}

TEST(LayoutEngineTest, ParseLegendLoc) {
    EXPECT_EQ(parseLegendLoc("right"), LegendLoc::Right);
    EXPECT_EQ(parseLegendLoc(" Bottom "), LegendLoc::Bottom);
    EXPECT_EQ(parseLegendLoc("none"), LegendLoc::None);
    EXPECT_THROW(parseLegendLoc("left"), Dotmatrix::InvalidArgumentException);
    EXPECT_EQ(legendLocName(LegendLoc::Bottom), "bottom");
}
