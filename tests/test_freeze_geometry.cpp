#include <gtest/gtest.h>
#include "GridFixtures.hpp"
#include "render/FreezeGeometry.hpp"
#include "render/ViewportLayout.hpp"

namespace {

struct GeometryFixture {
    GridConfig config = standardConfig();
    DimensionResolver dims{config, nullptr};

    FreezeGeometry make(const FreezeConfig& freeze, const Viewport& viewport,
                        const AnimationShifts& shifts = AnimationShifts{}) const {
        return FreezeGeometry(dims, calculateFreezeLayout(freeze, dims), viewport, 650.0, 264.0, shifts);
    }
};

FreezeConfig frozen(int rows, int cols) {
    FreezeConfig freeze;
    freeze.freezeRow = rows;
    freeze.freezeCol = cols;
    return freeze;
}

} // namespace

TEST(FreezeGeometryTest, PositionsIncludeHeadersAndScroll) {
    GeometryFixture fx;
    const FreezeGeometry geometry = fx.make(FreezeConfig{}, Viewport{30.0, 12.0});
    EXPECT_DOUBLE_EQ(geometry.columnX(0), 20.0);
    EXPECT_DOUBLE_EQ(geometry.columnX(2), 220.0);
    EXPECT_DOUBLE_EQ(geometry.rowY(1), 36.0);
    EXPECT_EQ(geometry.cellRect(1, 2, 2, 3), QRectF(220.0, 36.0, 300.0, 48.0));
}

TEST(FreezeGeometryTest, FrozenIndicesIgnoreScroll) {
    GeometryFixture fx;
    const FreezeGeometry geometry = fx.make(frozen(1, 2), Viewport{500.0, 240.0});
    EXPECT_DOUBLE_EQ(geometry.columnX(1), 150.0);
    EXPECT_DOUBLE_EQ(geometry.rowY(0), 24.0);
    // Scrollable indices start at the freeze boundary minus the scroll
    EXPECT_DOUBLE_EQ(geometry.columnX(7), 250.0 + 500.0 - 500.0);
    EXPECT_DOUBLE_EQ(geometry.rowY(11), 48.0 + 240.0 - 240.0);
    EXPECT_TRUE(geometry.isFrozenColumn(1));
    EXPECT_FALSE(geometry.isFrozenColumn(2));
}

TEST(FreezeGeometryTest, RangeClipKeepsScrollableRangesOutOfFrozenPanes) {
    GeometryFixture fx;
    const FreezeGeometry geometry = fx.make(frozen(1, 1), Viewport{50.0, 0.0});

    // Column 1 is scrolled half under the frozen column
    const QRectF clip = geometry.rangeClip(3, 1, 3, 1);
    EXPECT_DOUBLE_EQ(clip.left(), 150.0);
    EXPECT_DOUBLE_EQ(clip.top(), 48.0);

    const std::optional<QRectF> visible = geometry.visibleRangeRect(3, 1, 3, 1);
    ASSERT_TRUE(visible.has_value());
    EXPECT_DOUBLE_EQ(visible->left(), 150.0);
    EXPECT_DOUBLE_EQ(visible->right(), 200.0);

    // A range spanning frozen and scrollable columns may use the whole cell area
    EXPECT_DOUBLE_EQ(geometry.rangeClip(0, 0, 3, 4).left(), 50.0);
}

TEST(FreezeGeometryTest, ScrolledOutRangeIsAbsent) {
    GeometryFixture fx;
    const FreezeGeometry geometry = fx.make(FreezeConfig{}, Viewport{5000.0, 0.0});
    EXPECT_FALSE(geometry.visibleRangeRect(0, 0, 2, 2).has_value());
    EXPECT_FALSE(geometry.fillHandleRect(0, 0, 2, 2, 8.0).has_value());
}

TEST(FreezeGeometryTest, FillHandleSitsOnTheInnerCorner) {
    GeometryFixture fx;
    const FreezeGeometry geometry = fx.make(FreezeConfig{}, Viewport{});
    const std::optional<QRectF> handle = geometry.fillHandleRect(1, 1, 2, 2, 8.0);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(*handle, QRectF(341.0, 87.0, 8.0, 8.0));
}

TEST(FreezeGeometryTest, FillHandleHiddenWhenCornerIsClipped) {
    GeometryFixture fx;
    // Bottom-right corner of rows 0..20 is below the canvas
    const FreezeGeometry geometry = fx.make(FreezeConfig{}, Viewport{});
    EXPECT_FALSE(geometry.fillHandleRect(0, 0, 20, 0, 8.0).has_value());
}

TEST(FreezeGeometryTest, AnimationShiftsApplyFromTheirIndex) {
    GeometryFixture fx;
    InsertionAnimation animation;
    animation.type = AnimationAxis::Column;
    animation.index = 2;
    animation.count = 1;
    animation.targetSize = 100.0;
    animation.progress = 0.0;
    const FreezeGeometry geometry = fx.make(FreezeConfig{}, Viewport{}, AnimationShifts::fromAnimation(animation));

    EXPECT_DOUBLE_EQ(geometry.columnX(1), 150.0);
    EXPECT_DOUBLE_EQ(geometry.columnX(2), 150.0);
    EXPECT_DOUBLE_EQ(geometry.columnX(3), 250.0);
    EXPECT_DOUBLE_EQ(geometry.rowY(5), 144.0);
}
