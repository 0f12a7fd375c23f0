#include <gtest/gtest.h>
#include <limits>
#include "GridFixtures.hpp"
#include "render/MergeIndex.hpp"

namespace {

CellDataMap mergedSheet() {
    CellDataMap cells;
    CellData master = makeCell(5, 5, QStringLiteral("Merged"));
    master.rowSpan = 2;
    master.colSpan = 3;
    cells[CellCoord{5, 5}] = master;
    cells[CellCoord{0, 0}] = makeCell(0, 0, QStringLiteral("plain"));
    return cells;
}

} // namespace

TEST(MergeIndexTest, SlaveResolvesToMaster) {
    const CellDataMap cells = mergedSheet();
    const MergeIndex merges(&cells);

    const std::optional<CellCoord> master = merges.masterOf(6, 6);
    ASSERT_TRUE(master.has_value());
    EXPECT_EQ(*master, (CellCoord{5, 5}));
    EXPECT_FALSE(merges.masterOf(5, 5).has_value());
    EXPECT_FALSE(merges.masterOf(0, 0).has_value());
}

TEST(MergeIndexTest, EveryCoveredCellExceptMasterIsSlave) {
    const CellDataMap cells = mergedSheet();
    const MergeIndex merges(&cells);

    for (int row = 3; row <= 9; ++row) {
        for (int col = 3; col <= 10; ++col) {
            const bool covered = row >= 5 && row <= 6 && col >= 5 && col <= 7;
            const bool master = row == 5 && col == 5;
            EXPECT_EQ(merges.isSlave(row, col), covered && !master) << row << "," << col;
        }
    }
    ASSERT_NE(merges.regionAt(6, 7), nullptr);
    EXPECT_EQ(merges.regionAt(6, 7)->lastCol(), 7);
}

TEST(MergeIndexTest, LinesSkipMergeInteriors) {
    const CellDataMap cells = mergedSheet();
    const MergeIndex merges(&cells);

    const std::vector<LineSegment> inner = merges.lineSegments(LineOrientation::Vertical, 6, 0, 10);
    ASSERT_EQ(inner.size(), 2u);
    EXPECT_EQ(inner[0], (LineSegment{0, 5}));
    EXPECT_EQ(inner[1], (LineSegment{7, 11}));

    // The merge's own left edge is drawn in full
    const std::vector<LineSegment> edge = merges.lineSegments(LineOrientation::Vertical, 5, 0, 10);
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0], (LineSegment{0, 11}));

    const std::vector<LineSegment> horizontal = merges.lineSegments(LineOrientation::Horizontal, 6, 0, 10);
    ASSERT_EQ(horizontal.size(), 2u);
    EXPECT_EQ(horizontal[0], (LineSegment{0, 5}));
    EXPECT_EQ(horizontal[1], (LineSegment{8, 11}));
}

TEST(MergeIndexTest, NoSegmentCrossesInsideAnySpan) {
    CellDataMap cells = mergedSheet();
    CellData wide = makeCell(1, 1, QStringLiteral("wide"));
    wide.rowSpan = 3;
    wide.colSpan = 2;
    cells[CellCoord{1, 1}] = wide;
    const MergeIndex merges(&cells);

    for (const MergeRegion& region : merges.getRegions()) {
        for (int line = region.col + 1; line < region.col + region.colSpan; ++line) {
            for (const LineSegment& segment : merges.lineSegments(LineOrientation::Vertical, line, 0, 20)) {
                const bool overlaps = segment.start < region.row + region.rowSpan && region.row < segment.end;
                EXPECT_FALSE(overlaps) << "vertical line " << line;
            }
        }
        for (int line = region.row + 1; line < region.row + region.rowSpan; ++line) {
            for (const LineSegment& segment : merges.lineSegments(LineOrientation::Horizontal, line, 0, 20)) {
                const bool overlaps = segment.start < region.col + region.colSpan && region.col < segment.end;
                EXPECT_FALSE(overlaps) << "horizontal line " << line;
            }
        }
    }
}

TEST(MergeIndexTest, EmptyInputs) {
    const MergeIndex none(nullptr);
    EXPECT_TRUE(none.isEmpty());
    EXPECT_TRUE(none.lineSegments(LineOrientation::Vertical, 1, 4, 2).empty());
    const std::vector<LineSegment> full = none.lineSegments(LineOrientation::Vertical, 1, 2, 4);
    ASSERT_EQ(full.size(), 1u);
    EXPECT_EQ(full[0], (LineSegment{2, 5}));
}

TEST(MergeIndexTest, SpansAreCutAtTheSheetEdge) {
    CellDataMap cells;
    CellData tall = makeCell(10, 2, QStringLiteral("tall"));
    tall.rowSpan = std::numeric_limits<int>::max();
    tall.colSpan = 2;
    cells[CellCoord{10, 2}] = tall;
    CellData outside = makeCell(200, 0, QStringLiteral("outside"));
    outside.rowSpan = 3;
    cells[CellCoord{200, 0}] = outside;

    const MergeIndex merges(&cells, 100, 20);
    ASSERT_EQ(merges.getRegions().size(), 1u);
    EXPECT_EQ(merges.getRegions()[0].lastRow(), 99);
    EXPECT_EQ(merges.masterOf(99, 3), (std::optional<CellCoord>(CellCoord{10, 2})));
    EXPECT_FALSE(merges.masterOf(201, 0).has_value());

    const std::vector<LineSegment> line = merges.lineSegments(LineOrientation::Vertical, 3, 0, 99);
    ASSERT_EQ(line.size(), 1u);
    EXPECT_EQ(line[0], (LineSegment{0, 10}));
}
