/*
Calcula — MergeIndex
Role: Per-frame index of merged regions: master lookup for slave cells and merge-aware grid line segments.
Inputs/Outputs: CellDataMap in; master coordinates and [start,end) line segments out.
Threading: Built and read on the render thread within one frame.
Performance: Build is O(cells); lookups are O(merges), which is small on real sheets.
Integration: Used by GridLinesLayer, CellContentLayer and autofit.
Observability: None.
Related: GridLinesLayer.hpp, CellContentLayer.hpp.
Assumptions: Merges do not overlap; stored spans are >= 1 and never reach past the sheet.
*/
#pragma once
#include <limits>
#include <optional>
#include <vector>
#include "../../core/sheet/model/SheetData.h"

struct MergeRegion {
    int row = 0;
    int col = 0;
    int rowSpan = 1;
    int colSpan = 1;

    int lastRow() const { return row + rowSpan - 1; }
    int lastCol() const { return col + colSpan - 1; }
    bool contains(int r, int c) const { return r >= row && r <= lastRow() && c >= col && c <= lastCol(); }
};

// Perpendicular index range [start, end) of one drawn piece of a grid line
struct LineSegment {
    int start = 0;
    int end = 0;

    bool operator==(const LineSegment& other) const { return start == other.start && end == other.end; }
};

enum class LineOrientation {
    Vertical,    // line at the left edge of column `lineIndex`, spans rows
    Horizontal   // line at the top edge of row `lineIndex`, spans columns
};

class MergeIndex {
public:
    MergeIndex() = default;
    // Regions starting outside the sheet are dropped; spans are cut at the sheet edge
    explicit MergeIndex(const CellDataMap* cells, int totalRows = std::numeric_limits<int>::max(),
                        int totalCols = std::numeric_limits<int>::max());

    // Master of a slave cell; nothing for masters and unmerged cells
    std::optional<CellCoord> masterOf(int row, int col) const;
    bool isSlave(int row, int col) const { return masterOf(row, col).has_value(); }

    const MergeRegion* regionAt(int row, int col) const;

    // Segments of a line over perpendicular indices [perpStart, perpEnd] that avoid merge interiors
    std::vector<LineSegment> lineSegments(LineOrientation orientation, int lineIndex,
                                          int perpStart, int perpEnd) const;

    const std::vector<MergeRegion>& getRegions() const { return m_regions; }
    bool isEmpty() const { return m_regions.empty(); }

private:
    std::vector<MergeRegion> m_regions;
};
