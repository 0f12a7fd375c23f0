#include "MergeIndex.hpp"
#include <algorithm>

MergeIndex::MergeIndex(const CellDataMap* cells, int totalRows, int totalCols) {
    if (!cells) return;
    for (const auto& [coord, cell] : *cells) {
        if (!cell.isMerged()) continue;
        if (coord.row < 0 || coord.row >= totalRows || coord.col < 0 || coord.col >= totalCols) continue;
        const int rowSpan = std::clamp(cell.rowSpan, 1, totalRows - coord.row);
        const int colSpan = std::clamp(cell.colSpan, 1, totalCols - coord.col);
        m_regions.push_back(MergeRegion{coord.row, coord.col, rowSpan, colSpan});
    }
    // Stable iteration order independent of hash layout
    std::sort(m_regions.begin(), m_regions.end(), [](const MergeRegion& a, const MergeRegion& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    });
}

std::optional<CellCoord> MergeIndex::masterOf(int row, int col) const {
    const MergeRegion* region = regionAt(row, col);
    if (!region || (region->row == row && region->col == col)) return std::nullopt;
    return CellCoord{region->row, region->col};
}

const MergeRegion* MergeIndex::regionAt(int row, int col) const {
    for (const auto& region : m_regions) {
        if (region.row > row) break;  // sorted by row
        if (region.contains(row, col)) return &region;
    }
    return nullptr;
}

std::vector<LineSegment> MergeIndex::lineSegments(LineOrientation orientation, int lineIndex,
                                                  int perpStart, int perpEnd) const {
    std::vector<LineSegment> segments;
    if (perpEnd < perpStart) return segments;

    std::vector<LineSegment> gaps;
    for (const auto& region : m_regions) {
        if (orientation == LineOrientation::Vertical) {
            if (region.colSpan > 1 && region.col < lineIndex && lineIndex < region.col + region.colSpan) {
                gaps.push_back(LineSegment{region.row, region.row + region.rowSpan});
            }
        } else {
            if (region.rowSpan > 1 && region.row < lineIndex && lineIndex < region.row + region.rowSpan) {
                gaps.push_back(LineSegment{region.col, region.col + region.colSpan});
            }
        }
    }

    const int limit = perpEnd + 1;
    if (gaps.empty()) {
        segments.push_back(LineSegment{perpStart, limit});
        return segments;
    }

    std::sort(gaps.begin(), gaps.end(), [](const LineSegment& a, const LineSegment& b) { return a.start < b.start; });

    int current = perpStart;
    for (const auto& gap : gaps) {
        if (gap.start >= limit) break;
        if (gap.start > current) {
            segments.push_back(LineSegment{current, gap.start});
        }
        current = std::max(current, gap.end);
    }
    if (current < limit) {
        segments.push_back(LineSegment{current, limit});
    }
    return segments;
}
