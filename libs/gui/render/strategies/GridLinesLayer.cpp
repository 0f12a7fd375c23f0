#include "GridLinesLayer.hpp"
#include "../DimensionResolver.hpp"
#include "../FreezeGeometry.hpp"
#include "../MergeIndex.hpp"
#include <algorithm>
#include <cmath>

void GridLinesLayer::paintZone(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass) {
    surface.fillRect(pass.clip, frame.getTheme().cellBackground);

    const StrokeStyle stroke(frame.getTheme().gridLine, 1.0);
    paintVerticalLines(surface, frame, pass, stroke);
    paintHorizontalLines(surface, frame, pass, stroke);
}

void GridLinesLayer::paintVerticalLines(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass,
                                        const StrokeStyle& stroke) {
    const DimensionResolver& dims = frame.getDimensions();
    const FreezeGeometry& geometry = frame.getGeometry();
    const MergeIndex& merges = frame.getMerges();
    const VisibleRange& range = pass.range;
    const int lastLine = std::min(range.endCol + 1, dims.getTotalCols());

    double previousX = -1.0;
    for (int col = range.startCol; col <= lastLine; ++col) {
        const double x = (col == lastLine && col > range.endCol)
            ? geometry.columnX(range.endCol) + dims.getColumnWidth(range.endCol)
            : geometry.columnX(col);
        if (x < pass.clip.left() || x > pass.clip.right()) continue;
        const double lineX = crisp(x);
        if (lineX == previousX) continue;  // hidden column: same boundary twice
        previousX = lineX;

        for (const LineSegment& segment :
             merges.lineSegments(LineOrientation::Vertical, col, range.startRow, range.endRow)) {
            const int lastRow = std::min(segment.end, range.endRow + 1) - 1;
            if (lastRow < segment.start) continue;
            const double top = std::max(geometry.rowY(segment.start), pass.clip.top());
            const double bottom = std::min(geometry.rowY(lastRow) + dims.getRowHeight(lastRow), pass.clip.bottom());
            if (bottom <= top) continue;
            surface.strokeLine(QPointF(lineX, top), QPointF(lineX, bottom), stroke);
        }
    }
}

void GridLinesLayer::paintHorizontalLines(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass,
                                          const StrokeStyle& stroke) {
    const DimensionResolver& dims = frame.getDimensions();
    const FreezeGeometry& geometry = frame.getGeometry();
    const MergeIndex& merges = frame.getMerges();
    const VisibleRange& range = pass.range;
    const int lastLine = std::min(range.endRow + 1, dims.getTotalRows());

    double previousY = -1.0;
    for (int row = range.startRow; row <= lastLine; ++row) {
        const double y = (row == lastLine && row > range.endRow)
            ? geometry.rowY(range.endRow) + dims.getRowHeight(range.endRow)
            : geometry.rowY(row);
        if (y < pass.clip.top() || y > pass.clip.bottom()) continue;
        const double lineY = crisp(y);
        if (lineY == previousY) continue;
        previousY = lineY;

        for (const LineSegment& segment :
             merges.lineSegments(LineOrientation::Horizontal, row, range.startCol, range.endCol)) {
            const int lastCol = std::min(segment.end, range.endCol + 1) - 1;
            if (lastCol < segment.start) continue;
            const double left = std::max(geometry.columnX(segment.start), pass.clip.left());
            const double right = std::min(geometry.columnX(lastCol) + dims.getColumnWidth(lastCol), pass.clip.right());
            if (right <= left) continue;
            surface.strokeLine(QPointF(left, lineY), QPointF(right, lineY), stroke);
        }
    }
}
