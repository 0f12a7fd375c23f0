#include "FreezeGeometry.hpp"
#include <algorithm>

FreezeGeometry::FreezeGeometry(const DimensionResolver& dims, const FreezePaneLayout& freeze,
                               const Viewport& viewport, double width, double height,
                               const AnimationShifts& shifts)
    : m_dims(dims)
    , m_freeze(freeze)
    , m_scrollX(std::max(0.0, viewport.scrollX))
    , m_scrollY(std::max(0.0, viewport.scrollY))
    , m_width(std::max(0.0, width))
    , m_height(std::max(0.0, height))
    , m_shifts(shifts) {
}

double FreezeGeometry::columnX(int col) const {
    const double origin = m_dims.getRowHeaderWidth();
    double x = 0.0;
    if (col < m_freeze.frozenCols) {
        x = origin + m_dims.columnSpanWidth(0, col);
    } else {
        x = origin + m_freeze.frozenColsWidth
            + m_dims.columnSpanWidth(m_freeze.frozenCols, col - m_freeze.frozenCols) - m_scrollX;
    }
    return x + m_shifts.cols.at(col);
}

double FreezeGeometry::rowY(int row) const {
    const double origin = m_dims.getColHeaderHeight();
    double y = 0.0;
    if (row < m_freeze.frozenRows) {
        y = origin + m_dims.rowSpanHeight(0, row);
    } else {
        y = origin + m_freeze.frozenRowsHeight
            + m_dims.rowSpanHeight(m_freeze.frozenRows, row - m_freeze.frozenRows) - m_scrollY;
    }
    return y + m_shifts.rows.at(row);
}

QRectF FreezeGeometry::cellRect(int row, int col, int rowSpan, int colSpan) const {
    const double x = columnX(col);
    const double y = rowY(row);
    return QRectF(x, y, m_dims.columnSpanWidth(col, std::max(1, colSpan)),
                  m_dims.rowSpanHeight(row, std::max(1, rowSpan)));
}

QRectF FreezeGeometry::rangeRect(int minRow, int minCol, int maxRow, int maxCol) const {
    const double x1 = columnX(minCol);
    const double y1 = rowY(minRow);
    const double x2 = columnX(maxCol) + m_dims.getColumnWidth(maxCol);
    const double y2 = rowY(maxRow) + m_dims.getRowHeight(maxRow);
    return QRectF(QPointF(x1, y1), QPointF(x2, y2));
}

QRectF FreezeGeometry::rangeClip(int minRow, int minCol, int maxRow, int maxCol) const {
    const double headerX = std::min(m_width, m_dims.getRowHeaderWidth());
    const double headerY = std::min(m_height, m_dims.getColHeaderHeight());
    const double boundaryX = std::min(m_width, headerX + m_freeze.frozenColsWidth);
    const double boundaryY = std::min(m_height, headerY + m_freeze.frozenRowsHeight);

    double left = headerX;
    double right = m_width;
    double top = headerY;
    double bottom = m_height;

    if (m_freeze.hasFrozenCols()) {
        if (minCol >= m_freeze.frozenCols) left = boundaryX;   // entirely scrollable
        if (maxCol < m_freeze.frozenCols) right = boundaryX;   // entirely frozen
    }
    if (m_freeze.hasFrozenRows()) {
        if (minRow >= m_freeze.frozenRows) top = boundaryY;
        if (maxRow < m_freeze.frozenRows) bottom = boundaryY;
    }
    return QRectF(QPointF(left, top), QPointF(right, bottom));
}

std::optional<QRectF> FreezeGeometry::visibleRangeRect(int minRow, int minCol, int maxRow, int maxCol) const {
    const QRectF visible = rangeRect(minRow, minCol, maxRow, maxCol)
                               .intersected(rangeClip(minRow, minCol, maxRow, maxCol));
    if (visible.width() <= 0.0 || visible.height() <= 0.0) return std::nullopt;
    return visible;
}

std::optional<QRectF> FreezeGeometry::fillHandleRect(int minRow, int minCol, int maxRow, int maxCol,
                                                     double handleSize) const {
    const QRectF full = rangeRect(minRow, minCol, maxRow, maxCol);
    const QRectF clip = rangeClip(minRow, minCol, maxRow, maxCol);
    const QRectF visible = full.intersected(clip);
    if (visible.isEmpty()) return std::nullopt;

    // The true corner must be on screen, not a clip edge standing in for it
    static constexpr double kEpsilon = 0.5;
    if (full.right() > clip.right() + kEpsilon || full.right() <= clip.left()) return std::nullopt;
    if (full.bottom() > clip.bottom() + kEpsilon || full.bottom() <= clip.top()) return std::nullopt;

    // Centered on the inner edge of the 2px selection border
    const double cx = visible.right() - 1.0 - handleSize / 2.0;
    const double cy = visible.bottom() - 1.0 - handleSize / 2.0;
    return QRectF(cx - handleSize / 2.0, cy - handleSize / 2.0, handleSize, handleSize);
}
