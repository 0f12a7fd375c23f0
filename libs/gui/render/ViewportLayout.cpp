#include "ViewportLayout.hpp"
#include <algorithm>

namespace {

VisibleRange combine(const AxisWindow& rows, const AxisWindow& cols) {
    VisibleRange range;
    range.startRow = rows.start;
    range.endRow = rows.end;
    range.offsetY = rows.offset;
    range.startCol = cols.start;
    range.endCol = cols.end;
    range.offsetX = cols.offset;
    return range;
}

} // namespace

FreezePaneLayout calculateFreezeLayout(const FreezeConfig& freeze, const DimensionResolver& dims) {
    FreezePaneLayout layout;
    layout.frozenRows = std::min(freeze.frozenRowCount(), dims.getTotalRows());
    layout.frozenCols = std::min(freeze.frozenColCount(), dims.getTotalCols());
    layout.frozenRowsHeight = dims.rowSpanHeight(0, layout.frozenRows);
    layout.frozenColsWidth = dims.columnSpanWidth(0, layout.frozenCols);
    return layout;
}

VisibleRange calculateVisibleRange(const Viewport& viewport, const DimensionResolver& dims,
                                   double width, double height) {
    if (width <= 0.0 || height <= 0.0 || dims.getTotalRows() <= 0 || dims.getTotalCols() <= 0) {
        return VisibleRange{};
    }
    const AxisWindow cols = ViewportLayout::scanAxis(dims, GridAxis::Columns, 0, dims.getTotalCols(),
                                                     viewport.scrollX, width - dims.getRowHeaderWidth());
    const AxisWindow rows = ViewportLayout::scanAxis(dims, GridAxis::Rows, 0, dims.getTotalRows(),
                                                     viewport.scrollY, height - dims.getColHeaderHeight());
    return combine(rows, cols);
}

ViewportLayout::ViewportLayout(const DimensionResolver& dims, const FreezeConfig& freeze, const Viewport& viewport,
                               double width, double height)
    : m_dims(dims)
    , m_viewport(viewport)
    , m_freeze(calculateFreezeLayout(freeze, dims))
    , m_width(width)
    , m_height(height) {
    m_viewport.scrollX = std::max(0.0, m_viewport.scrollX);
    m_viewport.scrollY = std::max(0.0, m_viewport.scrollY);
    m_scrollableX = std::min(std::max(0.0, m_width), dims.getRowHeaderWidth() + m_freeze.frozenColsWidth);
    m_scrollableY = std::min(std::max(0.0, m_height), dims.getColHeaderHeight() + m_freeze.frozenRowsHeight);
}

AxisWindow ViewportLayout::scanAxis(const DimensionResolver& dims, GridAxis axis, int origin, int limit,
                                    double scroll, double extent) {
    AxisWindow window;
    limit = std::min(limit, dims.getTotal(axis));
    origin = std::max(0, origin);
    if (limit <= origin) {
        window.start = window.end = dims.clampIndex(axis, origin);
        return window;
    }
    scroll = std::max(0.0, scroll);

    // Start: first index whose trailing edge is past the scroll position
    int index = origin;
    int lastSized = -1;
    double accumulated = 0.0;
    while (index < limit) {
        const double size = dims.getSize(axis, index);
        if (size > 0.0) {
            if (accumulated + size > scroll) break;
            accumulated += size;
            lastSized = index;
        }
        ++index;
    }
    if (index >= limit) {
        // Scrolled past the last index: pin to it
        window.start = window.end = lastSized >= 0 ? lastSized : origin;
        return window;
    }
    window.start = index;
    window.offset = -(scroll - accumulated);

    if (extent <= 0.0) {
        window.end = window.start;
        return window;
    }

    // End: last index at least partially inside the extent
    double covered = window.offset;
    int end = index;
    while (end < limit) {
        covered += dims.getSize(axis, end);
        if (covered >= extent) break;
        ++end;
    }
    window.end = std::min(end, limit - 1);
    return window;
}

AxisWindow ViewportLayout::scrollableColumns() const {
    return scanAxis(m_dims, GridAxis::Columns, m_freeze.frozenCols, m_dims.getTotalCols(),
                    m_viewport.scrollX, m_width - m_scrollableX);
}

AxisWindow ViewportLayout::scrollableRows() const {
    return scanAxis(m_dims, GridAxis::Rows, m_freeze.frozenRows, m_dims.getTotalRows(),
                    m_viewport.scrollY, m_height - m_scrollableY);
}

AxisWindow ViewportLayout::frozenColumns() const {
    return scanAxis(m_dims, GridAxis::Columns, 0, m_freeze.frozenCols, 0.0,
                    m_scrollableX - m_dims.getRowHeaderWidth());
}

AxisWindow ViewportLayout::frozenRows() const {
    return scanAxis(m_dims, GridAxis::Rows, 0, m_freeze.frozenRows, 0.0,
                    m_scrollableY - m_dims.getColHeaderHeight());
}

VisibleRange ViewportLayout::getScrollableRange() const {
    if (isEmpty() || m_dims.getTotalRows() <= 0 || m_dims.getTotalCols() <= 0) return VisibleRange{};
    return combine(scrollableRows(), scrollableColumns());
}

std::optional<VisibleRange> ViewportLayout::getTopRange() const {
    if (isEmpty() || !m_freeze.hasFrozenRows()) return std::nullopt;
    return combine(frozenRows(), scrollableColumns());
}

std::optional<VisibleRange> ViewportLayout::getLeftRange() const {
    if (isEmpty() || !m_freeze.hasFrozenCols()) return std::nullopt;
    return combine(scrollableRows(), frozenColumns());
}

std::optional<VisibleRange> ViewportLayout::getTopLeftRange() const {
    if (isEmpty() || !m_freeze.hasFrozenRows() || !m_freeze.hasFrozenCols()) return std::nullopt;
    return combine(frozenRows(), frozenColumns());
}

std::vector<ZonePass> ViewportLayout::getZonePasses() const {
    std::vector<ZonePass> passes;
    if (isEmpty() || m_dims.getTotalRows() <= 0 || m_dims.getTotalCols() <= 0) return passes;

    auto addPass = [&](GridZone zone, const VisibleRange& range) {
        const QRectF clip = getZoneRect(zone);
        if (clip.width() <= 0.0 || clip.height() <= 0.0) return;
        passes.push_back(ZonePass{zone, clip, range});
    };

    addPass(GridZone::Scrollable, getScrollableRange());
    if (auto left = getLeftRange()) addPass(GridZone::Left, *left);
    if (auto top = getTopRange()) addPass(GridZone::Top, *top);
    if (auto corner = getTopLeftRange()) addPass(GridZone::TopLeft, *corner);
    return passes;
}

QRectF ViewportLayout::getZoneRect(GridZone zone) const {
    const double left = std::min(std::max(0.0, m_width), m_dims.getRowHeaderWidth());
    const double top = std::min(std::max(0.0, m_height), m_dims.getColHeaderHeight());
    const double right = std::max(0.0, m_width);
    const double bottom = std::max(0.0, m_height);

    switch (zone) {
    case GridZone::TopLeft:
        return QRectF(QPointF(left, top), QPointF(m_scrollableX, m_scrollableY));
    case GridZone::Top:
        return QRectF(QPointF(m_scrollableX, top), QPointF(right, m_scrollableY));
    case GridZone::Left:
        return QRectF(QPointF(left, m_scrollableY), QPointF(m_scrollableX, bottom));
    case GridZone::Scrollable:
        return QRectF(QPointF(m_scrollableX, m_scrollableY), QPointF(right, bottom));
    case GridZone::Header:
        break;
    }
    return QRectF();
}

QRectF ViewportLayout::getCellArea() const {
    const double left = std::min(std::max(0.0, m_width), m_dims.getRowHeaderWidth());
    const double top = std::min(std::max(0.0, m_height), m_dims.getColHeaderHeight());
    return QRectF(QPointF(left, top), QPointF(std::max(0.0, m_width), std::max(0.0, m_height)));
}

GridZone ViewportLayout::zoneAt(double x, double y) const {
    if (x < m_dims.getRowHeaderWidth() || y < m_dims.getColHeaderHeight()) return GridZone::Header;
    if (x < m_scrollableX) {
        return y < m_scrollableY ? GridZone::TopLeft : GridZone::Left;
    }
    return y < m_scrollableY ? GridZone::Top : GridZone::Scrollable;
}
