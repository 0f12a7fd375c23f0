#include "HitTester.hpp"
#include "../../core/CalculaLogging.hpp"
#include <algorithm>
#include <cmath>

HitTester::HitTester(const GridConfig& config, const Viewport& viewport, const DimensionOverrides* dimensions,
                     const FreezeConfig& freeze, double width, double height, const HitTestTuning& tuning)
    : m_config(config)
    , m_dims(m_config, dimensions)
    , m_layout(m_dims, freeze, viewport, width, height)
    , m_geometry(m_dims, m_layout.getFreezeLayout(), viewport, width, height)
    , m_viewport(viewport)
    , m_width(width)
    , m_height(height)
    , m_tuning(tuning) {
    m_viewport.scrollX = std::max(0.0, m_viewport.scrollX);
    m_viewport.scrollY = std::max(0.0, m_viewport.scrollY);
}

HitTester::HitTester(const GridFrame& frame, const HitTestTuning& tuning)
    : HitTester(frame.config, frame.viewport, frame.dimensions.get(), frame.freeze, frame.width, frame.height,
                tuning) {
}

bool HitTester::isReferenceOnSheet(const FormulaReference& reference, const QString& currentSheetName,
                                   const QString& formulaSourceSheetName) {
    if (currentSheetName.isEmpty()) return true;
    if (reference.sheetName && !reference.sheetName->isEmpty()) {
        return reference.sheetName->compare(currentSheetName, Qt::CaseInsensitive) == 0;
    }
    if (formulaSourceSheetName.isEmpty()) return true;
    return formulaSourceSheetName.compare(currentSheetName, Qt::CaseInsensitive) == 0;
}

bool HitTester::insideCellArea(double x, double y) const {
    return x >= m_dims.getRowHeaderWidth() && y >= m_dims.getColHeaderHeight();
}

HitTester::RangeBounds HitTester::clampedBounds(int startRow, int startCol, int endRow, int endCol) const {
    RangeBounds bounds;
    bounds.minRow = m_dims.clampRow(std::min(startRow, endRow));
    bounds.maxRow = m_dims.clampRow(std::max(startRow, endRow));
    bounds.minCol = m_dims.clampCol(std::min(startCol, endCol));
    bounds.maxCol = m_dims.clampCol(std::max(startCol, endCol));
    return bounds;
}

std::optional<HitTester::AxisHit> HitTester::indexAt(GridAxis axis, double pixel) const {
    const FreezePaneLayout& freeze = m_layout.getFreezeLayout();
    const bool rows = axis == GridAxis::Rows;
    const double header = rows ? m_dims.getColHeaderHeight() : m_dims.getRowHeaderWidth();
    const int frozenCount = rows ? freeze.frozenRows : freeze.frozenCols;
    const double boundary = rows ? m_layout.getScrollableOriginY() : m_layout.getScrollableOriginX();

    AxisHit hit;
    int origin = 0;
    int limit = m_dims.getTotal(axis);
    if (frozenCount > 0 && pixel < boundary) {
        hit.content = pixel - header;
        limit = frozenCount;
    } else {
        hit.content = pixel - boundary + (rows ? m_viewport.scrollY : m_viewport.scrollX);
        origin = frozenCount;
    }

    double accumulated = 0.0;
    for (int index = origin; index < limit; ++index) {
        const double size = m_dims.getSize(axis, index);
        if (size <= 0.0) continue;
        if (accumulated + size > hit.content) {
            hit.index = index;
            hit.start = accumulated;
            hit.size = size;
            return hit;
        }
        accumulated += size;
    }
    return std::nullopt;
}

int HitTester::applyStickiness(GridAxis axis, const AxisHit& hit, int originIndex, double threshold) const {
    if (threshold <= 0.0 || hit.size <= 0.0 || hit.index == originIndex) return hit.index;

    const double fraction = (hit.content - hit.start) / hit.size;
    const bool rows = axis == GridAxis::Rows;
    const FreezePaneLayout& freeze = m_layout.getFreezeLayout();
    const int frozenCount = rows ? freeze.frozenRows : freeze.frozenCols;
    const double boundary = rows ? m_layout.getScrollableOriginY() : m_layout.getScrollableOriginX();

    // Scrollable indices that end at or before the frozen boundary are covered by the pane
    auto coveredByFreeze = [&](int index) {
        if (frozenCount <= 0 || index < frozenCount) return false;
        const double start = rows ? m_geometry.rowY(index) : m_geometry.columnX(index);
        return start + m_dims.getSize(axis, index) <= boundary;
    };
    auto stepToward = [&](int index, int step) {
        // Next visible index toward the origin, never past it
        int next = index + step;
        while (next != originIndex && m_dims.getSize(axis, next) <= 0.0) next += step;
        return coveredByFreeze(next) ? index : next;
    };

    if (hit.index > originIndex && fraction < threshold) {
        return stepToward(hit.index, -1);
    }
    if (hit.index < originIndex && fraction > 1.0 - threshold) {
        return stepToward(hit.index, +1);
    }
    return hit.index;
}

std::optional<CellCoord> HitTester::cellFromPixel(double x, double y,
                                                  const std::optional<CellCoord>& dragOrigin) const {
    if (!insideCellArea(x, y)) return std::nullopt;

    const auto colHit = indexAt(GridAxis::Columns, x);
    const auto rowHit = indexAt(GridAxis::Rows, y);
    if (!colHit || !rowHit) return std::nullopt;

    CellCoord cell{rowHit->index, colHit->index};
    if (dragOrigin) {
        cell.col = applyStickiness(GridAxis::Columns, *colHit, m_dims.clampCol(dragOrigin->col),
                                   std::clamp(m_tuning.columnDragThreshold, 0.0, 1.0));
        cell.row = applyStickiness(GridAxis::Rows, *rowHit, m_dims.clampRow(dragOrigin->row),
                                   std::clamp(m_tuning.rowDragThreshold, 0.0, 1.0));
        if (cell.col != colHit->index || cell.row != rowHit->index) {
            cgLog_Hit("Drag stickiness held (" << rowHit->index << "," << colHit->index << ") at ("
                      << cell.row << "," << cell.col << ")");
        }
    }
    return cell;
}

std::optional<int> HitTester::columnFromHeader(double x, double y) const {
    if (y < 0.0 || y >= m_dims.getColHeaderHeight() || x < m_dims.getRowHeaderWidth()) return std::nullopt;
    const auto hit = indexAt(GridAxis::Columns, x);
    if (!hit) return std::nullopt;
    return hit->index;
}

std::optional<int> HitTester::rowFromHeader(double x, double y) const {
    if (x < 0.0 || x >= m_dims.getRowHeaderWidth() || y < m_dims.getColHeaderHeight()) return std::nullopt;
    const auto hit = indexAt(GridAxis::Rows, y);
    if (!hit) return std::nullopt;
    return hit->index;
}

std::optional<int> HitTester::columnResizeHandle(double x, double y) const {
    if (y < 0.0 || y >= m_dims.getColHeaderHeight() || x < m_dims.getRowHeaderWidth()) return std::nullopt;

    const double half = m_tuning.resizeHandleSize / 2.0;
    const FreezePaneLayout& freeze = m_layout.getFreezeLayout();
    for (int col = 0; col < freeze.frozenCols; ++col) {
        const double width = m_dims.getColumnWidth(col);
        if (width <= 0.0) continue;
        if (std::abs(x - (m_geometry.columnX(col) + width)) <= half) return col;
    }

    const VisibleRange range = m_layout.getScrollableRange();
    for (int col = range.startCol; col <= range.endCol; ++col) {
        const double width = m_dims.getColumnWidth(col);
        if (width <= 0.0) continue;
        const double edge = m_geometry.columnX(col) + width;
        if (edge < m_layout.getScrollableOriginX()) continue;  // hidden behind frozen columns
        if (std::abs(x - edge) <= half) return col;
    }
    return std::nullopt;
}

std::optional<int> HitTester::rowResizeHandle(double x, double y) const {
    if (x < 0.0 || x >= m_dims.getRowHeaderWidth() || y < m_dims.getColHeaderHeight()) return std::nullopt;

    const double half = m_tuning.resizeHandleSize / 2.0;
    const FreezePaneLayout& freeze = m_layout.getFreezeLayout();
    for (int row = 0; row < freeze.frozenRows; ++row) {
        const double height = m_dims.getRowHeight(row);
        if (height <= 0.0) continue;
        if (std::abs(y - (m_geometry.rowY(row) + height)) <= half) return row;
    }

    const VisibleRange range = m_layout.getScrollableRange();
    for (int row = range.startRow; row <= range.endRow; ++row) {
        const double height = m_dims.getRowHeight(row);
        if (height <= 0.0) continue;
        const double edge = m_geometry.rowY(row) + height;
        if (edge < m_layout.getScrollableOriginY()) continue;
        if (std::abs(y - edge) <= half) return row;
    }
    return std::nullopt;
}

std::optional<ReferenceCornerHit> HitTester::formulaReferenceCornerAtPixel(
    double x, double y, const std::vector<FormulaReference>& references,
    const QString& currentSheetName, const QString& formulaSourceSheetName) const {
    if (!insideCellArea(x, y)) return std::nullopt;

    const double tolerance = m_tuning.referenceCornerTolerance;
    // Last drawn reference is on top
    for (int i = static_cast<int>(references.size()) - 1; i >= 0; --i) {
        const FormulaReference& ref = references[static_cast<size_t>(i)];
        if (ref.isPassive || ref.isFullRow || ref.isFullColumn) continue;
        if (!isReferenceOnSheet(ref, currentSheetName, formulaSourceSheetName)) continue;

        const RangeBounds b = clampedBounds(ref.startRow, ref.startCol, ref.endRow, ref.endCol);
        const QRectF rect = m_geometry.rangeRect(b.minRow, b.minCol, b.maxRow, b.maxCol);
        const QRectF clip = m_geometry.rangeClip(b.minRow, b.minCol, b.maxRow, b.maxCol);
        if (!clip.contains(QPointF(x, y))) continue;

        const struct {
            QPointF point;
            ReferenceCorner corner;
        } corners[] = {
            {rect.topLeft(), ReferenceCorner::TopLeft},
            {rect.topRight(), ReferenceCorner::TopRight},
            {rect.bottomLeft(), ReferenceCorner::BottomLeft},
            {rect.bottomRight(), ReferenceCorner::BottomRight},
        };
        for (const auto& c : corners) {
            if (std::abs(x - c.point.x()) <= tolerance && std::abs(y - c.point.y()) <= tolerance) {
                return ReferenceCornerHit{i, c.corner};
            }
        }
    }
    return std::nullopt;
}

std::optional<ReferenceBorderHit> HitTester::formulaReferenceBorderAtPixel(
    double x, double y, const std::vector<FormulaReference>& references,
    const QString& currentSheetName, const QString& formulaSourceSheetName) const {
    if (!insideCellArea(x, y)) return std::nullopt;
    if (formulaReferenceCornerAtPixel(x, y, references, currentSheetName, formulaSourceSheetName)) {
        return std::nullopt;
    }

    const double tolerance = m_tuning.referenceEdgeTolerance;
    for (int i = static_cast<int>(references.size()) - 1; i >= 0; --i) {
        const FormulaReference& ref = references[static_cast<size_t>(i)];
        if (ref.isPassive) continue;
        if (!isReferenceOnSheet(ref, currentSheetName, formulaSourceSheetName)) continue;

        const RangeBounds b = clampedBounds(ref.startRow, ref.startCol, ref.endRow, ref.endCol);
        const QRectF rect = m_geometry.rangeRect(b.minRow, b.minCol, b.maxRow, b.maxCol);
        const QRectF clip = m_geometry.rangeClip(b.minRow, b.minCol, b.maxRow, b.maxCol);
        if (!clip.contains(QPointF(x, y))) continue;

        const bool withinX = x >= rect.left() - tolerance && x <= rect.right() + tolerance;
        const bool withinY = y >= rect.top() - tolerance && y <= rect.bottom() + tolerance;
        if (withinX && std::abs(y - rect.top()) <= tolerance) return ReferenceBorderHit{i, RectEdge::Top};
        if (withinX && std::abs(y - rect.bottom()) <= tolerance) return ReferenceBorderHit{i, RectEdge::Bottom};
        if (withinY && std::abs(x - rect.left()) <= tolerance) return ReferenceBorderHit{i, RectEdge::Left};
        if (withinY && std::abs(x - rect.right()) <= tolerance) return ReferenceBorderHit{i, RectEdge::Right};
    }
    return std::nullopt;
}

std::optional<RectEdge> HitTester::selectionBorderAtPixel(double x, double y, const Selection& selection) const {
    if (!insideCellArea(x, y)) return std::nullopt;

    const RangeBounds b = clampedBounds(selection.startRow, selection.startCol, selection.endRow, selection.endCol);
    const QRectF rect = m_geometry.rangeRect(b.minRow, b.minCol, b.maxRow, b.maxCol);
    const QRectF clip = m_geometry.rangeClip(b.minRow, b.minCol, b.maxRow, b.maxCol);
    if (!clip.contains(QPointF(x, y))) return std::nullopt;

    const double tolerance = m_tuning.selectionEdgeTolerance;
    const bool withinX = x >= rect.left() - tolerance && x <= rect.right() + tolerance;
    const bool withinY = y >= rect.top() - tolerance && y <= rect.bottom() + tolerance;
    const bool checkHorizontal = selection.type != SelectionType::Columns;  // top/bottom
    const bool checkVertical = selection.type != SelectionType::Rows;       // left/right

    if (checkHorizontal && withinX) {
        if (std::abs(y - rect.top()) <= tolerance) return RectEdge::Top;
        if (std::abs(y - rect.bottom()) <= tolerance) return RectEdge::Bottom;
    }
    if (checkVertical && withinY) {
        if (std::abs(x - rect.left()) <= tolerance) return RectEdge::Left;
        if (std::abs(x - rect.right()) <= tolerance) return RectEdge::Right;
    }
    return std::nullopt;
}

bool HitTester::fillHandleAtPixel(double x, double y, const Selection& selection) const {
    const RangeBounds b = clampedBounds(selection.startRow, selection.startCol, selection.endRow, selection.endCol);
    const auto handle = m_geometry.fillHandleRect(b.minRow, b.minCol, b.maxRow, b.maxCol, m_tuning.fillHandleSize);
    if (!handle) return false;
    // One extra pixel of slop around the square
    return handle->adjusted(-1.0, -1.0, 1.0, 1.0).contains(QPointF(x, y));
}

QPointF HitTester::cellOrigin(const CellCoord& cell) const {
    return QPointF(m_geometry.columnX(cell.col), m_geometry.rowY(cell.row));
}
