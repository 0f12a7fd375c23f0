/*
Calcula — FreezeGeometry
Role: Freeze-aware cell -> pixel resolver shared by highlights, cells, headers and hit tests.
Inputs/Outputs: Cell indices in; screen-space x/y/rects (header bands included in the coordinate system) out.
Threading: Pure; built per frame.
Performance: Positions use DimensionResolver span sums, so a lookup never walks every preceding index.
Integration: Owned by the frame accessor; used by every layer that positions something by cell index.
Observability: None.
Related: ViewportLayout.hpp, StructuralAnimation.hpp.
Assumptions: Frozen indices use a fixed origin, scrollable ones subtract the scroll; never mixed for one cell.
*/
#pragma once
#include <QRectF>
#include <optional>
#include "DimensionResolver.hpp"
#include "GridTypes.hpp"
#include "StructuralAnimation.hpp"

class FreezeGeometry {
public:
    FreezeGeometry(const DimensionResolver& dims, const FreezePaneLayout& freeze, const Viewport& viewport,
                   double width, double height, const AnimationShifts& shifts = AnimationShifts{});

    double columnX(int col) const;
    double rowY(int row) const;
    QRectF cellRect(int row, int col, int rowSpan = 1, int colSpan = 1) const;

    // Unclipped rectangle covering the inclusive range
    QRectF rangeRect(int minRow, int minCol, int maxRow, int maxCol) const;

    // Clip for a range: the zone(s) it may legitimately paint into
    QRectF rangeClip(int minRow, int minCol, int maxRow, int maxCol) const;

    // rangeRect intersected with rangeClip; empty results are dropped
    std::optional<QRectF> visibleRangeRect(int minRow, int minCol, int maxRow, int maxCol) const;

    // Fill-handle square at the bottom-right of a range; absent when that corner is clipped away
    std::optional<QRectF> fillHandleRect(int minRow, int minCol, int maxRow, int maxCol, double handleSize) const;

    bool isFrozenColumn(int col) const { return col < m_freeze.frozenCols; }
    bool isFrozenRow(int row) const { return row < m_freeze.frozenRows; }

    const FreezePaneLayout& getFreezeLayout() const { return m_freeze; }

private:
    const DimensionResolver& m_dims;
    FreezePaneLayout m_freeze;
    double m_scrollX;
    double m_scrollY;
    double m_width;
    double m_height;
    AnimationShifts m_shifts;
};
