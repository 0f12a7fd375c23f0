/*
Calcula — ViewportLayout
Role: Virtualizes the sheet: maps scroll + canvas size to visible cell windows for each freeze zone.
Inputs/Outputs: DimensionResolver, FreezeConfig, Viewport and canvas size in; VisibleRange / ZonePass out.
Threading: Pure; constructed per frame (and per hit test).
Performance: The start scan is O(start index) over hidden/overridden sizes; the end scan is O(visible cells).
Integration: GridRenderSession builds one per frame; HitTester reuses scanAxis and the zone rects.
Observability: None (callers log).
Related: DimensionResolver.hpp, GridTypes.hpp, HitTester.hpp.
Assumptions: Negative scroll is treated as 0; freeze counts are clamped to the sheet size.
*/
#pragma once
#include <QRectF>
#include <optional>
#include <vector>
#include "DimensionResolver.hpp"
#include "GridTypes.hpp"

// One axis of a visible window
struct AxisWindow {
    int start = 0;
    int end = 0;
    double offset = 0.0;
};

class ViewportLayout {
public:
    ViewportLayout(const DimensionResolver& dims, const FreezeConfig& freeze, const Viewport& viewport,
                   double width, double height);

    // Scans indices [origin, limit) of one axis. Hidden indices are skipped.
    static AxisWindow scanAxis(const DimensionResolver& dims, GridAxis axis, int origin, int limit,
                               double scroll, double extent);

    const FreezePaneLayout& getFreezeLayout() const { return m_freeze; }
    bool hasFreeze() const { return m_freeze.hasFrozenRows() || m_freeze.hasFrozenCols(); }

    // Zone windows. Frozen zones are absent when their axis is not frozen.
    VisibleRange getScrollableRange() const;
    std::optional<VisibleRange> getTopRange() const;
    std::optional<VisibleRange> getLeftRange() const;
    std::optional<VisibleRange> getTopLeftRange() const;

    // Paint order: scrollable, left, top, top-left. Without freeze a single scrollable pass.
    std::vector<ZonePass> getZonePasses() const;

    QRectF getZoneRect(GridZone zone) const;
    QRectF getCellArea() const;
    GridZone zoneAt(double x, double y) const;

    // Pixel where the scrollable columns / rows begin
    double getScrollableOriginX() const { return m_scrollableX; }
    double getScrollableOriginY() const { return m_scrollableY; }

    double getWidth() const { return m_width; }
    double getHeight() const { return m_height; }
    bool isEmpty() const { return m_width <= 0.0 || m_height <= 0.0; }

private:
    AxisWindow scrollableColumns() const;
    AxisWindow scrollableRows() const;
    AxisWindow frozenColumns() const;
    AxisWindow frozenRows() const;

    const DimensionResolver& m_dims;
    Viewport m_viewport;
    FreezePaneLayout m_freeze;
    double m_width;
    double m_height;
    double m_scrollableX;
    double m_scrollableY;
};

// Freeze-less virtualization window for a canvas of width x height
VisibleRange calculateVisibleRange(const Viewport& viewport, const DimensionResolver& dims,
                                   double width, double height);

FreezePaneLayout calculateFreezeLayout(const FreezeConfig& freeze, const DimensionResolver& dims);
