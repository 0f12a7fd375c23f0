/*
Calcula — IGridLayer
Role: Abstract interfaces for the layers the render session composes into a frame.
Inputs/Outputs: A layer paints onto an IDrawSurface using data pulled through an IFrameAccessor.
Threading: Called on the render thread, once per frame (zone layers once per freeze zone).
Performance: Layers should touch only the visible window handed to them.
Integration: Implemented by the classes under render/strategies and driven by GridRenderSession.
Observability: No diagnostics defined; responsibility of the concrete implementation.
Related: GridRenderSession.h, IFrameAccessor.hpp, GridLinesLayer.hpp, SelectionLayer.hpp.
Assumptions: Layers leave the surface state as they found it (save/restore around changes).
*/
#pragma once
#include <QRectF>
#include <optional>
#include "IDrawSurface.hpp"
#include "IFrameAccessor.hpp"

// Full-frame layer (highlights, headers)
class IGridLayer {
public:
    virtual ~IGridLayer() = default;

    virtual void paint(IDrawSurface& surface, const IFrameAccessor& frame) = 0;
    virtual const char* getLayerName() const = 0;

protected:
    // Normalized, clamped, freeze-clipped rect of a range; nothing when scrolled out
    static std::optional<QRectF> visibleRangeRect(const IFrameAccessor& frame, const Selection& range);
    static std::optional<QRectF> visibleRangeRect(const IFrameAccessor& frame, int minRow, int minCol,
                                                  int maxRow, int maxCol);

    // Crisp 1px line coordinate
    static double crisp(double value);

    // Stroke a rect whose 2px border sits just inside `rect`
    static void strokeInside(IDrawSurface& surface, const QRectF& rect, const StrokeStyle& stroke);
};

// Layer painted once per freeze zone, inside that zone's clip
class IZoneLayer {
public:
    virtual ~IZoneLayer() = default;

    virtual void paintZone(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass) = 0;
    virtual const char* getLayerName() const = 0;
};
