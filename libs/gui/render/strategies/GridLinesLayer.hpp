/*
Calcula — GridLinesLayer
Role: Paints a zone's background and its merge-aware grid lines.
Inputs/Outputs: ZonePass (clip + visible window) in; background fill and 1px crisp line segments out.
Threading: Render thread.
Performance: One MergeIndex::lineSegments query per visible boundary.
Integration: First zone layer run by GridRenderSession for every freeze zone.
Observability: No internal logging.
Related: MergeIndex.hpp, CellContentLayer.hpp.
Assumptions: The session has already clipped the surface to pass.clip when freeze panes are active.
*/
#pragma once
#include "../IGridLayer.hpp"

class GridLinesLayer : public IZoneLayer {
public:
    void paintZone(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass) override;
    const char* getLayerName() const override { return "GridLines"; }

private:
    void paintVerticalLines(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass,
                            const StrokeStyle& stroke);
    void paintHorizontalLines(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass,
                              const StrokeStyle& stroke);
};
