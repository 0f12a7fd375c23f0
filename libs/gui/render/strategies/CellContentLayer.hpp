/*
Calcula — CellContentLayer
Role: Paints cell backgrounds, borders, decorations and text for one freeze zone.
Inputs/Outputs: ZonePass in; per-cell fills, border strokes and (rotated / wrapped / truncated) text out.
Threading: Render thread.
Performance: Walks only the zone's visible window; fonts come from the session FontCache.
Integration: Second zone layer run by GridRenderSession, after GridLinesLayer.
Observability: Decoration hook failures are logged by StyleHookRegistry.
Related: StyleResolver.hpp, TextLayout.hpp, RenderHooks.hpp, MergeIndex.hpp.
Assumptions: Merge slaves are never painted; their master is painted once, even if it lies outside the window.
*/
#pragma once
#include "../IGridLayer.hpp"
#include "../StyleResolver.hpp"

class CellContentLayer : public IZoneLayer {
public:
    static constexpr double kPaddingX = 4.0;
    static constexpr double kPaddingY = 2.0;

    void paintZone(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass) override;
    const char* getLayerName() const override { return "CellContent"; }

    // Stroke of one border side as drawn on screen (double borders use two 1px strokes)
    static StrokeStyle borderStroke(const ResolvedBorder& border);

private:
    void paintCell(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass, const CellData& cell);
    void paintBorders(IDrawSurface& surface, const QRectF& visible, const ResolvedCellStyle& style);
    void paintBorderLine(IDrawSurface& surface, const QPointF& from, const QPointF& to, const ResolvedBorder& border);

    void paintRotatedText(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                          const QRectF& visible);
    void paintWrappedText(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                          const QRectF& visible, double availableWidth);
    void paintSingleLine(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                         const QRectF& cellRect, const QRectF& visible, double availableWidth);
};
