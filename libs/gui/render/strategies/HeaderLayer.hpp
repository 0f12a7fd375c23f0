/*
Calcula — HeaderLayer
Role: Column letters, row numbers and the corner box, with selection highlighting.
Inputs/Outputs: Zone windows from ViewportLayout + selection in; header band fills, separators and labels out.
Threading: Render thread.
Performance: Labels only for the visible windows of each band segment (frozen + scrollable).
Integration: Last layer run by GridRenderSession so headers sit above every cell-area highlight.
Observability: No internal logging.
Related: CellReference.h (column letters), ViewportLayout.hpp, FreezeGeometry.hpp.
Assumptions: Hidden rows/columns have zero size and get no label.
*/
#pragma once
#include "../DimensionResolver.hpp"
#include "../IGridLayer.hpp"
#include <vector>

class HeaderLayer : public IGridLayer {
public:
    void paint(IDrawSurface& surface, const IFrameAccessor& frame) override;
    const char* getLayerName() const override { return "Headers"; }

private:
    // Index window and clip of one piece of a header band
    struct BandSegment {
        int first = 0;
        int last = -1;
        QRectF clip;
    };

    enum class HeaderState { Plain, PartiallySelected, FullySelected };

    static std::vector<BandSegment> columnSegments(const IFrameAccessor& frame);
    static std::vector<BandSegment> rowSegments(const IFrameAccessor& frame);
    static HeaderState headerState(const GridFrame& frame, GridAxis axis, int index);

    void paintColumnHeaders(IDrawSurface& surface, const IFrameAccessor& frame);
    void paintRowHeaders(IDrawSurface& surface, const IFrameAccessor& frame);
    void paintCorner(IDrawSurface& surface, const IFrameAccessor& frame);
    void paintLabel(IDrawSurface& surface, const QString& label, const QPointF& center, const QColor& color);
};
