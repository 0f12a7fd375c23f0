/*
Calcula — SelectionLayer
Role: Primary selection highlight: translucent fill, 2px border, fill handle and the active-cell frame.
Inputs/Outputs: GridFrame::selection in; fills and strokes clipped to the freeze zone(s) the range belongs to.
Threading: Render thread.
Performance: Constant work per frame; positions come from FreezeGeometry span sums.
Integration: Run by GridRenderSession after the drag previews and before the clipboard ants.
Observability: No internal logging.
Related: ClipboardLayer.hpp, RangePreviewLayer.hpp, HitTester.hpp (fill handle hit area).
Assumptions: The fill handle size matches HitTestTuning::fillHandleSize so drawing and hit testing agree.
*/
#pragma once
#include "../IGridLayer.hpp"

class SelectionLayer : public IGridLayer {
public:
    void paint(IDrawSurface& surface, const IFrameAccessor& frame) override;
    const char* getLayerName() const override { return "Selection"; }

    // Selection belongs to another sheet than the one on screen while a formula is being edited
    static bool isSuppressed(const GridFrame& frame);

private:
    void paintFillHandle(IDrawSurface& surface, const IFrameAccessor& frame, const Selection& selection);
    void paintActiveCell(IDrawSurface& surface, const IFrameAccessor& frame, const Selection& selection);
};
