/*
Calcula — ClipboardLayer
Role: Marching-ants border around the copied or cut range.
Inputs/Outputs: GridFrame::clipboard (mode, range, dash phase) in; a white under-stroke plus a dashed color stroke out.
Threading: Render thread.
Performance: Two rect strokes per frame.
Integration: Run by GridRenderSession after SelectionLayer; GridFrameDriver advances the dash phase between frames.
Observability: No internal logging.
Related: GridFrameDriver.h (phase clock), SelectionLayer.hpp.
Assumptions: The phase is in pixels and already wrapped to [0, kDashPeriod).
*/
#pragma once
#include "../IGridLayer.hpp"

class ClipboardLayer : public IGridLayer {
public:
    static constexpr double kDashLength = 4.0;
    static constexpr double kDashPeriod = kDashLength * 2.0;
    static constexpr double kStrokeWidth = 2.0;

    void paint(IDrawSurface& surface, const IFrameAccessor& frame) override;
    const char* getLayerName() const override { return "Clipboard"; }

    static StrokeStyle antsStroke(const GridTheme& theme, const ClipboardState& clipboard);
};
