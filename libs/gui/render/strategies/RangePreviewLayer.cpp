#include "RangePreviewLayer.hpp"

void RangePreviewLayer::paint(IDrawSurface& surface, const IFrameAccessor& frame) {
    const GridFrame& snapshot = frame.getFrame();
    const std::optional<Selection>& range =
        m_kind == Kind::FillHandle ? snapshot.fillPreview : snapshot.selectionDragPreview;
    if (!range) return;

    const std::optional<QRectF> visible = visibleRangeRect(frame, *range);
    if (!visible) return;

    const GridTheme& theme = frame.getTheme();
    const bool fill = m_kind == Kind::FillHandle;
    surface.fillRect(*visible, fill ? theme.fillPreviewBackground : theme.dragPreviewBackground);
    strokeInside(surface, *visible,
                 StrokeStyle(fill ? theme.fillPreviewBorder : theme.dragPreviewBorder, 2.0, {4.0, 4.0}));
}
