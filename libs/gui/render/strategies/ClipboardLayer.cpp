#include "ClipboardLayer.hpp"

StrokeStyle ClipboardLayer::antsStroke(const GridTheme& theme, const ClipboardState& clipboard) {
    const QColor& color = clipboard.mode == ClipboardMode::Cut ? theme.clipboardCut : theme.clipboardCopy;
    return StrokeStyle(color, kStrokeWidth, {kDashLength, kDashLength}, -clipboard.dashOffset);
}

void ClipboardLayer::paint(IDrawSurface& surface, const IFrameAccessor& frame) {
    const ClipboardState& clipboard = frame.getFrame().clipboard;
    if (clipboard.mode == ClipboardMode::None || !clipboard.selection) return;

    const std::optional<QRectF> visible = visibleRangeRect(frame, *clipboard.selection);
    if (!visible) return;

    // White first so the gaps stay visible on any cell color
    strokeInside(surface, *visible, StrokeStyle(QColor(Qt::white), kStrokeWidth));
    strokeInside(surface, *visible, antsStroke(frame.getTheme(), clipboard));
}
