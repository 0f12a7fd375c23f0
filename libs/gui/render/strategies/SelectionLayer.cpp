#include "SelectionLayer.hpp"
#include "../DimensionResolver.hpp"
#include "../FreezeGeometry.hpp"
#include "../HitTester.hpp"
#include "../MergeIndex.hpp"

bool SelectionLayer::isSuppressed(const GridFrame& frame) {
    if (!frame.editing) return false;
    if (frame.currentSheetName.isEmpty() || frame.formulaSourceSheetName.isEmpty()) return false;
    return frame.currentSheetName.compare(frame.formulaSourceSheetName, Qt::CaseInsensitive) != 0;
}

void SelectionLayer::paint(IDrawSurface& surface, const IFrameAccessor& frame) {
    const GridFrame& snapshot = frame.getFrame();
    if (!snapshot.selection || isSuppressed(snapshot)) return;

    const Selection& selection = *snapshot.selection;
    const std::optional<QRectF> visible = visibleRangeRect(frame, selection);
    if (!visible) return;

    const GridTheme& theme = frame.getTheme();
    surface.fillRect(*visible, theme.selectionBackground);
    strokeInside(surface, *visible, StrokeStyle(theme.selectionBorder, 2.0));

    paintFillHandle(surface, frame, selection);
    paintActiveCell(surface, frame, selection);
}

void SelectionLayer::paintFillHandle(IDrawSurface& surface, const IFrameAccessor& frame, const Selection& selection) {
    const DimensionResolver& dims = frame.getDimensions();
    const std::optional<QRectF> handle = frame.getGeometry().fillHandleRect(
        dims.clampRow(selection.minRow()), dims.clampCol(selection.minCol()),
        dims.clampRow(selection.maxRow()), dims.clampCol(selection.maxCol()), frame.getTuning().fillHandleSize);
    if (!handle) return;

    surface.fillRect(*handle, QColor(Qt::white));
    surface.strokeRect(*handle, StrokeStyle(frame.getTheme().fillHandleBorder, 2.0));
}

void SelectionLayer::paintActiveCell(IDrawSurface& surface, const IFrameAccessor& frame, const Selection& selection) {
    const DimensionResolver& dims = frame.getDimensions();
    const int row = dims.clampRow(selection.endRow);
    const int col = dims.clampCol(selection.endCol);

    const GridFrame& snapshot = frame.getFrame();
    if (snapshot.editing && snapshot.editing->row == row && snapshot.editing->col == col) return;

    // A merged active cell is framed as a whole
    std::optional<QRectF> visible;
    if (const MergeRegion* merge = frame.getMerges().regionAt(row, col)) {
        visible = visibleRangeRect(frame, merge->row, merge->col, merge->lastRow(), merge->lastCol());
    } else {
        visible = visibleRangeRect(frame, row, col, row, col);
    }
    if (!visible) return;
    strokeInside(surface, *visible, StrokeStyle(frame.getTheme().activeCellBorder, 2.0));
}
