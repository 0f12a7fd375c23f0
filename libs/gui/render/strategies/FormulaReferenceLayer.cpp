#include "FormulaReferenceLayer.hpp"
#include "../DimensionResolver.hpp"
#include "../FreezeGeometry.hpp"
#include "../HitTester.hpp"
#include "../StyleResolver.hpp"
#include <algorithm>

QColor FormulaReferenceLayer::referenceColor(const GridTheme& theme, const FormulaReference& reference, int index) {
    if (std::optional<QColor> parsed = parseCssColor(reference.color)) return *parsed;
    const int slot = index % static_cast<int>(theme.referenceColors.size());
    return theme.referenceColors[static_cast<size_t>(slot)];
}

void FormulaReferenceLayer::paint(IDrawSurface& surface, const IFrameAccessor& frame) {
    const GridFrame& snapshot = frame.getFrame();
    const GridTheme& theme = frame.getTheme();

    for (size_t i = 0; i < snapshot.formulaReferences.size(); ++i) {
        const FormulaReference& reference = snapshot.formulaReferences[i];
        if (!HitTester::isReferenceOnSheet(reference, snapshot.currentSheetName, snapshot.formulaSourceSheetName)) {
            continue;
        }

        const std::optional<QRectF> visible = visibleRangeRect(
            frame, std::min(reference.startRow, reference.endRow), std::min(reference.startCol, reference.endCol),
            std::max(reference.startRow, reference.endRow), std::max(reference.startCol, reference.endCol));
        if (!visible) continue;

        const QColor color = referenceColor(theme, reference, static_cast<int>(i));
        QColor tint = color;
        tint.setAlpha(kFillAlpha);
        surface.fillRect(*visible, tint);

        StrokeStyle border(color, kBorderWidth);
        if (reference.isPassive) border.dashPattern = {4.0, 2.0};
        strokeInside(surface, *visible, border);

        if (!reference.isPassive && !reference.isFullRow && !reference.isFullColumn) {
            paintCorners(surface, frame, reference, color);
        }
    }
}

void FormulaReferenceLayer::paintCorners(IDrawSurface& surface, const IFrameAccessor& frame,
                                         const FormulaReference& reference, const QColor& color) {
    const DimensionResolver& dims = frame.getDimensions();
    const int minRow = dims.clampRow(std::min(reference.startRow, reference.endRow));
    const int maxRow = dims.clampRow(std::max(reference.startRow, reference.endRow));
    const int minCol = dims.clampCol(std::min(reference.startCol, reference.endCol));
    const int maxCol = dims.clampCol(std::max(reference.startCol, reference.endCol));

    const FreezeGeometry& geometry = frame.getGeometry();
    const QRectF rect = geometry.rangeRect(minRow, minCol, maxRow, maxCol);
    const QRectF clip = geometry.rangeClip(minRow, minCol, maxRow, maxCol);
    const double half = kCornerSize / 2.0;

    for (const QPointF& corner : {rect.topLeft(), rect.topRight(), rect.bottomLeft(), rect.bottomRight()}) {
        if (!clip.contains(corner)) continue;
        const QRectF grip(corner.x() - half, corner.y() - half, kCornerSize, kCornerSize);
        surface.save();
        surface.clipRect(clip);
        surface.fillRect(grip, color);
        surface.strokeRect(grip, StrokeStyle(QColor(Qt::white), 1.0));
        surface.restore();
    }
}
