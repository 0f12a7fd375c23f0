#include "CellContentLayer.hpp"
#include "../DimensionResolver.hpp"
#include "../FreezeGeometry.hpp"
#include "../MergeIndex.hpp"
#include "../RenderHooks.hpp"
#include "../TextLayout.hpp"
#include <algorithm>
#include <unordered_set>

namespace {

bool isEditingCell(const GridFrame& frame, int row, int col) {
    return frame.editing && frame.editing->row == row && frame.editing->col == col;
}

// Empty cells only paint when their stored style shows something
bool shouldPaint(const CellData& cell, const StyleDataMap* styles) {
    if (!cell.display.isEmpty()) return true;
    if (cell.styleIndex == 0) return false;
    return hasVisibleDecoration(lookupStyle(styles, cell.styleIndex));
}

}  // namespace

void CellContentLayer::paintZone(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass) {
    const GridFrame& snapshot = frame.getFrame();
    if (!snapshot.cells || snapshot.cells->empty()) return;

    const DimensionResolver& dims = frame.getDimensions();
    const MergeIndex& merges = frame.getMerges();
    const VisibleRange& range = pass.range;
    const int lastRow = std::min(range.endRow, dims.getTotalRows() - 1);
    const int lastCol = std::min(range.endCol, dims.getTotalCols() - 1);

    std::unordered_set<CellCoord, CellCoordHash> paintedMasters;

    for (int row = range.startRow; row <= lastRow; ++row) {
        for (int col = range.startCol; col <= lastCol; ++col) {
            CellCoord coord{row, col};
            if (std::optional<CellCoord> master = merges.masterOf(row, col)) {
                // A master scrolled out of the window still owns the visible part of its merge
                const bool masterOutside = master->row < range.startRow || master->col < range.startCol;
                if (!masterOutside || !paintedMasters.insert(*master).second) continue;
                coord = *master;
            }

            if (isEditingCell(snapshot, coord.row, coord.col)) continue;

            auto it = snapshot.cells->find(coord);
            if (it == snapshot.cells->end()) continue;
            if (!shouldPaint(it->second, snapshot.styles.get())) continue;

            paintCell(surface, frame, pass, it->second);
        }
    }
}

void CellContentLayer::paintCell(IDrawSurface& surface, const IFrameAccessor& frame, const ZonePass& pass,
                                 const CellData& cell) {
    const GridFrame& snapshot = frame.getFrame();
    const QRectF cellRect = frame.getGeometry().cellRect(cell.row, cell.col, std::max(1, cell.rowSpan),
                                                         std::max(1, cell.colSpan));
    const QRectF visible = cellRect.intersected(pass.clip);
    if (visible.isEmpty()) return;

    const double availableWidth = visible.width() - kPaddingX * 2.0;
    if (availableWidth <= 0.0) return;

    const StyleHookRegistry* hooks = frame.getStyleHooks();
    const ResolvedCellStyle style = resolveCellStyle(cell, snapshot.styles.get(), frame.getTheme(), hooks);

    surface.save();
    surface.clipRect(visible);

    if (style.background) surface.fillRect(visible, *style.background);
    paintBorders(surface, visible, style);

    if (hooks && hooks->hasDecorations()) {
        hooks->decorateCell(CellDecorationContext{surface, snapshot, cell.row, cell.col, cell.display, cellRect, visible});
    }

    if (!cell.display.isEmpty()) {
        surface.setFont(frame.getFontCache().fontFor(style.fontFamily, style.fontSize, style.bold, style.italic));
        if (style.rotation != 0.0) {
            paintRotatedText(surface, cell, style, visible);
        } else if (style.wrapText) {
            paintWrappedText(surface, cell, style, visible, availableWidth);
        } else {
            paintSingleLine(surface, cell, style, cellRect, visible, availableWidth);
        }
    }

    surface.restore();
}

StrokeStyle CellContentLayer::borderStroke(const ResolvedBorder& border) {
    switch (border.style) {
    case BorderLineStyle::Medium:
        return StrokeStyle(border.color, 2.0);
    case BorderLineStyle::Thick:
        return StrokeStyle(border.color, 3.0);
    case BorderLineStyle::Dashed:
        return StrokeStyle(border.color, 1.0, {4.0, 2.0});
    case BorderLineStyle::Dotted:
        return StrokeStyle(border.color, 1.0, {1.0, 2.0});
    case BorderLineStyle::None:
    case BorderLineStyle::Thin:
    case BorderLineStyle::Double:
        break;
    }
    return StrokeStyle(border.color, 1.0);
}

void CellContentLayer::paintBorders(IDrawSurface& surface, const QRectF& visible, const ResolvedCellStyle& style) {
    if (!style.hasVisibleBorder()) return;
    const double left = visible.left();
    const double top = visible.top();
    const double right = visible.right();
    const double bottom = visible.bottom();

    if (style.borderTop.isVisible()) paintBorderLine(surface, {left, top}, {right, top}, style.borderTop);
    if (style.borderBottom.isVisible()) paintBorderLine(surface, {left, bottom}, {right, bottom}, style.borderBottom);
    if (style.borderLeft.isVisible()) paintBorderLine(surface, {left, top}, {left, bottom}, style.borderLeft);
    if (style.borderRight.isVisible()) paintBorderLine(surface, {right, top}, {right, bottom}, style.borderRight);
}

void CellContentLayer::paintBorderLine(IDrawSurface& surface, const QPointF& from, const QPointF& to,
                                       const ResolvedBorder& border) {
    const StrokeStyle stroke = borderStroke(border);
    if (border.style != BorderLineStyle::Double) {
        surface.strokeLine(from, to, stroke);
        return;
    }

    constexpr double kDoubleGap = 1.5;
    const QPointF shift = from.y() == to.y() ? QPointF(0.0, kDoubleGap) : QPointF(kDoubleGap, 0.0);
    surface.strokeLine(from - shift, to - shift, stroke);
    surface.strokeLine(from + shift, to + shift, stroke);
}

void CellContentLayer::paintRotatedText(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                                        const QRectF& visible) {
    const double maxWidth = visible.height() - kPaddingY * 2.0;
    if (maxWidth <= 0.0) return;

    surface.translate(visible.center().x(), visible.center().y());
    surface.rotate(-style.rotation);

    const double half = maxWidth / 2.0;
    const FittedText fitted = TextLayout::fitToWidth(surface, cell.display, maxWidth);
    const double x = fitted.truncated ? -half : TextLayout::alignedX(style.align, -half, half, fitted.width, 0.0);
    surface.fillText(fitted.text, QPointF(x, 0.0), TextBaseline::Middle, style.textColor);
}

void CellContentLayer::paintWrappedText(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                                        const QRectF& visible, double availableWidth) {
    const QStringList lines = TextLayout::wrapLines(surface, cell.display, availableWidth);
    const double lineHeight = style.fontSize * TextLayout::kLineHeightFactor;
    const double totalHeight = lines.size() * lineHeight;

    double firstLineY = 0.0;
    switch (style.verticalAlign) {
    case VerticalAlign::Top:
        firstLineY = visible.top() + kPaddingY + lineHeight / 2.0;
        break;
    case VerticalAlign::Bottom:
        firstLineY = visible.bottom() - kPaddingY - totalHeight + lineHeight / 2.0;
        break;
    case VerticalAlign::Middle:
        firstLineY = visible.top() + (visible.height() - totalHeight) / 2.0 + lineHeight / 2.0;
        break;
    }

    const double left = visible.left() + kPaddingX;
    for (int i = 0; i < lines.size(); ++i) {
        const double lineY = firstLineY + i * lineHeight;
        if (lineY - lineHeight / 2.0 > visible.bottom()) break;
        if (lineY + lineHeight / 2.0 < visible.top()) continue;

        const FittedText fitted = TextLayout::fitToWidth(surface, lines.at(i), availableWidth);
        const double x = fitted.truncated
            ? left : TextLayout::alignedX(style.align, left, left + availableWidth, fitted.width, 0.0);
        surface.fillText(fitted.text, QPointF(x, lineY), TextBaseline::Middle, style.textColor);
    }
}

void CellContentLayer::paintSingleLine(IDrawSurface& surface, const CellData& cell, const ResolvedCellStyle& style,
                                       const QRectF& cellRect, const QRectF& visible, double availableWidth) {
    const double left = visible.left() + kPaddingX;
    const double right = left + availableWidth;

    double textY = cellRect.center().y();
    TextBaseline baseline = TextBaseline::Middle;
    if (style.verticalAlign == VerticalAlign::Top) {
        textY = visible.top() + kPaddingY;
        baseline = TextBaseline::Top;
    } else if (style.verticalAlign == VerticalAlign::Bottom) {
        textY = visible.bottom() - kPaddingY;
        baseline = TextBaseline::Bottom;
    }

    const FittedText fitted = TextLayout::fitToWidth(surface, cell.display, availableWidth);
    const double x = fitted.truncated ? left : TextLayout::alignedX(style.align, left, right, fitted.width, 0.0);
    surface.fillText(fitted.text, QPointF(x, textY), baseline, style.textColor);

    if (!style.underline && !style.strikethrough) return;

    const double decoWidth = std::min(surface.measureText(cell.display), availableWidth);
    const double decoX = TextLayout::alignedX(style.align, left, right, decoWidth, 0.0);
    const StrokeStyle stroke(style.textColor, 1.0);

    if (style.underline) {
        double y = textY + style.fontSize / 2.0 + 1.0;
        if (style.verticalAlign == VerticalAlign::Top) {
            y = visible.top() + kPaddingY + style.fontSize + 1.0;
        } else if (style.verticalAlign == VerticalAlign::Bottom) {
            y = visible.bottom() - kPaddingY + 1.0;
        }
        surface.strokeLine(QPointF(decoX, y), QPointF(decoX + decoWidth, y), stroke);
    }
    if (style.strikethrough) {
        double y = textY;
        if (style.verticalAlign == VerticalAlign::Top) {
            y = visible.top() + kPaddingY + style.fontSize / 2.0;
        } else if (style.verticalAlign == VerticalAlign::Bottom) {
            y = visible.bottom() - kPaddingY - style.fontSize / 2.0;
        }
        surface.strokeLine(QPointF(decoX, y), QPointF(decoX + decoWidth, y), stroke);
    }
}
