#include "HeaderLayer.hpp"
#include "../DimensionResolver.hpp"
#include "../FreezeGeometry.hpp"
#include "../TextLayout.hpp"
#include "../ViewportLayout.hpp"
#include "../../../core/sheet/CellReference.h"

void HeaderLayer::paint(IDrawSurface& surface, const IFrameAccessor& frame) {
    const GridTheme& theme = frame.getTheme();
    surface.setFont(frame.getFontCache().fontFor(theme.cellFontFamily, theme.headerFontSize, false, false));

    paintColumnHeaders(surface, frame);
    paintRowHeaders(surface, frame);
    paintCorner(surface, frame);
}

HeaderLayer::HeaderState HeaderLayer::headerState(const GridFrame& frame, GridAxis axis, int index) {
    if (!frame.selection) return HeaderState::Plain;
    const Selection& selection = *frame.selection;
    const bool columns = axis == GridAxis::Columns;
    const int first = columns ? selection.minCol() : selection.minRow();
    const int last = columns ? selection.maxCol() : selection.maxRow();
    if (index < first || index > last) return HeaderState::Plain;

    const SelectionType fullType = columns ? SelectionType::Columns : SelectionType::Rows;
    return selection.type == fullType ? HeaderState::FullySelected : HeaderState::PartiallySelected;
}

std::vector<HeaderLayer::BandSegment> HeaderLayer::columnSegments(const IFrameAccessor& frame) {
    const ViewportLayout& layout = frame.getLayout();
    const double headerHeight = frame.getDimensions().getColHeaderHeight();
    const double left = frame.getDimensions().getRowHeaderWidth();
    const double split = layout.getScrollableOriginX();

    std::vector<BandSegment> segments;
    if (std::optional<VisibleRange> frozen = layout.getLeftRange()) {
        segments.push_back({frozen->startCol, frozen->endCol, QRectF(QPointF(left, 0.0), QPointF(split, headerHeight))});
    }
    const VisibleRange scrollable = layout.getScrollableRange();
    segments.push_back({scrollable.startCol, scrollable.endCol,
                        QRectF(QPointF(split, 0.0), QPointF(layout.getWidth(), headerHeight))});
    return segments;
}

std::vector<HeaderLayer::BandSegment> HeaderLayer::rowSegments(const IFrameAccessor& frame) {
    const ViewportLayout& layout = frame.getLayout();
    const double headerWidth = frame.getDimensions().getRowHeaderWidth();
    const double top = frame.getDimensions().getColHeaderHeight();
    const double split = layout.getScrollableOriginY();

    std::vector<BandSegment> segments;
    if (std::optional<VisibleRange> frozen = layout.getTopRange()) {
        segments.push_back({frozen->startRow, frozen->endRow, QRectF(QPointF(0.0, top), QPointF(headerWidth, split))});
    }
    const VisibleRange scrollable = layout.getScrollableRange();
    segments.push_back({scrollable.startRow, scrollable.endRow,
                        QRectF(QPointF(0.0, split), QPointF(headerWidth, layout.getHeight()))});
    return segments;
}

void HeaderLayer::paintLabel(IDrawSurface& surface, const QString& label, const QPointF& center, const QColor& color) {
    const double width = surface.measureText(label);
    surface.fillText(label, QPointF(center.x() - width / 2.0, center.y()), TextBaseline::Middle, color);
}

void HeaderLayer::paintColumnHeaders(IDrawSurface& surface, const IFrameAccessor& frame) {
    const DimensionResolver& dims = frame.getDimensions();
    const ViewportLayout& layout = frame.getLayout();
    const GridTheme& theme = frame.getTheme();
    const double headerHeight = dims.getColHeaderHeight();
    const double bandLeft = dims.getRowHeaderWidth();
    const double width = layout.getWidth();
    if (width <= bandLeft || headerHeight <= 0.0) return;

    surface.fillRect(QRectF(QPointF(bandLeft, 0.0), QPointF(width, headerHeight)), theme.headerBackground);

    const FreezeGeometry& geometry = frame.getGeometry();
    const StrokeStyle border(theme.headerBorder, 1.0);
    for (const BandSegment& segment : columnSegments(frame)) {
        if (segment.clip.width() <= 0.0) continue;
        surface.save();
        surface.clipRect(segment.clip);
        for (int col = segment.first; col <= segment.last && col < dims.getTotalCols(); ++col) {
            const double colWidth = dims.getColumnWidth(col);
            if (colWidth <= 0.0) continue;
            const double x = geometry.columnX(col);
            if (x + colWidth < segment.clip.left() || x > segment.clip.right()) continue;

            const HeaderState state = headerState(frame.getFrame(), GridAxis::Columns, col);
            if (state == HeaderState::FullySelected) {
                surface.fillRect(QRectF(x, 0.0, colWidth, headerHeight), theme.headerHighlight);
            } else if (state == HeaderState::PartiallySelected) {
                surface.fillRect(QRectF(x, 0.0, colWidth, headerHeight), theme.headerPartialHighlight);
            }

            const double lineX = crisp(x + colWidth);
            surface.strokeLine(QPointF(lineX, 0.0), QPointF(lineX, headerHeight), border);
            paintLabel(surface, columnToLetter(col), QPointF(x + colWidth / 2.0, headerHeight / 2.0),
                       state == HeaderState::Plain ? theme.headerText : theme.headerHighlightText);
        }
        surface.restore();
    }

    if (layout.getFreezeLayout().hasFrozenCols()) {
        const double split = layout.getScrollableOriginX();
        surface.strokeLine(QPointF(split, 0.0), QPointF(split, headerHeight),
                           StrokeStyle(theme.freezeSeparator, theme.freezeSeparatorWidth));
    }
    surface.strokeLine(QPointF(bandLeft, headerHeight + 0.5), QPointF(width, headerHeight + 0.5), border);
}

void HeaderLayer::paintRowHeaders(IDrawSurface& surface, const IFrameAccessor& frame) {
    const DimensionResolver& dims = frame.getDimensions();
    const ViewportLayout& layout = frame.getLayout();
    const GridTheme& theme = frame.getTheme();
    const double headerWidth = dims.getRowHeaderWidth();
    const double bandTop = dims.getColHeaderHeight();
    const double height = layout.getHeight();
    if (height <= bandTop || headerWidth <= 0.0) return;

    surface.fillRect(QRectF(QPointF(0.0, bandTop), QPointF(headerWidth, height)), theme.headerBackground);

    const FreezeGeometry& geometry = frame.getGeometry();
    const StrokeStyle border(theme.headerBorder, 1.0);
    const QColor& plainText = dims.hasHiddenRows() ? theme.headerFilteredText : theme.headerText;
    for (const BandSegment& segment : rowSegments(frame)) {
        if (segment.clip.height() <= 0.0) continue;
        surface.save();
        surface.clipRect(segment.clip);
        for (int row = segment.first; row <= segment.last && row < dims.getTotalRows(); ++row) {
            const double rowHeight = dims.getRowHeight(row);
            if (rowHeight <= 0.0) continue;
            const double y = geometry.rowY(row);
            if (y + rowHeight < segment.clip.top() || y > segment.clip.bottom()) continue;

            const HeaderState state = headerState(frame.getFrame(), GridAxis::Rows, row);
            if (state == HeaderState::FullySelected) {
                surface.fillRect(QRectF(0.0, y, headerWidth, rowHeight), theme.headerHighlight);
            } else if (state == HeaderState::PartiallySelected) {
                surface.fillRect(QRectF(0.0, y, headerWidth, rowHeight), theme.headerPartialHighlight);
            }

            const double lineY = crisp(y + rowHeight);
            surface.strokeLine(QPointF(0.0, lineY), QPointF(headerWidth, lineY), border);
            paintLabel(surface, QString::number(row + 1), QPointF(headerWidth / 2.0, y + rowHeight / 2.0),
                       state == HeaderState::Plain ? plainText : theme.headerHighlightText);
        }
        surface.restore();
    }

    if (layout.getFreezeLayout().hasFrozenRows()) {
        const double split = layout.getScrollableOriginY();
        surface.strokeLine(QPointF(0.0, split), QPointF(headerWidth, split),
                           StrokeStyle(theme.freezeSeparator, theme.freezeSeparatorWidth));
    }
    surface.strokeLine(QPointF(headerWidth + 0.5, bandTop), QPointF(headerWidth + 0.5, height), border);
}

void HeaderLayer::paintCorner(IDrawSurface& surface, const IFrameAccessor& frame) {
    const DimensionResolver& dims = frame.getDimensions();
    const QRectF corner(0.0, 0.0, dims.getRowHeaderWidth(), dims.getColHeaderHeight());
    if (corner.isEmpty()) return;

    surface.fillRect(corner, frame.getTheme().cornerBackground);
    surface.strokeRect(corner.adjusted(0.5, 0.5, -0.5, -0.5), StrokeStyle(frame.getTheme().headerBorder, 1.0));
}
