#include "IGridLayer.hpp"
#include "DimensionResolver.hpp"
#include "FreezeGeometry.hpp"
#include <algorithm>
#include <cmath>

std::optional<QRectF> IGridLayer::visibleRangeRect(const IFrameAccessor& frame, const Selection& range) {
    return visibleRangeRect(frame, range.minRow(), range.minCol(), range.maxRow(), range.maxCol());
}

std::optional<QRectF> IGridLayer::visibleRangeRect(const IFrameAccessor& frame, int minRow, int minCol,
                                                   int maxRow, int maxCol) {
    const DimensionResolver& dims = frame.getDimensions();
    if (dims.getTotalRows() <= 0 || dims.getTotalCols() <= 0) return std::nullopt;
    return frame.getGeometry().visibleRangeRect(dims.clampRow(minRow), dims.clampCol(minCol),
                                                dims.clampRow(maxRow), dims.clampCol(maxCol));
}

double IGridLayer::crisp(double value) {
    return std::floor(value) + 0.5;
}

void IGridLayer::strokeInside(IDrawSurface& surface, const QRectF& rect, const StrokeStyle& stroke) {
    const double inset = stroke.width / 2.0;
    const QRectF inner = rect.adjusted(inset, inset, -inset, -inset);
    if (inner.width() <= 0.0 || inner.height() <= 0.0) return;
    surface.strokeRect(inner, stroke);
}
