#include "DimensionResolver.hpp"
#include <algorithm>

namespace {

// Sum over [first, last) of (actual - default) for the sparse entries of one axis
double sparseDelta(const std::unordered_map<int, double>& sizes,
                   const std::unordered_set<int>& hidden,
                   int first, int last, double defaultSize) {
    double delta = 0.0;
    for (const auto& [index, size] : sizes) {
        if (index < first || index >= last || size <= 0.0) continue;
        if (hidden.count(index)) continue;  // counted below as fully hidden
        delta += size - defaultSize;
    }
    for (int index : hidden) {
        if (index < first || index >= last) continue;
        delta -= defaultSize;
    }
    return delta;
}

} // namespace

DimensionResolver::DimensionResolver(const GridConfig& config, const DimensionOverrides* overrides)
    : m_config(config)
    , m_overrides(overrides)
    , m_totalRows(std::max(0, config.totalRows))
    , m_totalCols(std::max(0, config.totalCols))
    , m_defaultWidth(config.defaultCellWidth > 0.0 ? config.defaultCellWidth : kFallbackCellWidth)
    , m_defaultHeight(config.defaultCellHeight > 0.0 ? config.defaultCellHeight : kFallbackCellHeight)
    , m_rowHeaderWidth(std::max(0.0, config.rowHeaderWidth))
    , m_colHeaderHeight(std::max(0.0, config.colHeaderHeight)) {
}

double DimensionResolver::getColumnWidth(int col) const {
    if (m_overrides) {
        if (m_overrides->hiddenCols.count(col)) return 0.0;
        auto it = m_overrides->columnWidths.find(col);
        if (it != m_overrides->columnWidths.end() && it->second > 0.0) return it->second;
    }
    return m_defaultWidth;
}

double DimensionResolver::getRowHeight(int row) const {
    if (m_overrides) {
        if (m_overrides->hiddenRows.count(row)) return 0.0;
        auto it = m_overrides->rowHeights.find(row);
        if (it != m_overrides->rowHeights.end() && it->second > 0.0) return it->second;
    }
    return m_defaultHeight;
}

double DimensionResolver::getSize(GridAxis axis, int index) const {
    return axis == GridAxis::Rows ? getRowHeight(index) : getColumnWidth(index);
}

double DimensionResolver::columnSpanWidth(int firstCol, int count) const {
    return getSpan(GridAxis::Columns, firstCol, count);
}

double DimensionResolver::rowSpanHeight(int firstRow, int count) const {
    return getSpan(GridAxis::Rows, firstRow, count);
}

double DimensionResolver::getSpan(GridAxis axis, int first, int count) const {
    if (count <= 0) return 0.0;
    const int total = getTotal(axis);
    const int begin = std::clamp(first, 0, total);
    const int end = static_cast<int>(std::clamp<long long>(static_cast<long long>(first) + count, 0, total));
    if (end <= begin) return 0.0;

    const double defaultSize = getDefaultSize(axis);
    double span = defaultSize * (end - begin);
    if (!m_overrides) return span;

    if (axis == GridAxis::Rows) {
        span += sparseDelta(m_overrides->rowHeights, m_overrides->hiddenRows, begin, end, defaultSize);
    } else {
        span += sparseDelta(m_overrides->columnWidths, m_overrides->hiddenCols, begin, end, defaultSize);
    }
    return std::max(0.0, span);
}

int DimensionResolver::clampRow(int row) const {
    return m_totalRows > 0 ? std::clamp(row, 0, m_totalRows - 1) : 0;
}

int DimensionResolver::clampCol(int col) const {
    return m_totalCols > 0 ? std::clamp(col, 0, m_totalCols - 1) : 0;
}

int DimensionResolver::clampIndex(GridAxis axis, int index) const {
    return axis == GridAxis::Rows ? clampRow(index) : clampCol(index);
}
