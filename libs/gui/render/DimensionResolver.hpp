/*
Calcula — DimensionResolver
Role: Resolves per-column widths and per-row heights from the config defaults and sparse overrides.
Inputs/Outputs: Borrows a GridConfig and an optional DimensionOverrides; returns sizes and span sums.
Threading: Read-only; one instance per frame.
Performance: Single lookups are O(1); span sums are O(overrides + hidden) instead of O(span length).
Integration: Used by ViewportLayout, FreezeGeometry, HitTester, the layers and autofit.
Observability: None.
Related: SheetData.h, ViewportLayout.hpp.
Assumptions: The borrowed config/overrides outlive the resolver.
*/
#pragma once
#include "../../core/sheet/model/SheetData.h"

enum class GridAxis { Rows, Columns };

class DimensionResolver {
public:
    DimensionResolver(const GridConfig& config, const DimensionOverrides* overrides);

    double getColumnWidth(int col) const;   // 0 for hidden columns
    double getRowHeight(int row) const;     // 0 for hidden rows
    double getSize(GridAxis axis, int index) const;

    // Sum of sizes for indices [first, first + count)
    double columnSpanWidth(int firstCol, int count) const;
    double rowSpanHeight(int firstRow, int count) const;
    double getSpan(GridAxis axis, int first, int count) const;

    int getTotalRows() const { return m_totalRows; }
    int getTotalCols() const { return m_totalCols; }
    int getTotal(GridAxis axis) const { return axis == GridAxis::Rows ? m_totalRows : m_totalCols; }

    int clampRow(int row) const;
    int clampCol(int col) const;
    int clampIndex(GridAxis axis, int index) const;

    double getRowHeaderWidth() const { return m_rowHeaderWidth; }
    double getColHeaderHeight() const { return m_colHeaderHeight; }
    double getDefaultSize(GridAxis axis) const { return axis == GridAxis::Rows ? m_defaultHeight : m_defaultWidth; }

    bool hasHiddenRows() const { return m_overrides && !m_overrides->hiddenRows.empty(); }
    bool hasHiddenColumns() const { return m_overrides && !m_overrides->hiddenCols.empty(); }

    const GridConfig& getConfig() const { return m_config; }

private:
    static constexpr double kFallbackCellWidth = 100.0;
    static constexpr double kFallbackCellHeight = 24.0;

    const GridConfig& m_config;
    const DimensionOverrides* m_overrides;
    int m_totalRows;
    int m_totalCols;
    double m_defaultWidth;
    double m_defaultHeight;
    double m_rowHeaderWidth;
    double m_colHeaderHeight;
};
