/*
Calcula — HitTester
Role: Maps pointer pixels back to cells, header indices, resize handles, selection edges,
      formula-reference corners/edges and the fill handle. Freeze-zone aware.
Inputs/Outputs: Frame geometry (config, viewport, dimensions, freeze, canvas size) in; plain index/edge results out.
Threading: Pure; construct one per pointer event (cheap) or keep while the frame is unchanged.
Performance: Cell lookup scans from the zone origin (O(index) worst case, like virtualization).
Integration: Consumed by the interaction layer; shares FreezeGeometry with the highlight layers.
Observability: Drag stickiness decisions logged on calcula.hit at debug level.
Related: ViewportLayout.hpp, FreezeGeometry.hpp, GridSettings.h (HitTestTuning persistence).
Assumptions: Canvas-relative coordinates; the borrowed DimensionOverrides outlive the tester.
*/
#pragma once
#include <QPointF>
#include <QString>
#include <optional>
#include <vector>
#include "DimensionResolver.hpp"
#include "FreezeGeometry.hpp"
#include "GridTypes.hpp"
#include "ViewportLayout.hpp"

struct HitTestTuning {
    // Fraction of the next cell the pointer must cross before a drag advances into it (0 = immediate)
    static constexpr double kDefaultColumnDragThreshold = 0.5;
    static constexpr double kDefaultRowDragThreshold = 0.0;

    double columnDragThreshold = kDefaultColumnDragThreshold;
    double rowDragThreshold = kDefaultRowDragThreshold;
    double resizeHandleSize = 6.0;
    double referenceCornerTolerance = 5.0;
    double referenceEdgeTolerance = 4.0;
    double selectionEdgeTolerance = 4.0;
    double fillHandleSize = 8.0;
};

enum class ReferenceCorner { TopLeft, TopRight, BottomLeft, BottomRight };
enum class RectEdge { Top, Right, Bottom, Left };

struct ReferenceCornerHit {
    int referenceIndex = -1;
    ReferenceCorner corner = ReferenceCorner::TopLeft;
};

struct ReferenceBorderHit {
    int referenceIndex = -1;
    RectEdge edge = RectEdge::Top;
};

class HitTester {
public:
    HitTester(const GridConfig& config, const Viewport& viewport, const DimensionOverrides* dimensions,
              const FreezeConfig& freeze, double width, double height, const HitTestTuning& tuning = HitTestTuning{});
    HitTester(const GridFrame& frame, const HitTestTuning& tuning = HitTestTuning{});

    // Members reference each other (layout and geometry borrow m_dims)
    HitTester(const HitTester&) = delete;
    HitTester& operator=(const HitTester&) = delete;

    // Header bands and pixels past the last row/column resolve to nothing.
    // With a drag origin, per-axis stickiness delays advancing away from it.
    std::optional<CellCoord> cellFromPixel(double x, double y,
                                           const std::optional<CellCoord>& dragOrigin = std::nullopt) const;

    std::optional<int> columnFromHeader(double x, double y) const;
    std::optional<int> rowFromHeader(double x, double y) const;

    std::optional<int> columnResizeHandle(double x, double y) const;
    std::optional<int> rowResizeHandle(double x, double y) const;

    std::optional<ReferenceCornerHit> formulaReferenceCornerAtPixel(
        double x, double y, const std::vector<FormulaReference>& references,
        const QString& currentSheetName, const QString& formulaSourceSheetName) const;

    // Nothing when the point is on a corner handle; corners win
    std::optional<ReferenceBorderHit> formulaReferenceBorderAtPixel(
        double x, double y, const std::vector<FormulaReference>& references,
        const QString& currentSheetName, const QString& formulaSourceSheetName) const;

    std::optional<RectEdge> selectionBorderAtPixel(double x, double y, const Selection& selection) const;
    bool fillHandleAtPixel(double x, double y, const Selection& selection) const;

    // Top-left pixel of a cell (freeze aware)
    QPointF cellOrigin(const CellCoord& cell) const;

    const HitTestTuning& getTuning() const { return m_tuning; }

    // Unqualified references belong to the formula's source sheet; qualified ones match by name (case-insensitive)
    static bool isReferenceOnSheet(const FormulaReference& reference, const QString& currentSheetName,
                                   const QString& formulaSourceSheetName);

private:
    struct AxisHit {
        int index = 0;
        double start = 0.0;   // content offset of the cell start within its zone
        double size = 0.0;
        double content = 0.0; // content offset of the pointer within its zone
    };

    // Range bounds ordered and clamped to the sheet, as the highlight layers draw them
    struct RangeBounds {
        int minRow = 0;
        int minCol = 0;
        int maxRow = 0;
        int maxCol = 0;
    };

    RangeBounds clampedBounds(int startRow, int startCol, int endRow, int endCol) const;
    std::optional<AxisHit> indexAt(GridAxis axis, double pixel) const;
    int applyStickiness(GridAxis axis, const AxisHit& hit, int originIndex, double threshold) const;
    bool insideCellArea(double x, double y) const;

    GridConfig m_config;
    DimensionResolver m_dims;
    ViewportLayout m_layout;
    FreezeGeometry m_geometry;
    Viewport m_viewport;
    double m_width;
    double m_height;
    HitTestTuning m_tuning;
};
