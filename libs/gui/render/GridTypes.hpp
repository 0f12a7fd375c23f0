/*
Calcula — GridTypes
Role: Shared render-side types: virtualization windows, freeze zones and the per-call frame snapshot.
Inputs/Outputs: GridFrame bundles everything one render call consumes; the rest are derived values.
Threading: Value types; GridFrame shares large tables via shared_ptr<const ...> and is read-only.
Performance: Copying a GridFrame copies pointers for the cell/style/dimension tables, not the tables.
Integration: Used by GridRenderSession, the layers under render/strategies and HitTester.
Observability: None.
Related: SheetData.h, ViewportLayout.hpp, GridRenderSession.h.
Assumptions: Missing tables (null pointers) are treated as empty.
*/
#pragma once
#include <QRectF>
#include <QString>
#include <QVariantMap>
#include <memory>
#include <optional>
#include <vector>
#include "../../core/sheet/model/SheetData.h"

// Inclusive cell window plus the sub-pixel offset of its first cell
struct VisibleRange {
    int startRow = 0;
    int endRow = 0;
    int startCol = 0;
    int endCol = 0;
    double offsetX = 0.0;  // in (-width(startCol), 0]
    double offsetY = 0.0;  // in (-height(startRow), 0]

    bool containsRow(int row) const { return row >= startRow && row <= endRow; }
    bool containsCol(int col) const { return col >= startCol && col <= endCol; }
};

struct FreezePaneLayout {
    int frozenRows = 0;
    int frozenCols = 0;
    double frozenRowsHeight = 0.0;
    double frozenColsWidth = 0.0;

    bool hasFrozenRows() const { return frozenRows > 0; }
    bool hasFrozenCols() const { return frozenCols > 0; }
};

enum class GridZone {
    Header,       // column/row header bands and the corner
    TopLeft,      // frozen rows x frozen columns
    Top,          // frozen rows, scrolls horizontally
    Left,         // frozen columns, scrolls vertically
    Scrollable    // scrolls on both axes
};

// One zone of a frame: its clip rectangle and the cells it shows
struct ZonePass {
    GridZone zone = GridZone::Scrollable;
    QRectF clip;
    VisibleRange range;
};

// Extension-contributed region; the registry renders it by `type`
struct GridRegion {
    QString id;
    QString type;
    int startRow = 0;
    int startCol = 0;
    int endRow = 0;
    int endCol = 0;
    QVariantMap data;
};

// Everything one render call reads. Nothing here is retained past the call.
struct GridFrame {
    double width = 0.0;
    double height = 0.0;

    GridConfig config;
    Viewport viewport;
    FreezeConfig freeze;
    std::shared_ptr<const DimensionOverrides> dimensions;
    std::shared_ptr<const CellDataMap> cells;
    std::shared_ptr<const StyleDataMap> styles;

    std::optional<Selection> selection;
    std::optional<EditingCell> editing;
    ClipboardState clipboard;
    std::optional<Selection> fillPreview;
    std::optional<Selection> selectionDragPreview;
    std::optional<InsertionAnimation> insertionAnimation;
    std::vector<FormulaReference> formulaReferences;

    QString currentSheetName;
    QString formulaSourceSheetName;

    std::vector<GridRegion> regions;
};
