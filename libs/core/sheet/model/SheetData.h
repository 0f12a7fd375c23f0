/*
Calcula — SheetData
Role: Plain value types describing one frame's worth of sheet state handed to the grid core.
Inputs/Outputs: Filled by the interaction layer / backend bridge; read (never written) by the render core.
Threading: Immutable once published; large maps are shared via std::shared_ptr<const ...>.
Performance: Cell and style tables are hash maps keyed by coordinate / style index.
Integration: Consumed by GridFrame (render/GridTypes.hpp) and every render/hit-test module.
Observability: None.
Related: GridTypes.hpp, DimensionResolver.hpp, StyleResolver.hpp.
Assumptions: Row/column indices are 0-based; counts (freeze, spans) are >= 1 when meaningful.
*/
#pragma once
#include <QString>
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>

struct CellCoord {
    int row = 0;
    int col = 0;

    bool operator==(const CellCoord& other) const { return row == other.row && col == other.col; }
    bool operator!=(const CellCoord& other) const { return !(*this == other); }
};

struct CellCoordHash {
    std::size_t operator()(const CellCoord& c) const noexcept {
        return std::hash<long long>()((static_cast<long long>(c.row) << 32) ^ static_cast<unsigned int>(c.col));
    }
};

// Static sheet geometry
struct GridConfig {
    int totalRows = 1048576;
    int totalCols = 16384;
    double defaultCellWidth = 100.0;
    double defaultCellHeight = 24.0;
    double rowHeaderWidth = 50.0;
    double colHeaderHeight = 24.0;
    double minColumnWidth = 20.0;
    double minRowHeight = 16.0;
};

struct Viewport {
    double scrollX = 0.0;
    double scrollY = 0.0;
};

// Sparse size exceptions; anything not listed uses the config default
struct DimensionOverrides {
    std::unordered_map<int, double> columnWidths;
    std::unordered_map<int, double> rowHeights;
    std::unordered_set<int> hiddenRows;
    std::unordered_set<int> hiddenCols;
};

// Counts of pinned rows/columns. The count is also the first scrollable index.
struct FreezeConfig {
    std::optional<int> freezeRow;
    std::optional<int> freezeCol;

    int frozenRowCount() const { return freezeRow && *freezeRow > 0 ? *freezeRow : 0; }
    int frozenColCount() const { return freezeCol && *freezeCol > 0 ? *freezeCol : 0; }
    bool isActive() const { return frozenRowCount() > 0 || frozenColCount() > 0; }
};

struct CellData {
    int row = 0;
    int col = 0;
    QString display;
    int styleIndex = 0;
    std::optional<QString> formula;
    int rowSpan = 1;
    int colSpan = 1;

    bool isMerged() const { return rowSpan > 1 || colSpan > 1; }
};

using CellDataMap = std::unordered_map<CellCoord, CellData, CellCoordHash>;

enum class BorderLineStyle { None, Thin, Medium, Thick, Dashed, Dotted, Double };

struct BorderSide {
    BorderLineStyle style = BorderLineStyle::None;
    QString color = QStringLiteral("#000000");
    double width = 0.0;

    bool isVisible() const { return style != BorderLineStyle::None && width > 0.0; }
};

enum class HorizontalAlign { General, Left, Center, Right };
enum class VerticalAlign { Top, Middle, Bottom };

struct StyleData {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    double fontSize = 11.0;
    QString fontFamily = QStringLiteral("system-ui");
    QString textColor = QStringLiteral("#000000");
    QString backgroundColor = QStringLiteral("#ffffff");
    HorizontalAlign textAlign = HorizontalAlign::General;
    VerticalAlign verticalAlign = VerticalAlign::Middle;
    QString numberFormat = QStringLiteral("General");
    bool wrapText = false;
    double textRotation = 0.0;  // degrees, counter-clockwise positive (Excel convention)
    BorderSide borderTop;
    BorderSide borderRight;
    BorderSide borderBottom;
    BorderSide borderLeft;
};

using StyleDataMap = std::unordered_map<int, StyleData>;

enum class SelectionType { Cells, Rows, Columns };

// start* is the anchor, end* the active corner; either may be the larger index
struct Selection {
    int startRow = 0;
    int startCol = 0;
    int endRow = 0;
    int endCol = 0;
    SelectionType type = SelectionType::Cells;

    int minRow() const { return startRow < endRow ? startRow : endRow; }
    int maxRow() const { return startRow < endRow ? endRow : startRow; }
    int minCol() const { return startCol < endCol ? startCol : endCol; }
    int maxCol() const { return startCol < endCol ? endCol : startCol; }
};

struct EditingCell {
    int row = 0;
    int col = 0;
    QString value;
    std::optional<QString> sourceSheetName;
    int rowSpan = 1;
    int colSpan = 1;
};

enum class ClipboardMode { None, Copy, Cut };

struct ClipboardState {
    ClipboardMode mode = ClipboardMode::None;
    std::optional<Selection> selection;
    double dashOffset = 0.0;  // marching-ants phase, advanced by the frame driver
};

struct FormulaReference {
    int startRow = 0;
    int startCol = 0;
    int endRow = 0;
    int endCol = 0;
    QString color;
    std::optional<QString> sheetName;
    bool isPassive = false;     // shown while navigating, not while editing
    bool isFullRow = false;
    bool isFullColumn = false;
};

enum class AnimationAxis { Row, Column };
enum class StructuralChange { Insert, Delete };

struct InsertionAnimation {
    AnimationAxis type = AnimationAxis::Row;
    StructuralChange direction = StructuralChange::Insert;
    int index = 0;
    int count = 1;
    double progress = 0.0;
    double targetSize = 0.0;
};
