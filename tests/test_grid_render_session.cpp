#include <gtest/gtest.h>
#include <algorithm>
#include "GridFixtures.hpp"
#include "RecordingSurface.hpp"
#include "GridRenderSession.h"

using Op = RecordingSurface::Op;
using Call = RecordingSurface::Call;

namespace {

int countText(const RecordingSurface& surface, const QString& text) {
    const std::vector<QString> texts = surface.texts();
    return static_cast<int>(std::count(texts.begin(), texts.end(), text));
}

const Call* findText(const RecordingSurface& surface, const QString& text) {
    for (const Call& call : surface.calls()) {
        if (call.op == Op::FillText && call.text == text) return &call;
    }
    return nullptr;
}

} // namespace

TEST(GridRenderSessionTest, SkipsNonPositiveCanvas) {
    GridRenderSession session;
    RecordingSurface surface;
    session.render(surface, makeFrame(0.0, 200.0));
    session.render(surface, makeFrame(200.0, -1.0));
    EXPECT_TRUE(surface.calls().empty());
}

TEST(GridRenderSessionTest, ClearsCanvasFirstAndLeavesStateBalanced) {
    GridRenderSession session;
    RecordingSurface surface;
    GridFrame frame = makeFrame();
    frame.freeze.freezeRow = 1;
    frame.freeze.freezeCol = 1;
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("a")), makeCell(4, 4, QStringLiteral("b"))});
    session.render(surface, frame);

    ASSERT_FALSE(surface.calls().empty());
    const Call& first = surface.calls().front();
    EXPECT_EQ(first.op, Op::FillRect);
    EXPECT_EQ(first.rect, QRectF(0.0, 0.0, 650.0, 264.0));
    EXPECT_EQ(first.color, session.getTheme().cellBackground);
    EXPECT_EQ(surface.depth(), 0);
}

TEST(GridRenderSessionTest, LayersStackInFixedOrder) {
    GridRenderSession session;
    const QColor marker(1, 2, 3);
    session.getOverlays().registerOverlay({QStringLiteral("marker"), [&](const OverlayRenderContext& c) {
                                               c.surface.fillRect(c.regionRect, marker);
                                           }, nullptr, 0});

    GridFrame frame = makeFrame();
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("Hello"))});
    GridRegion region;
    region.id = QStringLiteral("m");
    region.type = QStringLiteral("marker");
    frame.regions = {region};
    FormulaReference ref;
    ref.startRow = ref.endRow = 4;
    ref.startCol = ref.endCol = 4;
    ref.color = QStringLiteral("#ff0000");
    frame.formulaReferences = {ref};
    frame.selection = makeSelection(0, 0, 1, 1);
    frame.clipboard.mode = ClipboardMode::Copy;
    frame.clipboard.selection = makeSelection(2, 2, 2, 2);

    RecordingSurface surface;
    session.render(surface, frame);
    const GridTheme& theme = session.getTheme();

    const int text = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "Hello"; });
    const int overlay = surface.indexOfColor(Op::FillRect, marker);
    const int reference = surface.indexOfColor(Op::FillRect, QColor(255, 0, 0, 26));
    const int selection = surface.indexOfColor(Op::FillRect, theme.selectionBackground);
    const int clipboard = surface.indexOfColor(Op::StrokeRect, theme.clipboardCopy);
    const int header = surface.indexOfColor(Op::FillRect, theme.headerBackground);

    ASSERT_GE(text, 0);
    EXPECT_LT(text, overlay);
    EXPECT_LT(overlay, reference);
    EXPECT_LT(reference, selection);
    EXPECT_LT(selection, clipboard);
    EXPECT_LT(clipboard, header);
}

TEST(GridRenderSessionTest, LayerNames) {
    const GridRenderSession session;
    const std::vector<QString> expected{
        QStringLiteral("GridLines"), QStringLiteral("CellContent"), QStringLiteral("FormulaReferences"),
        QStringLiteral("FillPreview"), QStringLiteral("DragPreview"), QStringLiteral("Selection"),
        QStringLiteral("Clipboard"), QStringLiteral("Headers")};
    EXPECT_EQ(session.getLayerNames(), expected);
}

TEST(GridRenderSessionTest, SelectionHiddenWhileEditingFormulaOnAnotherSheet) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.selection = makeSelection(1, 1, 2, 2);
    frame.editing = EditingCell{5, 5, QStringLiteral("=Sheet1!A1"), std::nullopt, 1, 1};
    frame.currentSheetName = QStringLiteral("Sheet1");
    frame.formulaSourceSheetName = QStringLiteral("Sheet2");

    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_LT(surface.indexOfColor(Op::FillRect, session.getTheme().selectionBackground), 0);

    frame.formulaSourceSheetName = QStringLiteral("SHEET1");
    surface.clear();
    session.render(surface, frame);
    EXPECT_GE(surface.indexOfColor(Op::FillRect, session.getTheme().selectionBackground), 0);
}

TEST(GridRenderSessionTest, EditedCellIsNotPainted) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("Hello")), makeCell(0, 1, QStringLiteral("World"))});
    frame.editing = EditingCell{0, 0, QStringLiteral("Hel"), std::nullopt, 1, 1};

    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_EQ(countText(surface, QStringLiteral("Hello")), 0);
    EXPECT_EQ(countText(surface, QStringLiteral("World")), 1);
}

TEST(GridRenderSessionTest, MergeSlavesAreNeverPainted) {
    GridRenderSession session;
    CellData master = makeCell(0, 0, QStringLiteral("Merged"));
    master.colSpan = 2;
    GridFrame frame = makeFrame();
    frame.cells = makeCells({master, makeCell(0, 1, QStringLiteral("slave"))});

    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_EQ(countText(surface, QStringLiteral("Merged")), 1);
    EXPECT_EQ(countText(surface, QStringLiteral("slave")), 0);
}

TEST(GridRenderSessionTest, MasterScrolledOutStillPaintsOnce) {
    GridRenderSession session;
    CellData master = makeCell(0, 0, QStringLiteral("Merged"));
    master.colSpan = 3;
    master.rowSpan = 2;
    GridFrame frame = makeFrame();
    frame.viewport.scrollX = 150.0;
    frame.cells = makeCells({master});

    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_EQ(countText(surface, QStringLiteral("Merged")), 1);
}

TEST(GridRenderSessionTest, MergedCellSuppressesInteriorGridLine) {
    GridRenderSession session;
    CellData master = makeCell(0, 0, QStringLiteral("Merged"));
    master.colSpan = 2;
    GridFrame frame = makeFrame();
    frame.cells = makeCells({master});

    RecordingSurface surface;
    session.render(surface, frame);
    const QColor gridLine = session.getTheme().gridLine;
    // The boundary between columns 0 and 1 (x = 150.5) must not cross row 0
    for (const Call& call : surface.callsOf(Op::StrokeLine)) {
        if (call.color != gridLine || call.from.x() != 150.5 || call.to.x() != 150.5) continue;
        EXPECT_GE(call.from.y(), 48.0);
    }
}

TEST(GridRenderSessionTest, FreezeZonesAreClippedAndSeparated) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.freeze.freezeRow = 2;
    frame.freeze.freezeCol = 1;

    RecordingSurface surface;
    session.render(surface, frame);

    const std::vector<Call> clips = surface.callsOf(Op::Clip);
    auto clipped = [&](const QRectF& rect) {
        return std::any_of(clips.begin(), clips.end(), [&](const Call& c) { return c.rect == rect; });
    };
    EXPECT_TRUE(clipped(QRectF(150.0, 72.0, 500.0, 192.0)));
    EXPECT_TRUE(clipped(QRectF(50.0, 72.0, 100.0, 192.0)));
    EXPECT_TRUE(clipped(QRectF(150.0, 24.0, 500.0, 48.0)));
    EXPECT_TRUE(clipped(QRectF(50.0, 24.0, 100.0, 48.0)));

    const QColor separator = session.getTheme().freezeSeparator;
    const int vertical = surface.indexOf([&](const Call& c) {
        return c.op == Op::StrokeLine && c.color == separator && c.from == QPointF(150.0, 24.0)
            && c.to == QPointF(150.0, 264.0);
    });
    const int horizontal = surface.indexOf([&](const Call& c) {
        return c.op == Op::StrokeLine && c.color == separator && c.from == QPointF(50.0, 72.0)
            && c.to == QPointF(650.0, 72.0);
    });
    EXPECT_GE(vertical, 0);
    EXPECT_GE(horizontal, 0);
}

TEST(GridRenderSessionTest, FrozenCellsIgnoreScroll) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.freeze.freezeCol = 1;
    frame.viewport.scrollX = 400.0;
    frame.cells = makeCells({makeCell(3, 0, QStringLiteral("pinned"))});

    RecordingSurface surface;
    session.render(surface, frame);
    const Call* pinned = findText(surface, QStringLiteral("pinned"));
    ASSERT_NE(pinned, nullptr);
    EXPECT_DOUBLE_EQ(pinned->from.x(), 54.0);
}

TEST(GridRenderSessionTest, HeaderLabels) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.selection = makeSelection(0, 0, 0, 99, SelectionType::Rows);

    RecordingSurface surface;
    session.render(surface, frame);
    const GridTheme& theme = session.getTheme();

    ASSERT_NE(findText(surface, QStringLiteral("A")), nullptr);
    ASSERT_NE(findText(surface, QStringLiteral("F")), nullptr);
    ASSERT_NE(findText(surface, QStringLiteral("2")), nullptr);
    EXPECT_EQ(findText(surface, QStringLiteral("1"))->color, theme.headerHighlightText);
    EXPECT_EQ(findText(surface, QStringLiteral("2"))->color, theme.headerText);
    EXPECT_GE(surface.indexOfColor(Op::FillRect, theme.headerHighlight), 0);
    // Every column is partially selected by a full-row selection
    EXPECT_GE(surface.indexOfColor(Op::FillRect, theme.headerPartialHighlight), 0);
}

TEST(GridRenderSessionTest, RowLabelsChangeColorWhileRowsAreHidden) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    auto dims = std::make_shared<DimensionOverrides>();
    dims->hiddenRows = {1};
    frame.dimensions = dims;

    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_EQ(findText(surface, QStringLiteral("1"))->color, session.getTheme().headerFilteredText);
    EXPECT_EQ(findText(surface, QStringLiteral("2")), nullptr);
    EXPECT_NE(findText(surface, QStringLiteral("3")), nullptr);
}

TEST(GridRenderSessionTest, NumbersAlignRightAndLongTextTruncates) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("123")),
                             makeCell(1, 0, QStringLiteral("This label is far too long for one cell"))});

    RecordingSurface surface;
    session.render(surface, frame);

    const Call* number = findText(surface, QStringLiteral("123"));
    ASSERT_NE(number, nullptr);
    EXPECT_DOUBLE_EQ(number->from.x(), 129.5);
    EXPECT_DOUBLE_EQ(number->from.y(), 36.0);
    EXPECT_EQ(number->baseline, TextBaseline::Middle);

    const int truncatedAt = surface.indexOf([](const Call& c) {
        return c.op == Op::FillText && c.text.endsWith(QStringLiteral("..."));
    });
    ASSERT_GE(truncatedAt, 0);
    const Call* truncated = &surface.calls()[static_cast<size_t>(truncatedAt)];
    EXPECT_TRUE(truncated->text.startsWith(QStringLiteral("This label")));
    EXPECT_DOUBLE_EQ(truncated->from.x(), 54.0);
}

TEST(GridRenderSessionTest, DecoratedEmptyCellsPaintTheirFill) {
    GridRenderSession session;
    auto styles = std::make_shared<StyleDataMap>();
    (*styles)[1].backgroundColor = QStringLiteral("#ffff00");
    GridFrame frame = makeFrame();
    frame.styles = styles;
    frame.cells = makeCells({makeCell(1, 1, QString(), 1), makeCell(2, 2, QString(), 0)});

    RecordingSurface surface;
    session.render(surface, frame);
    const int fill = surface.indexOfColor(Op::FillRect, QColor(0xff, 0xff, 0x00));
    ASSERT_GE(fill, 0);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(fill)].rect, QRectF(150.0, 48.0, 100.0, 24.0));
}

TEST(GridRenderSessionTest, SessionInterceptorsReachCells) {
    GridRenderSession session;
    session.getStyleHooks().registerInterceptor(
        QStringLiteral("negative-red"), [](const QString& text, const StyleData&, const CellCoord&) {
            if (!text.startsWith(QLatin1Char('-'))) return std::optional<StyleOverride>();
            StyleOverride o;
            o.textColor = QStringLiteral("#cc0000");
            return std::optional<StyleOverride>(o);
        });

    GridFrame frame = makeFrame();
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("-5")), makeCell(0, 1, QStringLiteral("5"))});
    RecordingSurface surface;
    session.render(surface, frame);

    EXPECT_EQ(findText(surface, QStringLiteral("-5"))->color, QColor(0xcc, 0x00, 0x00));
    EXPECT_EQ(findText(surface, QStringLiteral("5"))->color, session.getTheme().cellText);
}

TEST(GridRenderSessionTest, ClipboardAntsUseDashOffset) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.clipboard.mode = ClipboardMode::Cut;
    frame.clipboard.selection = makeSelection(1, 1, 1, 1);
    frame.clipboard.dashOffset = 3.0;

    RecordingSurface surface;
    session.render(surface, frame);
    const int ants = surface.indexOf([&](const Call& c) {
        return c.op == Op::StrokeRect && c.color == session.getTheme().clipboardCut && !c.stroke.dashPattern.isEmpty();
    });
    ASSERT_GE(ants, 0);
    const Call& call = surface.calls()[static_cast<size_t>(ants)];
    EXPECT_DOUBLE_EQ(call.stroke.dashOffset, -3.0);
    EXPECT_EQ(call.rect, QRectF(151.0, 49.0, 98.0, 22.0));
}

TEST(GridRenderSessionTest, ColumnAutofit) {
    GridRenderSession session;
    RecordingSurface measure;
    CellData wide = makeCell(0, 0, QStringLiteral("This merged text is ignored"));
    wide.colSpan = 2;
    const std::vector<CellData> cells{makeCell(0, 0, QStringLiteral("Hello world")), wide,
                                      makeCell(1, 0, QString())};

    EXPECT_DOUBLE_EQ(session.measureOptimalColumnWidth(measure, 0, cells, nullptr, 20.0), 71.0);
    EXPECT_DOUBLE_EQ(session.measureOptimalColumnWidth(measure, 0, {}, nullptr, 20.0), 20.0);
    EXPECT_DOUBLE_EQ(session.measureOptimalColumnWidth(measure, 0, {}, nullptr, 10.0), 16.0);
}

TEST(GridRenderSessionTest, RowAutofit) {
    GridRenderSession session;
    RecordingSurface measure;
    const GridConfig config = standardConfig();

    StyleDataMap styles;
    styles[1].wrapText = true;
    CellData tall = makeCell(0, 0, QStringLiteral("this is ignored"));
    tall.rowSpan = 2;

    const std::vector<CellData> single{makeCell(0, 0, QStringLiteral("Hello"))};
    const std::vector<CellData> wrapped{makeCell(0, 0, QStringLiteral("aaaaaaaaaa aaaaaaaaaa"), 1), tall};

    EXPECT_DOUBLE_EQ(session.measureOptimalRowHeight(measure, single, &styles, config, nullptr, 16.0), 18.0);
    EXPECT_DOUBLE_EQ(session.measureOptimalRowHeight(measure, wrapped, &styles, config, nullptr, 16.0), 31.0);
    EXPECT_DOUBLE_EQ(session.measureOptimalRowHeight(measure, {}, &styles, config, nullptr, 24.0), 24.0);
}

TEST(GridRenderSessionTest, SavedSelectionsAreKeyedCaseInsensitively) {
    GridRenderSession session;
    session.saveSelection(QStringLiteral("Budget"), makeSelection(1, 2, 3, 4));
    session.saveSelection(QStringLiteral("Other"), makeSelection(0, 0, 0, 0));

    const std::optional<Selection> restored = session.getSavedSelection(QStringLiteral("BUDGET"));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->endCol, 4);
    EXPECT_EQ(session.savedSelectionCount(), 2);

    session.saveSelection(QStringLiteral("budget"), makeSelection(9, 9, 9, 9));
    EXPECT_EQ(session.getSavedSelection(QStringLiteral("Budget"))->startRow, 9);
    EXPECT_EQ(session.savedSelectionCount(), 2);

    EXPECT_TRUE(session.forgetSelection(QStringLiteral("other")));
    EXPECT_FALSE(session.getSavedSelection(QStringLiteral("Other")).has_value());
    session.clearSavedSelections();
    EXPECT_EQ(session.savedSelectionCount(), 0);
}

TEST(GridRenderSessionTest, HitTesterUsesSessionTuning) {
    HitTestTuning tuning;
    tuning.resizeHandleSize = 20.0;
    const GridRenderSession session(GridTheme{}, tuning);
    const HitTester tester = session.createHitTester(makeFrame());
    EXPECT_EQ(tester.columnResizeHandle(159.0, 10.0), std::optional<int>(0));
}

TEST(GridRenderSessionTest, ThemeChangeDropsCachedFonts) {
    GridRenderSession session;
    GridFrame frame = makeFrame();
    frame.cells = makeCells({makeCell(0, 0, QStringLiteral("x"))});
    RecordingSurface surface;
    session.render(surface, frame);
    EXPECT_GT(session.getFontCache().size(), 0);

    GridTheme theme;
    theme.headerFontSize = 14.0;
    session.setTheme(theme);
    EXPECT_EQ(session.getFontCache().size(), 0);
    EXPECT_DOUBLE_EQ(session.getTheme().headerFontSize, 14.0);
}

TEST(GridRenderSessionTest, PreviewsPaintBetweenReferencesAndSelection) {
    GridTheme theme;
    theme.fillPreviewBackground = QColor(10, 20, 30, 40);
    theme.dragPreviewBackground = QColor(50, 60, 70, 80);
    theme.selectionBackground = QColor(90, 100, 110, 120);
    GridRenderSession session(theme);

    GridFrame frame = makeFrame();
    FormulaReference ref;
    ref.startRow = ref.endRow = 6;
    ref.startCol = ref.endCol = 4;
    ref.color = QStringLiteral("#ff0000");
    frame.formulaReferences = {ref};
    frame.fillPreview = makeSelection(1, 0, 3, 0);
    frame.selectionDragPreview = makeSelection(2, 2, 3, 3);
    frame.selection = makeSelection(0, 0, 0, 0);

    RecordingSurface surface;
    session.render(surface, frame);

    const int reference = surface.indexOfColor(Op::FillRect, QColor(255, 0, 0, 26));
    const int fill = surface.indexOfColor(Op::FillRect, theme.fillPreviewBackground);
    const int drag = surface.indexOfColor(Op::FillRect, theme.dragPreviewBackground);
    const int selection = surface.indexOfColor(Op::FillRect, theme.selectionBackground);
    ASSERT_GE(reference, 0);
    EXPECT_LT(reference, fill);
    EXPECT_LT(fill, drag);
    EXPECT_LT(drag, selection);

    EXPECT_EQ(surface.calls()[static_cast<size_t>(fill)].rect, QRectF(50.0, 48.0, 100.0, 72.0));
    EXPECT_EQ(surface.calls()[static_cast<size_t>(drag)].rect, QRectF(250.0, 72.0, 200.0, 48.0));

    const Call& fillBorder = surface.calls()[static_cast<size_t>(fill + 1)];
    EXPECT_EQ(fillBorder.op, Op::StrokeRect);
    EXPECT_EQ(fillBorder.color, theme.fillPreviewBorder);
    EXPECT_EQ(fillBorder.stroke.dashPattern, QVector<double>({4.0, 4.0}));
    const Call& dragBorder = surface.calls()[static_cast<size_t>(drag + 1)];
    EXPECT_EQ(dragBorder.op, Op::StrokeRect);
    EXPECT_EQ(dragBorder.color, theme.dragPreviewBorder);
}

TEST(GridRenderSessionTest, HeadersPaintColumnsThenRowsThenCorner) {
    GridRenderSession session;
    RecordingSurface surface;
    session.render(surface, makeFrame());
    const GridTheme& theme = session.getTheme();

    const int columns = surface.indexOfColor(Op::FillRect, theme.headerBackground);
    ASSERT_GE(columns, 0);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(columns)].rect, QRectF(50.0, 0.0, 600.0, 24.0));

    const int rows = surface.indexOf([&](const Call& c) {
        return c.op == Op::FillRect && c.color == theme.headerBackground;
    }, columns + 1);
    ASSERT_GT(rows, columns);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(rows)].rect, QRectF(0.0, 24.0, 50.0, 240.0));

    const int corner = surface.indexOfColor(Op::FillRect, theme.cornerBackground);
    ASSERT_GT(corner, rows);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(corner)].rect, QRectF(0.0, 0.0, 50.0, 24.0));

    const int columnLabel = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "A"; });
    const int rowLabel = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "1"; });
    EXPECT_GT(columnLabel, columns);
    EXPECT_LT(columnLabel, rows);
    EXPECT_GT(rowLabel, rows);
    EXPECT_LT(rowLabel, corner);

    const Call& cornerBorder = surface.calls()[static_cast<size_t>(corner + 1)];
    EXPECT_EQ(cornerBorder.op, Op::StrokeRect);
    EXPECT_EQ(cornerBorder.color, theme.headerBorder);
}

TEST(GridRenderSessionTest, RotatedTextTurnsAboutTheCellCenter) {
    GridRenderSession session;
    auto styles = std::make_shared<StyleDataMap>();
    (*styles)[1].textRotation = 90.0;
    GridFrame frame = makeFrame();
    frame.styles = styles;
    frame.cells = makeCells({makeCell(1, 1, QStringLiteral("Up"), 1)});

    RecordingSurface surface;
    session.render(surface, frame);

    const int translate = surface.indexOf([](const Call& c) { return c.op == Op::Translate; });
    ASSERT_GE(translate, 0);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(translate)].from, QPointF(200.0, 60.0));

    const Call& rotate = surface.calls()[static_cast<size_t>(translate + 1)];
    EXPECT_EQ(rotate.op, Op::Rotate);
    EXPECT_DOUBLE_EQ(rotate.value, -90.0);

    const int text = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "Up"; });
    ASSERT_GT(text, translate + 1);
    const Call& label = surface.calls()[static_cast<size_t>(text)];
    EXPECT_DOUBLE_EQ(label.from.x(), -10.0);
    EXPECT_DOUBLE_EQ(label.from.y(), 0.0);
    EXPECT_EQ(label.baseline, TextBaseline::Middle);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(text + 1)].op, Op::Restore);
    EXPECT_EQ(surface.depth(), 0);
}

TEST(GridRenderSessionTest, UnderlineAndStrikethroughFollowTheText) {
    GridRenderSession session;
    auto styles = std::make_shared<StyleDataMap>();
    (*styles)[1].underline = true;
    (*styles)[1].strikethrough = true;
    (*styles)[1].textColor = QStringLiteral("#123456");
    GridFrame frame = makeFrame();
    frame.styles = styles;
    frame.cells = makeCells({makeCell(2, 0, QStringLiteral("Hi"), 1)});

    RecordingSurface surface;
    session.render(surface, frame);

    const QColor ink(0x12, 0x34, 0x56);
    const int text = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "Hi"; });
    ASSERT_GE(text, 0);
    EXPECT_EQ(surface.calls()[static_cast<size_t>(text)].color, ink);

    const Call& underline = surface.calls()[static_cast<size_t>(text + 1)];
    EXPECT_EQ(underline.op, Op::StrokeLine);
    EXPECT_EQ(underline.color, ink);
    EXPECT_DOUBLE_EQ(underline.stroke.width, 1.0);
    EXPECT_EQ(underline.from, QPointF(54.0, 90.5));
    EXPECT_EQ(underline.to, QPointF(65.0, 90.5));

    const Call& strike = surface.calls()[static_cast<size_t>(text + 2)];
    EXPECT_EQ(strike.op, Op::StrokeLine);
    EXPECT_EQ(strike.color, ink);
    EXPECT_EQ(strike.from, QPointF(54.0, 84.0));
    EXPECT_EQ(strike.to, QPointF(65.0, 84.0));
}

TEST(GridRenderSessionTest, CellBordersPaintBetweenFillAndText) {
    GridRenderSession session;
    auto styles = std::make_shared<StyleDataMap>();
    StyleData& style = (*styles)[1];
    style.backgroundColor = QStringLiteral("#ffff00");
    style.borderTop = BorderSide{BorderLineStyle::Double, QStringLiteral("#aa0000"), 1.0};
    style.borderBottom = BorderSide{BorderLineStyle::Dashed, QStringLiteral("#00aa00"), 1.0};
    style.borderLeft = BorderSide{BorderLineStyle::Dotted, QStringLiteral("#0000aa"), 1.0};
    style.borderRight = BorderSide{BorderLineStyle::Thick, QStringLiteral("#aa00aa"), 1.0};
    GridFrame frame = makeFrame();
    frame.styles = styles;
    frame.cells = makeCells({makeCell(2, 0, QStringLiteral("Box"), 1)});

    RecordingSurface surface;
    session.render(surface, frame);

    const int fill = surface.indexOfColor(Op::FillRect, QColor(0xff, 0xff, 0x00));
    const int text = surface.indexOf([](const Call& c) { return c.op == Op::FillText && c.text == "Box"; });
    ASSERT_GE(fill, 0);
    ASSERT_GT(text, fill);

    std::vector<Call> lines;
    for (int i = fill + 1; i < text; ++i) {
        const Call& call = surface.calls()[static_cast<size_t>(i)];
        if (call.op == Op::StrokeLine) lines.push_back(call);
    }
    ASSERT_EQ(lines.size(), 5u);

    EXPECT_EQ(lines[0].color, QColor(0xaa, 0x00, 0x00));
    EXPECT_EQ(lines[0].from, QPointF(50.0, 70.5));
    EXPECT_EQ(lines[0].to, QPointF(150.0, 70.5));
    EXPECT_EQ(lines[1].color, QColor(0xaa, 0x00, 0x00));
    EXPECT_EQ(lines[1].from, QPointF(50.0, 73.5));
    EXPECT_EQ(lines[1].to, QPointF(150.0, 73.5));

    EXPECT_EQ(lines[2].color, QColor(0x00, 0xaa, 0x00));
    EXPECT_EQ(lines[2].from, QPointF(50.0, 96.0));
    EXPECT_EQ(lines[2].stroke.dashPattern, QVector<double>({4.0, 2.0}));

    EXPECT_EQ(lines[3].color, QColor(0x00, 0x00, 0xaa));
    EXPECT_EQ(lines[3].from, QPointF(50.0, 72.0));
    EXPECT_EQ(lines[3].stroke.dashPattern, QVector<double>({1.0, 2.0}));

    EXPECT_EQ(lines[4].color, QColor(0xaa, 0x00, 0xaa));
    EXPECT_EQ(lines[4].from, QPointF(150.0, 72.0));
    EXPECT_DOUBLE_EQ(lines[4].stroke.width, 3.0);
}
