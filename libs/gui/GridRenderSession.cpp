/*
Calcula — GridRenderSession
Role: Implements the per-frame pipeline and the auto-fit measurements.
Inputs/Outputs: Builds the frame accessor, runs zone layers per freeze zone, then overlays, highlights and headers.
Threading: Caller's thread; the measurement surface is created lazily on first auto-fit.
Performance: Zone layers only see their zone's visible window; timing is sampled every 120 frames.
Integration: Defines the concrete layer stack and its z-order.
Observability: cgLog_RenderN frame stats; cgLog_Render for skipped frames and measurement surface lifetime.
Related: GridRenderSession.h, strategies/*.hpp, OverlayRegistry.hpp.
Assumptions: The layer stack is fixed at construction; order below is the visual stacking order.
*/
#include "GridRenderSession.h"
#include "../core/CalculaLogging.hpp"
#include <QElapsedTimer>
#include <QPainter>
#include <algorithm>
#include <cmath>

#include "render/DimensionResolver.hpp"
#include "render/FreezeGeometry.hpp"
#include "render/IGridLayer.hpp"
#include "render/MergeIndex.hpp"
#include "render/QPainterSurface.hpp"
#include "render/StructuralAnimation.hpp"
#include "render/StyleResolver.hpp"
#include "render/ViewportLayout.hpp"
#include "render/strategies/CellContentLayer.hpp"
#include "render/strategies/ClipboardLayer.hpp"
#include "render/strategies/FormulaReferenceLayer.hpp"
#include "render/strategies/GridLinesLayer.hpp"
#include "render/strategies/HeaderLayer.hpp"
#include "render/strategies/RangePreviewLayer.hpp"
#include "render/strategies/SelectionLayer.hpp"
#include "../core/sheet/CellReference.h"

namespace {
    // Session implementation of the frame accessor (derived state for one render call)
    class SessionFrameAccessor : public IFrameAccessor {
    private:
        const GridFrame& m_frame;
        const DimensionResolver& m_dims;
        const ViewportLayout& m_layout;
        const FreezeGeometry& m_geometry;
        const MergeIndex& m_merges;
        const GridTheme& m_theme;
        const HitTestTuning& m_tuning;
        const StyleHookRegistry& m_hooks;
        FontCache& m_fonts;

    public:
        SessionFrameAccessor(const GridFrame& frame, const DimensionResolver& dims, const ViewportLayout& layout,
                             const FreezeGeometry& geometry, const MergeIndex& merges, const GridTheme& theme,
                             const HitTestTuning& tuning, const StyleHookRegistry& hooks, FontCache& fonts)
            : m_frame(frame), m_dims(dims), m_layout(layout), m_geometry(geometry), m_merges(merges)
            , m_theme(theme), m_tuning(tuning), m_hooks(hooks), m_fonts(fonts) {}

        const GridFrame& getFrame() const override { return m_frame; }
        const DimensionResolver& getDimensions() const override { return m_dims; }
        const ViewportLayout& getLayout() const override { return m_layout; }
        const FreezeGeometry& getGeometry() const override { return m_geometry; }
        const MergeIndex& getMerges() const override { return m_merges; }
        const GridTheme& getTheme() const override { return m_theme; }
        const HitTestTuning& getTuning() const override { return m_tuning; }
        const StyleHookRegistry* getStyleHooks() const override {
            return m_hooks.hasInterceptors() || m_hooks.hasDecorations() ? &m_hooks : nullptr;
        }
        FontCache& getFontCache() const override { return m_fonts; }
    };

    bool isSaneFitFontSize(double size) { return size > 0.0 && size < 200.0; }
}

GridRenderSession::GridRenderSession() {
    init();
}

GridRenderSession::GridRenderSession(const GridTheme& theme, const HitTestTuning& tuning)
    : m_theme(theme)
    , m_tuning(tuning) {
    init();
}

GridRenderSession::~GridRenderSession() {
    releaseMeasurementSurface();
}

void GridRenderSession::init() {
    m_zoneLayers.push_back(std::make_unique<GridLinesLayer>());
    m_zoneLayers.push_back(std::make_unique<CellContentLayer>());

    // Stacking order of everything drawn over the cells; overlays run before the first entry
    m_highlightLayers.push_back(std::make_unique<FormulaReferenceLayer>());
    m_highlightLayers.push_back(std::make_unique<RangePreviewLayer>(RangePreviewLayer::Kind::FillHandle));
    m_highlightLayers.push_back(std::make_unique<RangePreviewLayer>(RangePreviewLayer::Kind::SelectionMove));
    m_highlightLayers.push_back(std::make_unique<SelectionLayer>());
    m_highlightLayers.push_back(std::make_unique<ClipboardLayer>());

    m_headerLayer = std::make_unique<HeaderLayer>();
}

void GridRenderSession::setTheme(const GridTheme& theme) {
    m_theme = theme;
    m_fontCache.clear();
}

std::vector<QString> GridRenderSession::getLayerNames() const {
    std::vector<QString> names;
    for (const auto& layer : m_zoneLayers) names.push_back(QString::fromLatin1(layer->getLayerName()));
    for (const auto& layer : m_highlightLayers) names.push_back(QString::fromLatin1(layer->getLayerName()));
    names.push_back(QString::fromLatin1(m_headerLayer->getLayerName()));
    return names;
}

void GridRenderSession::render(IDrawSurface& surface, const GridFrame& frame) {
    if (frame.width <= 0.0 || frame.height <= 0.0) {
        cgLog_Render("render skipped: canvas" << frame.width << "x" << frame.height);
        return;
    }

    QElapsedTimer timer;
    timer.start();

    const DimensionResolver dims(frame.config, frame.dimensions.get());
    const AnimationShifts shifts = AnimationShifts::fromAnimation(frame.insertionAnimation);
    const ViewportLayout layout(dims, frame.freeze, frame.viewport, frame.width, frame.height);
    const FreezeGeometry geometry(dims, layout.getFreezeLayout(), frame.viewport, frame.width, frame.height, shifts);
    const MergeIndex merges(frame.cells.get(), dims.getTotalRows(), dims.getTotalCols());
    const SessionFrameAccessor accessor(frame, dims, layout, geometry, merges, m_theme, m_tuning,
                                        m_styleHooks, m_fontCache);

    surface.fillRect(QRectF(0.0, 0.0, frame.width, frame.height), m_theme.cellBackground);

    // Scrollable -> left -> top -> corner; each frozen zone paints over the one before
    const std::vector<ZonePass> passes = layout.getZonePasses();
    const bool clipZones = layout.hasFreeze();
    for (const ZonePass& pass : passes) {
        if (clipZones) {
            surface.save();
            surface.clipRect(pass.clip);
        }
        for (const auto& layer : m_zoneLayers) layer->paintZone(surface, accessor, pass);
        if (clipZones) surface.restore();
    }

    if (clipZones) {
        const StrokeStyle separator(m_theme.freezeSeparator, m_theme.freezeSeparatorWidth);
        const FreezePaneLayout& freeze = layout.getFreezeLayout();
        if (freeze.hasFrozenCols()) {
            const double x = layout.getScrollableOriginX();
            surface.strokeLine(QPointF(x, dims.getColHeaderHeight()), QPointF(x, frame.height), separator);
        }
        if (freeze.hasFrozenRows()) {
            const double y = layout.getScrollableOriginY();
            surface.strokeLine(QPointF(dims.getRowHeaderWidth(), y), QPointF(frame.width, y), separator);
        }
    }

    m_overlays.paint(surface, frame, geometry);
    for (const auto& layer : m_highlightLayers) layer->paint(surface, accessor);
    m_headerLayer->paint(surface, accessor);

    const qint64 totalUs = timer.nsecsElapsed() / 1000;
    cgLog_RenderN(120, "grid frame: total=" << totalUs << "us"
                       << "zones=" << passes.size()
                       << "cells=" << (frame.cells ? frame.cells->size() : 0)
                       << "merges=" << merges.getRegions().size()
                       << "fonts=" << m_fontCache.size());
}

HitTester GridRenderSession::createHitTester(const GridFrame& frame) const {
    return HitTester(frame, m_tuning);
}

//  AUTO-FIT

IDrawSurface& GridRenderSession::measurementSurface() {
    if (!m_measureSurface) {
        m_measureImage = QImage(1, 1, QImage::Format_ARGB32_Premultiplied);
        m_measurePainter = std::make_unique<QPainter>(&m_measureImage);
        m_measureSurface = std::make_unique<QPainterSurface>(m_measurePainter.get());
        cgLog_Render("measurement surface created");
    }
    return *m_measureSurface;
}

void GridRenderSession::releaseMeasurementSurface() {
    if (!m_measureSurface) return;
    m_measureSurface.reset();
    m_measurePainter.reset();
    m_measureImage = QImage();
    cgLog_Render("measurement surface released");
}

const QFont& GridRenderSession::fitFont(const StyleData& style) {
    const QString family = style.fontFamily.trimmed().isEmpty() ? m_theme.cellFontFamily : style.fontFamily;
    const double size = isSaneFitFontSize(style.fontSize) ? style.fontSize : m_theme.cellFontSize;
    return m_fontCache.fontFor(family, size, style.bold, style.italic);
}

double GridRenderSession::measureOptimalColumnWidth(int col, const std::vector<CellData>& cells,
                                                    const StyleDataMap* styles, double minWidth) {
    return measureOptimalColumnWidth(measurementSurface(), col, cells, styles, minWidth);
}

double GridRenderSession::measureOptimalRowHeight(const std::vector<CellData>& cells, const StyleDataMap* styles,
                                                  const GridConfig& config, const DimensionOverrides* dimensions,
                                                  double minHeight) {
    return measureOptimalRowHeight(measurementSurface(), cells, styles, config, dimensions, minHeight);
}

double GridRenderSession::measureOptimalColumnWidth(IDrawSurface& measure, int col, const std::vector<CellData>& cells,
                                                    const StyleDataMap* styles, double minWidth) {
    // The header label sets the floor
    measure.setFont(m_fontCache.fontFor(m_theme.cellFontFamily, m_theme.headerFontSize, false, false));
    double widest = measure.measureText(columnToLetter(col)) + kFitPaddingX * 2.0 + kFitMargin;

    for (const CellData& cell : cells) {
        if (cell.colSpan > 1 || cell.display.isEmpty()) continue;
        measure.setFont(fitFont(lookupStyle(styles, cell.styleIndex)));
        widest = std::max(widest, measure.measureText(cell.display) + kFitPaddingX * 2.0 + kFitMargin);
    }
    return std::max(minWidth, std::ceil(widest));
}

double GridRenderSession::measureOptimalRowHeight(IDrawSurface& measure, const std::vector<CellData>& cells,
                                                  const StyleDataMap* styles, const GridConfig& config,
                                                  const DimensionOverrides* dimensions, double minHeight) {
    const DimensionResolver dims(config, dimensions);
    double tallest = 0.0;

    for (const CellData& cell : cells) {
        if (cell.rowSpan > 1 || cell.display.isEmpty()) continue;
        const StyleData& style = lookupStyle(styles, cell.styleIndex);
        const double fontSize = isSaneFitFontSize(style.fontSize) ? style.fontSize : m_theme.cellFontSize;

        int lineCount = 1;
        if (style.wrapText) {
            const double available = dims.getColumnWidth(cell.col) - kFitPaddingX * 2.0;
            if (available > 0.0) {
                measure.setFont(fitFont(style));
                lineCount = std::max(1, static_cast<int>(TextLayout::wrapLines(measure, cell.display, available).size()));
            }
        }
        tallest = std::max(tallest, lineCount * fontSize * TextLayout::kLineHeightFactor + kFitPaddingY * 2.0);
    }

    if (tallest <= 0.0) return minHeight;
    return std::max(minHeight, std::ceil(tallest));
}

//  SAVED SELECTIONS

void GridRenderSession::saveSelection(const QString& sheetName, const Selection& selection) {
    m_savedSelections.insert(sheetName.toLower(), selection);
}

std::optional<Selection> GridRenderSession::getSavedSelection(const QString& sheetName) const {
    auto it = m_savedSelections.constFind(sheetName.toLower());
    if (it == m_savedSelections.constEnd()) return std::nullopt;
    return it.value();
}

bool GridRenderSession::forgetSelection(const QString& sheetName) {
    return m_savedSelections.remove(sheetName.toLower()) > 0;
}
