/*
Calcula — GridRenderSession
Role: Orchestrates one frame of the spreadsheet grid: zones, overlays, highlights and headers in a fixed z-order.
Inputs/Outputs: Takes an immutable GridFrame and an IDrawSurface; paints the whole canvas. Also answers auto-fit queries.
Threading: GUI/render thread only; one render() call at a time. Nothing from a frame is kept after the call.
Performance: Per-frame derived state (dimensions, zones, merges, geometry) is built once and shared by every layer.
Integration: Owned by the grid widget; layers live under render/strategies, hooks in RenderHooks/OverlayRegistry.
Observability: Per-frame timing on calcula.render via cgLog_RenderN; hook failures logged by the registries.
Related: GridFrameDriver.h, GridSettings.h, IGridLayer.hpp, HitTester.hpp.
Assumptions: The caller keeps the session alive across frames so the font memo and measurement surface are reused.
*/
#pragma once
#include <QHash>
#include <QImage>
#include <QString>
#include <memory>
#include <optional>
#include <vector>
#include "render/GridTheme.hpp"
#include "render/GridTypes.hpp"
#include "render/HitTester.hpp"
#include "render/OverlayRegistry.hpp"
#include "render/RenderHooks.hpp"
#include "render/TextLayout.hpp"

class QPainter;
class QPainterSurface;
class IDrawSurface;
class IZoneLayer;
class IGridLayer;

/**
 *  GRID RENDER SESSION
 *
 * Replaces module-level render state with one explicit object: the layer stack,
 * the hook registries, the lazily created measurement surface and the per-sheet
 * saved selections all live here and die with the session.
 */
class GridRenderSession {
public:
    static constexpr double kFitPaddingX = 4.0;
    static constexpr double kFitPaddingY = 2.0;
    static constexpr double kFitMargin = 2.0;

    GridRenderSession();
    explicit GridRenderSession(const GridTheme& theme, const HitTestTuning& tuning = HitTestTuning{});
    ~GridRenderSession();

    GridRenderSession(const GridRenderSession&) = delete;
    GridRenderSession& operator=(const GridRenderSession&) = delete;

    //  FRAME
    void render(IDrawSurface& surface, const GridFrame& frame);
    HitTester createHitTester(const GridFrame& frame) const;

    //  AUTO-FIT (measured on the session's offscreen surface)
    double measureOptimalColumnWidth(int col, const std::vector<CellData>& cells, const StyleDataMap* styles,
                                     double minWidth);
    double measureOptimalRowHeight(const std::vector<CellData>& cells, const StyleDataMap* styles,
                                   const GridConfig& config, const DimensionOverrides* dimensions, double minHeight);

    // Same measurements on a caller-supplied surface
    double measureOptimalColumnWidth(IDrawSurface& measure, int col, const std::vector<CellData>& cells,
                                     const StyleDataMap* styles, double minWidth);
    double measureOptimalRowHeight(IDrawSurface& measure, const std::vector<CellData>& cells,
                                   const StyleDataMap* styles, const GridConfig& config,
                                   const DimensionOverrides* dimensions, double minHeight);

    bool hasMeasurementSurface() const { return m_measureSurface != nullptr; }
    void releaseMeasurementSurface();

    //  SAVED SELECTIONS (sheet names compare case-insensitively)
    void saveSelection(const QString& sheetName, const Selection& selection);
    std::optional<Selection> getSavedSelection(const QString& sheetName) const;
    bool forgetSelection(const QString& sheetName);
    void clearSavedSelections() { m_savedSelections.clear(); }
    int savedSelectionCount() const { return m_savedSelections.size(); }

    //  LOOK & HOOKS
    const GridTheme& getTheme() const { return m_theme; }
    void setTheme(const GridTheme& theme);
    const HitTestTuning& getTuning() const { return m_tuning; }
    void setTuning(const HitTestTuning& tuning) { m_tuning = tuning; }

    StyleHookRegistry& getStyleHooks() { return m_styleHooks; }
    const StyleHookRegistry& getStyleHooks() const { return m_styleHooks; }
    OverlayRegistry& getOverlays() { return m_overlays; }
    const OverlayRegistry& getOverlays() const { return m_overlays; }
    FontCache& getFontCache() { return m_fontCache; }

    // Layer names in paint order (zone layers first)
    std::vector<QString> getLayerNames() const;

private:
    void init();
    IDrawSurface& measurementSurface();
    const QFont& fitFont(const StyleData& style);

    GridTheme m_theme;
    HitTestTuning m_tuning;
    StyleHookRegistry m_styleHooks;
    OverlayRegistry m_overlays;
    FontCache m_fontCache;

    std::vector<std::unique_ptr<IZoneLayer>> m_zoneLayers;
    std::vector<std::unique_ptr<IGridLayer>> m_highlightLayers;
    std::unique_ptr<IGridLayer> m_headerLayer;

    // Destroyed surface -> painter -> image
    QImage m_measureImage;
    std::unique_ptr<QPainter> m_measurePainter;
    std::unique_ptr<QPainterSurface> m_measureSurface;

    QHash<QString, Selection> m_savedSelections;
};
