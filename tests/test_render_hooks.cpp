#include <gtest/gtest.h>
#include <stdexcept>
#include "GridFixtures.hpp"
#include "RecordingSurface.hpp"
#include "render/FreezeGeometry.hpp"
#include "render/OverlayRegistry.hpp"
#include "render/RenderHooks.hpp"
#include "render/ViewportLayout.hpp"

namespace {

GridRegion region(const QString& id, const QString& type, int row, int col) {
    GridRegion r;
    r.id = id;
    r.type = type;
    r.startRow = r.endRow = row;
    r.startCol = r.endCol = col;
    return r;
}

struct OverlayFixture {
    GridFrame frame = makeFrame();
    DimensionResolver dims{frame.config, nullptr};
    FreezeGeometry geometry{dims, FreezePaneLayout{}, frame.viewport, frame.width, frame.height};
    RecordingSurface surface;
};

} // namespace

TEST(OverlayRegistryTest, PaintsByPriorityThenRegistration) {
    OverlayFixture fx;
    fx.frame.regions = {region(QStringLiteral("r1"), QStringLiteral("note"), 1, 1),
                        region(QStringLiteral("r2"), QStringLiteral("validation"), 2, 2)};

    OverlayRegistry overlays;
    std::vector<QString> order;
    overlays.registerOverlay({QStringLiteral("note"),
                              [&](const OverlayRenderContext& c) { order.push_back(QStringLiteral("note:") + c.region.id); },
                              nullptr, 5});
    overlays.registerOverlay({QStringLiteral("validation"),
                              [&](const OverlayRenderContext& c) { order.push_back(QStringLiteral("val:") + c.region.id); },
                              nullptr, 0});
    overlays.registerOverlay({QStringLiteral("note"),
                              [&](const OverlayRenderContext&) { order.push_back(QStringLiteral("note-late")); },
                              nullptr, 5});

    overlays.paint(fx.surface, fx.frame, fx.geometry);
    EXPECT_EQ(order, (std::vector<QString>{QStringLiteral("val:r2"), QStringLiteral("note:r1"),
                                           QStringLiteral("note-late")}));
    EXPECT_EQ(overlays.count(), 3);
    EXPECT_EQ(fx.surface.depth(), 0);
}

TEST(OverlayRegistryTest, ContextCarriesRegionGeometry) {
    OverlayFixture fx;
    fx.frame.regions = {region(QStringLiteral("r1"), QStringLiteral("note"), 1, 1)};

    OverlayRegistry overlays;
    QRectF seen;
    bool visible = false;
    overlays.registerOverlay({QStringLiteral("note"), [&](const OverlayRenderContext& c) {
                                  seen = c.regionRect;
                                  visible = c.visibleRect.has_value();
                              }, nullptr, 0});
    overlays.paint(fx.surface, fx.frame, fx.geometry);
    EXPECT_EQ(seen, QRectF(150.0, 48.0, 100.0, 24.0));
    EXPECT_TRUE(visible);
}

TEST(OverlayRegistryTest, FailingRendererIsSkipped) {
    OverlayFixture fx;
    fx.frame.regions = {region(QStringLiteral("a"), QStringLiteral("note"), 0, 0),
                        region(QStringLiteral("b"), QStringLiteral("note"), 1, 0)};

    OverlayRegistry overlays;
    int painted = 0;
    overlays.registerOverlay({QStringLiteral("note"), [&](const OverlayRenderContext& c) {
                                  if (c.region.id == QStringLiteral("a")) throw std::runtime_error("bad region");
                                  ++painted;
                              }, nullptr, 0});
    overlays.paint(fx.surface, fx.frame, fx.geometry);
    EXPECT_EQ(painted, 1);
    EXPECT_EQ(fx.surface.depth(), 0);
}

TEST(OverlayRegistryTest, RejectsIncompleteRegistrationsAndUnregisters) {
    OverlayRegistry overlays;
    EXPECT_EQ(overlays.registerOverlay({QString(), [](const OverlayRenderContext&) {}, nullptr, 0}), 0);
    EXPECT_EQ(overlays.registerOverlay({QStringLiteral("x"), nullptr, nullptr, 0}), 0);

    const int handle = overlays.registerOverlay({QStringLiteral("x"), [](const OverlayRenderContext&) {}, nullptr, 0});
    EXPECT_GT(handle, 0);
    EXPECT_EQ(overlays.getTypes(), (std::vector<QString>{QStringLiteral("x")}));
    EXPECT_TRUE(overlays.unregisterOverlay(handle));
    EXPECT_FALSE(overlays.unregisterOverlay(handle));
    EXPECT_EQ(overlays.count(), 0);
}

TEST(OverlayRegistryTest, HitTestPrefersTopmost) {
    OverlayFixture fx;
    fx.frame.regions = {region(QStringLiteral("low"), QStringLiteral("under"), 1, 1),
                        region(QStringLiteral("high"), QStringLiteral("over"), 1, 1)};

    auto inside = [](const GridRegion&, const QRectF& rect, double x, double y) {
        return rect.contains(QPointF(x, y));
    };
    OverlayRegistry overlays;
    overlays.registerOverlay({QStringLiteral("over"), [](const OverlayRenderContext&) {}, inside, 10});
    overlays.registerOverlay({QStringLiteral("under"), [](const OverlayRenderContext&) {}, inside, 0});

    const std::optional<GridRegion> hit = overlays.hitTest(200.0, 60.0, fx.frame, fx.geometry);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->id, QStringLiteral("high"));
    EXPECT_FALSE(overlays.hitTest(400.0, 200.0, fx.frame, fx.geometry).has_value());
}

TEST(CellDecorationTest, DecorationsRunInOrderInsideSaveRestore) {
    StyleHookRegistry hooks;
    std::vector<int> order;
    hooks.registerDecoration(QStringLiteral("b"), [&](const CellDecorationContext&) { order.push_back(2); }, 1);
    hooks.registerDecoration(QStringLiteral("a"), [&](const CellDecorationContext& c) {
        order.push_back(1);
        c.surface.fillRect(c.clip, QColor(Qt::red));
    });
    hooks.registerDecoration(QStringLiteral("broken"), [](const CellDecorationContext&) {
        throw std::runtime_error("decoration failed");
    }, 2);

    RecordingSurface surface;
    const GridFrame frame = makeFrame();
    const QString display = QStringLiteral("x");
    hooks.decorateCell(CellDecorationContext{surface, frame, 0, 0, display, QRectF(50, 24, 100, 24),
                                             QRectF(50, 24, 100, 24)});

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(surface.callsOf(RecordingSurface::Op::Save).size(), 3u);
    EXPECT_EQ(surface.depth(), 0);
    EXPECT_EQ(hooks.decorationCount(), 3);
}
