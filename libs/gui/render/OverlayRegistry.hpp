/*
Calcula — OverlayRegistry
Role: Plugin table for extension overlays: region type tag -> priority-ordered (priority, render closure) list.
Inputs/Outputs: GridRegion list from the frame in; overlay draws out; optional hit testing back to a region.
Threading: GUI/render thread only.
Performance: Painting flattens registrations once per frame and filters regions per registration.
Integration: Owned by GridRenderSession; painted right after structural content, before formula references.
Observability: Registration and render failures logged on calcula.app / calcula.render.
Related: GridTypes.hpp (GridRegion), GridRenderSession.cpp, FreezeGeometry.hpp.
Assumptions: Renderers restore any surface state they change; the registry brackets each call with save/restore.
*/
#pragma once
#include <QRectF>
#include <QString>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>
#include "GridTypes.hpp"

class IDrawSurface;
class FreezeGeometry;

struct OverlayRenderContext {
    IDrawSurface& surface;
    const GridFrame& frame;
    const GridRegion& region;
    const FreezeGeometry& geometry;
    QRectF regionRect;                 // unclipped screen rect of the region
    std::optional<QRectF> visibleRect; // after zone clipping; empty when scrolled out
};

using OverlayRenderFn = std::function<void(const OverlayRenderContext& context)>;
using OverlayHitTestFn = std::function<bool(const GridRegion& region, const QRectF& regionRect, double x, double y)>;

struct OverlayRegistration {
    QString type;
    OverlayRenderFn render;
    OverlayHitTestFn hitTest;
    int priority = 0;
};

class OverlayRegistry {
public:
    // Returns a handle for unregisterOverlay()
    int registerOverlay(const OverlayRegistration& registration);
    bool unregisterOverlay(int handle);
    void clear();

    int count() const;
    std::vector<QString> getTypes() const;

    // Ascending priority; equal priorities in registration order
    void paint(IDrawSurface& surface, const GridFrame& frame, const FreezeGeometry& geometry) const;

    // Topmost region under the point (reverse paint order), if its overlay implements hit testing
    std::optional<GridRegion> hitTest(double x, double y, const GridFrame& frame,
                                      const FreezeGeometry& geometry) const;

private:
    struct Entry {
        int handle = 0;
        std::uint64_t sequence = 0;
        OverlayRegistration registration;
    };

    std::vector<const Entry*> ordered() const;

    std::map<QString, std::vector<Entry>> m_byType;
    int m_nextHandle = 1;
    std::uint64_t m_nextSequence = 0;
};
