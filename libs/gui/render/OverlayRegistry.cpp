#include "OverlayRegistry.hpp"
#include "FreezeGeometry.hpp"
#include "IDrawSurface.hpp"
#include "../../core/CalculaLogging.hpp"
#include <algorithm>
#include <exception>

int OverlayRegistry::registerOverlay(const OverlayRegistration& registration) {
    if (!registration.render || registration.type.isEmpty()) {
        cgLog_Warn("Overlay registration rejected: missing type or render function");
        return 0;
    }
    Entry entry{m_nextHandle++, m_nextSequence++, registration};
    auto& list = m_byType[registration.type];
    auto pos = std::upper_bound(list.begin(), list.end(), entry, [](const Entry& a, const Entry& b) {
        return a.registration.priority != b.registration.priority
            ? a.registration.priority < b.registration.priority
            : a.sequence < b.sequence;
    });
    list.insert(pos, std::move(entry));
    cgLog_App("Overlay registered: type=" << registration.type << " priority=" << registration.priority);
    return m_nextHandle - 1;
}

bool OverlayRegistry::unregisterOverlay(int handle) {
    for (auto it = m_byType.begin(); it != m_byType.end(); ++it) {
        auto& list = it->second;
        auto found = std::find_if(list.begin(), list.end(), [&](const Entry& e) { return e.handle == handle; });
        if (found == list.end()) continue;
        list.erase(found);
        if (list.empty()) m_byType.erase(it);
        return true;
    }
    return false;
}

void OverlayRegistry::clear() {
    m_byType.clear();
}

int OverlayRegistry::count() const {
    int total = 0;
    for (const auto& [type, list] : m_byType) total += static_cast<int>(list.size());
    return total;
}

std::vector<QString> OverlayRegistry::getTypes() const {
    std::vector<QString> types;
    types.reserve(m_byType.size());
    for (const auto& [type, list] : m_byType) types.push_back(type);
    return types;
}

std::vector<const OverlayRegistry::Entry*> OverlayRegistry::ordered() const {
    std::vector<const Entry*> entries;
    for (const auto& [type, list] : m_byType) {
        for (const auto& entry : list) entries.push_back(&entry);
    }
    std::stable_sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
        return a->registration.priority != b->registration.priority
            ? a->registration.priority < b->registration.priority
            : a->sequence < b->sequence;
    });
    return entries;
}

void OverlayRegistry::paint(IDrawSurface& surface, const GridFrame& frame, const FreezeGeometry& geometry) const {
    if (m_byType.empty() || frame.regions.empty()) return;

    for (const Entry* entry : ordered()) {
        for (const auto& region : frame.regions) {
            if (region.type != entry->registration.type) continue;

            const int minRow = std::min(region.startRow, region.endRow);
            const int maxRow = std::max(region.startRow, region.endRow);
            const int minCol = std::min(region.startCol, region.endCol);
            const int maxCol = std::max(region.startCol, region.endCol);
            OverlayRenderContext context{surface, frame, region, geometry,
                                         geometry.rangeRect(minRow, minCol, maxRow, maxCol),
                                         geometry.visibleRangeRect(minRow, minCol, maxRow, maxCol)};
            surface.save();
            try {
                entry->registration.render(context);
            } catch (const std::exception& e) {
                cgLog_Warn("Overlay " << region.type << "/" << region.id << " failed: " << e.what());
            }
            surface.restore();
        }
    }
}

std::optional<GridRegion> OverlayRegistry::hitTest(double x, double y, const GridFrame& frame,
                                                   const FreezeGeometry& geometry) const {
    const auto entries = ordered();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        const Entry* entry = *it;
        if (!entry->registration.hitTest) continue;
        for (const auto& region : frame.regions) {
            if (region.type != entry->registration.type) continue;
            const QRectF rect = geometry.rangeRect(std::min(region.startRow, region.endRow),
                                                   std::min(region.startCol, region.endCol),
                                                   std::max(region.startRow, region.endRow),
                                                   std::max(region.startCol, region.endCol));
            if (entry->registration.hitTest(region, rect, x, y)) return region;
        }
    }
    return std::nullopt;
}
