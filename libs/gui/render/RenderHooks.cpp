#include "RenderHooks.hpp"
#include "IDrawSurface.hpp"
#include "../../core/CalculaLogging.hpp"
#include <algorithm>
#include <exception>

template <typename Fn>
void StyleHookRegistry::insertSorted(std::vector<Entry<Fn>>& entries, const QString& id, Fn fn, int priority) {
    removeById(entries, id);
    Entry<Fn> entry{id, std::move(fn), priority, m_nextSequence++};
    // Ascending priority; equal priorities keep registration order
    auto pos = std::upper_bound(entries.begin(), entries.end(), entry, [](const Entry<Fn>& a, const Entry<Fn>& b) {
        return a.priority != b.priority ? a.priority < b.priority : a.sequence < b.sequence;
    });
    entries.insert(pos, std::move(entry));
}

template <typename Fn>
bool StyleHookRegistry::removeById(std::vector<Entry<Fn>>& entries, const QString& id) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const Entry<Fn>& e) { return e.id == id; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

void StyleHookRegistry::registerInterceptor(const QString& id, StyleInterceptorFn fn, int priority) {
    if (!fn) return;
    insertSorted(m_interceptors, id, std::move(fn), priority);
    cgLog_App("Style interceptor registered: " << id << " priority=" << priority);
}

bool StyleHookRegistry::unregisterInterceptor(const QString& id) {
    return removeById(m_interceptors, id);
}

void StyleHookRegistry::registerDecoration(const QString& id, CellDecorationFn fn, int priority) {
    if (!fn) return;
    insertSorted(m_decorations, id, std::move(fn), priority);
    cgLog_App("Cell decoration registered: " << id << " priority=" << priority);
}

bool StyleHookRegistry::unregisterDecoration(const QString& id) {
    return removeById(m_decorations, id);
}

void StyleHookRegistry::clear() {
    m_interceptors.clear();
    m_decorations.clear();
}

StyleOverride StyleHookRegistry::interceptStyle(const QString& text, const StyleData& baseStyle,
                                                const CellCoord& cell) const {
    StyleOverride merged;
    for (const auto& entry : m_interceptors) {
        try {
            if (auto result = entry.fn(text, baseStyle, cell)) {
                merged.mergeFrom(*result);
            }
        } catch (const std::exception& e) {
            cgLog_Warn("Style interceptor " << entry.id << " failed at (" << cell.row << "," << cell.col
                       << "): " << e.what());
        }
    }
    return merged;
}

void StyleHookRegistry::decorateCell(const CellDecorationContext& context) const {
    for (const auto& entry : m_decorations) {
        context.surface.save();
        try {
            entry.fn(context);
        } catch (const std::exception& e) {
            cgLog_Warn("Cell decoration " << entry.id << " failed at (" << context.row << "," << context.col
                       << "): " << e.what());
        }
        context.surface.restore();
    }
}
