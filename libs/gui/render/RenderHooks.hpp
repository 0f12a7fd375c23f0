/*
Calcula — RenderHooks
Role: Ordered registries of pluggable cell hooks: style interceptors (conditional formatting) and decorations.
Inputs/Outputs: Interceptors map (text, stored style, cell) to a partial StyleOverride; decorations paint into a cell.
Threading: Registration and invocation on the GUI/render thread only.
Performance: Linear over registrations per painted cell; callers check hasInterceptors()/hasDecorations() first.
Integration: Owned by GridRenderSession; consulted by StyleResolver and CellContentLayer.
Observability: A hook that throws is logged on calcula.render and skipped for that cell.
Related: StyleResolver.hpp, CellContentLayer.cpp, OverlayRegistry.hpp.
Assumptions: Hook ids are unique per registry; re-registering an id replaces the previous entry.
*/
#pragma once
#include <QRectF>
#include <QString>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include "StyleResolver.hpp"

class IDrawSurface;
struct GridFrame;

using StyleInterceptorFn =
    std::function<std::optional<StyleOverride>(const QString& text, const StyleData& baseStyle, const CellCoord& cell)>;

struct CellDecorationContext {
    IDrawSurface& surface;
    const GridFrame& frame;
    int row;
    int col;
    const QString& display;
    QRectF cellRect;   // merged bounds, unclipped
    QRectF clip;       // visible part of the cell inside its zone
};

using CellDecorationFn = std::function<void(const CellDecorationContext& context)>;

class StyleHookRegistry {
public:
    void registerInterceptor(const QString& id, StyleInterceptorFn fn, int priority = 0);
    bool unregisterInterceptor(const QString& id);

    void registerDecoration(const QString& id, CellDecorationFn fn, int priority = 0);
    bool unregisterDecoration(const QString& id);

    void clear();

    bool hasInterceptors() const { return !m_interceptors.empty(); }
    bool hasDecorations() const { return !m_decorations.empty(); }
    int interceptorCount() const { return static_cast<int>(m_interceptors.size()); }
    int decorationCount() const { return static_cast<int>(m_decorations.size()); }

    // Applies every interceptor in order; later overrides win field by field
    StyleOverride interceptStyle(const QString& text, const StyleData& baseStyle, const CellCoord& cell) const;

    void decorateCell(const CellDecorationContext& context) const;

private:
    template <typename Fn>
    struct Entry {
        QString id;
        Fn fn;
        int priority = 0;
        std::uint64_t sequence = 0;
    };

    template <typename Fn>
    void insertSorted(std::vector<Entry<Fn>>& entries, const QString& id, Fn fn, int priority);

    template <typename Fn>
    static bool removeById(std::vector<Entry<Fn>>& entries, const QString& id);

    std::vector<Entry<StyleInterceptorFn>> m_interceptors;
    std::vector<Entry<CellDecorationFn>> m_decorations;
    std::uint64_t m_nextSequence = 0;
};
