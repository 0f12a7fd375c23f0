/*
Calcula — TextLayout
Role: Measures and fits cell text: ellipsis truncation, word/character wrapping, alignment offsets.
Inputs/Outputs: Text + width budget in; fitted strings / line lists out. Measures with the surface's current font.
Threading: Render thread only (uses the supplied surface).
Performance: Truncation is a binary search over prefix lengths (O(log n) measurements).
Integration: Used by CellContentLayer, HeaderLayer and GridRenderSession autofit. FontCache is owned by the session.
Observability: None.
Related: CellContentLayer.cpp, GridRenderSession.cpp.
Assumptions: The caller has already set the font on the surface.
*/
#pragma once
#include <QFont>
#include <QHash>
#include <QString>
#include <QStringList>
#include "IDrawSurface.hpp"
#include "../../core/sheet/model/SheetData.h"

struct FittedText {
    QString text;
    double width = 0.0;
    bool truncated = false;
};

class TextLayout {
public:
    static constexpr double kLineHeightFactor = 1.2;

    static QString ellipsis();

    // Longest prefix (plus ellipsis) that fits; returns the text untouched when it already fits
    static FittedText fitToWidth(IDrawSurface& surface, const QString& text, double maxWidth);

    // Word-boundary wrapping with a per-character fallback for words wider than maxWidth
    static QStringList wrapLines(IDrawSurface& surface, const QString& text, double maxWidth);

    // X of the text start inside [left, right] with `padding` on the aligned edge
    static double alignedX(HorizontalAlign align, double left, double right, double textWidth, double padding);
};

// Memoizes QFont construction keyed by its CSS-like description
class FontCache {
public:
    const QFont& fontFor(const QString& family, double pixelSize, bool bold, bool italic);
    int size() const { return m_fonts.size(); }
    void clear() { m_fonts.clear(); }

    static QString describe(const QString& family, double pixelSize, bool bold, bool italic);

private:
    QHash<QString, QFont> m_fonts;
};
