/*
Calcula — FormulaReferenceLayer
Role: Colored boxes around the ranges referenced by the formula being edited (or the selected formula cell).
Inputs/Outputs: GridFrame::formulaReferences + sheet names in; tinted fill, 2px border and corner grips out.
Threading: Render thread.
Performance: Linear in the number of references.
Integration: Run by GridRenderSession right after the overlay registry, below every other highlight.
Observability: No internal logging.
Related: HitTester.hpp (corner/border drag targets), GridTheme.hpp (palette).
Assumptions: Full-row/column references already carry their full extent; unparsable colors use the theme palette.
*/
#pragma once
#include "../IGridLayer.hpp"

class FormulaReferenceLayer : public IGridLayer {
public:
    static constexpr double kBorderWidth = 2.0;
    static constexpr double kCornerSize = 6.0;
    static constexpr int kFillAlpha = 26;  // ~10%

    void paint(IDrawSurface& surface, const IFrameAccessor& frame) override;
    const char* getLayerName() const override { return "FormulaReferences"; }

    static QColor referenceColor(const GridTheme& theme, const FormulaReference& reference, int index);

private:
    void paintCorners(IDrawSurface& surface, const IFrameAccessor& frame, const FormulaReference& reference,
                      const QColor& color);
};
