/*
Calcula — RangePreviewLayer
Role: Dashed preview of a pending range operation: fill-handle drag or selection move.
Inputs/Outputs: GridFrame::fillPreview or GridFrame::selectionDragPreview in; translucent fill and dashed 2px border out.
Threading: Render thread.
Performance: One fill and one stroke per frame.
Integration: GridRenderSession runs a FillHandle instance, then a SelectionMove instance, before SelectionLayer.
Observability: No internal logging.
Related: SelectionLayer.hpp, GridTheme.hpp.
Assumptions: Previews are transient; a missing range means nothing is drawn.
*/
#pragma once
#include "../IGridLayer.hpp"

class RangePreviewLayer : public IGridLayer {
public:
    enum class Kind { FillHandle, SelectionMove };

    explicit RangePreviewLayer(Kind kind) : m_kind(kind) {}

    void paint(IDrawSurface& surface, const IFrameAccessor& frame) override;
    const char* getLayerName() const override {
        return m_kind == Kind::FillHandle ? "FillPreview" : "DragPreview";
    }

    Kind getKind() const { return m_kind; }

private:
    Kind m_kind;
};
