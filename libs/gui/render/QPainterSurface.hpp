/*
Calcula — QPainterSurface
Role: IDrawSurface backed by a QPainter (widgets, QImage, QQuickPaintedItem, printing).
Inputs/Outputs: Borrows an active QPainter; forwards draw calls with pixel dash patterns converted to Qt pen units.
Threading: Same thread as the QPainter's paint device.
Performance: Caches QFontMetricsF for the current font.
Integration: Used by callers to render a GridFrame and by GridRenderSession as its text measurement surface.
Observability: None.
Related: IDrawSurface.hpp, GridRenderSession.cpp.
Assumptions: The painter is active (begin() succeeded) for the lifetime of this object.
*/
#pragma once
#include <QFontMetricsF>
#include <memory>
#include "IDrawSurface.hpp"

class QPainter;

class QPainterSurface : public IDrawSurface {
public:
    explicit QPainterSurface(QPainter* painter);
    ~QPainterSurface() override;

    void save() override;
    void restore() override;
    void clipRect(const QRectF& rect) override;

    void fillRect(const QRectF& rect, const QColor& color) override;
    void strokeRect(const QRectF& rect, const StrokeStyle& stroke) override;
    void strokeLine(const QPointF& from, const QPointF& to, const StrokeStyle& stroke) override;

    void setFont(const QFont& font) override;
    double measureText(const QString& text) override;
    void fillText(const QString& text, const QPointF& position, TextBaseline baseline,
                  const QColor& color) override;

    void translate(double dx, double dy) override;
    void rotate(double degrees) override;

private:
    void applyStroke(const StrokeStyle& stroke);

    QPainter* m_painter;
    QFont m_font;
    std::unique_ptr<QFontMetricsF> m_metrics;
};
