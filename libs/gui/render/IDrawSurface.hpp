/*
Calcula — IDrawSurface
Role: Abstract 2D immediate-mode drawing surface the grid core paints onto.
Inputs/Outputs: Rect fills/strokes, dashed lines, text with a baseline, save/clip/restore, translate/rotate.
Threading: Implementations are single-threaded; the grid core never shares a surface across threads.
Performance: Calls map 1:1 to the backend; no batching at this level.
Integration: QPainterSurface implements it on QPainter; tests use a recording fake.
Observability: No diagnostics defined; responsibility of the concrete implementation.
Related: QPainterSurface.hpp, GridRenderSession.h.
Assumptions: Coordinates are device-independent pixels; 1px lines are placed on x.5 by the caller.
*/
#pragma once
#include <QColor>
#include <QFont>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <utility>

enum class TextBaseline { Top, Middle, Alphabetic, Bottom };

struct StrokeStyle {
    QColor color;
    double width = 1.0;
    QVector<qreal> dashPattern;  // pixels, alternating on/off; empty = solid
    double dashOffset = 0.0;     // pixels; positive shifts the pattern backwards along the path

    StrokeStyle() = default;
    StrokeStyle(const QColor& c, double w) : color(c), width(w) {}
    StrokeStyle(const QColor& c, double w, QVector<qreal> dash, double offset = 0.0)
        : color(c), width(w), dashPattern(std::move(dash)), dashOffset(offset) {}
};

class IDrawSurface {
public:
    virtual ~IDrawSurface() = default;

    virtual void save() = 0;
    virtual void restore() = 0;
    virtual void clipRect(const QRectF& rect) = 0;  // intersects with the current clip

    virtual void fillRect(const QRectF& rect, const QColor& color) = 0;
    virtual void strokeRect(const QRectF& rect, const StrokeStyle& stroke) = 0;
    virtual void strokeLine(const QPointF& from, const QPointF& to, const StrokeStyle& stroke) = 0;

    virtual void setFont(const QFont& font) = 0;
    virtual double measureText(const QString& text) = 0;
    virtual void fillText(const QString& text, const QPointF& position, TextBaseline baseline,
                          const QColor& color) = 0;

    virtual void translate(double dx, double dy) = 0;
    virtual void rotate(double degrees) = 0;  // clockwise on screen
};
