#include "QPainterSurface.hpp"
#include <QPainter>
#include <QPen>

QPainterSurface::QPainterSurface(QPainter* painter)
    : m_painter(painter) {
    if (m_painter) {
        m_font = m_painter->font();
    }
    m_metrics = std::make_unique<QFontMetricsF>(m_font);
}

QPainterSurface::~QPainterSurface() = default;

void QPainterSurface::save() {
    if (m_painter) m_painter->save();
}

void QPainterSurface::restore() {
    if (!m_painter) return;
    m_painter->restore();
    // restore() also rewinds the painter font
    if (m_painter->font() != m_font) {
        m_font = m_painter->font();
        m_metrics = std::make_unique<QFontMetricsF>(m_font);
    }
}

void QPainterSurface::clipRect(const QRectF& rect) {
    if (m_painter) m_painter->setClipRect(rect, Qt::IntersectClip);
}

void QPainterSurface::fillRect(const QRectF& rect, const QColor& color) {
    if (m_painter) m_painter->fillRect(rect, color);
}

void QPainterSurface::applyStroke(const StrokeStyle& stroke) {
    QPen pen(stroke.color, stroke.width);
    pen.setCapStyle(Qt::FlatCap);
    pen.setJoinStyle(Qt::MiterJoin);
    if (!stroke.dashPattern.isEmpty() && stroke.width > 0.0) {
        // Qt dash lengths are in units of the pen width
        QVector<qreal> pattern;
        pattern.reserve(stroke.dashPattern.size());
        for (qreal length : stroke.dashPattern) {
            pattern.push_back(length / stroke.width);
        }
        pen.setDashPattern(pattern);
        pen.setDashOffset(stroke.dashOffset / stroke.width);
    }
    m_painter->setPen(pen);
    m_painter->setBrush(Qt::NoBrush);
}

void QPainterSurface::strokeRect(const QRectF& rect, const StrokeStyle& stroke) {
    if (!m_painter) return;
    applyStroke(stroke);
    m_painter->drawRect(rect);
}

void QPainterSurface::strokeLine(const QPointF& from, const QPointF& to, const StrokeStyle& stroke) {
    if (!m_painter) return;
    applyStroke(stroke);
    m_painter->drawLine(from, to);
}

void QPainterSurface::setFont(const QFont& font) {
    if (font == m_font) return;
    m_font = font;
    m_metrics = std::make_unique<QFontMetricsF>(m_font);
    if (m_painter) m_painter->setFont(m_font);
}

double QPainterSurface::measureText(const QString& text) {
    return m_metrics->horizontalAdvance(text);
}

void QPainterSurface::fillText(const QString& text, const QPointF& position, TextBaseline baseline,
                               const QColor& color) {
    if (!m_painter) return;
    double y = position.y();
    switch (baseline) {
    case TextBaseline::Top:
        y += m_metrics->ascent();
        break;
    case TextBaseline::Middle:
        y += (m_metrics->ascent() - m_metrics->descent()) / 2.0;
        break;
    case TextBaseline::Bottom:
        y -= m_metrics->descent();
        break;
    case TextBaseline::Alphabetic:
        break;
    }
    m_painter->setPen(color);
    m_painter->drawText(QPointF(position.x(), y), text);
}

void QPainterSurface::translate(double dx, double dy) {
    if (m_painter) m_painter->translate(dx, dy);
}

void QPainterSurface::rotate(double degrees) {
    if (m_painter) m_painter->rotate(degrees);
}
