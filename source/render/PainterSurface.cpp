#include "PainterSurface.h"

#include <QPainter>
#include <QPen>

PainterSurface::PainterSurface(QPainter& painter, const QSize& size)
    : m_painter(painter)
    , m_size(size)
{
}

void PainterSurface::save()
{
    m_painter.save();
}

void PainterSurface::restore()
{
    m_painter.restore();
}

void PainterSurface::translate(qreal dx, qreal dy)
{
    m_painter.translate(dx, dy);
}

void PainterSurface::scale(qreal sx, qreal sy)
{
    m_painter.scale(sx, sy);
}

void PainterSurface::rotate(qreal degrees)
{
    m_painter.rotate(degrees);
}

void PainterSurface::setHighQualityResampling(bool enabled)
{
    m_painter.setRenderHint(QPainter::SmoothPixmapTransform, enabled);
    m_painter.setRenderHint(QPainter::Antialiasing, enabled);
}

void PainterSurface::clipToPath(const QPainterPath& path)
{
    m_painter.setClipPath(path, Qt::IntersectClip);
}

void PainterSurface::clear(const QColor& color)
{
    m_painter.save();
    m_painter.resetTransform();
    m_painter.setClipping(false);
    m_painter.setCompositionMode(QPainter::CompositionMode_Source);
    m_painter.fillRect(QRect(QPoint(0, 0), m_size), color);
    m_painter.restore();
}

void PainterSurface::fillRect(const QRectF& rect, const QColor& color)
{
    m_painter.fillRect(rect, color);
}

void PainterSurface::fillPath(const QPainterPath& path, const QColor& color)
{
    m_painter.fillPath(path, color);
}

void PainterSurface::drawImage(const QRectF& target, const QImage& image)
{
    m_painter.drawImage(target, image);
}

void PainterSurface::applyPen(const StrokeStyle& style)
{
    QPen pen(style.color, style.width);
    pen.setCapStyle(Qt::FlatCap);
    if (style.isDashed() && style.width > 0) {
        // QPen dash lengths are in units of the pen width
        QVector<qreal> dashes;
        dashes.reserve(style.dashPattern.size());
        for (qreal length : style.dashPattern) {
            dashes.append(length / style.width);
        }
        pen.setDashPattern(dashes);
    }
    m_painter.setPen(pen);
    m_painter.setBrush(Qt::NoBrush);
}

void PainterSurface::strokeLine(const QLineF& line, const StrokeStyle& style)
{
    applyPen(style);
    m_painter.drawLine(line);
}

void PainterSurface::strokeRect(const QRectF& rect, const StrokeStyle& style)
{
    applyPen(style);
    m_painter.drawRect(rect);
}

void PainterSurface::strokePath(const QPainterPath& path, const StrokeStyle& style)
{
    applyPen(style);
    m_painter.drawPath(path);
}

void PainterSurface::drawText(const QRectF& rect, const QString& text, const QColor& color)
{
    m_painter.setPen(color);
    m_painter.drawText(rect, Qt::AlignCenter | Qt::TextWordWrap, text);
}
