#pragma once

// ============================================================================
// PainterSurface - RenderSurface backed by a QPainter
// ============================================================================
// Used for the on-screen viewport (painter on the widget) and for every
// offscreen buffer (painter on a QImage: export, mockup pattern buffer, CLI).
// The painter must outlive the surface.
// ============================================================================

#include "RenderSurface.h"

class QPainter;

class PainterSurface : public RenderSurface {
public:
    /**
     * @param painter Active painter.
     * @param size Pixel size of the device the painter draws on.
     */
    PainterSurface(QPainter& painter, const QSize& size);

    QSize size() const override { return m_size; }

    void save() override;
    void restore() override;

    void translate(qreal dx, qreal dy) override;
    void scale(qreal sx, qreal sy) override;
    void rotate(qreal degrees) override;
    void setHighQualityResampling(bool enabled) override;
    void clipToPath(const QPainterPath& path) override;

    void clear(const QColor& color) override;
    void fillRect(const QRectF& rect, const QColor& color) override;
    void fillPath(const QPainterPath& path, const QColor& color) override;
    void drawImage(const QRectF& target, const QImage& image) override;
    void strokeLine(const QLineF& line, const StrokeStyle& style) override;
    void strokeRect(const QRectF& rect, const StrokeStyle& style) override;
    void strokePath(const QPainterPath& path, const StrokeStyle& style) override;
    void drawText(const QRectF& rect, const QString& text, const QColor& color) override;

private:
    void applyPen(const StrokeStyle& style);

    QPainter& m_painter;
    QSize m_size;
};
