#pragma once

// ============================================================================
// RenderSurface - Minimal drawing target used by every renderer
// ============================================================================
// Compositor, OverlayRenderer and ChromaKeyCompositor draw through this
// interface only. PainterSurface forwards to a QPainter (widget or QImage);
// RecordingSurface records calls in memory for tests.
//
// Transform calls compose the same way QPainter's do: the most recent call
// is applied to coordinates first.
// ============================================================================

#include <QColor>
#include <QImage>
#include <QLineF>
#include <QPainterPath>
#include <QRectF>
#include <QSize>
#include <QString>
#include <QVector>

/**
 * @brief Pen description for stroke calls.
 *
 * Widths and dash lengths are in the surface's current user space, so a
 * renderer working under scale(zoom) passes 1/zoom for a one-pixel line.
 */
struct StrokeStyle {
    QColor color = Qt::black;
    qreal width = 1.0;
    QVector<qreal> dashPattern;     ///< Alternating dash/gap lengths, empty = solid

    StrokeStyle() = default;
    StrokeStyle(const QColor& c, qreal w) : color(c), width(w) {}
    StrokeStyle(const QColor& c, qreal w, const QVector<qreal>& dashes)
        : color(c), width(w), dashPattern(dashes) {}

    bool isDashed() const { return !dashPattern.isEmpty(); }
};

class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    /// Pixel size of the target.
    virtual QSize size() const = 0;

    // ===== State stack =====
    virtual void save() = 0;
    virtual void restore() = 0;

    // ===== Transform =====
    virtual void translate(qreal dx, qreal dy) = 0;
    virtual void scale(qreal sx, qreal sy) = 0;
    virtual void rotate(qreal degrees) = 0;

    /// Bilinear/smooth resampling for drawImage() when true.
    virtual void setHighQualityResampling(bool enabled) = 0;

    /// Intersect the clip with @p path (user space).
    virtual void clipToPath(const QPainterPath& path) = 0;

    // ===== Drawing =====
    virtual void clear(const QColor& color) = 0;
    virtual void fillRect(const QRectF& rect, const QColor& color) = 0;
    virtual void fillPath(const QPainterPath& path, const QColor& color) = 0;
    virtual void drawImage(const QRectF& target, const QImage& image) = 0;
    virtual void strokeLine(const QLineF& line, const StrokeStyle& style) = 0;
    virtual void strokeRect(const QRectF& rect, const StrokeStyle& style) = 0;
    virtual void strokePath(const QPainterPath& path, const StrokeStyle& style) = 0;
    virtual void drawText(const QRectF& rect, const QString& text, const QColor& color) = 0;
};
