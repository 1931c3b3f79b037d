#pragma once

// ============================================================================
// RecordingSurface - In-memory RenderSurface that records every call
// ============================================================================
// Test double for the renderers. Nothing is rasterized; each call is stored
// with the world transform that was active when it was made, so tests can
// assert both logical coordinates and where they land on the device.
// ============================================================================

#include "RenderSurface.h"

#include <QStack>
#include <QTransform>

class RecordingSurface : public RenderSurface {
public:
    enum class Op {
        Save, Restore, Translate, Scale, Rotate, Resampling, Clip,
        Clear, FillRect, FillPath, DrawImage, StrokeLine, StrokeRect, StrokePath, DrawText
    };

    struct Call {
        Op op = Op::Save;
        QTransform transform;   ///< World transform when the call was made (after it, for transform ops)
        QRectF rect;            ///< FillRect / DrawImage target / StrokeRect / DrawText / path bounds
        QLineF line;            ///< StrokeLine
        QColor color;           ///< Fill / text / clear colour
        StrokeStyle style;      ///< Stroke calls
        QSize imageSize;        ///< DrawImage source size
        qreal a = 0.0;          ///< Translate dx, Scale sx, Rotate degrees, Resampling flag
        qreal b = 0.0;          ///< Translate dy, Scale sy
        QString text;           ///< DrawText

        /// Logical rect mapped through the recorded transform.
        QRectF deviceRect() const { return transform.mapRect(rect); }
    };

    explicit RecordingSurface(const QSize& size) : m_size(size) {}

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

    // ===== Inspection =====
    const QVector<Call>& calls() const { return m_calls; }
    QVector<Call> calls(Op op) const;
    int count(Op op) const;
    QTransform currentTransform() const { return m_transform; }
    bool highQualityResampling() const { return m_highQuality; }
    void reset();

private:
    Call makeCall(Op op) const;

    QSize m_size;
    QTransform m_transform;
    QStack<QTransform> m_stack;
    bool m_highQuality = false;
    QVector<Call> m_calls;
};
