#include "ChromaKeyCompositor.h"
#include "Compositor.h"
#include "PainterSurface.h"

#include <QDebug>
#include <QPainter>

namespace ChromaKeyCompositor {

bool isKeyColor(int r, int g, int b, int a)
{
    return g > 200 && g > r + 50 && g > b + 50 && r < 50 && b < 50 && a > 0;
}

int substitute(QImage& mockup, const QImage& pattern)
{
    if (mockup.size() != pattern.size()) {
        qWarning() << "ChromaKeyCompositor: size mismatch" << mockup.size() << pattern.size();
        return -1;
    }

    if (mockup.format() != QImage::Format_RGBA8888) {
        mockup = mockup.convertToFormat(QImage::Format_RGBA8888);
    }
    const QImage source = pattern.format() == QImage::Format_RGBA8888
        ? pattern
        : pattern.convertToFormat(QImage::Format_RGBA8888);

    int replaced = 0;
    const int width = mockup.width();
    for (int y = 0; y < mockup.height(); ++y) {
        uchar* dst = mockup.scanLine(y);
        const uchar* src = source.constScanLine(y);
        for (int x = 0; x < width; ++x) {
            uchar* px = dst + x * 4;
            if (isKeyColor(px[0], px[1], px[2], px[3])) {
                const uchar* sp = src + x * 4;
                px[0] = sp[0];
                px[1] = sp[1];
                px[2] = sp[2];
                px[3] = sp[3];
                ++replaced;
            }
        }
    }
    return replaced;
}

QSize displaySize(const QSize& textureSize, const QSize& viewportSize, qreal mockupZoom)
{
    if (textureSize.isEmpty() || viewportSize.isEmpty()) {
        return QSize(1, 1);
    }

    const qreal largest = qMin(viewportSize.width(), viewportSize.height())
                          * DISPLAY_FRACTION * mockupZoom;
    const qreal aspect = static_cast<qreal>(textureSize.width()) / textureSize.height();

    qreal w = largest;
    qreal h = largest;
    if (aspect >= 1.0) {
        h = largest / aspect;
    } else {
        w = largest * aspect;
    }
    return QSize(qMax(1, qRound(w)), qMax(1, qRound(h)));
}

QImage renderPatternBuffer(const RenderState& state, const PatternImage& pattern, const QSize& size)
{
    QImage buffer(size, QImage::Format_ARGB32_Premultiplied);
    buffer.fill(Qt::transparent);

    const qreal zoom = state.mockupZoom();
    const QPointF centre(size.width() / 2.0, size.height() / 2.0);

    // Zoom about the centre: translate(c) scale(z) translate(-c) == translate(c * (1 - z)) scale(z)
    TileLayoutParams params;
    params.viewportSize = QSizeF(size);
    params.tileSize = state.tileSizeFor(pattern.width());
    params.pan = centre * (1.0 - zoom);
    params.zoom = zoom;
    params.offsetPercentX = state.offsetPercentX();
    params.offsetPercentY = state.offsetPercentY();
    params.repeatType = state.repeatType();

    QPainter painter(&buffer);
    PainterSurface surface(painter, size);
    surface.setHighQualityResampling(true);
    Compositor::drawTiles(surface, pattern.image(), params);
    painter.end();

    return buffer;
}

QImage compose(const QImage& texture, const RenderState& state, const PatternImage& pattern,
               const QSize& viewportSize)
{
    if (texture.isNull()) {
        return QImage();
    }

    const QSize size = displaySize(texture.size(), viewportSize, state.mockupZoom());

    // Nearest-neighbour so every scaled texel is either key green or not
    QImage composite = texture.scaled(size, Qt::IgnoreAspectRatio, Qt::FastTransformation)
                              .convertToFormat(QImage::Format_RGBA8888);
    const QImage patternBuffer = renderPatternBuffer(state, pattern, size);

    substitute(composite, patternBuffer);
    return composite;
}

void draw(RenderSurface& surface, const QImage& composite, qreal degrees)
{
    if (composite.isNull()) {
        return;
    }

    const QSize target = surface.size();
    const qreal w = composite.width();
    const qreal h = composite.height();

    surface.save();
    surface.translate(target.width() / 2.0, target.height() / 2.0);
    surface.rotate(degrees);
    surface.drawImage(QRectF(-w / 2.0, -h / 2.0, w, h), composite);
    surface.restore();
}

} // namespace ChromaKeyCompositor
