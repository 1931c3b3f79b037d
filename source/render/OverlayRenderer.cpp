#include "OverlayRenderer.h"

#include <cmath>
#include <limits>

namespace OverlayRenderer {

StrokeStyle tileGridStyle(qreal zoom)
{
    return StrokeStyle(QColor(255, 255, 255, 102), 1.0 / zoom);
}

StrokeStyle seamlessTestStyle(qreal zoom)
{
    return StrokeStyle(QColor(255, 0, 0, 204), 3.0 / zoom);
}

StrokeStyle measurementGridStyle(qreal zoom)
{
    const qreal dash = 5.0 / zoom;
    return StrokeStyle(QColor(255, 255, 255, 128), 2.0 / zoom, {dash, dash});
}

QVector<QLineF> tileGridLines(const TileRange& range, qreal tileSize,
                              qreal offsetPercentX, qreal offsetPercentY)
{
    QVector<QLineF> lines;
    if (range.isEmpty() || tileSize <= 0.0) {
        return lines;
    }

    const qreal ts = tileSize;
    const qreal top = range.startY * ts - ts;
    const qreal bottom = (range.endY() + 1) * ts;
    const qreal left = range.startX * ts - ts;
    const qreal right = (range.endX() + 1) * ts;

    if (range.countX + range.countY + 2 <= std::numeric_limits<int>::max()) {
        lines.reserve(static_cast<int>(range.countX + range.countY + 2));
    }

    // Vertical lines
    for (qint64 i = range.startX; i < range.endX() + 1; ++i) {
        const qreal x = i * ts + offsetPercentX * ts;
        lines.append(QLineF(x, top, x, bottom));
    }

    // Horizontal lines
    for (qint64 j = range.startY; j < range.endY() + 1; ++j) {
        const qreal y = j * ts + offsetPercentY * ts;
        lines.append(QLineF(left, y, right, y));
    }
    return lines;
}

QVector<QLineF> measurementGridLines(int inches, const QSizeF& viewportSize,
                                     const QPointF& pan, qreal zoom)
{
    QVector<QLineF> lines;
    if (inches <= 0 || zoom <= 0.0) {
        return lines;
    }

    const qreal grid = inches * MEASUREMENT_DPI;
    const qreal startX = std::floor(-pan.x() / zoom / grid) * grid;
    const qreal startY = std::floor(-pan.y() / zoom / grid) * grid;
    const int cellsX = static_cast<int>(std::ceil(viewportSize.width() / zoom / grid + 2));
    const int cellsY = static_cast<int>(std::ceil(viewportSize.height() / zoom / grid + 2));
    const qreal endX = startX + cellsX * grid;
    const qreal endY = startY + cellsY * grid;

    lines.reserve(cellsX + cellsY + 2);

    // Integer steps so the last line lands exactly on endX/endY
    for (int k = 0; k <= cellsX; ++k) {
        const qreal x = startX + k * grid;
        lines.append(QLineF(x, startY, x, endY));
    }
    for (int k = 0; k <= cellsY; ++k) {
        const qreal y = startY + k * grid;
        lines.append(QLineF(startX, y, endX, y));
    }
    return lines;
}

void drawTileGrid(RenderSurface& surface, const TileRange& range, const TileLayoutParams& params)
{
    const StrokeStyle style = tileGridStyle(params.zoom);
    const QVector<QLineF> lines = tileGridLines(range, params.tileSize,
                                                params.offsetPercentX, params.offsetPercentY);
    for (const QLineF& line : lines) {
        surface.strokeLine(line, style);
    }
}

void drawSeamlessTest(RenderSurface& surface, const TileRange& range, const TileLayoutParams& params)
{
    if (range.isEmpty() || params.tileSize <= 0.0) {
        return;
    }

    const StrokeStyle style = seamlessTestStyle(params.zoom);
    const QSizeF tile(params.tileSize, params.tileSize);
    surface.save();
    for (qint64 i = range.startX; i < range.endX(); ++i) {
        for (qint64 j = range.startY; j < range.endY(); ++j) {
            const QPointF pos = TileLayout::placeTile(TileIndex(i, j), params.tileSize,
                                                      params.offsetPercentX, params.offsetPercentY,
                                                      params.repeatType);
            surface.strokeRect(QRectF(pos, tile), style);
        }
    }
    surface.restore();
}

void drawMeasurementGrid(RenderSurface& surface, int inches, const QSizeF& viewportSize,
                         const QPointF& pan, qreal zoom)
{
    const QVector<QLineF> lines = measurementGridLines(inches, viewportSize, pan, zoom);
    if (lines.isEmpty()) {
        return;
    }

    const StrokeStyle style = measurementGridStyle(zoom);
    surface.save();
    for (const QLineF& line : lines) {
        surface.strokeLine(line, style);
    }
    surface.restore();
}

} // namespace OverlayRenderer
