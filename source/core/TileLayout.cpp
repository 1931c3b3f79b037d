#include "TileLayout.h"

#include <QDebug>

#include <cmath>
#include <limits>

namespace TileLayout {

namespace {

// Largest magnitude whose floor/ceil is still an exact, distinct integer in a
// double, and whose sum with a count stays inside qint64.
constexpr qreal MAX_INDEX = 4503599627370496.0;    // 2^52

qreal wrapAxis(qreal pan, qreal period)
{
    if (!std::isfinite(pan)) {
        return 0.0;
    }
    if (std::abs(pan) < period) {
        return pan;
    }
    return std::fmod(pan, period);
}

bool toIndex(qreal value, qint64& out)
{
    if (!std::isfinite(value) || std::abs(value) > MAX_INDEX) {
        return false;
    }
    out = static_cast<qint64>(value);
    return true;
}

} // namespace

qreal panPeriod(qreal tileSize, qreal zoom)
{
    return 2.0 * tileSize * zoom;
}

TileLayoutParams wrapPan(const TileLayoutParams& params)
{
    TileLayoutParams wrapped = params;
    const qreal period = panPeriod(params.tileSize, params.zoom);
    if (!(period > 0.0) || !std::isfinite(period)) {
        return wrapped;
    }
    wrapped.pan = QPointF(wrapAxis(params.pan.x(), period), wrapAxis(params.pan.y(), period));
    return wrapped;
}

TileRange coveringRange(const TileLayoutParams& params)
{
    TileRange range;
    if (!params.isValid()) {
        return range;
    }

    const qreal ts = params.tileSize;
    const qreal zoom = params.zoom;

    TileRange candidate;
    if (!toIndex(std::ceil(params.viewportSize.width() / ts / zoom), candidate.countX)
        || !toIndex(std::ceil(params.viewportSize.height() / ts / zoom), candidate.countY)
        || !toIndex(std::floor(-params.pan.x() / (ts * zoom)), candidate.startX)
        || !toIndex(std::floor(-params.pan.y() / (ts * zoom)), candidate.startY)) {
        qWarning() << "TileLayout: covering range out of index domain, pan" << params.pan
                   << "tile" << ts << "zoom" << zoom;
        return range;
    }

    candidate.countX += 2 * MARGIN_TILES;
    candidate.countY += 2 * MARGIN_TILES;
    candidate.startX -= MARGIN_TILES;
    candidate.startY -= MARGIN_TILES;
    return candidate;
}

QPointF basePosition(const TileIndex& index, qreal tileSize,
                     qreal offsetPercentX, qreal offsetPercentY)
{
    return QPointF(index.first * tileSize + offsetPercentX * tileSize,
                   index.second * tileSize + offsetPercentY * tileSize);
}

QPointF placeTile(const TileIndex& index, qreal tileSize,
                  qreal offsetPercentX, qreal offsetPercentY, RepeatType repeatType)
{
    QPointF pos = basePosition(index, tileSize, offsetPercentX, offsetPercentY);

    // The perturbed axis is the one *across* the parity index: half-drop moves
    // odd columns vertically, brick moves odd rows horizontally.
    switch (repeatType) {
        case RepeatType::Full:
            break;
        case RepeatType::HalfDrop:
            if (index.first % 2 != 0) {
                pos.ry() += tileSize / 2.0;
            }
            break;
        case RepeatType::Brick:
            if (index.second % 2 != 0) {
                pos.rx() += tileSize / 2.0;
            }
            break;
    }
    return pos;
}

QVector<TilePlacement> placementsInRange(const TileRange& range, const TileLayoutParams& params)
{
    QVector<TilePlacement> result;
    if (range.isEmpty() || params.tileSize <= 0.0) {
        return result;
    }

    const qreal ts = params.tileSize;
    if (range.tileCount() <= std::numeric_limits<int>::max()) {
        result.reserve(static_cast<int>(range.tileCount()));
    }
    for (qint64 i = range.startX; i < range.endX(); ++i) {
        for (qint64 j = range.startY; j < range.endY(); ++j) {
            TileIndex index(i, j);
            QPointF pos = placeTile(index, ts, params.offsetPercentX,
                                    params.offsetPercentY, params.repeatType);
            result.append({index, QRectF(pos, QSizeF(ts, ts))});
        }
    }
    return result;
}

QVector<TilePlacement> compute(const TileLayoutParams& params)
{
    return placementsInRange(coveringRange(params), params);
}

QVector<TilePlacement> computeLocal(const QPointF& origin, const QSizeF& extent,
                                    qreal tileSize, qreal offsetPercentX,
                                    qreal offsetPercentY, RepeatType repeatType)
{
    QVector<TilePlacement> result;
    if (tileSize <= 0.0 || extent.width() <= 0.0 || extent.height() <= 0.0) {
        return result;
    }

    const int endX = static_cast<int>(std::ceil(extent.width() / tileSize)) + LOCAL_MARGIN_AFTER;
    const int endY = static_cast<int>(std::ceil(extent.height() / tileSize)) + LOCAL_MARGIN_AFTER;

    result.reserve((endX + LOCAL_MARGIN_BEFORE) * (endY + LOCAL_MARGIN_BEFORE));
    for (int i = -LOCAL_MARGIN_BEFORE; i < endX; ++i) {
        for (int j = -LOCAL_MARGIN_BEFORE; j < endY; ++j) {
            TileIndex index(i, j);
            QPointF pos = origin + placeTile(index, tileSize, offsetPercentX,
                                             offsetPercentY, repeatType);
            result.append({index, QRectF(pos, QSizeF(tileSize, tileSize))});
        }
    }
    return result;
}

} // namespace TileLayout
