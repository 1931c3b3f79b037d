#pragma once

// ============================================================================
// TileLayout - Which tiles cover a viewport, and where each one is drawn
// ============================================================================
// All positions are in "logical" pattern space: the space in which tiles are
// tileSize apart. The caller maps logical space to the target surface with a
// single translate(pan) + scale(zoom), so nothing here is per-tile transformed.
//
// Coverage always includes MARGIN_TILES extra tiles on every side of the
// minimum covering range, so a viewport is never under-covered while a pan
// or zoom gesture is in flight.
//
// Indices and counts are 64-bit: a tiny tile at a low zoom covers millions of
// columns, and an unbounded pan puts the first column far from zero. Every
// topology repeats after two tiles, so renderers wrap the pan first
// (see wrapPan) and never iterate over huge indices.
// ============================================================================

#include "RenderState.h"

#include <QPair>
#include <QtGlobal>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QVector>

#include <limits>

/// Integer tile coordinate (column i, row j). Derived, never persisted.
using TileIndex = QPair<qint64, qint64>;

/**
 * @brief One placed instance of the pattern.
 */
struct TilePlacement {
    TileIndex index;    ///< (i, j)
    QRectF rect;        ///< (drawX, drawY, tileSize, tileSize) in logical space
};

/**
 * @brief Inclusive-exclusive range of tile indices: [startX, startX + countX).
 */
struct TileRange {
    qint64 startX = 0;
    qint64 startY = 0;
    qint64 countX = 0;
    qint64 countY = 0;

    qint64 endX() const { return startX + countX; }   ///< one past the last column
    qint64 endY() const { return startY + countY; }   ///< one past the last row
    bool isEmpty() const { return countX <= 0 || countY <= 0; }
    /// Saturates at the qint64 maximum.
    qint64 tileCount() const {
        if (isEmpty()) {
            return 0;
        }
        if (countX > std::numeric_limits<qint64>::max() / countY) {
            return std::numeric_limits<qint64>::max();
        }
        return countX * countY;
    }
};

/**
 * @brief Inputs to the covering computation.
 */
struct TileLayoutParams {
    QSizeF viewportSize;                    ///< Target surface size in device pixels
    qreal tileSize = 0.0;                   ///< Pattern width * scale, must be > 0
    QPointF pan;                            ///< Device-pixel translation applied before zoom
    qreal zoom = 1.0;                       ///< Logical -> device scale factor
    qreal offsetPercentX = 0.0;             ///< Fraction of a tile
    qreal offsetPercentY = 0.0;
    RepeatType repeatType = RepeatType::Full;

    bool isValid() const {
        return tileSize > 0.0 && zoom > 0.0
            && viewportSize.width() > 0.0 && viewportSize.height() > 0.0;
    }
};

namespace TileLayout {

/// Extra tiles beyond the minimum covering count, on each side of each axis.
constexpr int MARGIN_TILES = 3;

/// Tiles on each side used by the local (unzoomed) swatch placement.
constexpr int LOCAL_MARGIN_BEFORE = 2;
constexpr int LOCAL_MARGIN_AFTER = 4;

/// Pan period of every repeat topology, in device pixels: two tiles.
qreal panPeriod(qreal tileSize, qreal zoom);

/**
 * @brief Same params with each pan axis reduced modulo panPeriod().
 *
 * The tiled output is unchanged. A pan already inside (-period, period) is
 * returned as is. Non-finite pans become 0.
 */
TileLayoutParams wrapPan(const TileLayoutParams& params);

/**
 * @brief Tile range covering the viewport, margins included.
 *
 *   countX = ceil(W / tileSize / zoom) + 2 * MARGIN_TILES
 *   startX = floor(-panX / (tileSize * zoom)) - MARGIN_TILES
 *
 * and symmetrically for Y. Returns an empty range for invalid params, or when
 * a start or count does not fit the 64-bit index domain (wrap the pan first).
 */
TileRange coveringRange(const TileLayoutParams& params);

/**
 * @brief Untopologised tile origin: (i + offsetX) * tileSize, (j + offsetY) * tileSize.
 */
QPointF basePosition(const TileIndex& index, qreal tileSize,
                     qreal offsetPercentX, qreal offsetPercentY);

/**
 * @brief Tile origin after the repeat topology adjustment.
 *
 * half-drop shifts drawY by tileSize/2 when |i| is odd.
 * brick shifts drawX by tileSize/2 when |j| is odd.
 */
QPointF placeTile(const TileIndex& index, qreal tileSize,
                  qreal offsetPercentX, qreal offsetPercentY, RepeatType repeatType);

/**
 * @brief All placements in the covering range, column-major (i outer, j inner).
 *
 * Materializes the whole range; renderers stream with placeTile instead.
 */
QVector<TilePlacement> compute(const TileLayoutParams& params);

/**
 * @brief Placements for a given range (used when the range is already known).
 */
QVector<TilePlacement> placementsInRange(const TileRange& range, const TileLayoutParams& params);

/**
 * @brief Unzoomed placement filling a rectangle that starts at @p origin.
 *
 * Covers columns -2 .. ceil(width / tileSize) + 4 (exclusive) and likewise for
 * rows, with every tile shifted by @p origin. Used for the fabric swatch.
 */
QVector<TilePlacement> computeLocal(const QPointF& origin, const QSizeF& extent,
                                    qreal tileSize, qreal offsetPercentX,
                                    qreal offsetPercentY, RepeatType repeatType);

} // namespace TileLayout
