#pragma once

// ============================================================================
// OverlayRenderer - Auxiliary overlays drawn over the tiled composite
// ============================================================================
// Every draw function works in logical pattern space: the caller has already
// applied translate(pan) + scale(zoom) to the surface. Line widths and dash
// lengths are divided by zoom so they stay constant in device pixels.
//
// The line/rect computations are exposed separately so they can be tested
// without a surface.
// ============================================================================

#include "RenderSurface.h"
#include "../core/TileLayout.h"

#include <QLineF>
#include <QPointF>
#include <QSizeF>
#include <QVector>

namespace OverlayRenderer {

/// Pixels per inch used to turn the measurement grid spacing into pixels.
constexpr int MEASUREMENT_DPI = 150;

// ===== Styles =====
StrokeStyle tileGridStyle(qreal zoom);          ///< white 40%, 1 device px
StrokeStyle seamlessTestStyle(qreal zoom);      ///< red 80%, 3 device px
StrokeStyle measurementGridStyle(qreal zoom);   ///< white 50%, 2 device px, 5/5 dashes

// ===== Geometry =====

/**
 * @brief Tile-boundary lines for a covering range.
 *
 * Lines sit at the unperturbed tile edges (i + offsetX) * tileSize, one more
 * than the number of columns/rows, and each line extends one tile past the
 * range so panning never exposes a line end.
 */
QVector<QLineF> tileGridLines(const TileRange& range, qreal tileSize,
                              qreal offsetPercentX, qreal offsetPercentY);

/**
 * @brief Measurement grid lines in logical space.
 *
 * Spacing is inches * MEASUREMENT_DPI. The grid is anchored at logical 0 and
 * covers the logical extent visible through pan/zoom, plus two cells.
 * Returns nothing when @p inches is 0 or the zoom is not positive.
 */
QVector<QLineF> measurementGridLines(int inches, const QSizeF& viewportSize,
                                     const QPointF& pan, qreal zoom);

// ===== Drawing =====
void drawTileGrid(RenderSurface& surface, const TileRange& range, const TileLayoutParams& params);

/// Outline every tile of @p range where it is placed (after the repeat topology shift).
void drawSeamlessTest(RenderSurface& surface, const TileRange& range, const TileLayoutParams& params);

void drawMeasurementGrid(RenderSurface& surface, int inches, const QSizeF& viewportSize,
                         const QPointF& pan, qreal zoom);

} // namespace OverlayRenderer
