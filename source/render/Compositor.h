#pragma once

// ============================================================================
// Compositor - Draws a RenderState into a RenderSurface
// ============================================================================
// One code path serves the live preview and every export. The tile loop is
// always preceded by a single translate(pan) + scale(zoom), so the loop
// itself only issues plain drawImage() calls at TileLayout positions.
//
// Export framing: an export of edge length `size` uses
//     f = size / maxCanvasSize,  pan' = pan * f,  zoom' = zoom * f
// which maps every tile to exactly f times its preview position. The covering
// range (and therefore the tile margins) is unchanged by construction.
// ============================================================================

#include "RenderSurface.h"
#include "../core/PatternImage.h"
#include "../core/RenderState.h"
#include "../core/TileLayout.h"
#include "../export/ExportTypes.h"

#include <QByteArray>
#include <QImage>
#include <QSizeF>
#include <atomic>

class MockupLibrary;

namespace Compositor {

/// Checkerboard square size in device pixels.
constexpr int CHECKER_SQUARE = 20;

/// JPEG encoder quality for exports.
constexpr int EXPORT_JPEG_QUALITY = 95;

/// Fabric swatch corner radius in device pixels.
constexpr qreal FABRIC_CORNER_RADIUS = 15.0;

// ===== Framing =====

/// Layout parameters for the interactive preview on a viewport of the given size.
TileLayoutParams previewParams(const RenderState& state, qreal tileSize, const QSizeF& viewportSize);

/// Ratio between an export edge length and the preview canvas size.
qreal exportFactor(const RenderState& state, int exportSize);

/// Layout parameters for a square export of edge length @p exportSize.
TileLayoutParams exportParams(const RenderState& state, qreal tileSize, int exportSize);

// ===== Drawing =====

/**
 * @brief Draw the tiled pattern for @p layout.
 *
 * Wraps the pan (TileLayout::wrapPan), applies translate(pan) and
 * scale(zoom) once, then blits each placement as it is computed. The
 * surface transform is restored before returning.
 *
 * @param abort Checked once per column of tiles (may be null).
 * @return false if @p abort was set before all tiles were drawn.
 */
bool drawTiles(RenderSurface& surface, const QImage& tile, const TileLayoutParams& layout,
               const std::atomic<bool>* abort = nullptr);

/// Fill the whole surface with the preview background (checker or solid).
void drawBackground(RenderSurface& surface, const Background& background);

/// Idle state: dark checker plus a prompt to load a pattern.
void drawPlaceholder(RenderSurface& surface);

/// Rounded fabric swatch centred on the surface, pattern drawn unzoomed inside.
void drawFabricSwatch(RenderSurface& surface, const RenderState& state, const PatternImage& pattern);

/**
 * @brief Render one preview frame.
 *
 * @param pattern Loaded pattern, or null for the placeholder.
 * @param mockups Texture source for mockup view modes (may be null; the
 *                mockup then renders as background only).
 * @param highQuality Smooth resampling for tile blits. Off during drag gestures.
 */
void render(RenderSurface& surface, const RenderState& state, const PatternImage* pattern,
            const MockupLibrary* mockups = nullptr, bool highQuality = true);

// ===== Export =====

/**
 * @brief Render the tiled pattern into a transparent square image.
 *
 * Always high quality. No background, no overlays.
 * @return The image, or a null image if @p abort was set.
 */
QImage renderExportImage(const RenderState& state, const PatternImage& pattern, int exportSize,
                         const std::atomic<bool>* abort = nullptr);

/**
 * @brief Encode an image. JPEG output is flattened onto white first.
 * @param errorMessage Receives the writer's error on failure (may be null).
 * @return Encoded bytes, empty on failure.
 */
QByteArray encode(const QImage& image, ExportFormat format, QString* errorMessage = nullptr);

/**
 * @brief Render and encode an export.
 *
 * With no pattern this is a no-op that reports ExportStatus::NoPattern.
 */
ExportResult exportPattern(const RenderState& state, const PatternImage* pattern,
                           const ExportRequest& request, const std::atomic<bool>* abort = nullptr);

} // namespace Compositor
