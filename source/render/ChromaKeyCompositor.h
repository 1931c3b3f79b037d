#pragma once

// ============================================================================
// ChromaKeyCompositor - Substitutes the pattern into a mockup's green area
// ============================================================================
// The mockup texture is scaled to its display size, the pattern is rendered
// into a buffer of the same size at mockupZoom, and every key-colour pixel of
// the mockup takes the pattern pixel at the same coordinate (alpha included).
// The composite is then drawn rotated about the surface centre.
//
// A pixel is key colour when
//     g > 200, g > r + 50, g > b + 50, r < 50, b < 50, a > 0
// with channels taken from the non-premultiplied RGBA value.
// ============================================================================

#include "RenderSurface.h"
#include "../core/PatternImage.h"
#include "../core/RenderState.h"

#include <QImage>
#include <QSize>

namespace ChromaKeyCompositor {

/// Largest composite edge as a fraction of the shorter viewport edge (before mockupZoom).
constexpr qreal DISPLAY_FRACTION = 0.72;

bool isKeyColor(int r, int g, int b, int a);

/**
 * @brief Replace every key-colour pixel of @p mockup with the pixel of
 *        @p pattern at the same position.
 *
 * @p mockup is converted to Format_RGBA8888 if needed. Both images must have
 * the same size.
 * @return Number of replaced pixels, or -1 if the sizes differ.
 */
int substitute(QImage& mockup, const QImage& pattern);

/**
 * @brief Composite size: the texture's aspect ratio with its largest edge at
 *        DISPLAY_FRACTION * min(viewport) * mockupZoom. Never smaller than 1x1.
 */
QSize displaySize(const QSize& textureSize, const QSize& viewportSize, qreal mockupZoom);

/**
 * @brief Render the repeat into a transparent buffer of @p size, zoomed by
 *        mockupZoom about the buffer centre.
 */
QImage renderPatternBuffer(const RenderState& state, const PatternImage& pattern, const QSize& size);

/**
 * @brief Scale @p texture to its display size and substitute the pattern.
 * @return The composite in Format_RGBA8888, or a null image for a null texture.
 */
QImage compose(const QImage& texture, const RenderState& state, const PatternImage& pattern,
               const QSize& viewportSize);

/// Draw @p composite centred on the surface, rotated by @p degrees.
void draw(RenderSurface& surface, const QImage& composite, qreal degrees);

} // namespace ChromaKeyCompositor
