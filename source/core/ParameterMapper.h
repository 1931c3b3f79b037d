#pragma once

// ============================================================================
// ParameterMapper - Slider position <-> application value mapping and snapping
// ============================================================================
// Scale and zoom sliders run over [0, 100] with a piecewise-linear response
// split at 50, so the left half gives fine control below 1x/100% and the
// right half covers the large values:
//
//   scale:  0 -> 0.05    50 -> 1.0    100 -> 5.0
//   zoom:   0 -> 1%      50 -> 100%   100 -> 800%
//
// Snapping is applied on gesture release only. After snapping, the value is
// projected back through the inverse map so the slider handle lands on the
// position that corresponds to the snapped value.
// ============================================================================

#include <QtGlobal>

namespace ParameterMapper {

constexpr int SLIDER_MIN = 0;
constexpr int SLIDER_MID = 50;
constexpr int SLIDER_MAX = 100;

// ===== Scale =====

/// Slider position -> pattern scale factor, range [0.05, 5.0].
qreal scaleFromSlider(int position);

/// Pattern scale factor -> nearest slider position.
int sliderFromScale(qreal scale);

// ===== Zoom =====

/// Slider position -> zoom factor (1.0 = 100%), range [0.01, 8.0].
qreal zoomFromSlider(int position);

/**
 * @brief Zoom factor -> slider position.
 *
 * The factor is first rounded to a whole percentage, matching what the zoom
 * label displays.
 */
int sliderFromZoom(qreal zoom);

/// Zoom factor -> whole percentage shown in the UI.
int zoomPercent(qreal zoom);

// ===== Snapping =====

/// round(value / step) * step, with halves rounding up.
qreal snap(qreal value, qreal step);

/// 0.25 steps from 0.25 upwards, 0.01 steps below (never under 0.05).
qreal snapScale(qreal scale);

/// Zoom in percent: 25% steps from 25% upwards, whole percents below (never under 1).
qreal snapZoom(qreal percent);

/// Offset slider in percent, 10% steps.
int snapOffset(int percent);

// ===== Release helpers =====

/**
 * @brief A snapped application value together with its re-projected slider position.
 */
struct SnappedValue {
    qreal value = 0.0;
    int sliderPosition = 0;
};

/// Scale slider released at @p position.
SnappedValue releaseScale(int position);

/// Zoom slider released at @p position. value is a zoom factor.
SnappedValue releaseZoom(int position);

/// Offset slider released at @p percent. value is a fraction of a tile.
SnappedValue releaseOffset(int percent);

} // namespace ParameterMapper
