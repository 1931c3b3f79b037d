#include "ParameterMapper.h"

#include <cmath>

namespace ParameterMapper {

namespace {

// Halves round towards +infinity, as the slider labels have always done
qreal roundHalfUp(qreal value)
{
    return std::floor(value + 0.5);
}

int clampSlider(qreal position)
{
    return qBound(SLIDER_MIN, static_cast<int>(roundHalfUp(position)), SLIDER_MAX);
}

} // namespace

qreal scaleFromSlider(int position)
{
    position = qBound(SLIDER_MIN, position, SLIDER_MAX);
    if (position <= SLIDER_MID) {
        return 0.05 + (position / 50.0) * 0.95;
    }
    return 1.0 + ((position - 50) / 50.0) * 4.0;
}

int sliderFromScale(qreal scale)
{
    if (scale <= 1.0) {
        return clampSlider(((scale - 0.05) / 0.95) * 50.0);
    }
    return clampSlider(50.0 + ((scale - 1.0) / 4.0) * 50.0);
}

qreal zoomFromSlider(int position)
{
    position = qBound(SLIDER_MIN, position, SLIDER_MAX);
    if (position <= SLIDER_MID) {
        return (1.0 + (position / 50.0) * 99.0) / 100.0;
    }
    return (100.0 + ((position - 50) / 50.0) * 700.0) / 100.0;
}

int zoomPercent(qreal zoom)
{
    return static_cast<int>(roundHalfUp(zoom * 100.0));
}

int sliderFromZoom(qreal zoom)
{
    const int percent = zoomPercent(zoom);
    if (percent <= 100) {
        return clampSlider(((percent - 1) / 99.0) * 50.0);
    }
    return clampSlider(50.0 + ((percent - 100) / 700.0) * 50.0);
}

qreal snap(qreal value, qreal step)
{
    if (step <= 0.0) {
        return value;
    }
    return roundHalfUp(value / step) * step;
}

qreal snapScale(qreal scale)
{
    if (scale >= 0.25) {
        return snap(scale, 0.25);
    }
    return qMax(0.05, snap(scale, 0.01));
}

qreal snapZoom(qreal percent)
{
    if (percent >= 25.0) {
        return snap(percent, 25.0);
    }
    return qMax(1.0, roundHalfUp(percent));
}

int snapOffset(int percent)
{
    return static_cast<int>(snap(percent, 10.0));
}

SnappedValue releaseScale(int position)
{
    SnappedValue result;
    result.value = snapScale(scaleFromSlider(position));
    result.sliderPosition = sliderFromScale(result.value);
    return result;
}

SnappedValue releaseZoom(int position)
{
    const qreal snappedPercent = snapZoom(zoomPercent(zoomFromSlider(position)));
    SnappedValue result;
    result.value = snappedPercent / 100.0;
    result.sliderPosition = sliderFromZoom(result.value);
    return result;
}

SnappedValue releaseOffset(int percent)
{
    const int snapped = qBound(SLIDER_MIN, snapOffset(percent), SLIDER_MAX);
    SnappedValue result;
    result.value = snapped / 100.0;
    result.sliderPosition = snapped;
    return result;
}

} // namespace ParameterMapper
