#include "PanZoomGesture.h"
#include "../core/PatternSession.h"

#include <QLineF>

PanZoomGesture::PanZoomGesture(PatternSession& session)
    : m_session(session)
{
}

bool PanZoomGesture::beginDrag(const QPointF& pos)
{
    if (!m_session.hasPattern() || !m_session.state().viewMode().isTiled()) {
        return false;
    }

    m_dragging = true;
    m_dragStart = pos - m_session.state().pan();
    return true;
}

bool PanZoomGesture::dragTo(const QPointF& pos)
{
    if (!m_dragging || !m_session.state().viewMode().isTiled()) {
        return false;
    }

    m_session.setPan(pos - m_dragStart);
    return true;
}

void PanZoomGesture::endDrag()
{
    m_dragging = false;
}

bool PanZoomGesture::wheel(const QPointF& pos, const QSizeF& viewportSize, int angleDelta)
{
    if (!m_session.hasPattern() || angleDelta == 0) {
        return false;
    }
    if (inDeadZone(pos, viewportSize, WHEEL_DEAD_ZONE)) {
        return false;
    }

    applyZoom(pos, angleDelta > 0 ? WHEEL_ZOOM_IN : WHEEL_ZOOM_OUT);
    return true;
}

void PanZoomGesture::beginPinch(const QPointF& p1, const QPointF& p2)
{
    if (!m_session.hasPattern()) {
        return;
    }
    m_lastPinchDistance = QLineF(p1, p2).length();
}

bool PanZoomGesture::pinch(const QPointF& p1, const QPointF& p2, const QSizeF& viewportSize)
{
    if (!m_session.hasPattern()) {
        return false;
    }

    // The dead zone is tested on the first touch, not the midpoint
    if (inDeadZone(p1, viewportSize, PINCH_DEAD_ZONE)) {
        return false;
    }

    const qreal distance = QLineF(p1, p2).length();
    bool applied = false;
    if (m_lastPinchDistance > 0.0) {
        applyZoom((p1 + p2) / 2.0, distance / m_lastPinchDistance);
        applied = true;
    }
    m_lastPinchDistance = distance;
    return applied;
}

void PanZoomGesture::endPinch()
{
    m_lastPinchDistance = 0.0;
}

PanZoomGesture::ZoomStep PanZoomGesture::zoomAbout(const QPointF& anchor, qreal zoom,
                                                   const QPointF& pan, qreal factor)
{
    ZoomStep step;
    step.zoom = qBound(RenderState::MIN_ZOOM, zoom * factor, RenderState::MAX_ZOOM);
    const qreal change = step.zoom - zoom;
    step.pan = pan - (anchor - pan) * (change / zoom);
    return step;
}

bool PanZoomGesture::inDeadZone(const QPointF& pos, const QSizeF& size, qreal margin)
{
    return pos.x() < margin || pos.x() > size.width() - margin
        || pos.y() < margin || pos.y() > size.height() - margin;
}

void PanZoomGesture::applyZoom(const QPointF& anchor, qreal factor)
{
    const RenderState& state = m_session.state();
    const ZoomStep step = zoomAbout(anchor, state.zoom(), state.pan(), factor);
    m_session.setZoomAndPan(step.zoom, step.pan);
}
