#include "PatternSession.h"

#include <QDebug>

PatternSession::PatternSession(QObject* parent)
    : QObject(parent)
{
}

qreal PatternSession::tileSize() const
{
    return m_pattern ? m_state.tileSizeFor(m_pattern->width()) : 0.0;
}

void PatternSession::setPattern(PatternImagePtr pattern)
{
    if (!pattern) {
        clearPattern();
        return;
    }

    m_pattern = std::move(pattern);
    qDebug() << "PatternSession: pattern loaded" << m_pattern->size()
             << m_pattern->sourcePath();

    if (m_state.setScale(m_pattern->autoFitScale())) {
        emit scaleChanged(m_state.scale());
    }

    emit patternChanged();
    emit redrawRequested();
}

void PatternSession::clearPattern()
{
    const bool hadPattern = (m_pattern != nullptr);
    m_pattern.reset();
    if (hadPattern) {
        emit patternChanged();
    }
    emit redrawRequested();
}

void PatternSession::setScale(qreal scale)
{
    if (m_state.setScale(scale)) {
        emit scaleChanged(m_state.scale());
    }
    emit redrawRequested();
}

void PatternSession::setZoom(qreal zoom)
{
    if (m_state.setZoom(zoom)) {
        emit zoomChanged(m_state.zoom());
    }
    emit redrawRequested();
}

void PatternSession::setOffsetPercentX(qreal offset)
{
    m_state.setOffsetPercentX(offset);
    emit redrawRequested();
}

void PatternSession::setOffsetPercentY(qreal offset)
{
    m_state.setOffsetPercentY(offset);
    emit redrawRequested();
}

void PatternSession::setPanX(qreal x)
{
    m_state.setPan(QPointF(x, m_state.panY()));
    emit redrawRequested();
}

void PatternSession::setPanY(qreal y)
{
    m_state.setPan(QPointF(m_state.panX(), y));
    emit redrawRequested();
}

void PatternSession::setPan(QPointF pan)
{
    m_state.setPan(pan);
    emit redrawRequested();
}

void PatternSession::setZoomAndPan(qreal zoom, QPointF pan)
{
    if (m_state.setZoom(zoom)) {
        emit zoomChanged(m_state.zoom());
    }
    m_state.setPan(pan);
    emit redrawRequested();
}

void PatternSession::setRepeatType(RepeatType type)
{
    m_state.setRepeatType(type);
    emit redrawRequested();
}

void PatternSession::setViewMode(const ViewMode& mode)
{
    m_state.setViewMode(mode);
    emit redrawRequested();
}

void PatternSession::setBackground(const Background& background)
{
    m_state.setBackground(background);
    emit redrawRequested();
}

void PatternSession::setGridOverlaySize(int inches)
{
    m_state.setGridOverlaySize(inches);
    emit redrawRequested();
}

void PatternSession::setSeamlessTestMode(bool enabled)
{
    m_state.setSeamlessTestMode(enabled);
    emit redrawRequested();
}

void PatternSession::setMockupZoom(qreal zoom)
{
    m_state.setMockupZoom(zoom);
    emit redrawRequested();
}

void PatternSession::setMockupRotate(qreal degrees)
{
    m_state.setMockupRotate(degrees);
    emit redrawRequested();
}

void PatternSession::setMaxCanvasSize(int size)
{
    m_state.setMaxCanvasSize(size);
    emit redrawRequested();
}
