#include "PatternViewport.h"
#include "../compat/qt_compat.h"
#include "../core/PatternSession.h"
#include "../mockups/MockupLibrary.h"
#include "../render/Compositor.h"
#include "../render/PainterSurface.h"

#include <QMouseEvent>
#include <QPainter>
#include <QTouchEvent>
#include <QWheelEvent>

PatternViewport::PatternViewport(PatternSession& session, const MockupLibrary& mockups, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
    , m_mockups(mockups)
    , m_gesture(session)
{
    setAttribute(Qt::WA_AcceptTouchEvents);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMinimumSize(2 * CANVAS_MARGIN + 64, 2 * CANVAS_MARGIN + 64);
    setFocusPolicy(Qt::StrongFocus);

    connect(&m_session, &PatternSession::redrawRequested, this, QOverload<>::of(&QWidget::update));
}

QRect PatternViewport::canvasRect() const
{
    int side = qMin(width(), height()) - 2 * CANVAS_MARGIN;
    side = qMin(side, m_session.state().maxCanvasSize());
    side = qMax(side, 1);
    return QRect((width() - side) / 2, (height() - side) / 2, side, side);
}

QPointF PatternViewport::toCanvas(const QPointF& widgetPos) const
{
    return widgetPos - QPointF(canvasRect().topLeft());
}

void PatternViewport::renderFrame()
{
    const QSize size = canvasRect().size();
    if (m_frame.size() != size) {
        m_frame = QImage(size, QImage::Format_ARGB32_Premultiplied);
    }

    const bool interacting = m_gesture.isDragging() || m_gesture.isPinching();

    QPainter painter(&m_frame);
    PainterSurface surface(painter, size);
    Compositor::render(surface, m_session.state(), m_session.pattern().get(), &m_mockups, !interacting);
}

void PatternViewport::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    renderFrame();

    QPainter painter(this);
    painter.fillRect(rect(), QColor(64, 64, 64));
    painter.drawImage(canvasRect().topLeft(), m_frame);
}

void PatternViewport::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    if (!m_session.hasPattern()) {
        if (QRectF(canvasRect()).contains(PP_MOUSE_POS(event))) {
            emit openPatternRequested();
        }
        event->accept();
        return;
    }

    if (m_gesture.beginDrag(toCanvas(PP_MOUSE_POS(event)))) {
        setCursor(Qt::ClosedHandCursor);
    }
    event->accept();
}

void PatternViewport::mouseMoveEvent(QMouseEvent* event)
{
    if (m_gesture.isDragging()) {
        m_gesture.dragTo(toCanvas(PP_MOUSE_POS(event)));
        event->accept();
        return;
    }
    event->ignore();
}

void PatternViewport::mouseReleaseEvent(QMouseEvent* event)
{
    if (m_gesture.isDragging()) {
        m_gesture.endDrag();
        unsetCursor();
        update();  // Full quality repaint
    }
    event->accept();
}

void PatternViewport::wheelEvent(QWheelEvent* event)
{
    const QPointF pos = toCanvas(PP_WHEEL_POS(event));
    if (m_gesture.wheel(pos, QSizeF(canvasRect().size()), event->angleDelta().y())) {
        event->accept();
        return;
    }
    event->ignore();
}

bool PatternViewport::event(QEvent* event)
{
    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            return handleTouchEvent(static_cast<QTouchEvent*>(event));
        default:
            return QWidget::event(event);
    }
}

bool PatternViewport::handleTouchEvent(QTouchEvent* event)
{
    // Let Qt synthesize a mouse click so a tap on the empty canvas opens a file
    if (!m_session.hasPattern()) {
        event->ignore();
        return false;
    }

    const auto points = PP_TOUCH_POINTS(event);
    const QSizeF canvasSize(canvasRect().size());

    if (event->type() == QEvent::TouchEnd || event->type() == QEvent::TouchCancel) {
        m_gesture.endPinch();
        if (m_gesture.isDragging()) {
            m_gesture.endDrag();
        }
        update();
        event->accept();
        return true;
    }

    if (points.size() >= 2) {
        // Two fingers: a running drag turns into a pinch
        if (m_gesture.isDragging()) {
            m_gesture.endDrag();
        }
        const QPointF p1 = toCanvas(PP_TP_POS(points.at(0)));
        const QPointF p2 = toCanvas(PP_TP_POS(points.at(1)));
        if (!m_gesture.isPinching()) {
            m_gesture.beginPinch(p1, p2);
        } else {
            m_gesture.pinch(p1, p2, canvasSize);
        }
    } else if (points.size() == 1 && !m_gesture.isPinching()) {
        const QPointF p = toCanvas(PP_TP_POS(points.at(0)));
        if (event->type() == QEvent::TouchBegin) {
            m_gesture.beginDrag(p);
        } else if (m_gesture.isDragging()) {
            m_gesture.dragTo(p);
        }
    }

    event->accept();
    return true;
}
