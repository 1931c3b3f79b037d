#pragma once

// ============================================================================
// PatternViewport - Interactive preview canvas
// ============================================================================
// Shows the pattern session as a centred square canvas whose edge is
//     min(width - 2 * CANVAS_MARGIN, height - 2 * CANVAS_MARGIN, maxCanvasSize)
// Frames are rendered into an offscreen QImage through PainterSurface and
// Compositor::render(), then blitted. Mouse, wheel and touch input is mapped
// to canvas coordinates and handed to PanZoomGesture.
//
// While a drag or pinch is in progress tiles are drawn without smooth
// resampling; the release repaints in full quality.
// ============================================================================

#include "../input/PanZoomGesture.h"

#include <QImage>
#include <QWidget>

class MockupLibrary;
class PatternSession;

class PatternViewport : public QWidget
{
    Q_OBJECT

public:
    /// Space between the widget edge and the canvas.
    static constexpr int CANVAS_MARGIN = 32;

    /**
     * @param session Session to display (not owned).
     * @param mockups Mockup textures (not owned).
     */
    PatternViewport(PatternSession& session, const MockupLibrary& mockups, QWidget* parent = nullptr);

    /// Canvas rectangle in widget coordinates.
    QRect canvasRect() const;

    /// The last rendered frame (null before the first paint).
    const QImage& lastFrame() const { return m_frame; }

signals:
    /// Click on the empty canvas: the window should offer a file dialog.
    void openPatternRequested();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    bool event(QEvent* event) override;

private:
    QPointF toCanvas(const QPointF& widgetPos) const;
    bool handleTouchEvent(QTouchEvent* event);
    void renderFrame();

    PatternSession& m_session;
    const MockupLibrary& m_mockups;
    PanZoomGesture m_gesture;
    QImage m_frame;
};
