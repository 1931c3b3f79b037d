#pragma once

// ============================================================================
// PanZoomGesture - Drag, wheel and pinch arithmetic for the pattern preview
// ============================================================================
// Works on plain positions in viewport pixels, so it is independent of
// QMouseEvent / QWheelEvent / QTouchEvent. PatternViewport translates events
// into these calls; every accepted gesture step ends up as one PatternSession
// setter call (and therefore one redraw).
//
// Zoom keeps the point under the anchor fixed:
//     pan -= (anchor - pan) * (newZoom - zoom) / zoom
// ============================================================================

#include <QPointF>
#include <QSizeF>

class PatternSession;

class PanZoomGesture {
public:
    static constexpr qreal WHEEL_ZOOM_IN = 1.1;
    static constexpr qreal WHEEL_ZOOM_OUT = 0.9;
    static constexpr qreal WHEEL_DEAD_ZONE = 80.0;     ///< Edge band where the wheel is ignored
    static constexpr qreal PINCH_DEAD_ZONE = 100.0;    ///< Edge band for the first touch point

    struct ZoomStep {
        qreal zoom = 1.0;
        QPointF pan;
    };

    /**
     * @param session Session to drive (not owned, must outlive the gesture).
     */
    explicit PanZoomGesture(PatternSession& session);

    // ===== Drag pan =====

    /**
     * @brief Start a drag at @p pos.
     *
     * Only tile and tile-grid view modes with a pattern loaded accept drags.
     * @return true if a drag started.
     */
    bool beginDrag(const QPointF& pos);

    /// @return true if the pan was updated.
    bool dragTo(const QPointF& pos);

    void endDrag();
    bool isDragging() const { return m_dragging; }

    // ===== Wheel zoom =====

    /**
     * @brief Zoom in (delta > 0) or out (delta < 0) about @p pos.
     * @return true if the zoom was applied (pattern loaded, outside the dead zone).
     */
    bool wheel(const QPointF& pos, const QSizeF& viewportSize, int angleDelta);

    // ===== Pinch zoom =====
    void beginPinch(const QPointF& p1, const QPointF& p2);

    /**
     * @brief Continue a pinch. The zoom factor is the distance ratio to the
     *        previous step, anchored at the midpoint of the two touches.
     * @return true if the zoom was applied.
     */
    bool pinch(const QPointF& p1, const QPointF& p2, const QSizeF& viewportSize);

    void endPinch();
    bool isPinching() const { return m_lastPinchDistance > 0.0; }

    // ===== Pure helpers =====

    /// Clamped zoom by @p factor about @p anchor.
    static ZoomStep zoomAbout(const QPointF& anchor, qreal zoom, const QPointF& pan, qreal factor);

    /// True if @p pos lies within @p margin of any edge of a viewport of @p size.
    static bool inDeadZone(const QPointF& pos, const QSizeF& size, qreal margin);

private:
    void applyZoom(const QPointF& anchor, qreal factor);

    PatternSession& m_session;

    bool m_dragging = false;
    QPointF m_dragStart;            ///< press position minus pan at press time

    qreal m_lastPinchDistance = 0.0;
};
