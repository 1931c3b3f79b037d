#pragma once

// ============================================================================
// PatternSession - The loaded pattern plus its RenderState
// ============================================================================
// PatternSession is the one place UI code mutates rendering parameters. It is
// passed by reference to whoever needs it (viewport, window, CLI, exporter);
// there is no global instance.
//
// Every setter forwards to the validating RenderState setter and then emits
// redrawRequested() exactly once, whether or not the clamped value differed.
// ============================================================================

#include "PatternImage.h"
#include "RenderState.h"

#include <QObject>
#include <QPointF>

class PatternSession : public QObject {
    Q_OBJECT

public:
    explicit PatternSession(QObject* parent = nullptr);

    const RenderState& state() const { return m_state; }

    /// The loaded pattern, or nullptr in the idle (nothing loaded) state.
    const PatternImagePtr& pattern() const { return m_pattern; }
    bool hasPattern() const { return m_pattern != nullptr; }

    /// Tile edge length for the loaded pattern, 0 when nothing is loaded.
    qreal tileSize() const;

    // ===== Pattern lifecycle =====

    /**
     * @brief "Pattern loaded" entry point.
     *
     * Stores the pattern and auto-fits scale so the tile is about 300px wide.
     * Passing nullptr is the same as clearPattern().
     */
    void setPattern(PatternImagePtr pattern);

    /// Return to the idle state (placeholder shown, export disabled).
    void clearPattern();

    // ===== Setters (one redraw each) =====
    void setScale(qreal scale);
    void setZoom(qreal zoom);
    void setOffsetPercentX(qreal offset);
    void setOffsetPercentY(qreal offset);
    void setPanX(qreal x);
    void setPanY(qreal y);
    void setPan(QPointF pan);

    /**
     * @brief Zoom and pan in a single step (wheel and pinch gestures).
     */
    void setZoomAndPan(qreal zoom, QPointF pan);

    void setRepeatType(RepeatType type);
    void setViewMode(const ViewMode& mode);
    void setBackground(const Background& background);
    void setGridOverlaySize(int inches);
    void setSeamlessTestMode(bool enabled);
    void setMockupZoom(qreal zoom);
    void setMockupRotate(qreal degrees);
    void setMaxCanvasSize(int size);

signals:
    /// Emitted once per setter call; the view repaints in response.
    void redrawRequested();

    /// Emitted when a pattern is loaded or cleared.
    void patternChanged();

    /// Emitted when the stored scale changes (including the auto-fit on load).
    void scaleChanged(qreal scale);

    /// Emitted when the stored zoom changes, so the zoom slider can follow gestures.
    void zoomChanged(qreal zoom);

private:
    RenderState m_state;
    PatternImagePtr m_pattern;
};
