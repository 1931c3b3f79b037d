#pragma once

// ============================================================================
// RenderState - Every parameter that shapes a rendered frame
// ============================================================================
// RenderState is a value type. It is owned by PatternSession, copied into
// export jobs, and never shared as a global. Every setter re-clamps its input
// to the documented domain, so a RenderState can never hold an out-of-range
// value no matter where the input came from (slider, gesture, replayed JSON).
// ============================================================================

#include "../mockups/MockupKind.h"

#include <QColor>
#include <QPointF>
#include <QString>
#include <QtGlobal>

/**
 * @brief How alternate rows/columns of tiles are offset.
 */
enum class RepeatType {
    Full,       ///< Plain grid
    HalfDrop,   ///< Odd columns shifted down by half a tile
    Brick       ///< Odd rows shifted right by half a tile
};

QString repeatTypeToString(RepeatType type);
RepeatType repeatTypeFromString(const QString& str, bool* ok = nullptr);

/**
 * @brief What the preview shows.
 */
struct ViewMode {
    enum Kind {
        Tile,       ///< Infinite tiled pattern
        TileGrid,   ///< Tiled pattern with tile boundary lines
        Mockup,     ///< Pattern substituted into a product mockup
        Fabric      ///< Pattern clipped to a rounded fabric swatch
    };

    Kind kind = Tile;
    MockupKind mockup = MockupKind::Phone;  ///< Only meaningful for Kind::Mockup

    static ViewMode tile() { return ViewMode(); }
    static ViewMode tileGrid() { ViewMode m; m.kind = TileGrid; return m; }
    static ViewMode fabric() { ViewMode m; m.kind = Fabric; return m; }
    static ViewMode forMockup(MockupKind k) { ViewMode m; m.kind = Mockup; m.mockup = k; return m; }

    /// True for the modes that draw the infinite repeat (and accept pan gestures).
    bool isTiled() const { return kind == Tile || kind == TileGrid; }

    bool operator==(const ViewMode& other) const {
        return kind == other.kind && (kind != Mockup || mockup == other.mockup);
    }
    bool operator!=(const ViewMode& other) const { return !(*this == other); }
};

QString viewModeToString(const ViewMode& mode);
ViewMode viewModeFromString(const QString& str, bool* ok = nullptr);

/**
 * @brief Preview background: a checkerboard or a solid colour.
 */
class Background {
public:
    static Background checker() { return Background(); }
    static Background solid(const QColor& color);

    bool isChecker() const { return m_checker; }
    QColor color() const { return m_color; }

    /// "checker" or "#rrggbb"
    QString toString() const;

    /**
     * @brief Parse "checker", "#RGB" or "#RRGGBB" (the leading # is optional).
     * @param ok Set to false on malformed input (may be null). Result is checker then.
     */
    static Background fromString(const QString& str, bool* ok = nullptr);

    bool operator==(const Background& other) const {
        return m_checker == other.m_checker && (m_checker || m_color == other.m_color);
    }
    bool operator!=(const Background& other) const { return !(*this == other); }

private:
    bool m_checker = true;
    QColor m_color;
};

/**
 * @brief Validated rendering parameters.
 *
 * Setters return true when the stored value changed. Non-finite numbers are
 * ignored (return false) because there is no sensible value to clamp them to.
 */
class RenderState {
public:
    // ===== Domains =====
    static constexpr qreal MIN_SCALE = 0.05;
    static constexpr qreal MAX_SCALE = 5.0;
    static constexpr qreal MIN_ZOOM = 0.01;
    static constexpr qreal MAX_ZOOM = 8.0;
    static constexpr qreal MIN_MOCKUP_ZOOM = 1.0;
    static constexpr qreal MAX_MOCKUP_ZOOM = 1.5;
    static constexpr int MIN_CANVAS_SIZE = 256;
    static constexpr int MAX_CANVAS_SIZE = 4096;
    static constexpr int DEFAULT_CANVAS_SIZE = 1200;

    /// Allowed measurement grid spacings in inches (0 = off).
    static bool isValidGridOverlaySize(int inches);

    RenderState() = default;

    // ===== Getters =====
    qreal scale() const { return m_scale; }
    qreal zoom() const { return m_zoom; }
    qreal offsetPercentX() const { return m_offsetPercentX; }
    qreal offsetPercentY() const { return m_offsetPercentY; }
    qreal panX() const { return m_pan.x(); }
    qreal panY() const { return m_pan.y(); }
    QPointF pan() const { return m_pan; }
    RepeatType repeatType() const { return m_repeatType; }
    ViewMode viewMode() const { return m_viewMode; }
    Background background() const { return m_background; }
    int gridOverlaySize() const { return m_gridOverlaySize; }
    bool seamlessTestMode() const { return m_seamlessTestMode; }
    qreal mockupZoom() const { return m_mockupZoom; }
    qreal mockupRotate() const { return m_mockupRotate; }
    int maxCanvasSize() const { return m_maxCanvasSize; }

    // ===== Validated setters =====
    bool setScale(qreal scale);
    bool setZoom(qreal zoom);

    /**
     * @brief Set the horizontal offset as a fraction of a tile.
     *
     * The domain is [0, 1). Values outside it wrap (1.0 and 0.0 describe the
     * same repeat), so a snapped 100% lands on 0.
     */
    bool setOffsetPercentX(qreal offset);
    bool setOffsetPercentY(qreal offset);

    bool setPan(QPointF pan);
    bool setRepeatType(RepeatType type);
    bool setViewMode(const ViewMode& mode);
    bool setBackground(const Background& background);

    /**
     * @brief Set the measurement grid spacing.
     *
     * Anything outside {0,1,2,6,12} is moved to the nearest allowed spacing.
     */
    bool setGridOverlaySize(int inches);

    bool setSeamlessTestMode(bool enabled);
    bool setMockupZoom(qreal zoom);

    /// Degrees, wrapped into [0, 360).
    bool setMockupRotate(qreal degrees);

    bool setMaxCanvasSize(int size);

    /**
     * @brief Tile edge length in pattern pixels for a pattern of the given width.
     *
     * Always > 0 for a valid PatternImage because scale >= MIN_SCALE.
     */
    qreal tileSizeFor(int patternWidth) const { return patternWidth * m_scale; }

private:
    qreal m_scale = 1.0;
    qreal m_zoom = 1.0;
    qreal m_offsetPercentX = 0.0;
    qreal m_offsetPercentY = 0.0;
    QPointF m_pan;
    RepeatType m_repeatType = RepeatType::Full;
    ViewMode m_viewMode;
    Background m_background;
    int m_gridOverlaySize = 0;
    bool m_seamlessTestMode = false;
    qreal m_mockupZoom = 1.0;
    qreal m_mockupRotate = 0.0;
    int m_maxCanvasSize = DEFAULT_CANVAS_SIZE;
};
