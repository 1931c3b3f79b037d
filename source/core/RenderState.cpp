// ============================================================================
// RenderState - Implementation
// ============================================================================

#include "RenderState.h"

#include <QRegularExpression>
#include <QtMath>
#include <array>
#include <cmath>
#include <cstdlib>

namespace {

constexpr std::array<int, 5> GRID_OVERLAY_SIZES = {0, 1, 2, 6, 12};

// Wrap into [0, period)
qreal wrap(qreal value, qreal period)
{
    qreal wrapped = std::fmod(value, period);
    if (wrapped < 0) {
        wrapped += period;
    }
    // fmod of a tiny negative number can round back up to period
    if (wrapped >= period) {
        wrapped = 0.0;
    }
    return wrapped;
}

} // namespace

// ===== RepeatType =====

QString repeatTypeToString(RepeatType type)
{
    switch (type) {
        case RepeatType::Full:     return QStringLiteral("full");
        case RepeatType::HalfDrop: return QStringLiteral("half-drop");
        case RepeatType::Brick:    return QStringLiteral("brick");
    }
    return QString();
}

RepeatType repeatTypeFromString(const QString& str, bool* ok)
{
    const QString s = str.trimmed().toLower();
    if (ok) *ok = true;
    if (s == QLatin1String("full")) return RepeatType::Full;
    if (s == QLatin1String("half-drop")) return RepeatType::HalfDrop;
    if (s == QLatin1String("brick")) return RepeatType::Brick;
    if (ok) *ok = false;
    return RepeatType::Full;
}

// ===== ViewMode =====

QString viewModeToString(const ViewMode& mode)
{
    switch (mode.kind) {
        case ViewMode::Tile:     return QStringLiteral("tile");
        case ViewMode::TileGrid: return QStringLiteral("tile-grid");
        case ViewMode::Fabric:   return QStringLiteral("fabric");
        case ViewMode::Mockup:   return mockupKey(mode.mockup);
    }
    return QString();
}

ViewMode viewModeFromString(const QString& str, bool* ok)
{
    const QString s = str.trimmed().toLower();
    if (ok) *ok = true;
    if (s == QLatin1String("tile")) return ViewMode::tile();
    if (s == QLatin1String("tile-grid")) return ViewMode::tileGrid();
    if (s == QLatin1String("fabric")) return ViewMode::fabric();

    bool isMockup = false;
    MockupKind kind = mockupKindFromKey(s, &isMockup);
    if (isMockup) {
        return ViewMode::forMockup(kind);
    }

    if (ok) *ok = false;
    return ViewMode::tile();
}

// ===== Background =====

Background Background::solid(const QColor& color)
{
    Background bg;
    if (color.isValid()) {
        bg.m_checker = false;
        bg.m_color = color;
    }
    return bg;
}

QString Background::toString() const
{
    return m_checker ? QStringLiteral("checker") : m_color.name(QColor::HexRgb);
}

Background Background::fromString(const QString& str, bool* ok)
{
    const QString s = str.trimmed();
    if (s.compare(QLatin1String("checker"), Qt::CaseInsensitive) == 0) {
        if (ok) *ok = true;
        return checker();
    }

    static const QRegularExpression hexPattern(
        QStringLiteral("^#?([0-9A-Fa-f]{3}|[0-9A-Fa-f]{6})$"));
    QRegularExpressionMatch match = hexPattern.match(s);
    if (!match.hasMatch()) {
        if (ok) *ok = false;
        return checker();
    }

    // Expand #RGB to #RRGGBB
    QString hex = match.captured(1);
    if (hex.length() == 3) {
        QString expanded;
        for (QChar c : hex) {
            expanded += c;
            expanded += c;
        }
        hex = expanded;
    }

    if (ok) *ok = true;
    return solid(QColor(QStringLiteral("#") + hex));
}

// ===== RenderState =====

bool RenderState::isValidGridOverlaySize(int inches)
{
    for (int allowed : GRID_OVERLAY_SIZES) {
        if (allowed == inches) return true;
    }
    return false;
}

bool RenderState::setScale(qreal scale)
{
    if (!qIsFinite(scale)) return false;
    scale = qBound(MIN_SCALE, scale, MAX_SCALE);
    if (scale == m_scale) return false;
    m_scale = scale;
    return true;
}

bool RenderState::setZoom(qreal zoom)
{
    if (!qIsFinite(zoom)) return false;
    zoom = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    if (zoom == m_zoom) return false;
    m_zoom = zoom;
    return true;
}

bool RenderState::setOffsetPercentX(qreal offset)
{
    if (!qIsFinite(offset)) return false;
    offset = wrap(offset, 1.0);
    if (offset == m_offsetPercentX) return false;
    m_offsetPercentX = offset;
    return true;
}

bool RenderState::setOffsetPercentY(qreal offset)
{
    if (!qIsFinite(offset)) return false;
    offset = wrap(offset, 1.0);
    if (offset == m_offsetPercentY) return false;
    m_offsetPercentY = offset;
    return true;
}

bool RenderState::setPan(QPointF pan)
{
    if (!qIsFinite(pan.x()) || !qIsFinite(pan.y())) return false;
    if (pan == m_pan) return false;
    m_pan = pan;
    return true;
}

bool RenderState::setRepeatType(RepeatType type)
{
    if (type == m_repeatType) return false;
    m_repeatType = type;
    return true;
}

bool RenderState::setViewMode(const ViewMode& mode)
{
    if (mode == m_viewMode) return false;
    m_viewMode = mode;
    return true;
}

bool RenderState::setBackground(const Background& background)
{
    if (background == m_background) return false;
    m_background = background;
    return true;
}

bool RenderState::setGridOverlaySize(int inches)
{
    // Nearest allowed spacing, ties go to the smaller one
    int best = GRID_OVERLAY_SIZES[0];
    for (int allowed : GRID_OVERLAY_SIZES) {
        if (std::abs(allowed - inches) < std::abs(best - inches)) {
            best = allowed;
        }
    }
    if (best == m_gridOverlaySize) return false;
    m_gridOverlaySize = best;
    return true;
}

bool RenderState::setSeamlessTestMode(bool enabled)
{
    if (enabled == m_seamlessTestMode) return false;
    m_seamlessTestMode = enabled;
    return true;
}

bool RenderState::setMockupZoom(qreal zoom)
{
    if (!qIsFinite(zoom)) return false;
    zoom = qBound(MIN_MOCKUP_ZOOM, zoom, MAX_MOCKUP_ZOOM);
    if (zoom == m_mockupZoom) return false;
    m_mockupZoom = zoom;
    return true;
}

bool RenderState::setMockupRotate(qreal degrees)
{
    if (!qIsFinite(degrees)) return false;
    degrees = wrap(degrees, 360.0);
    if (degrees == m_mockupRotate) return false;
    m_mockupRotate = degrees;
    return true;
}

bool RenderState::setMaxCanvasSize(int size)
{
    size = qBound(MIN_CANVAS_SIZE, size, MAX_CANVAS_SIZE);
    if (size == m_maxCanvasSize) return false;
    m_maxCanvasSize = size;
    return true;
}
