#pragma once

// ============================================================================
// SettingsSnapshot - Serializable subset of RenderState
// ============================================================================
// The fields a user expects "Save settings" to remember. A snapshot is
// replayed through PatternSession's validated setters, so a hand-edited or
// stale snapshot is clamped rather than rejected. Capturing a session and
// replaying the snapshot into another session reproduces the values exactly.
//
// JSON keys: scale, offsetPercentX, offsetPercentY, repeatType,
// backgroundColor, zoom, panX, panY.
// ============================================================================

#include "RenderState.h"

#include <QByteArray>
#include <QJsonObject>

class PatternSession;

struct SettingsSnapshot {
    qreal scale = 1.0;
    qreal offsetPercentX = 0.0;
    qreal offsetPercentY = 0.0;
    RepeatType repeatType = RepeatType::Full;
    Background background;
    qreal zoom = 1.0;
    qreal panX = 0.0;
    qreal panY = 0.0;

    static SettingsSnapshot capture(const RenderState& state);

    /// Replay through the session setters (one redraw per field).
    void applyTo(PatternSession& session) const;

    QJsonObject toJson() const;

    /**
     * @brief Build a snapshot from JSON.
     *
     * Missing keys keep their defaults. Unknown repeatType/backgroundColor
     * strings fall back to full/checker and are logged.
     */
    static SettingsSnapshot fromJson(const QJsonObject& obj);

    /// Compact JSON document bytes (QSettings value, snapshot files).
    QByteArray toJsonBytes() const;

    /**
     * @brief Parse JSON document bytes.
     * @param ok Set to false if the bytes are not a JSON object (may be null).
     */
    static SettingsSnapshot fromJsonBytes(const QByteArray& data, bool* ok = nullptr);

    bool operator==(const SettingsSnapshot& other) const;
    bool operator!=(const SettingsSnapshot& other) const { return !(*this == other); }
};
