#include "SettingsSnapshot.h"
#include "PatternSession.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>

SettingsSnapshot SettingsSnapshot::capture(const RenderState& state)
{
    SettingsSnapshot snapshot;
    snapshot.scale = state.scale();
    snapshot.offsetPercentX = state.offsetPercentX();
    snapshot.offsetPercentY = state.offsetPercentY();
    snapshot.repeatType = state.repeatType();
    snapshot.background = state.background();
    snapshot.zoom = state.zoom();
    snapshot.panX = state.panX();
    snapshot.panY = state.panY();
    return snapshot;
}

void SettingsSnapshot::applyTo(PatternSession& session) const
{
    session.setScale(scale);
    session.setOffsetPercentX(offsetPercentX);
    session.setOffsetPercentY(offsetPercentY);
    session.setRepeatType(repeatType);
    session.setBackground(background);
    session.setZoom(zoom);
    session.setPanX(panX);
    session.setPanY(panY);
}

QJsonObject SettingsSnapshot::toJson() const
{
    QJsonObject obj;
    obj["scale"] = scale;
    obj["offsetPercentX"] = offsetPercentX;
    obj["offsetPercentY"] = offsetPercentY;
    obj["repeatType"] = repeatTypeToString(repeatType);
    obj["backgroundColor"] = background.toString();
    obj["zoom"] = zoom;
    obj["panX"] = panX;
    obj["panY"] = panY;
    return obj;
}

SettingsSnapshot SettingsSnapshot::fromJson(const QJsonObject& obj)
{
    SettingsSnapshot snapshot;
    snapshot.scale = obj["scale"].toDouble(snapshot.scale);
    snapshot.offsetPercentX = obj["offsetPercentX"].toDouble(0.0);
    snapshot.offsetPercentY = obj["offsetPercentY"].toDouble(0.0);
    snapshot.zoom = obj["zoom"].toDouble(snapshot.zoom);
    snapshot.panX = obj["panX"].toDouble(0.0);
    snapshot.panY = obj["panY"].toDouble(0.0);

    if (obj.contains("repeatType")) {
        bool ok = false;
        snapshot.repeatType = repeatTypeFromString(obj["repeatType"].toString(), &ok);
        if (!ok) {
            qWarning() << "SettingsSnapshot: unknown repeatType" << obj["repeatType"].toString();
        }
    }

    if (obj.contains("backgroundColor")) {
        bool ok = false;
        snapshot.background = Background::fromString(obj["backgroundColor"].toString(), &ok);
        if (!ok) {
            qWarning() << "SettingsSnapshot: invalid backgroundColor" << obj["backgroundColor"].toString();
        }
    }

    return snapshot;
}

QByteArray SettingsSnapshot::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

SettingsSnapshot SettingsSnapshot::fromJsonBytes(const QByteArray& data, bool* ok)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "SettingsSnapshot: not a JSON object:" << parseError.errorString();
        if (ok) *ok = false;
        return SettingsSnapshot();
    }

    if (ok) *ok = true;
    return fromJson(doc.object());
}

bool SettingsSnapshot::operator==(const SettingsSnapshot& other) const
{
    return scale == other.scale
        && offsetPercentX == other.offsetPercentX
        && offsetPercentY == other.offsetPercentY
        && repeatType == other.repeatType
        && background == other.background
        && zoom == other.zoom
        && panX == other.panX
        && panY == other.panY;
}
