#include "MockupKind.h"

#include <QCoreApplication>

QString mockupKey(MockupKind kind)
{
    switch (kind) {
        case MockupKind::Phone:      return QStringLiteral("phone");
        case MockupKind::IPad:       return QStringLiteral("ipad");
        case MockupKind::Tote:       return QStringLiteral("tote");
        case MockupKind::Bandana:    return QStringLiteral("bandana");
        case MockupKind::Bedspread:  return QStringLiteral("bedspread");
        case MockupKind::Mug:        return QStringLiteral("mug");
        case MockupKind::Bottle:     return QStringLiteral("bottle");
        case MockupKind::Sweatshirt: return QStringLiteral("sweatshirt");
    }
    return QString();
}

QString mockupLabel(MockupKind kind)
{
    switch (kind) {
        case MockupKind::Phone:      return QCoreApplication::translate("Mockup", "Phone Case");
        case MockupKind::IPad:       return QCoreApplication::translate("Mockup", "iPad Case");
        case MockupKind::Tote:       return QCoreApplication::translate("Mockup", "Tote Bag");
        case MockupKind::Bandana:    return QCoreApplication::translate("Mockup", "Bandana");
        case MockupKind::Bedspread:  return QCoreApplication::translate("Mockup", "Bedspread");
        case MockupKind::Mug:        return QCoreApplication::translate("Mockup", "Mug");
        case MockupKind::Bottle:     return QCoreApplication::translate("Mockup", "Water Bottle");
        case MockupKind::Sweatshirt: return QCoreApplication::translate("Mockup", "Sweatshirt");
    }
    return QString();
}

QString mockupFileName(MockupKind kind)
{
    // The phone texture is shipped as iphone.png, everything else matches its key
    switch (kind) {
        case MockupKind::Phone:      return QStringLiteral("iphone.png");
        case MockupKind::IPad:
        case MockupKind::Tote:
        case MockupKind::Bandana:
        case MockupKind::Bedspread:
        case MockupKind::Mug:
        case MockupKind::Bottle:
        case MockupKind::Sweatshirt:
            return mockupKey(kind) + QStringLiteral(".png");
    }
    return QString();
}

MockupKind mockupKindFromKey(const QString& key, bool* ok)
{
    const QString normalized = key.trimmed().toLower();
    for (MockupKind kind : ALL_MOCKUP_KINDS) {
        if (mockupKey(kind) == normalized) {
            if (ok) *ok = true;
            return kind;
        }
    }
    if (ok) *ok = false;
    return MockupKind::Phone;
}
