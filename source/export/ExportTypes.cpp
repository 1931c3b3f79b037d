#include "ExportTypes.h"

QString exportFormatToString(ExportFormat format)
{
    switch (format) {
        case ExportFormat::Png: return QStringLiteral("png");
        case ExportFormat::Jpg: return QStringLiteral("jpg");
    }
    return QStringLiteral("png");
}

ExportFormat exportFormatFromString(const QString& str, bool* ok)
{
    const QString lower = str.trimmed().toLower();
    if (ok) *ok = true;
    if (lower == QLatin1String("png")) {
        return ExportFormat::Png;
    }
    if (lower == QLatin1String("jpg") || lower == QLatin1String("jpeg")) {
        return ExportFormat::Jpg;
    }
    if (ok) *ok = false;
    return ExportFormat::Png;
}

QString exportFormatExtension(ExportFormat format)
{
    return exportFormatToString(format);
}

QString ExportRequest::suggestedFileName() const
{
    return QStringLiteral("pattern-%1px.%2").arg(size).arg(exportFormatExtension(format));
}
