#pragma once

/**
 * @file ExportTypes.h
 * @brief Request and result types shared by the export pipeline.
 *
 * Used by Compositor::exportPattern(), PatternExporter and the CLI.
 */

#include <QByteArray>
#include <QMetaType>
#include <QString>

/**
 * @brief Encoded output format.
 */
enum class ExportFormat {
    Png,    ///< Lossless, keeps transparency
    Jpg     ///< Quality 95, flattened onto white
};

QString exportFormatToString(ExportFormat format);

/**
 * @brief Parse "png", "jpg" or "jpeg" (case-insensitive).
 * @param ok Set to false for anything else (may be null). Result is Png then.
 */
ExportFormat exportFormatFromString(const QString& str, bool* ok = nullptr);

/// File extension without the dot ("png" / "jpg").
QString exportFormatExtension(ExportFormat format);

/**
 * @brief One export job. Transient: consumed by a single exportPattern() call.
 */
struct ExportRequest {
    static constexpr int MIN_SIZE = 1;
    static constexpr int MAX_SIZE = 10000;
    static constexpr int DEFAULT_CUSTOM_SIZE = 2400;

    int size = DEFAULT_CUSTOM_SIZE;     ///< Output edge length in pixels (square)
    ExportFormat format = ExportFormat::Png;

    bool isValid() const { return size >= MIN_SIZE && size <= MAX_SIZE; }

    /// "pattern-<size>px.<ext>"
    QString suggestedFileName() const;
};

/**
 * @brief Outcome of an export.
 */
enum class ExportStatus {
    Success,            ///< data holds the encoded image
    NoPattern,          ///< Nothing loaded; the request was a no-op
    InvalidRequest,     ///< Size outside [MIN_SIZE, MAX_SIZE]
    Busy,               ///< Another export is still running
    Cancelled,          ///< Abort token was set while rendering
    EncodeFailed        ///< Rendering or image encoding failed
};

struct ExportResult {
    ExportStatus status = ExportStatus::NoPattern;
    ExportRequest request;
    QByteArray data;            ///< Encoded bytes (empty unless Success)
    QString message;            ///< Error detail for logs and the CLI

    bool succeeded() const { return status == ExportStatus::Success; }
    QString suggestedFileName() const { return request.suggestedFileName(); }
};

Q_DECLARE_METATYPE(ExportResult)
