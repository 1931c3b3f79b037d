#include "CliHandler.h"
#include "CliSignal.h"
#include "../core/PatternImage.h"
#include "../core/PatternSession.h"
#include "../core/SettingsSnapshot.h"
#include "../export/ExportTypes.h"
#include "../mockups/MockupLibrary.h"
#include "../render/Compositor.h"
#include "../render/PainterSurface.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QPainter>
#include <QTextStream>
#include <QtMath>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

static void reportError(const QString& message)
{
    QTextStream err(stderr);
    err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    err.flush();
}

static void setError(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
}

/**
 * Read a numeric option. Returns false only when the option is present but
 * not a finite number; @p present tells whether @p value was written.
 */
static bool readReal(const QCommandLineParser& parser, const QString& name,
                     qreal& value, bool& present, QString* error)
{
    present = parser.isSet(name);
    if (!present) {
        return true;
    }
    bool ok = false;
    const qreal parsed = parser.value(name).toDouble(&ok);
    if (!ok || !qIsFinite(parsed)) {
        setError(error, QCoreApplication::translate("CLI", "--%1 expects a number, got \"%2\"")
                            .arg(name, parser.value(name)));
        return false;
    }
    value = parsed;
    return true;
}

static bool readInt(const QCommandLineParser& parser, const QString& name,
                    int& value, bool& present, QString* error)
{
    present = parser.isSet(name);
    if (!present) {
        return true;
    }
    bool ok = false;
    const int parsed = parser.value(name).toInt(&ok);
    if (!ok) {
        setError(error, QCoreApplication::translate("CLI", "--%1 expects an integer, got \"%2\"")
                            .arg(name, parser.value(name)));
        return false;
    }
    value = parsed;
    return true;
}

/**
 * Shared front half of both commands: positional pattern, output path,
 * pattern decoding and state options. Returns ExitCode::Success when the
 * session is ready to render.
 */
static int prepareSession(const QCommandLineParser& parser, const QString& commandLabel,
                          PatternSession& session, QString& outputPath)
{
    const QStringList inputs = parser.positionalArguments();
    if (inputs.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "No pattern specified. Use 'patternproof %1 --help' for usage.").arg(commandLabel));
        return ExitCode::InvalidArgs;
    }
    if (inputs.size() > 1) {
        reportError(QCoreApplication::translate("CLI",
            "Only one pattern can be rendered at a time (got %1).").arg(inputs.size()));
        return ExitCode::InvalidArgs;
    }

    outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(outputPath));

    if (QFileInfo::exists(outputPath) && !parser.isSet(QStringLiteral("overwrite"))) {
        reportError(QCoreApplication::translate("CLI",
            "%1 already exists. Use --overwrite to replace it.").arg(outputPath));
        return ExitCode::IoError;
    }

    const QString inputPath = QDir::current().absoluteFilePath(inputs.first());
    PatternImagePtr pattern = PatternImage::loadFromFile(inputPath);
    if (!pattern) {
        reportError(QCoreApplication::translate("CLI",
            "Could not read pattern image %1").arg(inputPath));
        return ExitCode::IoError;
    }
    session.setPattern(pattern);

    QString error;
    if (!applyStateOptions(parser, session, &error)) {
        reportError(error);
        return ExitCode::InvalidArgs;
    }
    return ExitCode::Success;
}

static int writeOutput(const QString& path, const QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                        .arg(path, file.errorString()));
        return ExitCode::IoError;
    }
    if (file.write(data) != data.size()) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
                        .arg(path, file.errorString()));
        return ExitCode::IoError;
    }
    file.close();
    return ExitCode::Success;
}

// =============================================================================
// State Options
// =============================================================================

bool applyStateOptions(const QCommandLineParser& parser, PatternSession& session, QString* error)
{
    if (parser.isSet(QStringLiteral("settings"))) {
        const QString path = parser.value(QStringLiteral("settings"));
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            setError(error, QCoreApplication::translate("CLI", "Cannot read settings %1: %2")
                                .arg(path, file.errorString()));
            return false;
        }
        bool ok = false;
        const SettingsSnapshot snapshot = SettingsSnapshot::fromJsonBytes(file.readAll(), &ok);
        if (!ok) {
            setError(error, QCoreApplication::translate("CLI",
                "%1 is not a settings snapshot (expected a JSON object)").arg(path));
            return false;
        }
        snapshot.applyTo(session);
    }

    // The canvas size frames pan/zoom, so it goes in before anything that uses it
    int canvas = 0;
    bool present = false;
    if (!readInt(parser, QStringLiteral("canvas"), canvas, present, error)) return false;
    if (present) session.setMaxCanvasSize(canvas);

    qreal value = 0.0;
    if (!readReal(parser, QStringLiteral("scale"), value, present, error)) return false;
    if (present) session.setScale(value);

    if (!readReal(parser, QStringLiteral("zoom"), value, present, error)) return false;
    if (present) session.setZoom(value);

    if (!readReal(parser, QStringLiteral("offset-x"), value, present, error)) return false;
    if (present) session.setOffsetPercentX(value / 100.0);

    if (!readReal(parser, QStringLiteral("offset-y"), value, present, error)) return false;
    if (present) session.setOffsetPercentY(value / 100.0);

    if (!readReal(parser, QStringLiteral("pan-x"), value, present, error)) return false;
    if (present) session.setPanX(value);

    if (!readReal(parser, QStringLiteral("pan-y"), value, present, error)) return false;
    if (present) session.setPanY(value);

    if (parser.isSet(QStringLiteral("repeat"))) {
        bool ok = false;
        const RepeatType type = repeatTypeFromString(parser.value(QStringLiteral("repeat")), &ok);
        if (!ok) {
            setError(error, QCoreApplication::translate("CLI",
                "Unknown repeat type \"%1\" (expected full, half-drop or brick)")
                    .arg(parser.value(QStringLiteral("repeat"))));
            return false;
        }
        session.setRepeatType(type);
    }

    if (parser.isSet(QStringLiteral("background"))) {
        bool ok = false;
        const Background bg = Background::fromString(parser.value(QStringLiteral("background")), &ok);
        if (!ok) {
            setError(error, QCoreApplication::translate("CLI",
                "Unknown background \"%1\" (expected checker or #RRGGBB)")
                    .arg(parser.value(QStringLiteral("background"))));
            return false;
        }
        session.setBackground(bg);
    }

    return true;
}

bool applyViewOptions(const QCommandLineParser& parser, PatternSession& session, QString* error)
{
    if (parser.isSet(QStringLiteral("view"))) {
        bool ok = false;
        const ViewMode mode = viewModeFromString(parser.value(QStringLiteral("view")), &ok);
        if (!ok) {
            setError(error, QCoreApplication::translate("CLI", "Unknown view mode \"%1\"")
                                .arg(parser.value(QStringLiteral("view"))));
            return false;
        }
        session.setViewMode(mode);
    }

    session.setSeamlessTestMode(parser.isSet(QStringLiteral("seamless")));

    int inches = 0;
    bool present = false;
    if (!readInt(parser, QStringLiteral("grid-inches"), inches, present, error)) return false;
    if (present) {
        if (!RenderState::isValidGridOverlaySize(inches)) {
            setError(error, QCoreApplication::translate("CLI",
                "--grid-inches must be one of 0, 1, 2, 6, 12 (got %1)").arg(inches));
            return false;
        }
        session.setGridOverlaySize(inches);
    }

    qreal value = 0.0;
    if (!readReal(parser, QStringLiteral("mockup-zoom"), value, present, error)) return false;
    if (present) session.setMockupZoom(value / 100.0);

    if (!readReal(parser, QStringLiteral("mockup-rotate"), value, present, error)) return false;
    if (present) session.setMockupRotate(value);

    return true;
}

// =============================================================================
// Export Handler
// =============================================================================

int handleExport(const QCommandLineParser& parser)
{
    PatternSession session;
    QString outputPath;
    int code = prepareSession(parser, QStringLiteral("export"), session, outputPath);
    if (code != ExitCode::Success) {
        return code;
    }

    ExportRequest request;
    request.size = session.state().maxCanvasSize();

    bool present = false;
    QString error;
    if (!readInt(parser, QStringLiteral("size"), request.size, present, &error)) {
        reportError(error);
        return ExitCode::InvalidArgs;
    }

    // Format: explicit option, else the output extension, else PNG
    bool formatOk = false;
    if (parser.isSet(QStringLiteral("format"))) {
        request.format = exportFormatFromString(parser.value(QStringLiteral("format")), &formatOk);
        if (!formatOk) {
            reportError(QCoreApplication::translate("CLI",
                "Unknown format \"%1\" (expected png or jpg)").arg(parser.value(QStringLiteral("format"))));
            return ExitCode::InvalidArgs;
        }
    } else {
        request.format = exportFormatFromString(QFileInfo(outputPath).suffix(), &formatOk);
    }

    if (!request.isValid()) {
        reportError(QCoreApplication::translate("CLI",
            "--size must be between %1 and %2 (got %3)")
                .arg(ExportRequest::MIN_SIZE).arg(ExportRequest::MAX_SIZE).arg(request.size));
        return ExitCode::InvalidArgs;
    }

    ExportResult result;
    {
        InterruptScope interrupt;
        result = Compositor::exportPattern(
            session.state(), session.pattern().get(), request, interrupt.abortToken());
        if (interrupt.interrupted()) {
            result.status = ExportStatus::Cancelled;
        }
    }

    switch (result.status) {
        case ExportStatus::Success:
            break;
        case ExportStatus::Cancelled:
            reportError(QCoreApplication::translate("CLI",
                "Export interrupted, %1 was not written").arg(outputPath));
            return ExitCode::Cancelled;
        case ExportStatus::InvalidRequest:
        case ExportStatus::NoPattern:
            reportError(result.message);
            return ExitCode::InvalidArgs;
        default:
            reportError(result.message);
            return ExitCode::RenderFailure;
    }

    code = writeOutput(outputPath, result.data);
    if (code != ExitCode::Success) {
        return code;
    }

    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Exported %1 (%2x%2 %3)\n")
               .arg(outputPath).arg(request.size).arg(exportFormatToString(request.format));
    return ExitCode::Success;
}

// =============================================================================
// Render Handler
// =============================================================================

int handleRender(const QCommandLineParser& parser)
{
    PatternSession session;
    QString outputPath;
    const int code = prepareSession(parser, QStringLiteral("render"), session, outputPath);
    if (code != ExitCode::Success) {
        return code;
    }

    QString error;
    if (!applyViewOptions(parser, session, &error)) {
        reportError(error);
        return ExitCode::InvalidArgs;
    }

    MockupLibrary mockups;
    const ViewMode mode = session.state().viewMode();
    if (mode.kind == ViewMode::Mockup) {
        const QString dir = parser.isSet(QStringLiteral("mockups"))
            ? parser.value(QStringLiteral("mockups"))
            : QCoreApplication::applicationDirPath() + QStringLiteral("/mockups");
        if (!mockups.loadTexture(mode.mockup, QDir(dir).filePath(mockupFileName(mode.mockup)))) {
            // Still rendered: the frame then shows only the background
            reportError(QCoreApplication::translate("CLI",
                "No %1 mockup texture in %2").arg(mockupKey(mode.mockup), dir));
        }
    }

    const int side = session.state().maxCanvasSize();
    QImage frame(side, side, QImage::Format_ARGB32_Premultiplied);
    {
        QPainter painter(&frame);
        PainterSurface surface(painter, frame.size());
        Compositor::render(surface, session.state(), session.pattern().get(), &mockups, true);
    }

    if (!frame.save(outputPath)) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1").arg(outputPath));
        return ExitCode::IoError;
    }

    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Rendered %1 (%2, %3x%3)\n")
               .arg(outputPath, viewModeToString(mode)).arg(side);
    return ExitCode::Success;
}

} // namespace Cli
