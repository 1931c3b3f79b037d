#ifndef CLITESTS_H
#define CLITESTS_H

#include <QObject>
#include <QTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QImage>
#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"
#include "../core/PatternSession.h"
#include "../core/SettingsSnapshot.h"
#include "../render/Compositor.h"

#include <csignal>

/**
 * Unit tests for headless command-line rendering.
 * Run with: patternproof --test-cli
 */
class CliTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    QString m_patternPath;

    QString path(const QString& name) const {
        return QDir(m_dir.path()).filePath(name);
    }

    static PatternImagePtr grayPattern() {
        QImage image(50, 50, QImage::Format_ARGB32);
        image.fill(Qt::gray);
        return PatternImage::fromImage(image);
    }

    // Parse "<app> args..." the way Cli::run() does after dropping the command
    static bool parse(QCommandLineParser& parser, Cli::Command cmd, const QStringList& args) {
        Cli::setupParser(parser, cmd);
        return parser.parse(QStringList{QStringLiteral("patternproof")} + args);
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
        m_patternPath = path("pattern.png");

        // Red top half, blue bottom half
        QImage pattern(40, 40, QImage::Format_ARGB32);
        pattern.fill(Qt::red);
        for (int y = 20; y < 40; ++y) {
            for (int x = 0; x < 40; ++x) {
                pattern.setPixelColor(x, y, Qt::blue);
            }
        }
        QVERIFY(pattern.save(m_patternPath));
    }

    void testParseCommand() {
        char app[] = "patternproof";
        char exportCmd[] = "export";
        char renderCmd[] = "render";
        char help[] = "--help";
        char version[] = "-v";
        char file[] = "pattern.png";

        char* noArgs[] = {app};
        QCOMPARE(Cli::parseCommand(1, noArgs), Cli::Command::None);
        QVERIFY(!Cli::isCliMode(1, noArgs));

        char* exportArgs[] = {app, exportCmd};
        QCOMPARE(Cli::parseCommand(2, exportArgs), Cli::Command::Export);
        QVERIFY(Cli::isCliMode(2, exportArgs));

        char* renderArgs[] = {app, renderCmd};
        QCOMPARE(Cli::parseCommand(2, renderArgs), Cli::Command::Render);

        char* helpArgs[] = {app, help};
        QCOMPARE(Cli::parseCommand(2, helpArgs), Cli::Command::Help);

        char* versionArgs[] = {app, version};
        QCOMPARE(Cli::parseCommand(2, versionArgs), Cli::Command::Version);

        // Opening a file is GUI mode
        char* fileArgs[] = {app, file};
        QCOMPARE(Cli::parseCommand(2, fileArgs), Cli::Command::None);

        QCOMPARE(Cli::commandName(Cli::Command::Export), QString("export"));
        QCOMPARE(Cli::commandName(Cli::Command::Render), QString("render"));
        QVERIFY(Cli::commandName(Cli::Command::None).isEmpty());
    }

    void testApplyStateOptions() {
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Export, {
            m_patternPath, "-o", path("unused.png"),
            "--scale", "2.5", "--zoom", "0.5", "--offset-x", "25", "--offset-y", "150",
            "--pan-x=-40", "--pan-y", "12", "--repeat", "half-drop", "--background", "#ff8800",
            "--canvas", "800"
        }));

        PatternSession session;
        session.setPattern(grayPattern());
        QString error;
        QVERIFY(Cli::applyStateOptions(parser, session, &error));
        QVERIFY(error.isEmpty());

        const RenderState& state = session.state();
        QCOMPARE(state.scale(), 2.5);
        QCOMPARE(state.zoom(), 0.5);
        QCOMPARE(state.offsetPercentX(), 0.25);
        QCOMPARE(state.offsetPercentY(), 0.5);     // 150% wraps
        QCOMPARE(state.pan(), QPointF(-40, 12));
        QCOMPARE(state.repeatType(), RepeatType::HalfDrop);
        QCOMPARE(state.background(), Background::solid(QColor("#ff8800")));
        QCOMPARE(state.maxCanvasSize(), 800);
    }

    void testStateOptionsClampAndReject() {
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "--scale", "99"}));
            PatternSession session;
            QVERIFY(Cli::applyStateOptions(parser, session));
            QCOMPARE(session.state().scale(), RenderState::MAX_SCALE);
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "--repeat", "diagonal"}));
            PatternSession session;
            QString error;
            QVERIFY(!Cli::applyStateOptions(parser, session, &error));
            QVERIFY(error.contains("diagonal"));
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "--zoom", "lots"}));
            PatternSession session;
            QVERIFY(!Cli::applyStateOptions(parser, session));
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Render, {m_patternPath, "--grid-inches", "3"}));
            PatternSession session;
            QString error;
            QVERIFY(!Cli::applyViewOptions(parser, session, &error));
            QVERIFY(!error.isEmpty());
        }
    }

    void testSettingsSnapshotThenOverride() {
        SettingsSnapshot snapshot;
        snapshot.scale = 0.8;
        snapshot.zoom = 3.0;
        snapshot.repeatType = RepeatType::Brick;
        const QString settingsPath = path("settings.json");
        QFile file(settingsPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(snapshot.toJsonBytes());
        file.close();

        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Export, {
            m_patternPath, "--settings", settingsPath, "--zoom", "1.25"
        }));
        PatternSession session;
        session.setPattern(grayPattern());
        QVERIFY(Cli::applyStateOptions(parser, session));

        QCOMPARE(session.state().scale(), 0.8);
        QCOMPARE(session.state().repeatType(), RepeatType::Brick);
        QCOMPARE(session.state().zoom(), 1.25);    // command line wins

        QCommandLineParser missing;
        QVERIFY(parse(missing, Cli::Command::Export, {m_patternPath, "--settings", path("nope.json")}));
        QVERIFY(!Cli::applyStateOptions(missing, session));
    }

    void testApplyViewOptions() {
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Render, {
            m_patternPath, "--view", "mug", "--seamless", "--grid-inches", "6",
            "--mockup-zoom", "120", "--mockup-rotate=-90"
        }));
        PatternSession session;
        QVERIFY(Cli::applyViewOptions(parser, session));

        const RenderState& state = session.state();
        QCOMPARE(state.viewMode(), ViewMode::forMockup(MockupKind::Mug));
        QVERIFY(state.seamlessTestMode());
        QCOMPARE(state.gridOverlaySize(), 6);
        QCOMPARE(state.mockupZoom(), 1.2);
        QCOMPARE(state.mockupRotate(), 270.0);
    }

    void testExportWritesFile() {
        const QString output = path("export.png");
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Export, {
            m_patternPath, "-o", output, "--size", "200", "--scale", "1", "--canvas", "400"
        }));
        QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::Success);

        QImage image(output);
        QCOMPARE(image.size(), QSize(200, 200));
        // Top-left tile at half size: red rows 0-9, blue rows 10-19
        QCOMPARE(image.pixelColor(5, 5), QColor(Qt::red));
        QCOMPARE(image.pixelColor(5, 15), QColor(Qt::blue));
    }

    void testExportJpegFromExtension() {
        const QString output = path("export.jpg");
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "-o", output, "--size", "64"}));
        QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::Success);

        QFile file(output);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QByteArray head = file.read(2);
        QCOMPARE(static_cast<unsigned char>(head.at(0)), static_cast<unsigned char>(0xFF));
        QCOMPARE(static_cast<unsigned char>(head.at(1)), static_cast<unsigned char>(0xD8));
    }

    void testExportErrors() {
        // Existing output without --overwrite
        const QString existing = path("existing.png");
        QVERIFY(QImage(4, 4, QImage::Format_ARGB32).save(existing));
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "-o", existing, "--size", "32"}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::IoError);
            QCOMPARE(QImage(existing).size(), QSize(4, 4));
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export,
                          {m_patternPath, "-o", existing, "--size", "32", "--overwrite"}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::Success);
            QCOMPARE(QImage(existing).size(), QSize(32, 32));
        }

        // Unreadable pattern
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {path("missing.png"), "-o", path("a.png")}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::IoError);
        }

        // Missing output / missing pattern / bad size / bad format
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::InvalidArgs);
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {"-o", path("b.png")}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::InvalidArgs);
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "-o", path("c.png"), "--size", "20000"}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::InvalidArgs);
            QVERIFY(!QFile::exists(path("c.png")));
        }
        {
            QCommandLineParser parser;
            QVERIFY(parse(parser, Cli::Command::Export, {m_patternPath, "-o", path("d.png"), "--format", "gif"}));
            QCOMPARE(Cli::handleExport(parser), Cli::ExitCode::InvalidArgs);
        }
    }

    void testInterruptCancelsExport() {
#ifdef Q_OS_WIN
        QSKIP("Console control events cannot be raised from inside the test");
#else
        struct sigaction before {};
        QCOMPARE(sigaction(SIGINT, nullptr, &before), 0);

        PatternSession session;
        session.setPattern(grayPattern());
        ExportRequest request;
        request.size = 400;
        {
            Cli::InterruptScope interrupt;
            QVERIFY(!interrupt.interrupted());

            // Handled by the scope: the process keeps running
            QCOMPARE(raise(SIGINT), 0);
            QVERIFY(interrupt.interrupted());
            QVERIFY(interrupt.abortToken()->load());

            const ExportResult result = Compositor::exportPattern(
                session.state(), session.pattern().get(), request, interrupt.abortToken());
            QCOMPARE(result.status, ExportStatus::Cancelled);
            QVERIFY(result.data.isEmpty());
        }

        struct sigaction after {};
        QCOMPARE(sigaction(SIGINT, nullptr, &after), 0);
        QVERIFY(after.sa_handler == before.sa_handler);

        // A stale interrupt does not cancel the next export
        Cli::InterruptScope next;
        QVERIFY(!next.interrupted());
        const ExportResult result = Compositor::exportPattern(
            session.state(), session.pattern().get(), request, next.abortToken());
        QCOMPARE(result.status, ExportStatus::Success);
#endif
    }

    void testRenderWritesFrame() {
        const QString output = path("frame.png");
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Render, {
            m_patternPath, "-o", output, "--canvas", "300", "--background", "#00ff00",
            "--view", "tile-grid"
        }));
        QCOMPARE(Cli::handleRender(parser), Cli::ExitCode::Success);

        QImage frame(output);
        QCOMPARE(frame.size(), QSize(300, 300));
    }

    void testRenderMissingMockupStillRenders() {
        const QString output = path("mockup.png");
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Render, {
            m_patternPath, "-o", output, "--canvas", "256", "--view", "tote",
            "--mockups", path("no-mockups-here"), "--background", "#336699"
        }));
        QCOMPARE(Cli::handleRender(parser), Cli::ExitCode::Success);

        QImage frame(output);
        QCOMPARE(frame.size(), QSize(256, 256));
        QCOMPARE(frame.pixelColor(128, 128), QColor("#336699"));
    }

    void testRenderRejectsBadView() {
        QCommandLineParser parser;
        QVERIFY(parse(parser, Cli::Command::Render, {
            m_patternPath, "-o", path("bad.png"), "--view", "hologram"
        }));
        QCOMPARE(Cli::handleRender(parser), Cli::ExitCode::InvalidArgs);
        QVERIFY(!QFile::exists(path("bad.png")));
    }
};

#endif // CLITESTS_H
