// ============================================================================
// PatternProof - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QGuiApplication>
#include <QTranslator>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTest>
#include <QDebug>

#include "PatternWindow.h"
#include "cli/CliParser.h"

// Platform-specific includes
#ifdef Q_OS_WIN
#include <windows.h>
#endif

// Test includes
#include "core/ParameterMapperTests.h"
#include "core/RenderStateTests.h"
#include "core/TileLayoutTests.h"
#include "core/SettingsSnapshotTests.h"
#include "render/CompositorTests.h"
#include "render/OverlayRendererTests.h"
#include "render/ChromaKeyTests.h"
#include "export/PatternExporterTests.h"
#include "input/PanZoomGestureTests.h"
#include "cli/CliTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator)
{
    QSettings settings("PatternProof", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/patternproof/translations",
        "/usr/local/share/patternproof/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "patternproof/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (path.isEmpty()) {
            continue;
        }
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    // QTest::qExec only sees the program name, not our --test-* flag
    char programName[] = "patternproof";
    char* testArgv[] = {programName};

    bool success = false;

    if (testType == "mapper") {
        ParameterMapperTests tests;
        return QTest::qExec(&tests, 1, testArgv);
    } else if (testType == "state") {
        RenderStateTests tests;
        return QTest::qExec(&tests, 1, testArgv);
    } else if (testType == "chromakey") {
        ChromaKeyTests tests;
        return QTest::qExec(&tests, 1, testArgv);
    } else if (testType == "export") {
        PatternExporterTests tests;
        return QTest::qExec(&tests, 1, testArgv);
    } else if (testType == "cli") {
        CliTests tests;
        return QTest::qExec(&tests, 1, testArgv);
    } else if (testType == "layout") {
        success = TileLayoutTests::runAllTests();
    } else if (testType == "overlay") {
        success = OverlayRendererTests::runAllTests();
    } else if (testType == "snapshot") {
        success = SettingsSnapshotTests::runAllTests();
    } else if (testType == "compositor") {
        success = CompositorTests::runUnitTests();
    } else if (testType == "gesture") {
        success = PanZoomGestureTests::runUnitTests();
    } else {
        qWarning() << "Unknown test suite:" << testType;
        return 1;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // ========== Headless Commands ==========
    // Checked before any application object exists: rendering needs a
    // QGuiApplication, but no display.
    if (Cli::isCliMode(argc, argv)) {
        if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
            qputenv("QT_QPA_PLATFORM", "offscreen");
        }
        QGuiApplication app(argc, argv);
        app.setOrganizationName("PatternProof");
        app.setApplicationName("App");

        QTranslator translator;
        loadTranslations(app, translator);

        return Cli::run(app, argc, argv);
    }

    QApplication app(argc, argv);
    app.setOrganizationName("PatternProof");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    auto* w = new PatternWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();

    if (!inputFile.isEmpty()) {
        w->openPatternFile(inputFile);
    }

    return app.exec();
}
