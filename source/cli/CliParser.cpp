#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "1.0.0";

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "export") == 0) {
        return Command::Export;
    }
    if (std::strcmp(arg1, "render") == 0) {
        return Command::Render;
    }

    // "patternproof --help" or "patternproof -v"
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;  // Unknown argument (or --test-*) - not a CLI command
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Export:  return QStringLiteral("export");
        case Command::Render:  return QStringLiteral("render");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addStateOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("settings"),
        QCoreApplication::translate("CLI", "Settings snapshot (JSON) to start from"),
        QStringLiteral("file")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("scale"),
        QCoreApplication::translate("CLI", "Pattern scale, 0.05 - 5.0 (default: auto-fit)"),
        QStringLiteral("S")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("zoom"),
        QCoreApplication::translate("CLI", "View zoom, 0.01 - 8.0 (default: 1.0)"),
        QStringLiteral("Z")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("offset-x"),
        QCoreApplication::translate("CLI", "Horizontal offset in percent of a tile, 0 - 100"),
        QStringLiteral("P")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("offset-y"),
        QCoreApplication::translate("CLI", "Vertical offset in percent of a tile, 0 - 100"),
        QStringLiteral("P")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("pan-x"),
        QCoreApplication::translate("CLI", "Horizontal pan in preview pixels"),
        QStringLiteral("X")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("pan-y"),
        QCoreApplication::translate("CLI", "Vertical pan in preview pixels"),
        QStringLiteral("Y")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("repeat"),
        QCoreApplication::translate("CLI", "Repeat type: full, half-drop, brick"),
        QStringLiteral("type")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("background"),
        QCoreApplication::translate("CLI", "Background: checker or #RRGGBB"),
        QStringLiteral("color")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("canvas"),
        QCoreApplication::translate("CLI", "Preview canvas size in pixels (default: 1200)"),
        QStringLiteral("N")));
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "PatternProof - Preview repeating patterns"));

    // Add standard help option (--help, -h)
    parser.addHelpOption();

    // Add version option (--version, -v)
    parser.addVersionOption();

    switch (cmd) {
        case Command::Export:
            parser.addPositionalArgument(
                QStringLiteral("pattern"),
                QCoreApplication::translate("CLI", "Pattern image file"),
                QStringLiteral("<pattern>"));

            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output image file"),
                QStringLiteral("path")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("size"),
                QCoreApplication::translate("CLI", "Export edge length in pixels, 1 - 10000 (default: canvas size)"),
                QStringLiteral("N")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("format"),
                QCoreApplication::translate("CLI", "png or jpg (default: from output extension)"),
                QStringLiteral("fmt")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing output file")));

            addStateOptions(parser);
            break;

        case Command::Render:
            parser.addPositionalArgument(
                QStringLiteral("pattern"),
                QCoreApplication::translate("CLI", "Pattern image file"),
                QStringLiteral("<pattern>"));

            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output image file (PNG)"),
                QStringLiteral("path")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("view"),
                QCoreApplication::translate("CLI", "View mode: tile, tile-grid, fabric or a mockup name"),
                QStringLiteral("mode")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("mockups"),
                QCoreApplication::translate("CLI", "Directory containing mockup textures"),
                QStringLiteral("dir")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("seamless"),
                QCoreApplication::translate("CLI", "Outline every tile in red")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("grid-inches"),
                QCoreApplication::translate("CLI", "Measurement grid spacing: 0, 1, 2, 6, 12"),
                QStringLiteral("N")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("mockup-zoom"),
                QCoreApplication::translate("CLI", "Mockup zoom in percent, 100 - 150"),
                QStringLiteral("P")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("mockup-rotate"),
                QCoreApplication::translate("CLI", "Mockup rotation in degrees"),
                QStringLiteral("deg")));

            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing output file")));

            addStateOptions(parser);
            break;

        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: patternproof [command] [options] <pattern>\n"
            "\n"
            "PatternProof - Preview repeating patterns as tiles, fabric and product mockups.\n"
            "\n"
            "COMMANDS:\n"
            "  export          Render a square export of the tiled pattern\n"
            "  render          Render one preview frame (view modes and overlays)\n"
            "  (no command)    Launch GUI application\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "QUICK START:\n"
            "  # 2400px PNG of a half-drop repeat\n"
            "  patternproof export flowers.png -o out.png --size 2400 --repeat half-drop\n"
            "\n"
            "  # Preview the pattern on a tote bag\n"
            "  patternproof render flowers.png -o tote.png --view tote --mockups ~/mockups\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Output written\n"
            "  2   Rendering or encoding failed\n"
            "  3   Invalid arguments\n"
            "  4   Could not read the pattern or write the output\n"
            "  5   Export interrupted (Ctrl+C)\n"
            "\n"
            "Run 'patternproof <command> --help' for command-specific options.\n");
    } else if (cmd == Command::Export) {
        out << QCoreApplication::translate("CLI",
            "Usage: patternproof export [OPTIONS] <pattern> -o <output>\n"
            "\n"
            "Export the tiled pattern as a square image with a transparent background.\n"
            "The export shows exactly what the preview canvas shows, at a larger size.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <pattern>               Pattern image file\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>     Output image file [required]\n"
            "  --size <N>              Edge length in pixels, 1 - 10000 (default: canvas size)\n"
            "  --format <fmt>          png or jpg (default: from output extension, else png)\n"
            "  --overwrite             Overwrite an existing output file\n"
            "\n"
            "STATE OPTIONS:\n"
            "  --settings <file>       Settings snapshot (JSON) applied first\n"
            "  --scale <S>             Pattern scale, 0.05 - 5.0 (default: auto-fit)\n"
            "  --zoom <Z>              View zoom, 0.01 - 8.0\n"
            "  --offset-x <P>          Horizontal offset, percent of a tile\n"
            "  --offset-y <P>          Vertical offset, percent of a tile\n"
            "  --pan-x <X>             Horizontal pan in preview pixels\n"
            "  --pan-y <Y>             Vertical pan in preview pixels\n"
            "  --repeat <type>         full, half-drop or brick\n"
            "  --background <color>    checker or #RRGGBB (preview only)\n"
            "  --canvas <N>            Preview canvas size (default: 1200)\n"
            "\n"
            "EXAMPLES:\n"
            "  patternproof export flowers.png -o flowers.jpg --size 3600 --scale 0.5\n"
            "  patternproof export flowers.png -o out.png --settings saved.json\n"
            "\n"
            "NOTE: JPEG exports are flattened onto white.\n");
    } else if (cmd == Command::Render) {
        out << QCoreApplication::translate("CLI",
            "Usage: patternproof render [OPTIONS] <pattern> -o <output>\n"
            "\n"
            "Render one preview frame at canvas size, background and overlays included.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <pattern>               Pattern image file\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>     Output image file [required]\n"
            "  --overwrite             Overwrite an existing output file\n"
            "\n"
            "VIEW OPTIONS:\n"
            "  --view <mode>           tile, tile-grid, fabric, phone, ipad, tote, bandana,\n"
            "                          bedspread, mug, bottle, sweatshirt (default: tile)\n"
            "  --mockups <dir>         Directory containing mockup textures\n"
            "  --mockup-zoom <P>       Mockup zoom in percent, 100 - 150\n"
            "  --mockup-rotate <deg>   Mockup rotation in degrees\n"
            "  --seamless              Outline every tile in red\n"
            "  --grid-inches <N>       Measurement grid: 0, 1, 2, 6 or 12 inches\n"
            "\n"
            "STATE OPTIONS:\n"
            "  Same as 'patternproof export --help'.\n"
            "\n"
            "EXAMPLES:\n"
            "  patternproof render flowers.png -o grid.png --view tile-grid --seamless\n"
            "  patternproof render flowers.png -o mug.png --view mug --mockups ./mockups\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "PatternProof " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Export:
            return handleExport(parser);
        case Command::Render:
            return handleRender(parser);
        default:
            // Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
