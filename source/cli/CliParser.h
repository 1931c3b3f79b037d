#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for headless PatternProof runs.
 *
 * When the first argument is a known command the application renders without
 * showing the GUI. Everything the control panel can set is also reachable
 * from the command line, or can be replayed from a saved settings snapshot.
 *
 * Supported commands:
 * - export: Render a square export of the tiled pattern (PNG or JPEG)
 * - render: Render one preview frame (any view mode, overlays included)
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command - launch GUI
    Help,           ///< Show help message
    Version,        ///< Show version information
    Export,         ///< Export the tiled pattern
    Render          ///< Render a preview frame
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Output written
    constexpr int RenderFailure = 2;  ///< Rendering or encoding failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
    constexpr int Cancelled = 5;      ///< Export interrupted (Ctrl+C)
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the application should run in CLI mode.
 *
 * Looks at the first argument only. Should be called before creating any Qt
 * application object, since CLI mode does not need a windowing platform.
 *
 * @param argc Argument count from main()
 * @param argv Argument vector from main()
 * @return true if a CLI command was detected, false for GUI mode
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command from argv[1].
 * @return The detected command, or Command::None for GUI mode
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string (e.g. "export").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 *
 * Both commands share the render state options (--scale, --zoom, ...).
 *
 * @param parser The parser to configure
 * @param cmd The command to set up options for
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help for a command.
 *
 * If cmd is Command::None or Command::Help, shows general help with the
 * available commands. Otherwise shows command-specific help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 *
 * Parses arguments, executes the requested command, and returns an exit code.
 *
 * @param app The QCoreApplication instance (a QGuiApplication for rendering)
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
