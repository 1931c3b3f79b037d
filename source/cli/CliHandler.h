#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for headless rendering.
 *
 * Provides handler functions for each CLI command:
 * - export: Square transparent export of the tiled pattern
 * - render: One preview frame at canvas size
 *
 * Each handler loads the pattern, builds a PatternSession from the state
 * options, renders, writes the output file and reports the result.
 */

#include "CliParser.h"

#include <QCommandLineParser>
#include <QString>

class PatternSession;

namespace Cli {

/**
 * @brief Handle the export command.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleExport(const QCommandLineParser& parser);

/**
 * @brief Handle the render command.
 *
 * Parses view options (--view, --mockups, --seamless, --grid-inches, ...)
 * on top of the state options.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleRender(const QCommandLineParser& parser);

/**
 * @brief Apply the state options shared by both commands to a session.
 *
 * Order: --settings snapshot first, then each individual option, so a
 * command-line value overrides the snapshot. Values are clamped by the
 * session setters; only unparseable values are errors.
 *
 * The pattern must already be set, since loading one auto-fits the scale.
 *
 * @param error Receives a user-facing message on failure (may be null)
 * @return false on a malformed value or unreadable snapshot
 */
bool applyStateOptions(const QCommandLineParser& parser, PatternSession& session,
                       QString* error = nullptr);

/**
 * @brief Apply the render-only view options (--view, --seamless, ...).
 * @return false on a malformed value
 */
bool applyViewOptions(const QCommandLineParser& parser, PatternSession& session,
                      QString* error = nullptr);

} // namespace Cli

#endif // CLIHANDLER_H
