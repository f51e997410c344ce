#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for PdfMixer.
 *
 * The first argument selects the command; QCommandLineParser handles the
 * options of that command.
 *
 * Supported commands:
 * - merge:      Concatenate PDFs (files or directories)
 * - interleave: Combine two PDFs page by page
 * - extract:    Keep the pages in a range, in range order
 * - delete:     Remove the pages in a range
 * - rotate:     Rotate all pages or the pages in a range
 * - reverse:    Reverse the page order
 * - split:      Split into chunks of N pages
 * - landscape:  Rotate portrait pages to landscape
 * - images:     Build a PDF from images
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
    None,           ///< No or unknown command
    Help,           ///< Show help message
    Version,        ///< Show version information
    Merge,
    Interleave,
    Extract,
    Delete,
    Rotate,
    Reverse,
    Split,
    Landscape,
    Images
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per output (default)
    Verbose,        ///< Detailed per-output info and debug logging
    Json            ///< One JSON object per line for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< All outputs written
    constexpr int PartialFailure = 1; ///< Some outputs skipped or failed
    constexpr int TotalFailure = 2;   ///< Nothing could be written
    constexpr int InvalidArgs = 3;    ///< Bad arguments or invalid operation parameters
    constexpr int InputError = 4;     ///< Missing, unreadable or malformed input
    constexpr int Cancelled = 5;      ///< Operation cancelled (Ctrl+C)
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from argv[1].
 * @return The detected command, or Command::None if absent or unknown
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Command name as typed on the command line (e.g. "merge").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 *
 * Adds the common options (output, overwrite, dry-run, verbose, json) and
 * the command's own options and positional arguments.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show general help (Command::None/Help) or command-specific help.
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
 * @brief Parse arguments, run the requested command and return an exit code.
 *
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
