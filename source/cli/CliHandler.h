#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the PdfMixer CLI.
 *
 * Each handler reads its command's options on top of the stored defaults
 * (MixerSettings), expands the input arguments, runs the job and reports
 * the results. Bad option values are rejected before any file is read.
 */

#include "CliParser.h"
#include "../batch/MixerOperations.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief merge: concatenate files and directories in argument order.
 */
int handleMerge(const QCommandLineParser& parser);

/**
 * @brief interleave: exactly two inputs, --mode and --start.
 */
int handleInterleave(const QCommandLineParser& parser);

/**
 * @brief extract and delete: --pages is required.
 */
int handleRangeCommand(const QCommandLineParser& parser, Command cmd);

/**
 * @brief rotate: --degrees (stored default if absent), optional --pages.
 */
int handleRotate(const QCommandLineParser& parser);

/**
 * @brief reverse and landscape: no command-specific options.
 */
int handleSimpleCommand(const QCommandLineParser& parser, Command cmd);

/**
 * @brief split: --every (stored default if absent).
 */
int handleSplit(const QCommandLineParser& parser);

/**
 * @brief images: image files and directories into one PDF.
 */
int handleImages(const QCommandLineParser& parser);

/**
 * @brief Output mode from --json / --verbose. --json wins.
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Map a job result to an exit code.
 *
 * - Cancelled → Cancelled (5)
 * - Job failed validation → InvalidArgs (3)
 * - Job failed on an input → InputError (4)
 * - Every output written → Success (0)
 * - Nothing written, every error an input error → InputError (4)
 * - Nothing written (or nothing to do) → TotalFailure (2)
 * - Otherwise (skips, some errors) → PartialFailure (1)
 */
int exitCodeFromResult(const MixerOps::JobResult& result);

} // namespace Cli

#endif // CLIHANDLER_H
