#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for PdfMixer jobs.
 *
 * The first Ctrl+C (SIGINT/SIGTERM, or CTRL_C_EVENT on Windows) sets a
 * cancellation flag. Jobs check it between outputs, so the output being
 * written is finished and the results so far are reported.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Install the Ctrl+C handlers. Call once, before running a job.
 */
void installSignalHandlers();

/**
 * @brief Flag set by the handlers; pass it to MixerOps jobs (never null).
 */
std::atomic<bool>* getCancellationFlag();

/**
 * @brief Set the flag as the handlers do.
 */
void requestCancellation();

bool wasCancelled();

/**
 * @brief Clear the flag before running another job in the same process.
 */
void resetCancellation();

} // namespace Cli

#endif // CLISIGNAL_H
