#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console reporting for PdfMixer jobs.
 *
 * Three output modes:
 * - Simple: One line per output (`[1/3] report.pdf... OK (4 pages)`)
 * - Verbose: Input, output, status and warnings per output
 * - JSON: One object per line, for scripting
 */

#include "CliParser.h"
#include "../batch/MixerOperations.h"

#include <QTextStream>

namespace Cli {

/**
 * @brief Progress and result reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   auto result = MixerOps::run(spec, progress.callback(), getCancellationFlag());
 *   progress.reportJob(result);
 * @endcode
 */
class ConsoleProgress {
public:
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Callback for MixerOps jobs.
     *
     * Only Verbose mode prints the step updates; Simple mode prints its
     * single line per output from reportFile().
     */
    MixerOps::ProgressCallback callback();

    /**
     * @brief Report one output result.
     */
    void reportFile(const MixerOps::FileResult& result);
    void reportFile(int index, int total, const MixerOps::FileResult& result);

    /**
     * @brief Report every output of a job, its warnings and the summary.
     *
     * A job-level failure (validation or unreadable input) is reported as an
     * error instead of a summary.
     */
    void reportJob(const MixerOps::JobResult& result, bool dryRun);

    /**
     * @brief Report the final job summary.
     */
    void reportSummary(const MixerOps::JobResult& result, bool dryRun);

    /**
     * @brief Report an error on stderr (a JSON object in JSON mode).
     */
    void reportError(const QString& message);

    /**
     * @brief Report a warning on stderr (a JSON object in JSON mode).
     */
    void reportWarning(const QString& message);

    OutputMode mode() const { return m_mode; }

private:
    void reportFileSimple(const MixerOps::FileResult& result);
    void reportFileVerbose(const MixerOps::FileResult& result);
    void reportFileJson(const MixerOps::FileResult& result);

    void reportSummaryText(const MixerOps::JobResult& result, bool dryRun);
    void reportSummaryJson(const MixerOps::JobResult& result, bool dryRun);

    // "1.5 MB"
    static QString formatSize(qint64 bytes);

    // "1.5 s" or "125 ms"
    static QString formatDuration(qint64 ms);

    static QString shortName(const QString& path);
    static QString statusString(MixerOps::FileStatus status);
    static QString jsonEscape(const QString& str);
    static QString jsonStringArray(const QStringList& values);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
    int m_currentIndex = 0; ///< Index of the output being reported
    int m_totalCount = 0;   ///< Number of outputs in the job
};

} // namespace Cli

#endif // CLIPROGRESS_H
