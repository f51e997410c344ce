#ifndef MIXEROPERATIONS_H
#define MIXEROPERATIONS_H

/**
 * @file MixerOperations.h
 * @brief Headless jobs: one function per user command.
 *
 * Every job runs the same pipeline:
 *   load (or convert) -> page operation -> sanitize -> write
 *
 * Each job creates its own MuPDF context, so jobs share no state and can
 * run on any thread. Parameters are validated before any file is touched.
 *
 * Output path handling:
 * - No output path: the default name is placed next to the (first) input
 * - Output path ending in .pdf (single output only): written to that file
 * - Otherwise the output path is a directory for default-named files
 *
 * Used by:
 * - CLI handlers
 * - JobQueueManager (background thread)
 */

#include "../core/OperationError.h"
#include "../core/PageTransforms.h"
#include "../pdf/ImageConverter.h"

#include <QList>
#include <QString>
#include <QStringList>

#include <atomic>
#include <functional>

namespace MixerOps {

// =============================================================================
// Commands
// =============================================================================

enum class Command {
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
 * @brief CLI name of a command ("merge", "interleave", ...).
 */
QString commandName(Command command);

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Status of a single output (or skipped input).
 */
enum class FileStatus {
    Success,        ///< Output written (or would be, in a dry run)
    Skipped,        ///< Not written: output exists, empty selection, unreadable input skipped
    Error           ///< Operation failed
};

/**
 * @brief Result for a single output file.
 */
struct FileResult {
    QString inputPath;              ///< Input the output was made from
    QString outputPath;             ///< Output file (empty if none was planned)
    FileStatus status = FileStatus::Error;
    OperationError error = OperationError::None;
    QString message;                ///< Error message, skip reason or note
    QStringList warnings;           ///< Partial selection notes
    qint64 outputSize = 0;          ///< Bytes written (0 if not created)
    int pagesWritten = 0;
    bool sanitized = false;         ///< Metadata pass completed without degradation
};

/**
 * @brief Summary result for a job.
 */
struct JobResult {
    Command command = Command::Merge;
    OperationError error = OperationError::None;    ///< Job-level failure
    QString errorMessage;
    QList<FileResult> results;      ///< Per-output results
    QStringList warnings;           ///< Job-level warnings
    int successCount = 0;
    int skippedCount = 0;
    int errorCount = 0;
    qint64 totalOutputSize = 0;
    qint64 elapsedMs = 0;
    bool cancelled = false;

    /// @brief Record a per-output result and update the counters.
    void add(const FileResult& result);

    /// @brief Mark the whole job failed.
    void fail(OperationError kind, const QString& message);

    bool hasErrors() const { return error != OperationError::None || errorCount > 0; }
    bool allSucceeded() const { return !hasErrors() && !cancelled && skippedCount == 0; }
    int totalCount() const { return successCount + skippedCount + errorCount; }
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Progress callback, called before each input or output is processed.
 *
 * @param current Current step (1-based)
 * @param total Total number of steps
 * @param currentFile File being processed
 * @param status Brief status message (e.g. "Loading...", "Writing...")
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

// =============================================================================
// Options
// =============================================================================

/**
 * @brief Where and how outputs are written.
 */
struct OutputOptions {
    QString outputPath;             ///< File (single output) or directory; empty for default
    bool overwrite = false;         ///< Replace existing output files
    bool dryRun = false;            ///< Report what would be written, write nothing
};

/**
 * @brief A complete job description (what the queue stores).
 */
struct JobSpec {
    Command command = Command::Merge;
    QStringList inputs;             ///< PDFs (A then B for interleave) or images
    QString pages;                  ///< Range text for extract/delete/rotate
    int degrees = 90;               ///< Rotation step
    PageOps::InterleaveSpec interleave;
    int pagesPerChunk = 10;         ///< Split size
    ImagePdfOptions imageOptions;
    bool skipInvalid = false;       ///< Merge: skip unreadable inputs instead of failing
    OutputOptions output;
};

// =============================================================================
// Jobs
// =============================================================================

/**
 * @brief Concatenate inputs into one document.
 *
 * With skipInvalid an unreadable input is recorded as Skipped and the merge
 * goes on; otherwise the first unreadable input fails the job with
 * InputError.
 */
JobResult merge(const QStringList& inputs, bool skipInvalid,
                const OutputOptions& output,
                ProgressCallback progress = nullptr,
                std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Interleave two inputs.
 */
JobResult interleave(const QString& inputA, const QString& inputB,
                     const PageOps::InterleaveSpec& spec,
                     const OutputOptions& output,
                     ProgressCallback progress = nullptr);

/**
 * @brief Extract the pages in a range, in range order, from each input.
 */
JobResult extract(const QStringList& inputs, const QString& pages,
                  const OutputOptions& output,
                  ProgressCallback progress = nullptr,
                  std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Remove the pages in a range from each input.
 */
JobResult deletePages(const QStringList& inputs, const QString& pages,
                      const OutputOptions& output,
                      ProgressCallback progress = nullptr,
                      std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Rotate the pages in a range (all pages if pages is empty).
 */
JobResult rotate(const QStringList& inputs, const QString& pages, int degrees,
                 const OutputOptions& output,
                 ProgressCallback progress = nullptr,
                 std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Reverse the page order of each input.
 */
JobResult reverse(const QStringList& inputs, const OutputOptions& output,
                  ProgressCallback progress = nullptr,
                  std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Split each input into chunks of pagesPerChunk pages.
 *
 * Outputs are named <base>_part_<first>-<last>.pdf in the output directory
 * (the input's directory by default). Cancellation is checked between
 * chunks.
 */
JobResult split(const QStringList& inputs, int pagesPerChunk,
                const OutputOptions& output,
                ProgressCallback progress = nullptr,
                std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Rotate every portrait page of each input to landscape.
 */
JobResult landscape(const QStringList& inputs, const OutputOptions& output,
                    ProgressCallback progress = nullptr,
                    std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Build one PDF with a page per image.
 */
JobResult images(const QStringList& imagePaths, const ImagePdfOptions& options,
                 const OutputOptions& output,
                 ProgressCallback progress = nullptr);

/**
 * @brief Run any job described by a JobSpec.
 */
JobResult run(const JobSpec& spec,
              ProgressCallback progress = nullptr,
              std::atomic<bool>* cancelled = nullptr);

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Default output file name for a command.
 *
 * Example: Extract + "/docs/report.pdf" -> "extract_report.pdf"
 * Merge, Interleave and Images ignore the input.
 */
QString defaultOutputName(Command command, const QString& inputPath = QString());

/**
 * @brief File name of one split chunk.
 * @param first 1-based first page of the chunk
 * @param last 1-based last page of the chunk
 */
QString splitChunkName(const QString& inputPath, int first, int last);

/**
 * @brief Final output path for a single output.
 * @param multipleOutputs True if the job writes more than one file
 */
QString resolveOutputPath(const QString& outputPath, const QString& defaultName,
                          const QString& inputPath, bool multipleOutputs);

/**
 * @brief Determine if output path names a single file (ends with extension).
 */
bool isSingleFileOutput(const QString& outputPath, const QString& extension);

} // namespace MixerOps

#endif // MIXEROPERATIONS_H
