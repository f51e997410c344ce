#include "MixerOperations.h"

#include "../core/PageRange.h"
#include "../pdf/MuPdfContext.h"
#include "../pdf/PdfSanitizer.h"
#include "../pdf/PdfSourceDocument.h"
#include "../pdf/PdfWriter.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QObject>

/**
 * @file MixerOperations.cpp
 * @brief Implementation of the per-command jobs.
 *
 * @see MixerOperations.h for API documentation
 */

namespace MixerOps {

using StreamTransform = std::function<PageOps::TransformResult(const PageStream&)>;

// =============================================================================
// Result bookkeeping
// =============================================================================

void JobResult::add(const FileResult& result)
{
    results.append(result);
    switch (result.status) {
        case FileStatus::Success:
            successCount++;
            totalOutputSize += result.outputSize;
            break;
        case FileStatus::Skipped:
            skippedCount++;
            break;
        case FileStatus::Error:
            errorCount++;
            break;
    }
}

void JobResult::fail(OperationError kind, const QString& message)
{
    error = kind;
    errorMessage = message;
    qWarning() << "[MixerOps]" << commandName(command) << "failed:" << message;
}

QString commandName(Command command)
{
    switch (command) {
        case Command::Merge:      return QStringLiteral("merge");
        case Command::Interleave: return QStringLiteral("interleave");
        case Command::Extract:    return QStringLiteral("extract");
        case Command::Delete:     return QStringLiteral("delete");
        case Command::Rotate:     return QStringLiteral("rotate");
        case Command::Reverse:    return QStringLiteral("reverse");
        case Command::Split:      return QStringLiteral("split");
        case Command::Landscape:  return QStringLiteral("landscape");
        case Command::Images:     return QStringLiteral("images");
    }
    return QString();
}

// =============================================================================
// Utility Functions
// =============================================================================

QString defaultOutputName(Command command, const QString& inputPath)
{
    const QString fileName = QFileInfo(inputPath).fileName();

    switch (command) {
        case Command::Merge:      return QStringLiteral("merged.pdf");
        case Command::Interleave: return QStringLiteral("interleaved.pdf");
        case Command::Images:     return QStringLiteral("images.pdf");
        case Command::Extract:    return "extract_" + fileName;
        case Command::Delete:     return "deleted_" + fileName;
        case Command::Rotate:     return "rotated_" + fileName;
        case Command::Reverse:    return "reversed_" + fileName;
        case Command::Landscape:  return "landscape_" + fileName;
        case Command::Split:      break;    // Named per chunk by splitChunkName()
    }
    return fileName;
}

QString splitChunkName(const QString& inputPath, int first, int last)
{
    return QStringLiteral("%1_part_%2-%3.pdf")
        .arg(QFileInfo(inputPath).completeBaseName())
        .arg(first)
        .arg(last);
}

bool isSingleFileOutput(const QString& outputPath, const QString& extension)
{
    if (outputPath.isEmpty()) {
        return false;
    }

    if (outputPath.endsWith('/') || outputPath.endsWith('\\')) {
        return false;
    }

    QFileInfo info(outputPath);
    if (info.exists() && info.isDir()) {
        return false;
    }

    return outputPath.endsWith(extension, Qt::CaseInsensitive);
}

QString resolveOutputPath(const QString& outputPath, const QString& defaultName,
                          const QString& inputPath, bool multipleOutputs)
{
    if (outputPath.isEmpty()) {
        const QString dir = inputPath.isEmpty() ? QDir::currentPath()
                                                : QFileInfo(inputPath).absolutePath();
        return QDir(dir).filePath(defaultName);
    }

    if (!multipleOutputs && isSingleFileOutput(outputPath, ".pdf")) {
        return outputPath;
    }

    return QDir(outputPath).filePath(defaultName);
}

// =============================================================================
// Pipeline steps
// =============================================================================

static bool isCancelled(std::atomic<bool>* cancelled)
{
    return cancelled && cancelled->load();
}

static std::shared_ptr<MuPdfContext> createContext(JobResult& result)
{
    std::shared_ptr<MuPdfContext> context = MuPdfContext::create();
    if (!context) {
        result.fail(OperationError::InputError, QObject::tr("Failed to initialize the PDF engine"));
    }
    return context;
}

static FileResult loadError(const QString& inputPath, const LoadResult& loaded)
{
    FileResult fr;
    fr.inputPath = inputPath;
    fr.status = FileStatus::Error;
    fr.error = loaded.error;
    fr.message = loaded.errorMessage;
    return fr;
}

/**
 * @brief Sanitize and write one stream, honouring overwrite and dry-run.
 *
 * An empty stream is skipped. A degraded sanitize still writes the pages
 * and records the reason as a warning.
 */
static FileResult writeOutput(const std::shared_ptr<MuPdfContext>& context,
                              const PageStream& stream,
                              const QString& inputPath,
                              const QString& outputPath,
                              const OutputOptions& options,
                              const QStringList& warnings)
{
    FileResult fr;
    fr.inputPath = inputPath;
    fr.outputPath = outputPath;
    fr.warnings = warnings;

    if (stream.isEmpty()) {
        fr.status = FileStatus::Skipped;
        fr.message = QObject::tr("No pages to write, nothing written");
        return fr;
    }

    if (QFile::exists(outputPath) && !options.overwrite) {
        fr.status = FileStatus::Skipped;
        fr.message = QObject::tr("Output file already exists");
        return fr;
    }

    if (options.dryRun) {
        fr.status = FileStatus::Success;
        fr.pagesWritten = stream.size();
        fr.message = QObject::tr("Would write %1 page(s) to: %2").arg(stream.size()).arg(outputPath);
        return fr;
    }

    SanitizeResult clean = PdfSanitizer::sanitize(context, stream);
    if (clean.degraded) {
        fr.warnings << clean.message;
    }

    PdfWriteResult written = PdfWriter::write(context, clean.stream, outputPath);
    if (!written.success) {
        fr.status = FileStatus::Error;
        fr.message = written.errorMessage;
        return fr;
    }

    fr.status = FileStatus::Success;
    fr.outputSize = written.fileSizeBytes;
    fr.pagesWritten = written.pagesWritten;
    fr.sanitized = !clean.degraded;

    qDebug() << "[MixerOps] Wrote" << fr.pagesWritten << "pages to" << outputPath
             << (fr.sanitized ? "" : "(metadata pass degraded)");
    return fr;
}

/**
 * @brief Load -> transform -> write for each input independently.
 */
static JobResult runPerFile(Command command, const QStringList& inputs,
                            const OutputOptions& output,
                            const StreamTransform& transform,
                            ProgressCallback progress,
                            std::atomic<bool>* cancelled)
{
    JobResult result;
    result.command = command;
    QElapsedTimer timer;
    timer.start();

    if (inputs.isEmpty()) {
        result.fail(OperationError::ValidationError, QObject::tr("No input files"));
        return result;
    }

    const bool multiple = inputs.size() > 1;
    if (multiple && isSingleFileOutput(output.outputPath, ".pdf")) {
        result.fail(OperationError::ValidationError,
                    QObject::tr("Output must be a directory when processing several inputs"));
        return result;
    }

    std::shared_ptr<MuPdfContext> context = createContext(result);
    if (!context) {
        return result;
    }

    const int total = inputs.size();
    for (int i = 0; i < total; ++i) {
        const QString& input = inputs.at(i);

        if (isCancelled(cancelled)) {
            result.cancelled = true;
            break;
        }

        if (progress) {
            progress(i + 1, total, input, QObject::tr("Processing..."));
        }

        LoadResult loaded = PdfSourceDocument::open(context, input);
        if (!loaded.success) {
            result.add(loadError(input, loaded));
            continue;
        }

        PageOps::TransformResult transformed = transform(loaded.stream);
        if (!transformed.success) {
            FileResult fr;
            fr.inputPath = input;
            fr.status = FileStatus::Error;
            fr.error = transformed.error;
            fr.message = transformed.errorMessage;
            result.add(fr);
            continue;
        }

        const QString outputPath = resolveOutputPath(output.outputPath,
                                                     defaultOutputName(command, input),
                                                     input, multiple);
        result.add(writeOutput(context, transformed.stream(), input, outputPath,
                               output, transformed.warnings));
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

// =============================================================================
// Jobs
// =============================================================================

JobResult merge(const QStringList& inputs, bool skipInvalid,
                const OutputOptions& output,
                ProgressCallback progress,
                std::atomic<bool>* cancelled)
{
    JobResult result;
    result.command = Command::Merge;
    QElapsedTimer timer;
    timer.start();

    if (inputs.isEmpty()) {
        result.fail(OperationError::ValidationError, QObject::tr("Merge needs at least one input document"));
        return result;
    }

    std::shared_ptr<MuPdfContext> context = createContext(result);
    if (!context) {
        return result;
    }

    QVector<PageStream> streams;
    const int total = inputs.size();
    for (int i = 0; i < total; ++i) {
        const QString& input = inputs.at(i);

        if (isCancelled(cancelled)) {
            result.cancelled = true;
            result.elapsedMs = timer.elapsed();
            return result;
        }

        if (progress) {
            progress(i + 1, total, input, QObject::tr("Loading..."));
        }

        LoadResult loaded = PdfSourceDocument::open(context, input);
        if (!loaded.success) {
            if (!skipInvalid) {
                result.fail(OperationError::InputError, loaded.errorMessage);
                result.elapsedMs = timer.elapsed();
                return result;
            }
            FileResult fr = loadError(input, loaded);
            fr.status = FileStatus::Skipped;
            result.add(fr);
            result.warnings << QObject::tr("Skipped unreadable input: %1").arg(loaded.errorMessage);
            continue;
        }

        streams.append(loaded.stream);
    }

    if (streams.isEmpty()) {
        result.fail(OperationError::InputError, QObject::tr("No readable input documents"));
        result.elapsedMs = timer.elapsed();
        return result;
    }

    PageOps::TransformResult merged = PageOps::merge(streams);
    if (!merged.success) {
        result.fail(merged.error, merged.errorMessage);
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QString outputPath = resolveOutputPath(output.outputPath,
                                                 defaultOutputName(Command::Merge),
                                                 inputs.first(), false);
    if (progress) {
        progress(total, total, outputPath, QObject::tr("Writing..."));
    }
    result.add(writeOutput(context, merged.stream(), inputs.first(), outputPath,
                           output, merged.warnings));

    result.elapsedMs = timer.elapsed();
    return result;
}

JobResult interleave(const QString& inputA, const QString& inputB,
                     const PageOps::InterleaveSpec& spec,
                     const OutputOptions& output,
                     ProgressCallback progress)
{
    JobResult result;
    result.command = Command::Interleave;
    QElapsedTimer timer;
    timer.start();

    if (spec.startFrom < 1) {
        result.fail(OperationError::ValidationError,
                    QObject::tr("Interleave start position must be at least 1 (got %1)")
                    .arg(spec.startFrom));
        return result;
    }

    std::shared_ptr<MuPdfContext> context = createContext(result);
    if (!context) {
        return result;
    }

    const QStringList inputs{inputA, inputB};
    QVector<PageStream> streams;
    for (int i = 0; i < inputs.size(); ++i) {
        if (progress) {
            progress(i + 1, inputs.size(), inputs.at(i), QObject::tr("Loading..."));
        }

        LoadResult loaded = PdfSourceDocument::open(context, inputs.at(i));
        if (!loaded.success) {
            result.fail(OperationError::InputError, loaded.errorMessage);
            result.elapsedMs = timer.elapsed();
            return result;
        }
        streams.append(loaded.stream);
    }

    PageOps::TransformResult mixed = PageOps::interleave(streams.at(0), streams.at(1), spec);
    if (!mixed.success) {
        result.fail(mixed.error, mixed.errorMessage);
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QString outputPath = resolveOutputPath(output.outputPath,
                                                 defaultOutputName(Command::Interleave),
                                                 inputA, false);
    result.add(writeOutput(context, mixed.stream(), inputA, outputPath, output, mixed.warnings));

    result.elapsedMs = timer.elapsed();
    return result;
}

JobResult extract(const QStringList& inputs, const QString& pages,
                  const OutputOptions& output,
                  ProgressCallback progress,
                  std::atomic<bool>* cancelled)
{
    StreamTransform transform = [&pages](const PageStream& source) {
        return PageOps::extract(source, PageRange::parse(pages, source.size()));
    };
    return runPerFile(Command::Extract, inputs, output, transform, progress, cancelled);
}

JobResult deletePages(const QStringList& inputs, const QString& pages,
                      const OutputOptions& output,
                      ProgressCallback progress,
                      std::atomic<bool>* cancelled)
{
    StreamTransform transform = [&pages](const PageStream& source) {
        const QSet<int> selected = PageRange::parseSet(pages, source.size());
        if (selected.isEmpty()) {
            // No stream: writeOutput skips the input instead of copying it unchanged
            PageOps::TransformResult nothing;
            nothing.success = true;
            nothing.warnings << QObject::tr("No pages matched the deletion range");
            return nothing;
        }
        return PageOps::remove(source, selected);
    };
    return runPerFile(Command::Delete, inputs, output, transform, progress, cancelled);
}

JobResult rotate(const QStringList& inputs, const QString& pages, int degrees,
                 const OutputOptions& output,
                 ProgressCallback progress,
                 std::atomic<bool>* cancelled)
{
    if (degrees % 90 != 0 || Page::normalizeRotation(degrees) == 0) {
        JobResult result;
        result.command = Command::Rotate;
        result.fail(OperationError::ValidationError,
                    QObject::tr("Rotation must be 90, 180 or 270 degrees (got %1)").arg(degrees));
        return result;
    }

    const bool allPages = pages.trimmed().isEmpty();
    StreamTransform transform = [&pages, degrees, allPages](const PageStream& source) {
        if (allPages) {
            return PageOps::rotate(source, degrees);
        }
        return PageOps::rotate(source, PageRange::parseSet(pages, source.size()), degrees);
    };
    return runPerFile(Command::Rotate, inputs, output, transform, progress, cancelled);
}

JobResult reverse(const QStringList& inputs, const OutputOptions& output,
                  ProgressCallback progress,
                  std::atomic<bool>* cancelled)
{
    return runPerFile(Command::Reverse, inputs, output, &PageOps::reverse, progress, cancelled);
}

JobResult landscape(const QStringList& inputs, const OutputOptions& output,
                    ProgressCallback progress,
                    std::atomic<bool>* cancelled)
{
    return runPerFile(Command::Landscape, inputs, output, &PageOps::autoLandscape,
                      progress, cancelled);
}

JobResult split(const QStringList& inputs, int pagesPerChunk,
                const OutputOptions& output,
                ProgressCallback progress,
                std::atomic<bool>* cancelled)
{
    JobResult result;
    result.command = Command::Split;
    QElapsedTimer timer;
    timer.start();

    if (pagesPerChunk <= 0) {
        result.fail(OperationError::ValidationError,
                    QObject::tr("Split size must be a positive number of pages (got %1)")
                    .arg(pagesPerChunk));
        return result;
    }
    if (inputs.isEmpty()) {
        result.fail(OperationError::ValidationError, QObject::tr("No input files"));
        return result;
    }

    std::shared_ptr<MuPdfContext> context = createContext(result);
    if (!context) {
        return result;
    }

    for (int i = 0; i < inputs.size() && !result.cancelled; ++i) {
        const QString& input = inputs.at(i);

        if (isCancelled(cancelled)) {
            result.cancelled = true;
            break;
        }

        LoadResult loaded = PdfSourceDocument::open(context, input);
        if (!loaded.success) {
            result.add(loadError(input, loaded));
            continue;
        }

        PageOps::TransformResult chunks = PageOps::split(loaded.stream, pagesPerChunk);
        if (!chunks.success) {
            result.fail(chunks.error, chunks.errorMessage);
            break;
        }
        result.warnings += chunks.warnings;

        int first = 1;
        const int total = chunks.streams.size();
        for (int c = 0; c < total; ++c) {
            if (isCancelled(cancelled)) {
                result.cancelled = true;
                break;
            }

            const PageStream& chunk = chunks.streams.at(c);
            const int last = first + chunk.size() - 1;
            const QString outputPath = resolveOutputPath(output.outputPath,
                                                         splitChunkName(input, first, last),
                                                         input, true);
            if (progress) {
                progress(c + 1, total, outputPath, QObject::tr("Writing..."));
            }

            result.add(writeOutput(context, chunk, input, outputPath, output, QStringList()));
            first = last + 1;
        }
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

JobResult images(const QStringList& imagePaths, const ImagePdfOptions& options,
                 const OutputOptions& output,
                 ProgressCallback progress)
{
    JobResult result;
    result.command = Command::Images;
    QElapsedTimer timer;
    timer.start();

    if (imagePaths.isEmpty()) {
        result.fail(OperationError::ValidationError, QObject::tr("No images selected"));
        return result;
    }

    std::shared_ptr<MuPdfContext> context = createContext(result);
    if (!context) {
        return result;
    }

    if (progress) {
        progress(1, 1, imagePaths.first(), QObject::tr("Converting..."));
    }

    ImageConverter converter(options);
    LoadResult converted = converter.convertImages(context, imagePaths);
    if (!converted.success) {
        result.fail(converted.error, converted.errorMessage);
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const QString outputPath = resolveOutputPath(output.outputPath,
                                                 defaultOutputName(Command::Images),
                                                 imagePaths.first(), false);
    result.add(writeOutput(context, converted.stream, imagePaths.first(), outputPath,
                           output, QStringList()));

    result.elapsedMs = timer.elapsed();
    return result;
}

JobResult run(const JobSpec& spec, ProgressCallback progress, std::atomic<bool>* cancelled)
{
    switch (spec.command) {
        case Command::Merge:
            return merge(spec.inputs, spec.skipInvalid, spec.output, progress, cancelled);
        case Command::Interleave:
            if (spec.inputs.size() != 2) {
                JobResult result;
                result.command = Command::Interleave;
                result.fail(OperationError::ValidationError,
                            QObject::tr("Interleave needs exactly two inputs (got %1)")
                            .arg(spec.inputs.size()));
                return result;
            }
            return interleave(spec.inputs.at(0), spec.inputs.at(1), spec.interleave,
                              spec.output, progress);
        case Command::Extract:
            return extract(spec.inputs, spec.pages, spec.output, progress, cancelled);
        case Command::Delete:
            return deletePages(spec.inputs, spec.pages, spec.output, progress, cancelled);
        case Command::Rotate:
            return rotate(spec.inputs, spec.pages, spec.degrees, spec.output, progress, cancelled);
        case Command::Reverse:
            return reverse(spec.inputs, spec.output, progress, cancelled);
        case Command::Split:
            return split(spec.inputs, spec.pagesPerChunk, spec.output, progress, cancelled);
        case Command::Landscape:
            return landscape(spec.inputs, spec.output, progress, cancelled);
        case Command::Images:
            return images(spec.inputs, spec.imageOptions, spec.output, progress);
    }

    JobResult result;
    result.fail(OperationError::ValidationError, QObject::tr("Unknown command"));
    return result;
}

} // namespace MixerOps
