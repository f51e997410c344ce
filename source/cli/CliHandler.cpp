#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../batch/InputDiscovery.h"
#include "../core/MixerSettings.h"
#include "../core/PageStream.h"
#include "../pdf/ImageConverter.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

/**
 * @file CliHandler.cpp
 * @brief Implementation of the CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const MixerOps::JobResult& result)
{
    if (result.cancelled) {
        return ExitCode::Cancelled;
    }

    switch (result.error) {
        case OperationError::ValidationError:
            return ExitCode::InvalidArgs;
        case OperationError::InputError:
            return ExitCode::InputError;
        case OperationError::None:
            break;
    }

    if (result.totalCount() == 0) {
        return ExitCode::TotalFailure;
    }
    if (result.allSucceeded()) {
        return ExitCode::Success;
    }
    if (result.successCount == 0 && result.skippedCount == 0) {
        for (const MixerOps::FileResult& file : result.results) {
            if (file.error != OperationError::InputError) {
                return ExitCode::TotalFailure;
            }
        }
        return ExitCode::InputError;
    }
    return ExitCode::PartialFailure;
}

static QString absolutePath(const QString& path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

static MixerOps::OutputOptions outputOptions(const QCommandLineParser& parser,
                                             const MixerSettings& settings)
{
    MixerOps::OutputOptions output;

    const QString outputPath = parser.value(QStringLiteral("output"));
    if (!outputPath.isEmpty()) {
        // Keep a trailing separator: "out.pdf/" names a directory
        const bool directory = outputPath.endsWith('/') || outputPath.endsWith('\\');
        output.outputPath = absolutePath(outputPath);
        if (directory) {
            output.outputPath += QLatin1Char('/');
        }
    }

    output.overwrite = settings.overwrite || parser.isSet(QStringLiteral("overwrite"));
    output.dryRun = parser.isSet(QStringLiteral("dry-run"));
    return output;
}

/**
 * @brief Read an integer option.
 * @return false (and an error reported) if the option is set but not a number
 */
static bool intOption(const QCommandLineParser& parser, const QString& name,
                      ConsoleProgress& progress, int* value)
{
    if (!parser.isSet(name)) {
        return true;
    }

    bool ok = false;
    const int parsed = parser.value(name).trimmed().toInt(&ok);
    if (!ok) {
        progress.reportError(QCoreApplication::translate("CLI",
            "--%1 expects a whole number, got '%2'").arg(name, parser.value(name)));
        return false;
    }
    *value = parsed;
    return true;
}

/**
 * @brief Check the discovered inputs.
 * @return An exit code if the command must stop, -1 to go on
 */
static int checkInputs(const MixerOps::DiscoveryResult& found, bool skipInvalid,
                       const QString& kind, ConsoleProgress& progress)
{
    for (const QString& missing : found.missing) {
        if (!skipInvalid) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Input not found: %1").arg(missing));
            return ExitCode::InputError;
        }
        progress.reportWarning(QCoreApplication::translate("CLI",
            "Skipping missing input: %1").arg(missing));
    }

    if (found.files.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No %1 found in the specified paths.").arg(kind));
        return found.missing.isEmpty() ? ExitCode::InvalidArgs : ExitCode::InputError;
    }
    return -1;
}

static bool requireInputs(const QCommandLineParser& parser, Command cmd,
                          ConsoleProgress& progress)
{
    if (!parser.positionalArguments().isEmpty()) {
        return true;
    }
    progress.reportError(QCoreApplication::translate("CLI",
        "No input files specified. Use 'pdfmixer %1 --help' for usage.")
        .arg(commandName(cmd)));
    return false;
}

static void saveDefaults(const QCommandLineParser& parser, const MixerSettings& settings,
                         const MixerOps::OutputOptions& output)
{
    if (!parser.isSet(QStringLiteral("save-defaults")) || output.dryRun) {
        return;
    }
    settings.save();
    qDebug() << "[CLI] Saved defaults";
}

static int runJob(const MixerOps::JobSpec& spec, ConsoleProgress& progress)
{
    MixerOps::JobResult result = MixerOps::run(spec, progress.callback(), getCancellationFlag());
    progress.reportJob(result, spec.output.dryRun);

    if (wasCancelled()) {
        return ExitCode::Cancelled;
    }
    return exitCodeFromResult(result);
}

static MixerOps::Command jobCommand(Command cmd)
{
    switch (cmd) {
        case Command::Merge:      return MixerOps::Command::Merge;
        case Command::Interleave: return MixerOps::Command::Interleave;
        case Command::Extract:    return MixerOps::Command::Extract;
        case Command::Delete:     return MixerOps::Command::Delete;
        case Command::Rotate:     return MixerOps::Command::Rotate;
        case Command::Reverse:    return MixerOps::Command::Reverse;
        case Command::Split:      return MixerOps::Command::Split;
        case Command::Landscape:  return MixerOps::Command::Landscape;
        case Command::Images:     return MixerOps::Command::Images;
        default:                  break;
    }
    return MixerOps::Command::Merge;
}

/**
 * @brief Shared body of the per-file commands (extract ... landscape).
 */
static int runPerFileCommand(const QCommandLineParser& parser, Command cmd,
                             MixerOps::JobSpec spec, const MixerSettings& settings,
                             ConsoleProgress& progress)
{
    MixerOps::DiscoveryResult found = MixerOps::collectPdfs(parser.positionalArguments());
    int stop = checkInputs(found, false, QCoreApplication::translate("CLI", "PDF files"), progress);
    if (stop >= 0) {
        return stop;
    }

    spec.command = jobCommand(cmd);
    spec.inputs = found.files;
    spec.output = outputOptions(parser, settings);
    saveDefaults(parser, settings, spec.output);
    return runJob(spec, progress);
}

// =============================================================================
// merge
// =============================================================================

int handleMerge(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, Command::Merge, progress)) {
        return ExitCode::InvalidArgs;
    }

    const MixerSettings settings = MixerSettings::load();
    const bool skipInvalid = parser.isSet(QStringLiteral("skip-invalid"));

    MixerOps::DiscoveryResult found = MixerOps::collectPdfs(
        parser.positionalArguments(), parser.isSet(QStringLiteral("recursive")));
    int stop = checkInputs(found, skipInvalid, QCoreApplication::translate("CLI", "PDF files"), progress);
    if (stop >= 0) {
        return stop;
    }

    MixerOps::JobSpec spec;
    spec.command = MixerOps::Command::Merge;
    spec.inputs = found.files;
    spec.skipInvalid = skipInvalid;
    spec.output = outputOptions(parser, settings);
    return runJob(spec, progress);
}

// =============================================================================
// interleave
// =============================================================================

int handleInterleave(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));

    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 2) {
        progress.reportError(QCoreApplication::translate("CLI",
            "interleave needs exactly two input files (got %1).").arg(inputs.size()));
        return ExitCode::InvalidArgs;
    }

    MixerSettings settings = MixerSettings::load();

    MixerOps::JobSpec spec;
    spec.command = MixerOps::Command::Interleave;

    QString modeName = settings.interleaveMode;
    if (parser.isSet(QStringLiteral("mode"))) {
        modeName = parser.value(QStringLiteral("mode"));
    }
    bool modeOk = false;
    spec.interleave.mode = PageOps::interleaveModeFromName(modeName, &modeOk);
    if (!modeOk) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Unknown interleave mode '%1'. Use alternate, a-odd-b-even, a-even-b-odd, a-odd or b-even.")
            .arg(modeName));
        return ExitCode::InvalidArgs;
    }
    settings.interleaveMode = PageOps::interleaveModeName(spec.interleave.mode);

    if (!intOption(parser, QStringLiteral("start"), progress, &spec.interleave.startFrom)) {
        return ExitCode::InvalidArgs;
    }

    for (const QString& input : inputs) {
        if (QFileInfo(input).isDir()) {
            progress.reportError(QCoreApplication::translate("CLI",
                "interleave takes two PDF files, not a directory: %1").arg(input));
            return ExitCode::InvalidArgs;
        }
        spec.inputs << absolutePath(input);
    }

    spec.output = outputOptions(parser, settings);
    saveDefaults(parser, settings, spec.output);
    return runJob(spec, progress);
}

// =============================================================================
// extract / delete
// =============================================================================

int handleRangeCommand(const QCommandLineParser& parser, Command cmd)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, cmd, progress)) {
        return ExitCode::InvalidArgs;
    }

    const QString pages = parser.value(QStringLiteral("pages"));
    if (pages.trimmed().isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "%1 needs a page range, e.g. --pages \"1-3,5\".").arg(commandName(cmd)));
        return ExitCode::InvalidArgs;
    }

    MixerOps::JobSpec spec;
    spec.pages = pages;
    return runPerFileCommand(parser, cmd, spec, MixerSettings::load(), progress);
}

// =============================================================================
// rotate
// =============================================================================

int handleRotate(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, Command::Rotate, progress)) {
        return ExitCode::InvalidArgs;
    }

    MixerSettings settings = MixerSettings::load();

    MixerOps::JobSpec spec;
    spec.degrees = settings.rotateDegrees;
    if (!intOption(parser, QStringLiteral("degrees"), progress, &spec.degrees)) {
        return ExitCode::InvalidArgs;
    }
    if (spec.degrees % 90 != 0 || Page::normalizeRotation(spec.degrees) == 0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "--degrees must be a quarter turn: 90, 180 or 270 (got %1).").arg(spec.degrees));
        return ExitCode::InvalidArgs;
    }
    spec.pages = parser.value(QStringLiteral("pages"));
    settings.rotateDegrees = Page::normalizeRotation(spec.degrees);
    return runPerFileCommand(parser, Command::Rotate, spec, settings, progress);
}

// =============================================================================
// reverse / landscape
// =============================================================================

int handleSimpleCommand(const QCommandLineParser& parser, Command cmd)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, cmd, progress)) {
        return ExitCode::InvalidArgs;
    }

    return runPerFileCommand(parser, cmd, MixerOps::JobSpec(), MixerSettings::load(), progress);
}

// =============================================================================
// split
// =============================================================================

int handleSplit(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, Command::Split, progress)) {
        return ExitCode::InvalidArgs;
    }

    MixerSettings settings = MixerSettings::load();

    MixerOps::JobSpec spec;
    spec.pagesPerChunk = settings.splitSize;
    if (!intOption(parser, QStringLiteral("every"), progress, &spec.pagesPerChunk)) {
        return ExitCode::InvalidArgs;
    }
    if (spec.pagesPerChunk <= 0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "--every must be at least 1 (got %1).").arg(spec.pagesPerChunk));
        return ExitCode::InvalidArgs;
    }
    settings.splitSize = spec.pagesPerChunk;

    return runPerFileCommand(parser, Command::Split, spec, settings, progress);
}

// =============================================================================
// images
// =============================================================================

int handleImages(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));
    if (!requireInputs(parser, Command::Images, progress)) {
        return ExitCode::InvalidArgs;
    }

    MixerSettings settings = MixerSettings::load();

    if (parser.isSet(QStringLiteral("page-size"))) {
        bool known = false;
        const QString requested = parser.value(QStringLiteral("page-size"));
        ImageConverter::paperSize(requested, &known);
        if (!known) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Unknown page size '%1'. Use A4, A3, Letter or Legal.").arg(requested));
            return ExitCode::InvalidArgs;
        }
        settings.pageSize = requested;
    }

    if (parser.isSet(QStringLiteral("margin"))) {
        bool ok = false;
        const double margin = parser.value(QStringLiteral("margin")).toDouble(&ok);
        if (!ok || margin < 0.0 || margin > MixerSettings::MAX_MARGIN_MM) {
            progress.reportError(QCoreApplication::translate("CLI",
                "--margin must be between 0 and %1 mm.").arg(MixerSettings::MAX_MARGIN_MM));
            return ExitCode::InvalidArgs;
        }
        settings.marginMm = margin;
    }

    if (!intOption(parser, QStringLiteral("dpi"), progress, &settings.dpi)) {
        return ExitCode::InvalidArgs;
    }
    if (settings.dpi < MixerSettings::MIN_DPI || settings.dpi > MixerSettings::MAX_DPI) {
        progress.reportError(QCoreApplication::translate("CLI",
            "--dpi must be between %1 and %2.")
            .arg(MixerSettings::MIN_DPI).arg(MixerSettings::MAX_DPI));
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("no-fit"))) {
        settings.fitToPage = false;
    }
    if (parser.isSet(QStringLiteral("no-keep-aspect"))) {
        settings.keepAspect = false;
    }
    if (parser.isSet(QStringLiteral("no-center"))) {
        settings.center = false;
    }
    if (parser.isSet(QStringLiteral("no-sort"))) {
        settings.sortByName = false;
    }
    settings.validate();

    MixerOps::DiscoveryResult found = MixerOps::collectImages(
        parser.positionalArguments(), parser.isSet(QStringLiteral("recursive")));
    int stop = checkInputs(found, false, QCoreApplication::translate("CLI", "images"), progress);
    if (stop >= 0) {
        return stop;
    }

    MixerOps::JobSpec spec;
    spec.command = MixerOps::Command::Images;
    spec.inputs = found.files;
    spec.imageOptions.pageSize = settings.pageSize;
    spec.imageOptions.marginMm = settings.marginMm;
    spec.imageOptions.dpi = settings.dpi;
    spec.imageOptions.fitToPage = settings.fitToPage;
    spec.imageOptions.keepAspect = settings.keepAspect;
    spec.imageOptions.center = settings.center;
    spec.imageOptions.sortByName = settings.sortByName;
    spec.output = outputOptions(parser, settings);

    saveDefaults(parser, settings, spec.output);
    return runJob(spec, progress);
}

} // namespace Cli
