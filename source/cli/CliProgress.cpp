#include "CliProgress.h"

#include <QCoreApplication>
#include <QFileInfo>

/**
 * @file CliProgress.cpp
 * @brief Implementation of the console reporter.
 *
 * @see CliProgress.h for API documentation
 */

namespace Cli {

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Progress Callback
// =============================================================================

MixerOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& currentFile, const QString& status) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << QStringLiteral("[%1/%2] %3: %4\n")
                 .arg(current)
                 .arg(total)
                 .arg(shortName(currentFile), status);
        m_out.flush();
    };
}

// =============================================================================
// Output Results
// =============================================================================

void ConsoleProgress::reportFile(const MixerOps::FileResult& result)
{
    switch (m_mode) {
        case OutputMode::Simple:
            reportFileSimple(result);
            break;
        case OutputMode::Verbose:
            reportFileVerbose(result);
            break;
        case OutputMode::Json:
            reportFileJson(result);
            break;
    }
}

void ConsoleProgress::reportFile(int index, int total, const MixerOps::FileResult& result)
{
    m_currentIndex = index;
    m_totalCount = total;
    reportFile(result);
}

void ConsoleProgress::reportFileSimple(const MixerOps::FileResult& result)
{
    // [1/3] report.pdf... OK (4 pages)
    // [2/3] notes.pdf... SKIPPED (Output file already exists)
    // [3/3] broken.pdf... ERROR: broken.pdf is not a readable PDF

    QString statusStr;
    switch (result.status) {
        case MixerOps::FileStatus::Success:
            statusStr = QCoreApplication::translate("CLI", "OK");
            if (result.pagesWritten > 0) {
                statusStr += QStringLiteral(" (%1 pages)").arg(result.pagesWritten);
            }
            break;
        case MixerOps::FileStatus::Skipped:
            statusStr = QCoreApplication::translate("CLI", "SKIPPED");
            if (!result.message.isEmpty()) {
                statusStr += QStringLiteral(" (%1)").arg(result.message);
            }
            break;
        case MixerOps::FileStatus::Error:
            statusStr = QCoreApplication::translate("CLI", "ERROR");
            if (!result.message.isEmpty()) {
                statusStr += QStringLiteral(": %1").arg(result.message);
            }
            break;
    }

    const QString name = result.outputPath.isEmpty() ? result.inputPath : result.outputPath;
    m_out << QStringLiteral("[%1/%2] %3... %4\n")
             .arg(m_currentIndex)
             .arg(m_totalCount)
             .arg(shortName(name), statusStr);

    for (const QString& warning : result.warnings) {
        m_out << QStringLiteral("        ") << warning << "\n";
    }
    m_out.flush();
}

void ConsoleProgress::reportFileVerbose(const MixerOps::FileResult& result)
{
    m_out << QCoreApplication::translate("CLI", "  Input:  ") << result.inputPath << "\n";
    if (!result.outputPath.isEmpty()) {
        m_out << QCoreApplication::translate("CLI", "  Output: ") << result.outputPath << "\n";
    }

    m_out << QCoreApplication::translate("CLI", "  Status: ");
    switch (result.status) {
        case MixerOps::FileStatus::Success:
            m_out << QCoreApplication::translate("CLI", "Success");
            if (result.pagesWritten > 0 || result.outputSize > 0) {
                QStringList details;
                if (result.pagesWritten > 0) {
                    details << QStringLiteral("%1 pages").arg(result.pagesWritten);
                }
                if (result.outputSize > 0) {
                    details << formatSize(result.outputSize);
                }
                m_out << " (" << details.join(QStringLiteral(", ")) << ")";
            }
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
        case MixerOps::FileStatus::Skipped:
            m_out << QCoreApplication::translate("CLI", "Skipped");
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
        case MixerOps::FileStatus::Error:
            m_out << QCoreApplication::translate("CLI", "Error");
            if (!result.message.isEmpty()) {
                m_out << " - " << result.message;
            }
            break;
    }
    m_out << "\n";

    if (result.status == MixerOps::FileStatus::Success && !result.sanitized) {
        m_out << QCoreApplication::translate("CLI", "  Note:   metadata could not be removed\n");
    }
    for (const QString& warning : result.warnings) {
        m_out << QCoreApplication::translate("CLI", "  Warn:   ") << warning << "\n";
    }
    m_out << "\n";
    m_out.flush();
}

void ConsoleProgress::reportFileJson(const MixerOps::FileResult& result)
{
    // {"type":"file","input":"/a.pdf","output":"/extract_a.pdf","status":"success","pages":3,"sanitized":true}

    m_out << "{\"type\":\"file\""
          << ",\"input\":\"" << jsonEscape(result.inputPath) << "\""
          << ",\"output\":\"" << jsonEscape(result.outputPath) << "\""
          << ",\"status\":\"" << statusString(result.status) << "\"";

    if (result.error != OperationError::None) {
        m_out << ",\"error\":\"" << operationErrorName(result.error) << "\"";
    }
    if (result.outputSize > 0) {
        m_out << ",\"size\":" << result.outputSize;
    }
    if (result.pagesWritten > 0) {
        m_out << ",\"pages\":" << result.pagesWritten;
    }
    if (result.status == MixerOps::FileStatus::Success) {
        m_out << ",\"sanitized\":" << (result.sanitized ? "true" : "false");
    }
    if (!result.message.isEmpty()) {
        m_out << ",\"message\":\"" << jsonEscape(result.message) << "\"";
    }
    if (!result.warnings.isEmpty()) {
        m_out << ",\"warnings\":" << jsonStringArray(result.warnings);
    }

    m_out << "}\n";
    m_out.flush();
}

// =============================================================================
// Job Reporting
// =============================================================================

void ConsoleProgress::reportJob(const MixerOps::JobResult& result, bool dryRun)
{
    for (const QString& warning : result.warnings) {
        reportWarning(warning);
    }

    const int total = result.results.size();
    for (int i = 0; i < total; ++i) {
        reportFile(i + 1, total, result.results[i]);
    }

    if (result.error != OperationError::None) {
        reportError(result.errorMessage);
        return;
    }

    if (result.cancelled) {
        reportWarning(QCoreApplication::translate("CLI", "Cancelled, remaining outputs were not written."));
    }

    reportSummary(result, dryRun);
}

void ConsoleProgress::reportSummary(const MixerOps::JobResult& result, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        reportSummaryJson(result, dryRun);
    } else {
        reportSummaryText(result, dryRun);
    }
}

void ConsoleProgress::reportSummaryText(const MixerOps::JobResult& result, bool dryRun)
{
    m_out << "\n";

    if (dryRun) {
        m_out << QCoreApplication::translate("CLI", "=== %1 (dry run) ===\n")
                 .arg(MixerOps::commandName(result.command));
    } else {
        m_out << QCoreApplication::translate("CLI", "=== %1 ===\n")
                 .arg(MixerOps::commandName(result.command));
    }

    m_out << QCoreApplication::translate("CLI", "Outputs:  ") << result.totalCount() << "\n";
    m_out << QCoreApplication::translate("CLI", "Written:  ") << result.successCount << "\n";

    if (result.skippedCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Skipped:  ") << result.skippedCount << "\n";
    }
    if (result.errorCount > 0) {
        m_out << QCoreApplication::translate("CLI", "Errors:   ") << result.errorCount << "\n";
    }
    if (result.totalOutputSize > 0 && !dryRun) {
        m_out << QCoreApplication::translate("CLI", "Size:     ")
              << formatSize(result.totalOutputSize) << "\n";
    }

    m_out << QCoreApplication::translate("CLI", "Time:     ")
          << formatDuration(result.elapsedMs) << "\n";
    m_out.flush();
}

void ConsoleProgress::reportSummaryJson(const MixerOps::JobResult& result, bool dryRun)
{
    m_out << "{\"type\":\"summary\""
          << ",\"command\":\"" << MixerOps::commandName(result.command) << "\""
          << ",\"total\":" << result.totalCount()
          << ",\"success\":" << result.successCount
          << ",\"skipped\":" << result.skippedCount
          << ",\"errors\":" << result.errorCount
          << ",\"total_size\":" << result.totalOutputSize
          << ",\"elapsed_ms\":" << result.elapsedMs
          << ",\"cancelled\":" << (result.cancelled ? "true" : "false")
          << ",\"dry_run\":" << (dryRun ? "true" : "false")
          << "}\n";
    m_out.flush();
}

// =============================================================================
// Errors and Warnings
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"error\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleProgress::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"type\":\"warning\",\"message\":\"" << jsonEscape(message) << "\"}\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

// =============================================================================
// Formatting
// =============================================================================

QString ConsoleProgress::formatSize(qint64 bytes)
{
    static const char* units[] = { "KB", "MB", "GB" };

    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }

    double value = bytes / 1024.0;
    int unit = 0;
    while (value >= 1024.0 && unit < 2) {
        value /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    return QStringLiteral("%1m %2s").arg(ms / 60000).arg((ms % 60000) / 1000);
}

QString ConsoleProgress::shortName(const QString& path)
{
    return QFileInfo(path).fileName();
}

QString ConsoleProgress::statusString(MixerOps::FileStatus status)
{
    switch (status) {
        case MixerOps::FileStatus::Success: return QStringLiteral("success");
        case MixerOps::FileStatus::Skipped: return QStringLiteral("skipped");
        case MixerOps::FileStatus::Error:   return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

QString ConsoleProgress::jsonEscape(const QString& str)
{
    QString escaped;
    escaped.reserve(str.size() + 8);

    for (const QChar c : str) {
        const ushort code = c.unicode();
        if (code == '"' || code == '\\') {
            escaped += QLatin1Char('\\');
            escaped += c;
        } else if (code == '\n') {
            escaped += QStringLiteral("\\n");
        } else if (code == '\r') {
            escaped += QStringLiteral("\\r");
        } else if (code == '\t') {
            escaped += QStringLiteral("\\t");
        } else if (code < 32) {
            escaped += QStringLiteral("\\u%1").arg(static_cast<uint>(code), 4, 16, QLatin1Char('0'));
        } else {
            escaped += c;
        }
    }
    return escaped;
}

QString ConsoleProgress::jsonStringArray(const QStringList& values)
{
    QStringList quoted;
    for (const QString& value : values) {
        quoted << QLatin1Char('"') + jsonEscape(value) + QLatin1Char('"');
    }
    return QLatin1Char('[') + quoted.join(QLatin1Char(',')) + QLatin1Char(']');
}

} // namespace Cli
