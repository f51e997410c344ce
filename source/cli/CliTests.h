#ifndef CLITESTS_H
#define CLITESTS_H

/**
 * @file CliTests.h
 * @brief End-to-end tests of the command line: arguments in, files and exit codes out.
 *
 * Settings are redirected to a temporary directory so stored defaults of
 * the user never leak into a test.
 *
 * Run with: pdfmixer_tests cli
 */

#include "CliHandler.h"
#include "CliParser.h"
#include "CliSignal.h"
#include "../core/MixerSettings.h"
#include "../pdf/MuPdfContext.h"
#include "../pdf/PdfSourceDocument.h"
#include "../pdf/PdfTestFixtures.h"

#include <QCoreApplication>
#include <QFile>
#include <QObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QTest>

#include <vector>

class CliTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_settingsDir;
    QTemporaryDir* m_dir = nullptr;

    QString path(const QString& name) const { return m_dir->filePath(name); }

    QString writePdf(const QString& name, int pages) {
        auto context = MuPdfContext::create();
        QFile file(path(name));
        if (!context || !file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(PdfTestFixtures::buildPdf(context->get(), pages, true));
        return file.fileName();
    }

    // Run the CLI as "pdfmixer <args...>"
    static int runCli(const QStringList& args) {
        QList<QByteArray> storage;
        storage << QByteArray("pdfmixer");
        for (const QString& arg : args) {
            storage << arg.toLocal8Bit();
        }

        std::vector<char*> argv;
        for (QByteArray& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        return Cli::run(*QCoreApplication::instance(), static_cast<int>(storage.size()), argv.data());
    }

    static int pageCount(const QString& file) {
        LoadResult loaded = PdfSourceDocument::open(MuPdfContext::create(), file);
        return loaded.success ? loaded.stream.size() : -1;
    }

    static MixerOps::FileResult fileResult(MixerOps::FileStatus status,
                                           OperationError error = OperationError::None) {
        MixerOps::FileResult fr;
        fr.status = status;
        fr.error = error;
        return fr;
    }

private slots:
    void initTestCase() {
        QVERIFY(m_settingsDir.isValid());
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_settingsDir.path());
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, m_settingsDir.path());
    }

    void init() {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
        Cli::resetCancellation();
    }

    void cleanup() {
        delete m_dir;
        m_dir = nullptr;
    }

    // ------------------------------------------------------------ parsing

    void testParseCommand() {
        char prog[] = "pdfmixer";
        char merge[] = "merge";
        char help[] = "-h";
        char bogus[] = "shuffle";

        char* withMerge[] = {prog, merge, nullptr};
        char* withHelp[] = {prog, help, nullptr};
        char* withBogus[] = {prog, bogus, nullptr};
        char* bare[] = {prog, nullptr};

        QCOMPARE(Cli::parseCommand(2, withMerge), Cli::Command::Merge);
        QCOMPARE(Cli::parseCommand(2, withHelp), Cli::Command::Help);
        QCOMPARE(Cli::parseCommand(2, withBogus), Cli::Command::None);
        QCOMPARE(Cli::parseCommand(1, bare), Cli::Command::None);
        QCOMPARE(Cli::commandName(Cli::Command::Landscape), QStringLiteral("landscape"));
    }

    void testExitCodeMapping() {
        MixerOps::JobResult ok;
        ok.add(fileResult(MixerOps::FileStatus::Success));
        QCOMPARE(Cli::exitCodeFromResult(ok), Cli::ExitCode::Success);

        MixerOps::JobResult partial = ok;
        partial.add(fileResult(MixerOps::FileStatus::Skipped));
        QCOMPARE(Cli::exitCodeFromResult(partial), Cli::ExitCode::PartialFailure);

        MixerOps::JobResult unreadable;
        unreadable.add(fileResult(MixerOps::FileStatus::Error, OperationError::InputError));
        QCOMPARE(Cli::exitCodeFromResult(unreadable), Cli::ExitCode::InputError);

        MixerOps::JobResult failed;
        failed.add(fileResult(MixerOps::FileStatus::Error));
        QCOMPARE(Cli::exitCodeFromResult(failed), Cli::ExitCode::TotalFailure);

        MixerOps::JobResult invalid;
        invalid.fail(OperationError::ValidationError, "bad");
        QCOMPARE(Cli::exitCodeFromResult(invalid), Cli::ExitCode::InvalidArgs);

        MixerOps::JobResult cancelled = ok;
        cancelled.cancelled = true;
        QCOMPARE(Cli::exitCodeFromResult(cancelled), Cli::ExitCode::Cancelled);

        QCOMPARE(Cli::exitCodeFromResult(MixerOps::JobResult()), Cli::ExitCode::TotalFailure);
    }

    // --------------------------------------------------------- end to end

    void testHelpAndVersion() {
        QCOMPARE(runCli({"--version"}), Cli::ExitCode::Success);
        QCOMPARE(runCli({"--help"}), Cli::ExitCode::Success);
        QCOMPARE(runCli({"extract", "--help"}), Cli::ExitCode::Success);
        QCOMPARE(runCli({"shuffle"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({}), Cli::ExitCode::InvalidArgs);
    }

    void testExtractToFile() {
        const QString input = writePdf("doc.pdf", 5);
        QCOMPARE(runCli({"extract", input, "--pages", "5-4", "-o", path("two.pdf")}),
                 Cli::ExitCode::Success);
        QCOMPARE(pageCount(path("two.pdf")), 2);
    }

    void testBadArguments() {
        const QString input = writePdf("doc.pdf", 2);
        QCOMPARE(runCli({"extract", input}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"rotate", input, "--degrees", "45"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"rotate", input, "--degrees", "abc"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"split", input, "--every", "0"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"interleave", input}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"interleave", input, input, "--mode", "zigzag"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"images", input, "--dpi", "9000"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"reverse", input, "--no-such-option"}), Cli::ExitCode::InvalidArgs);
        QVERIFY(!QFile::exists(path("rotated_doc.pdf")));
    }

    void testMissingAndUnreadableInputs() {
        QCOMPARE(runCli({"reverse", path("gone.pdf")}), Cli::ExitCode::InputError);

        QFile junk(path("junk.pdf"));
        QVERIFY(junk.open(QIODevice::WriteOnly));
        junk.write("not a pdf");
        junk.close();
        QCOMPARE(runCli({"reverse", path("junk.pdf")}), Cli::ExitCode::InputError);
        QCOMPARE(runCli({"merge", path("junk.pdf")}), Cli::ExitCode::InputError);
    }

    void testMergeSkipInvalid() {
        const QString a = writePdf("a.pdf", 2);
        QCOMPARE(runCli({"merge", a, path("gone.pdf")}), Cli::ExitCode::InputError);
        QCOMPARE(runCli({"merge", a, path("gone.pdf"), "--skip-invalid", "-o", path("m.pdf")}),
                 Cli::ExitCode::Success);
        QCOMPARE(pageCount(path("m.pdf")), 2);
    }

    void testExistingOutputGivesPartialFailure() {
        const QString input = writePdf("doc.pdf", 2);
        QCOMPARE(runCli({"reverse", input}), Cli::ExitCode::Success);
        QCOMPARE(runCli({"reverse", input}), Cli::ExitCode::PartialFailure);
        QCOMPARE(runCli({"reverse", input, "--overwrite", "--json"}), Cli::ExitCode::Success);
    }

    void testEmptySelectionGivesPartialFailure() {
        const QString input = writePdf("doc.pdf", 2);
        QCOMPARE(runCli({"extract", input, "--pages", "9"}), Cli::ExitCode::PartialFailure);
        QVERIFY(!QFile::exists(path("extract_doc.pdf")));
    }

    void testDeleteMatchingNothingGivesPartialFailure() {
        const QString input = writePdf("doc.pdf", 2);
        QCOMPARE(runCli({"delete", input, "--pages", "x"}), Cli::ExitCode::PartialFailure);
        QCOMPARE(runCli({"delete", input, "--pages", "5-9"}), Cli::ExitCode::PartialFailure);
        QVERIFY(!QFile::exists(path("deleted_doc.pdf")));
    }

    void testRotateNeedsQuarterTurn() {
        const QString input = writePdf("doc.pdf", 2);
        QCOMPARE(runCli({"rotate", input, "--degrees", "0"}), Cli::ExitCode::InvalidArgs);
        QCOMPARE(runCli({"rotate", input, "--degrees", "360"}), Cli::ExitCode::InvalidArgs);
        QVERIFY(!QFile::exists(path("rotated_doc.pdf")));

        QCOMPARE(runCli({"rotate", input, "--degrees=-90"}), Cli::ExitCode::Success);
        LoadResult written = PdfSourceDocument::open(MuPdfContext::create(), path("rotated_doc.pdf"));
        QVERIFY(written.success);
        QCOMPARE(written.stream.at(0).rotation, 270);
    }

    void testSaveDefaults() {
        const QString input = writePdf("doc.pdf", 5);
        QCOMPARE(runCli({"split", input, "--every", "2", "--save-defaults", "-o", path("a")}),
                 Cli::ExitCode::Success);
        QCOMPARE(MixerSettings::load().splitSize, 2);

        // Stored default applies without --every
        QCOMPARE(runCli({"split", input, "-o", path("b")}), Cli::ExitCode::Success);
        QVERIFY(QFile::exists(path("b/doc_part_5-5.pdf")));

        MixerSettings reset;
        reset.save();
    }

    void testCancelledBeforeStart() {
        const QString input = writePdf("doc.pdf", 2);
        Cli::requestCancellation();
        QCOMPARE(runCli({"reverse", input}), Cli::ExitCode::Cancelled);
        QVERIFY(!QFile::exists(path("reversed_doc.pdf")));
        Cli::resetCancellation();
    }
};

#endif // CLITESTS_H
