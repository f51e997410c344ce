#ifndef MIXEROPERATIONSTESTS_H
#define MIXEROPERATIONSTESTS_H

/**
 * @file MixerOperationsTests.h
 * @brief Tests for the headless jobs, run against files in a temporary directory.
 *
 * Run with: pdfmixer_tests jobs
 */

#include "InputDiscovery.h"
#include "MixerOperations.h"
#include "../pdf/MuPdfContext.h"
#include "../pdf/PdfSourceDocument.h"
#include "../pdf/PdfTestFixtures.h"

#include <QDir>
#include <QFile>
#include <QImage>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

#include <atomic>

class MixerOperationsTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    std::shared_ptr<MuPdfContext> m_context;

    QString path(const QString& name) const { return m_dir->filePath(name); }

    // Fixture PDF with metadata, written to the temporary directory
    QString writePdf(const QString& name, int pages) {
        const QString target = path(name);
        QDir().mkpath(QFileInfo(target).absolutePath());
        QFile file(target);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(PdfTestFixtures::buildPdf(m_context->get(), pages, true));
        return target;
    }

    LoadResult reload(const QString& file) {
        return PdfSourceDocument::open(m_context, file);
    }

    // Page numbers of a written file, recovered from the fixture content
    QVector<int> pageNumbers(const QString& file) {
        QVector<int> numbers;
        LoadResult loaded = reload(file);
        if (!loaded.success) {
            return numbers;
        }
        for (int i = 0; i < loaded.document->pageCount(); ++i) {
            const QByteArray content = loaded.document->pageContents(i);
            for (int n = 1; n <= 50; ++n) {
                if (content == PdfTestFixtures::pageContent(n)) {
                    numbers << n;
                    break;
                }
            }
        }
        return numbers;
    }

    MixerOps::OutputOptions to(const QString& outputPath = QString()) {
        MixerOps::OutputOptions output;
        output.outputPath = outputPath;
        return output;
    }

private slots:
    void init() {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
        m_context = MuPdfContext::create();
        QVERIFY(m_context);
    }

    void cleanup() {
        m_context.reset();
        delete m_dir;
        m_dir = nullptr;
    }

    // ---------------------------------------------------------- naming

    void testDefaultOutputNames() {
        QCOMPARE(MixerOps::defaultOutputName(MixerOps::Command::Extract, "/docs/report.pdf"),
                 QStringLiteral("extract_report.pdf"));
        QCOMPARE(MixerOps::defaultOutputName(MixerOps::Command::Merge, "/docs/report.pdf"),
                 QStringLiteral("merged.pdf"));
        QCOMPARE(MixerOps::splitChunkName("/docs/book.pdf", 11, 20),
                 QStringLiteral("book_part_11-20.pdf"));
    }

    void testResolveOutputPath() {
        QCOMPARE(MixerOps::resolveOutputPath(QString(), "extract_a.pdf", "/docs/a.pdf", false),
                 QStringLiteral("/docs/extract_a.pdf"));
        QCOMPARE(MixerOps::resolveOutputPath("/out/x.pdf", "extract_a.pdf", "/docs/a.pdf", false),
                 QStringLiteral("/out/x.pdf"));
        QCOMPARE(MixerOps::resolveOutputPath("/out/x.pdf", "extract_a.pdf", "/docs/a.pdf", true),
                 QStringLiteral("/out/x.pdf/extract_a.pdf"));
        QCOMPARE(MixerOps::resolveOutputPath("/out", "extract_a.pdf", "/docs/a.pdf", false),
                 QStringLiteral("/out/extract_a.pdf"));
    }

    // -------------------------------------------------------- discovery

    void testDiscoveryKeepsArgumentOrderAndReportsMissing() {
        const QString b = writePdf("b.pdf", 1);
        const QString a = writePdf("dir/a.pdf", 1);
        const QString c = writePdf("dir/C.pdf", 1);
        QFile(path("dir/notes.txt")).open(QIODevice::WriteOnly);

        MixerOps::DiscoveryResult found = MixerOps::collectPdfs(
            {b, path("dir"), path("nope.pdf"), b});
        QCOMPARE(found.files, QStringList({b, a, c}));
        QCOMPARE(found.missing, QStringList({path("nope.pdf")}));
    }

    // ----------------------------------------------------------- merge

    void testMergeWritesSanitizedConcatenation() {
        const QString a = writePdf("a.pdf", 2);
        const QString b = writePdf("b.pdf", 1);
        const QString out = path("out/all.pdf");

        MixerOps::JobResult result = MixerOps::merge({a, b}, false, to(out));
        QVERIFY(result.allSucceeded());
        QCOMPARE(result.results.size(), 1);
        QCOMPARE(result.results.first().pagesWritten, 3);
        QVERIFY(result.results.first().sanitized);

        QCOMPARE(pageNumbers(out), QVector<int>({1, 2, 1}));
        LoadResult written = reload(out);
        QVERIFY(!written.document->hasDocumentMetadata());
        QVERIFY(!written.document->hasPageMetadata(0));
    }

    void testMergeFailsOnUnreadableInput() {
        const QString a = writePdf("a.pdf", 1);
        QFile junk(path("junk.pdf"));
        QVERIFY(junk.open(QIODevice::WriteOnly));
        junk.write("not a pdf");
        junk.close();

        MixerOps::JobResult result = MixerOps::merge({a, path("junk.pdf")}, false, to());
        QCOMPARE(result.error, OperationError::InputError);
        QVERIFY(!QFile::exists(path("merged.pdf")));
    }

    void testMergeSkipInvalidGoesOn() {
        const QString a = writePdf("a.pdf", 2);
        MixerOps::JobResult result = MixerOps::merge({path("gone.pdf"), a}, true, to());

        QCOMPARE(result.error, OperationError::None);
        QCOMPARE(result.skippedCount, 1);
        QCOMPARE(result.successCount, 1);
        QVERIFY(!result.warnings.isEmpty());
        QVERIFY(QFile::exists(path("merged.pdf")));
    }

    // ------------------------------------------------------ interleave

    void testInterleaveAlternate() {
        const QString a = writePdf("a.pdf", 3);
        const QString b = writePdf("b.pdf", 1);

        PageOps::InterleaveSpec spec;
        MixerOps::JobResult result = MixerOps::interleave(a, b, spec, to());
        QVERIFY(result.allSucceeded());
        QCOMPARE(pageNumbers(path("interleaved.pdf")), QVector<int>({1, 1, 2, 3}));
    }

    void testInterleaveValidationBeforeIo() {
        PageOps::InterleaveSpec spec;
        spec.startFrom = 0;
        MixerOps::JobResult result = MixerOps::interleave(path("x.pdf"), path("y.pdf"), spec, to());
        QCOMPARE(result.error, OperationError::ValidationError);
    }

    // ------------------------------------------------- per-file commands

    void testExtractInRangeOrder() {
        const QString input = writePdf("report.pdf", 12);
        MixerOps::JobResult result = MixerOps::extract({input}, "12-10,2", to());
        QVERIFY(result.allSucceeded());
        QCOMPARE(pageNumbers(path("extract_report.pdf")), QVector<int>({12, 11, 10, 2}));
    }

    void testEmptySelectionIsSkipped() {
        const QString input = writePdf("report.pdf", 3);
        MixerOps::JobResult result = MixerOps::extract({input}, "7-9", to());

        QCOMPARE(result.error, OperationError::None);
        QCOMPARE(result.skippedCount, 1);
        QVERIFY(!result.results.first().warnings.isEmpty());
        QVERIFY(!QFile::exists(path("extract_report.pdf")));
    }

    void testDeleteAndReverse() {
        const QString input = writePdf("doc.pdf", 5);

        QVERIFY(MixerOps::deletePages({input}, "2,4", to()).allSucceeded());
        QCOMPARE(pageNumbers(path("deleted_doc.pdf")), QVector<int>({1, 3, 5}));

        QVERIFY(MixerOps::reverse({input}, to()).allSucceeded());
        QCOMPARE(pageNumbers(path("reversed_doc.pdf")), QVector<int>({5, 4, 3, 2, 1}));
    }

    void testDeleteMatchingNothingIsSkipped() {
        const QString input = writePdf("doc.pdf", 3);

        for (const QString& pages : {QStringLiteral("x"), QStringLiteral("7-9")}) {
            MixerOps::JobResult result = MixerOps::deletePages({input}, pages, to());
            QCOMPARE(result.error, OperationError::None);
            QCOMPARE(result.skippedCount, 1);
            QCOMPARE(result.successCount, 0);
            QVERIFY(!result.results.first().warnings.isEmpty());
            QVERIFY(!QFile::exists(path("deleted_doc.pdf")));
        }
    }

    void testRotateByFullTurnIsInvalid() {
        const QString input = writePdf("doc.pdf", 1);
        QCOMPARE(MixerOps::rotate({input}, QString(), 0, to()).error, OperationError::ValidationError);
        QCOMPARE(MixerOps::rotate({input}, QString(), 360, to()).error, OperationError::ValidationError);
        QVERIFY(!QFile::exists(path("rotated_doc.pdf")));
    }

    void testRotateSelectedAndAll() {
        const QString input = writePdf("doc.pdf", 3);

        QVERIFY(MixerOps::rotate({input}, "2", 90, to(path("some.pdf"))).allSucceeded());
        LoadResult some = reload(path("some.pdf"));
        QCOMPARE(some.stream.at(0).rotation, 0);
        QCOMPARE(some.stream.at(1).rotation, 90);

        QVERIFY(MixerOps::rotate({input}, QString(), -90, to(path("all.pdf"))).allSucceeded());
        LoadResult all = reload(path("all.pdf"));
        for (const Page& page : all.stream) {
            QCOMPARE(page.rotation, 270);
        }

        MixerOps::JobResult bad = MixerOps::rotate({input}, QString(), 45, to());
        QCOMPARE(bad.error, OperationError::ValidationError);
    }

    void testLandscape() {
        const QString input = writePdf("doc.pdf", 2);
        QVERIFY(MixerOps::landscape({input}, to()).allSucceeded());

        LoadResult written = reload(path("landscape_doc.pdf"));
        for (const Page& page : written.stream) {
            QVERIFY(!page.isPortrait());
        }
    }

    void testSplitNamesChunks() {
        const QString input = writePdf("book.pdf", 5);
        MixerOps::JobResult result = MixerOps::split({input}, 2, to(path("parts")));

        QCOMPARE(result.successCount, 3);
        QCOMPARE(pageNumbers(path("parts/book_part_1-2.pdf")), QVector<int>({1, 2}));
        QCOMPARE(pageNumbers(path("parts/book_part_5-5.pdf")), QVector<int>({5}));

        QCOMPARE(MixerOps::split({input}, 0, to()).error, OperationError::ValidationError);
    }

    void testMultipleInputsNeedDirectoryOutput() {
        const QString a = writePdf("a.pdf", 1);
        const QString b = writePdf("b.pdf", 1);
        MixerOps::JobResult result = MixerOps::reverse({a, b}, to(path("one.pdf")));
        QCOMPARE(result.error, OperationError::ValidationError);
    }

    void testMissingInputIsPerFileError() {
        const QString a = writePdf("a.pdf", 1);
        MixerOps::JobResult result = MixerOps::reverse({path("gone.pdf"), a}, to());
        QCOMPARE(result.errorCount, 1);
        QCOMPARE(result.successCount, 1);
        QCOMPARE(result.results.first().error, OperationError::InputError);
    }

    // ---------------------------------------------- overwrite and dry run

    void testExistingOutputIsSkippedUnlessOverwrite() {
        const QString input = writePdf("doc.pdf", 2);
        QVERIFY(MixerOps::reverse({input}, to()).allSucceeded());

        MixerOps::JobResult again = MixerOps::reverse({input}, to());
        QCOMPARE(again.skippedCount, 1);

        MixerOps::OutputOptions output = to();
        output.overwrite = true;
        QVERIFY(MixerOps::reverse({input}, output).allSucceeded());
    }

    void testDryRunWritesNothing() {
        const QString input = writePdf("doc.pdf", 2);
        MixerOps::OutputOptions output = to();
        output.dryRun = true;

        MixerOps::JobResult result = MixerOps::reverse({input}, output);
        QCOMPARE(result.successCount, 1);
        QCOMPARE(result.results.first().pagesWritten, 2);
        QVERIFY(!QFile::exists(path("reversed_doc.pdf")));
    }

    void testCancelledBeforeStart() {
        const QString input = writePdf("doc.pdf", 2);
        std::atomic<bool> cancelled(true);
        MixerOps::JobResult result = MixerOps::reverse({input}, to(), nullptr, &cancelled);
        QVERIFY(result.cancelled);
        QCOMPARE(result.totalCount(), 0);
    }

    // ---------------------------------------------------------- images

    void testImagesToPdf() {
        QImage image(60, 30, QImage::Format_RGB32);
        image.fill(Qt::green);
        QVERIFY(image.save(path("pic.png"), "PNG"));

        MixerOps::JobResult result = MixerOps::images({path("pic.png")}, ImagePdfOptions(), to());
        QVERIFY(result.allSucceeded());

        LoadResult written = reload(path("images.pdf"));
        QVERIFY(written.success);
        QCOMPARE(written.stream.size(), 1);
        QVERIFY(!written.document->hasDocumentMetadata());
    }

    // ------------------------------------------------------------- run

    void testRunDispatchesJobSpec() {
        const QString input = writePdf("doc.pdf", 4);

        MixerOps::JobSpec spec;
        spec.command = MixerOps::Command::Extract;
        spec.inputs = {input};
        spec.pages = "3,1";
        spec.output.outputPath = path("picked.pdf");

        QVERIFY(MixerOps::run(spec).allSucceeded());
        QCOMPARE(pageNumbers(path("picked.pdf")), QVector<int>({3, 1}));

        spec.command = MixerOps::Command::Interleave;
        QCOMPARE(MixerOps::run(spec).error, OperationError::ValidationError);
    }
};

#endif // MIXEROPERATIONSTESTS_H
