#pragma once

// ============================================================================
// PdfBackendTests - Loading, assembly, sanitizing and writing with MuPDF
// ============================================================================
// Documents come from PdfTestFixtures, so no sample files are needed.
//
// Run with: pdfmixer_tests backend
// ============================================================================

#include "MuPdfContext.h"
#include "PdfSanitizer.h"
#include "PdfSourceDocument.h"
#include "PdfTestFixtures.h"
#include "PdfWriter.h"
#include "../core/PageTransforms.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

class PdfBackendTests : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<MuPdfContext> m_context;

    // Content bytes of every page of a document, in order
    static QList<QByteArray> contents(const PdfSourceDocument& document) {
        QList<QByteArray> out;
        for (int i = 0; i < document.pageCount(); ++i) {
            out << document.pageContents(i);
        }
        return out;
    }

    static bool anyPageMetadata(const PdfSourceDocument& document) {
        for (int i = 0; i < document.pageCount(); ++i) {
            if (document.hasPageMetadata(i) || PdfTestFixtures::hasXObjectMetadata(document, i)) {
                return true;
            }
        }
        return false;
    }

    // Serialize, then load the bytes back
    LoadResult roundTrip(const PageStream& stream) {
        QString error;
        const QByteArray bytes = PdfWriter::toBytes(m_context, stream, PdfWriteOptions(), &error);
        if (bytes.isEmpty()) {
            qWarning() << "roundTrip failed:" << error;
        }
        return PdfSourceDocument::openFromData(m_context, bytes, QStringLiteral("written.pdf"));
    }

private slots:
    void init() {
        m_context = MuPdfContext::create();
        QVERIFY(m_context);
    }

    void cleanup() {
        m_context.reset();
    }

    // -------------------------------------------------------------- loading

    void testLoadReadsPageGeometry() {
        QVector<PdfTestFixtures::PageSpec> specs(3);
        specs[1].size = QSizeF(842, 595);
        specs[2].rotation = 90;

        LoadResult loaded = PdfTestFixtures::open(m_context, specs, false);
        QVERIFY2(loaded.success, qPrintable(loaded.errorMessage));
        QCOMPARE(loaded.stream.size(), 3);
        QCOMPARE(loaded.document->pageCount(), 3);

        QCOMPARE(loaded.stream.at(0).size, QSizeF(612, 792));
        QVERIFY(loaded.stream.at(0).isPortrait());
        QVERIFY(!loaded.stream.at(1).isPortrait());
        QCOMPARE(loaded.stream.at(2).rotation, 90);
        QVERIFY(!loaded.stream.at(2).isPortrait());

        for (int i = 0; i < 3; ++i) {
            QCOMPARE(loaded.stream.at(i).sourceIndex, i);
        }
    }

    void testMissingFileIsInputError() {
        QTemporaryDir dir;
        LoadResult loaded = PdfSourceDocument::open(m_context, dir.filePath("missing.pdf"));
        QVERIFY(!loaded.success);
        QCOMPARE(loaded.error, OperationError::InputError);
        QVERIFY(!loaded.document);
    }

    void testGarbageIsInputError() {
        LoadResult loaded = PdfSourceDocument::openFromData(
            m_context, QByteArray("this is not a pdf at all"), QStringLiteral("junk.pdf"));
        QVERIFY(!loaded.success);
        QCOMPARE(loaded.error, OperationError::InputError);

        loaded = PdfSourceDocument::openFromData(m_context, QByteArray(), QStringLiteral("empty.pdf"));
        QCOMPARE(loaded.error, OperationError::InputError);
    }

    void testOpenFromFile() {
        QTemporaryDir dir;
        const QString path = dir.filePath("two.pdf");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(PdfTestFixtures::buildPdf(m_context->get(), 2, false));
        file.close();

        LoadResult loaded = PdfSourceDocument::open(m_context, path);
        QVERIFY2(loaded.success, qPrintable(loaded.errorMessage));
        QCOMPARE(loaded.stream.size(), 2);
    }

    void testStreamKeepsDocumentAlive() {
        PageStream stream;
        {
            LoadResult loaded = PdfTestFixtures::open(m_context, 2, false);
            QVERIFY(loaded.success);
            stream = loaded.stream;
        }
        QVERIFY(stream.at(0).source);
        QVERIFY(!stream.at(0).source->pageContents(0).isEmpty());
    }

    // ------------------------------------------------------------ sanitizer

    void testFixtureCarriesMetadata() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 2, true);
        QVERIFY(loaded.success);
        QVERIFY(loaded.document->hasDocumentMetadata());
        QVERIFY(loaded.document->hasPageMetadata(0));
        QVERIFY(PdfTestFixtures::hasXObjectMetadata(*loaded.document, 0));
    }

    void testSanitizeRemovesAllMetadata() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 3, true);
        QVERIFY(loaded.success);

        SanitizeResult clean = PdfSanitizer::sanitize(m_context, loaded.stream);
        QVERIFY2(!clean.degraded, qPrintable(clean.message));
        QVERIFY(clean.document);
        QCOMPARE(clean.pagesCopied, 3);
        QCOMPARE(clean.stream.size(), 3);

        QVERIFY(!clean.document->hasDocumentMetadata());
        QVERIFY(!anyPageMetadata(*clean.document));

        // The source document is not touched
        QVERIFY(loaded.document->hasDocumentMetadata());
        QVERIFY(PdfTestFixtures::hasXObjectMetadata(*loaded.document, 0));
    }

    void testSanitizeKeepsContentOrderAndRotation() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 4, true);
        QVERIFY(loaded.success);

        auto reversed = PageOps::reverse(loaded.stream);
        auto rotated = PageOps::rotate(reversed.stream(), QSet<int>{1}, 270);

        SanitizeResult clean = PdfSanitizer::sanitize(m_context, rotated.stream());
        QVERIFY(!clean.degraded);

        QCOMPARE(clean.document->pageContents(0), loaded.document->pageContents(3));
        QCOMPARE(clean.document->pageContents(3), loaded.document->pageContents(0));
        QCOMPARE(clean.stream.at(0).rotation, 270);
        QCOMPARE(clean.stream.at(1).rotation, 0);
    }

    void testSanitizeIsIdempotent() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 2, true);
        QVERIFY(loaded.success);

        SanitizeResult once = PdfSanitizer::sanitize(m_context, loaded.stream);
        SanitizeResult twice = PdfSanitizer::sanitize(m_context, once.stream);
        QVERIFY(!twice.degraded);
        QCOMPARE(contents(*twice.document), contents(*once.document));
        QVERIFY(!twice.document->hasDocumentMetadata());
    }

    void testSanitizeEmptyStream() {
        SanitizeResult clean = PdfSanitizer::sanitize(m_context, PageStream());
        QVERIFY(!clean.degraded);
        QVERIFY(clean.stream.isEmpty());
        QVERIFY(!clean.document);
    }

    void testSanitizeDegradesOnForeignContext() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 1, true);
        QVERIFY(loaded.success);

        // Pages from another context cannot be grafted: input is returned as-is
        auto other = MuPdfContext::create();
        SanitizeResult clean = PdfSanitizer::sanitize(other, loaded.stream);
        QVERIFY(clean.degraded);
        QVERIFY(!clean.message.isEmpty());
        QCOMPARE(clean.stream, loaded.stream);
    }

    // --------------------------------------------------------------- writer

    void testWriteMergedDocuments() {
        LoadResult a = PdfTestFixtures::open(m_context, 2, true, QStringLiteral("a.pdf"));
        LoadResult b = PdfTestFixtures::open(m_context, 1, true, QStringLiteral("b.pdf"));
        QVERIFY(a.success && b.success);

        auto merged = PageOps::merge({a.stream, b.stream});
        SanitizeResult clean = PdfSanitizer::sanitize(m_context, merged.stream());
        QVERIFY(!clean.degraded);

        QTemporaryDir dir;
        const QString path = dir.filePath("out/merged.pdf");
        PdfWriteResult written = PdfWriter::write(m_context, clean.stream, path);
        QVERIFY2(written.success, qPrintable(written.errorMessage));
        QCOMPARE(written.pagesWritten, 3);
        QCOMPARE(written.fileSizeBytes, QFileInfo(path).size());

        LoadResult reloaded = PdfSourceDocument::open(m_context, path);
        QVERIFY(reloaded.success);
        QCOMPARE(reloaded.stream.size(), 3);
        QVERIFY(!reloaded.document->hasDocumentMetadata());
        QVERIFY(!anyPageMetadata(*reloaded.document));
        QCOMPARE(reloaded.document->pageContents(0), a.document->pageContents(0));
        QCOMPARE(reloaded.document->pageContents(2), b.document->pageContents(0));
    }

    void testWrittenRotationSurvivesReload() {
        LoadResult loaded = PdfTestFixtures::open(m_context, 2, false);
        QVERIFY(loaded.success);

        auto rotated = PageOps::rotate(loaded.stream, -90);
        LoadResult reloaded = roundTrip(rotated.stream());
        QVERIFY(reloaded.success);
        QCOMPARE(reloaded.stream.at(0).rotation, 270);
        QCOMPARE(reloaded.stream.at(1).rotation, 270);

        auto back = PageOps::rotate(reloaded.stream, 90);
        LoadResult upright = roundTrip(back.stream());
        QCOMPARE(upright.stream.at(0).rotation, 0);
    }

    void testWriteEmptyStreamFails() {
        QTemporaryDir dir;
        const QString path = dir.filePath("empty.pdf");
        PdfWriteResult written = PdfWriter::write(m_context, PageStream(), path);
        QVERIFY(!written.success);
        QVERIFY(!written.errorMessage.isEmpty());
        QVERIFY(!QFile::exists(path));
    }
};
