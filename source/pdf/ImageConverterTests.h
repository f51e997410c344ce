#pragma once

// ============================================================================
// ImageConverterTests - Unit tests for image page layout and conversion
// ============================================================================
// Run with: pdfmixer_tests images
// ============================================================================

#include "ImageConverter.h"
#include "MuPdfContext.h"
#include "PdfSourceDocument.h"

#include <QImage>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

class ImageConverterTests : public QObject {
    Q_OBJECT

private:
    // Solid image saved as PNG; returns the path
    static QString writeImage(const QTemporaryDir& dir, const QString& name, const QSize& size,
                              QColor color = Qt::red) {
        QImage image(size, QImage::Format_ARGB32);
        image.fill(color);
        const QString path = dir.filePath(name);
        return image.save(path, "PNG") ? path : QString();
    }

    static bool fuzzyEqual(const QRectF& a, const QRectF& b) {
        return qAbs(a.x() - b.x()) < 0.01 && qAbs(a.y() - b.y()) < 0.01
            && qAbs(a.width() - b.width()) < 0.01 && qAbs(a.height() - b.height()) < 0.01;
    }

private slots:
    // ------------------------------------------------------------ geometry

    void testPaperSizes() {
        bool ok = false;
        QCOMPARE(ImageConverter::paperSize("letter", &ok), QSizeF(612, 792));
        QVERIFY(ok);
        QCOMPARE(ImageConverter::paperSize(" Legal ", &ok), QSizeF(612, 1008));
        QVERIFY(ok);

        const QSizeF fallback = ImageConverter::paperSize("B5", &ok);
        QVERIFY(!ok);
        QCOMPARE(fallback, ImageConverter::paperSize("A4"));
    }

    void testPageSizeWithoutFitFollowsDpi() {
        ImagePdfOptions options;
        options.fitToPage = false;
        options.dpi = 144;
        QCOMPARE(ImageConverter::pageSizeFor(QSize(288, 144), options), QSizeF(144, 72));
    }

    void testPageSizeWithFitIsPaper() {
        ImagePdfOptions options;
        options.pageSize = "Letter";
        QCOMPARE(ImageConverter::pageSizeFor(QSize(10, 4000), options), QSizeF(612, 792));
    }

    void testPlaceCenteredKeepingAspect() {
        ImagePdfOptions options;
        options.pageSize = "Letter";
        options.marginMm = 25.4;    // 72 pt

        // 2:1 image in a 468 x 648 area: width bound
        const QRectF placed = ImageConverter::placeImage(QSizeF(612, 792), QSizeF(200, 100), options);
        QVERIFY(fuzzyEqual(placed, QRectF(72, (792 - 234) / 2.0, 468, 234)));
    }

    void testPlaceTopLeftStretched() {
        ImagePdfOptions options;
        options.pageSize = "Letter";
        options.marginMm = 25.4;
        options.keepAspect = false;
        options.center = false;

        const QRectF placed = ImageConverter::placeImage(QSizeF(612, 792), QSizeF(200, 100), options);
        QVERIFY(fuzzyEqual(placed, QRectF(72, 72, 468, 648)));
    }

    void testPlaceWithoutFitFillsPage() {
        ImagePdfOptions options;
        options.fitToPage = false;
        const QRectF placed = ImageConverter::placeImage(QSizeF(100, 50), QSizeF(400, 200), options);
        QCOMPARE(placed, QRectF(0, 0, 100, 50));
    }

    void testHugeMarginKeepsPositiveArea() {
        ImagePdfOptions options;
        options.pageSize = "A4";
        options.marginMm = 500;
        const QRectF placed = ImageConverter::placeImage(ImageConverter::paperSize("A4"),
                                                         QSizeF(10, 10), options);
        QVERIFY(placed.width() > 0);
        QVERIFY(placed.height() > 0);
    }

    void testCompressDownsamplesOnly() {
        QImage big(2000, 1000, QImage::Format_RGB32);
        big.fill(Qt::blue);

        // 1 inch x 0.5 inch at 100 DPI needs 100 x 50 pixels
        QImage decoded = QImage::fromData(ImageConverter::compressImage(big, QSizeF(72, 36), 100));
        QCOMPARE(decoded.size(), QSize(100, 50));

        QImage small(40, 20, QImage::Format_RGB32);
        small.fill(Qt::blue);
        decoded = QImage::fromData(ImageConverter::compressImage(small, QSizeF(720, 360), 300));
        QCOMPARE(decoded.size(), QSize(40, 20));
    }

    void testCompressFlattensAlphaOnWhite() {
        QImage transparent(8, 8, QImage::Format_ARGB32);
        transparent.fill(Qt::transparent);

        QImage decoded = QImage::fromData(
            ImageConverter::compressImage(transparent, QSizeF(8, 8), 72));
        QVERIFY(!decoded.isNull());
        QVERIFY(qGray(decoded.pixel(4, 4)) > 240);
    }

    void testSupportedSuffixes() {
        ImageConverter converter;
        QVERIFY(converter.canConvert("/photos/IMG_001.JPG"));
        QVERIFY(converter.canConvert("scan.tiff"));
        QVERIFY(!converter.canConvert("notes.pdf"));
    }

    // ---------------------------------------------------------- conversion

    void testConvertOnePagePerImageSortedByName() {
        QTemporaryDir dir;
        const QString b = writeImage(dir, "b.png", QSize(300, 100));
        const QString a = writeImage(dir, "A.png", QSize(100, 300));
        QVERIFY(!a.isEmpty() && !b.isEmpty());

        auto context = MuPdfContext::create();
        ImagePdfOptions options;
        options.pageSize = "Letter";
        ImageConverter converter(options);

        LoadResult result = converter.convertImages(context, {b, a});
        QVERIFY2(result.success, qPrintable(result.errorMessage));
        QCOMPARE(result.stream.size(), 2);
        QCOMPARE(result.stream.at(0).size, QSizeF(612, 792));
        QVERIFY(!result.document->hasDocumentMetadata());

        // Placed width is the first operand of "w 0 0 h x y cm"
        auto placedWidth = [&result](int index) {
            return result.document->pageContents(index).split('\n').value(1)
                   .split(' ').value(0).toDouble();
        };

        // A.png (the portrait image) comes first in case-insensitive name order
        QVERIFY(placedWidth(0) > 0);
        QVERIFY(placedWidth(0) < placedWidth(1));
    }

    void testConvertWithoutFitUsesImageSize() {
        QTemporaryDir dir;
        const QString path = writeImage(dir, "wide.png", QSize(600, 300));

        ImagePdfOptions options;
        options.fitToPage = false;
        options.dpi = 150;
        ImageConverter converter(options);

        LoadResult result = converter.convert(MuPdfContext::create(), path, QString());
        QVERIFY(result.success);
        QCOMPARE(result.stream.size(), 1);
        QCOMPARE(result.stream.at(0).size, QSizeF(288, 144));
    }

    void testConvertErrors() {
        auto context = MuPdfContext::create();
        ImageConverter converter;

        LoadResult empty = converter.convertImages(context, {});
        QCOMPARE(empty.error, OperationError::ValidationError);

        QTemporaryDir dir;
        const QString good = writeImage(dir, "good.png", QSize(10, 10));
        LoadResult missing = converter.convertImages(context, {good, dir.filePath("gone.png")});
        QVERIFY(!missing.success);
        QCOMPARE(missing.error, OperationError::InputError);
    }
};
