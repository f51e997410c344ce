// ============================================================================
// ImageConverter - Raster images to PDF pages
// ============================================================================

#include "ImageConverter.h"
#include "MuPdfContext.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QDebug>
#include <QFileInfo>
#include <QObject>
#include <QPainter>

#include <algorithm>

// Paper sizes in PDF points (1/72 inch)
static const QSizeF PAPER_A4(595.276, 841.890);
static const QSizeF PAPER_A3(841.890, 1190.551);
static const QSizeF PAPER_LETTER(612.0, 792.0);
static const QSizeF PAPER_LEGAL(612.0, 1008.0);

static constexpr int JPEG_QUALITY = 85;

static LoadResult conversionError(OperationError error, const QString& message)
{
    qWarning() << "[ImageConverter]" << message;

    LoadResult result;
    result.error = error;
    result.errorMessage = message;
    return result;
}

/**
 * @brief Append one page showing a JPEG image at the given rectangle.
 * @param placement Image rectangle in points, top-left origin
 */
static bool addImagePage(fz_context* ctx, pdf_document* doc, const QByteArray& jpeg,
                         const QSizeF& pageSize, const QRectF& placement)
{
    fz_buffer* imgBuf = nullptr;
    fz_image* fzImage = nullptr;
    fz_buffer* contents = nullptr;
    pdf_obj* imgRef = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* pageObj = nullptr;

    fz_var(imgBuf);
    fz_var(fzImage);
    fz_var(contents);
    fz_var(imgRef);
    fz_var(resources);
    fz_var(pageObj);

    fz_try(ctx) {
        imgBuf = fz_new_buffer_from_copied_data(ctx,
            reinterpret_cast<const unsigned char*>(jpeg.constData()),
            static_cast<size_t>(jpeg.size()));
        fzImage = fz_new_image_from_buffer(ctx, imgBuf);
        imgRef = pdf_add_image(ctx, doc, fzImage);

        resources = pdf_new_dict(ctx, doc, 1);
        pdf_obj* xobjects = pdf_dict_put_dict(ctx, resources, PDF_NAME(XObject), 1);
        pdf_dict_puts(ctx, xobjects, "Img0", imgRef);

        // PDF origin is bottom-left; image XObjects are drawn into a unit square
        const double pdfY = pageSize.height() - placement.y() - placement.height();
        contents = fz_new_buffer(ctx, 128);
        fz_append_string(ctx, contents, "q\n");
        fz_append_printf(ctx, contents, "%g 0 0 %g %g %g cm\n",
                         placement.width(), placement.height(), placement.x(), pdfY);
        fz_append_string(ctx, contents, "/Img0 Do\n");
        fz_append_string(ctx, contents, "Q\n");

        fz_rect mediabox = fz_make_rect(0, 0,
                                        static_cast<float>(pageSize.width()),
                                        static_cast<float>(pageSize.height()));
        pageObj = pdf_add_page(ctx, doc, mediabox, 0, resources, contents);
        pdf_insert_page(ctx, doc, -1, pageObj);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, pageObj);
        pdf_drop_obj(ctx, resources);
        pdf_drop_obj(ctx, imgRef);
        fz_drop_buffer(ctx, contents);
        fz_drop_image(ctx, fzImage);
        fz_drop_buffer(ctx, imgBuf);
    }
    fz_catch(ctx) {
        qWarning() << "[ImageConverter] Failed to add image page:" << fz_caught_message(ctx);
        return false;
    }

    return true;
}

// ============================================================================
// Construction
// ============================================================================

ImageConverter::ImageConverter(const ImagePdfOptions& options)
    : m_options(options)
{
}

QStringList ImageConverter::supportedSuffixes()
{
    return { "png", "jpg", "jpeg", "bmp", "gif", "tif", "tiff", "webp" };
}

bool ImageConverter::canConvert(const QString& inputPath) const
{
    return supportedSuffixes().contains(QFileInfo(inputPath).suffix().toLower());
}

// ============================================================================
// Geometry
// ============================================================================

QSizeF ImageConverter::paperSize(const QString& name, bool* ok)
{
    const QString key = name.trimmed().toUpper();
    if (ok) *ok = true;

    if (key == "A4") return PAPER_A4;
    if (key == "A3") return PAPER_A3;
    if (key == "LETTER") return PAPER_LETTER;
    if (key == "LEGAL") return PAPER_LEGAL;

    if (ok) *ok = false;
    return PAPER_A4;
}

QSizeF ImageConverter::pageSizeFor(const QSize& imagePixels, const ImagePdfOptions& options)
{
    if (options.fitToPage) {
        bool known = false;
        QSizeF paper = paperSize(options.pageSize, &known);
        if (known) {
            return paper;
        }
        qDebug() << "[ImageConverter] Unknown page size" << options.pageSize
                 << "- using the image size";
    }

    const int dpi = options.dpi > 0 ? options.dpi : 300;
    return QSizeF(imagePixels.width() * 72.0 / dpi, imagePixels.height() * 72.0 / dpi);
}

QRectF ImageConverter::placeImage(const QSizeF& pageSize, const QSizeF& imageSize,
                                  const ImagePdfOptions& options)
{
    bool known = false;
    paperSize(options.pageSize, &known);
    if (!options.fitToPage || !known) {
        return QRectF(QPointF(0, 0), pageSize);
    }

    const double margin = mmToPoints(options.marginMm);
    const double availWidth = qMax(1.0, pageSize.width() - 2 * margin);
    const double availHeight = qMax(1.0, pageSize.height() - 2 * margin);

    QSizeF placed(availWidth, availHeight);
    if (options.keepAspect && imageSize.width() > 0 && imageSize.height() > 0) {
        const double scale = qMin(availWidth / imageSize.width(),
                                  availHeight / imageSize.height());
        placed = QSizeF(imageSize.width() * scale, imageSize.height() * scale);
    }

    if (options.center) {
        return QRectF(QPointF((pageSize.width() - placed.width()) / 2,
                              (pageSize.height() - placed.height()) / 2), placed);
    }
    return QRectF(QPointF(margin, margin), placed);
}

// ============================================================================
// Compression
// ============================================================================

QByteArray ImageConverter::compressImage(const QImage& image, const QSizeF& displaySizePt,
                                         int targetDpi)
{
    if (image.isNull()) {
        return QByteArray();
    }

    QImage workImage = image;

    if (displaySizePt.width() > 0 && displaySizePt.height() > 0 && targetDpi > 0) {
        const int requiredWidth = qMax(1, qRound(displaySizePt.width() / 72.0 * targetDpi));
        const int requiredHeight = qMax(1, qRound(displaySizePt.height() / 72.0 * targetDpi));

        // Only downsample (upsampling adds bytes, not detail)
        if (image.width() > requiredWidth || image.height() > requiredHeight) {
            const qreal scale = qMin(static_cast<qreal>(requiredWidth) / image.width(),
                                     static_cast<qreal>(requiredHeight) / image.height());
            const int newWidth = qMax(1, qRound(image.width() * scale));
            const int newHeight = qMax(1, qRound(image.height() * scale));

            qDebug() << "[ImageConverter] Downsampling image from"
                     << image.width() << "x" << image.height()
                     << "to" << newWidth << "x" << newHeight
                     << "(target:" << targetDpi << "DPI)";

            workImage = image.scaled(newWidth, newHeight, Qt::IgnoreAspectRatio,
                                     Qt::SmoothTransformation);
        }
    }

    // JPEG has no alpha: composite transparent images on white
    QImage opaqueImage(workImage.size(), QImage::Format_RGB888);
    opaqueImage.fill(Qt::white);
    {
        QPainter painter(&opaqueImage);
        painter.drawImage(0, 0, workImage);
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);
    if (!opaqueImage.save(&buffer, "JPEG", JPEG_QUALITY)) {
        qWarning() << "[ImageConverter] Failed to compress image as JPEG";
        return QByteArray();
    }

    qDebug() << "[ImageConverter] Compressed image as JPEG:"
             << opaqueImage.width() << "x" << opaqueImage.height()
             << "->" << result.size() << "bytes";
    return result;
}

// ============================================================================
// Conversion
// ============================================================================

LoadResult ImageConverter::convert(const std::shared_ptr<MuPdfContext>& context,
                                   const QString& inputPath,
                                   const QString& outputDir)
{
    Q_UNUSED(outputDir)
    return convertImages(context, QStringList{inputPath});
}

LoadResult ImageConverter::convertImages(const std::shared_ptr<MuPdfContext>& context,
                                         const QStringList& imagePaths)
{
    if (imagePaths.isEmpty()) {
        return conversionError(OperationError::ValidationError,
                               QObject::tr("No images selected"));
    }
    if (!context) {
        return conversionError(OperationError::InputError,
                               QObject::tr("No PDF context available"));
    }

    QStringList paths = imagePaths;
    if (m_options.sortByName) {
        std::stable_sort(paths.begin(), paths.end(), [](const QString& a, const QString& b) {
            return QFileInfo(a).fileName().compare(QFileInfo(b).fileName(),
                                                   Qt::CaseInsensitive) < 0;
        });
    }

    fz_context* ctx = context->get();
    pdf_document* doc = nullptr;

    fz_try(ctx) {
        doc = pdf_create_document(ctx);
    }
    fz_catch(ctx) {
        return conversionError(OperationError::InputError,
                               QObject::tr("Failed to create PDF: %1")
                               .arg(QString::fromUtf8(fz_caught_message(ctx))));
    }

    for (const QString& path : paths) {
        QImage image(path);
        if (image.isNull()) {
            pdf_drop_document(ctx, doc);
            return conversionError(OperationError::InputError,
                                   QObject::tr("Cannot read image %1").arg(path));
        }

        const QSizeF pageSize = pageSizeFor(image.size(), m_options);
        const QRectF placement = placeImage(pageSize, QSizeF(image.size()), m_options);
        const QByteArray jpeg = compressImage(image, placement.size(), m_options.dpi);

        if (jpeg.isEmpty() || !addImagePage(ctx, doc, jpeg, pageSize, placement)) {
            pdf_drop_document(ctx, doc);
            return conversionError(OperationError::InputError,
                                   QObject::tr("Failed to embed image %1").arg(path));
        }

        qDebug() << "[ImageConverter] Added" << QFileInfo(path).fileName()
                 << "at" << placement << "on" << pageSize << "pt page";
    }

    const QString docName = paths.size() == 1 ? QFileInfo(paths.first()).fileName()
                                              : QStringLiteral("images");
    return PdfSourceDocument::adopt(context, doc, docName);
}
