#pragma once

// ============================================================================
// ImageConverter - Raster images to PDF pages
// ============================================================================
// Each image becomes one page. With fit-to-page the page has a fixed paper
// size and the image is scaled into the area inside the margins; without it
// the page takes the image's own size at the chosen DPI.
//
// Images are composited on white, downsampled to the target DPI for their
// placed size (never upsampled) and embedded as JPEG.
// ============================================================================

#include "ConversionAdapter.h"

#include <QByteArray>
#include <QImage>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QStringList>

/**
 * @brief Image page layout options.
 */
struct ImagePdfOptions {
    bool fitToPage = true;          ///< Use a paper size instead of the image size
    QString pageSize = QStringLiteral("A4");   ///< A4, A3, Letter or Legal
    double marginMm = 10.0;         ///< Margin on every side, in millimetres
    bool keepAspect = true;         ///< Scale uniformly instead of filling the area
    bool center = true;             ///< Center on the page instead of top-left
    int dpi = 300;                  ///< Target resolution for embedded images
    bool sortByName = true;         ///< Sort inputs by file name, case-insensitive
};

class ImageConverter : public ConversionAdapter {
public:
    explicit ImageConverter(const ImagePdfOptions& options = ImagePdfOptions());

    QString name() const override { return QStringLiteral("images"); }
    bool canConvert(const QString& inputPath) const override;

    /**
     * @brief One image as a one-page stream. outputDir is not used.
     */
    LoadResult convert(const std::shared_ptr<MuPdfContext>& context,
                       const QString& inputPath,
                       const QString& outputDir) override;

    /**
     * @brief Several images as one multi-page stream, one page per image.
     * @return ValidationError for an empty list, InputError for an unreadable image
     */
    LoadResult convertImages(const std::shared_ptr<MuPdfContext>& context,
                             const QStringList& imagePaths);

    const ImagePdfOptions& options() const { return m_options; }

    /**
     * @brief Lower-case file suffixes accepted as images.
     */
    static QStringList supportedSuffixes();

    /**
     * @brief Paper size in PDF points.
     * @param ok Set to false (and A4 returned) for an unknown name
     */
    static QSizeF paperSize(const QString& name, bool* ok = nullptr);

    static double mmToPoints(double mm) { return mm * 72.0 / 25.4; }

    /**
     * @brief Page size for an image of the given pixel size.
     */
    static QSizeF pageSizeFor(const QSize& imagePixels, const ImagePdfOptions& options);

    /**
     * @brief Where the image goes on the page, in points from the top-left corner.
     */
    static QRectF placeImage(const QSizeF& pageSize, const QSizeF& imageSize,
                             const ImagePdfOptions& options);

    /**
     * @brief Composite on white, downsample to targetDpi and encode as JPEG.
     * @param displaySizePt Placed size on the page in points
     * @return JPEG bytes, empty on failure
     */
    static QByteArray compressImage(const QImage& image, const QSizeF& displaySizePt,
                                    int targetDpi);

private:
    ImagePdfOptions m_options;
};
