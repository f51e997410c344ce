#pragma once

// ============================================================================
// ConversionAdapter - Abstract interface for non-PDF inputs
// ============================================================================
// Turns an input that is not a PDF (images, office documents, ...) into a
// PageStream the page operations can work with. The operations do not care
// which converter produced the pages.
//
// Implementations:
// - ImageConverter: raster images, assembled in-process with MuPDF
// ============================================================================

#include "PdfSourceDocument.h"

#include <QString>

#include <memory>

class MuPdfContext;

class ConversionAdapter {
public:
    virtual ~ConversionAdapter() = default;

    /**
     * @brief Short converter name for logs and messages.
     */
    virtual QString name() const = 0;

    /**
     * @brief Check whether this converter handles the given file.
     */
    virtual bool canConvert(const QString& inputPath) const = 0;

    /**
     * @brief Convert one input into a page stream.
     * @param context MuPDF context that will own the produced document
     * @param inputPath File to convert
     * @param outputDir Scratch directory for converters that need one
     * @return InputError if the input cannot be converted
     */
    virtual LoadResult convert(const std::shared_ptr<MuPdfContext>& context,
                               const QString& inputPath,
                               const QString& outputDir) = 0;
};
