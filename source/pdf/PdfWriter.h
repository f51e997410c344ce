#pragma once

// ============================================================================
// PdfWriter - Serializes a PageStream to a PDF file
// ============================================================================
// The stream is assembled into a fresh document, written into memory and
// then committed through QSaveFile, so a failed write never leaves a
// truncated file at the destination.
// ============================================================================

#include <QByteArray>
#include <QString>

#include <memory>

class MuPdfContext;
class PageStream;

/**
 * @brief Serialization options.
 */
struct PdfWriteOptions {
    bool compress = true;           ///< Deflate content streams, images and fonts
    bool garbageCollect = true;     ///< Drop unreferenced objects and renumber
};

/**
 * @brief Result of a write.
 */
struct PdfWriteResult {
    bool success = false;
    QString errorMessage;
    int pagesWritten = 0;
    qint64 fileSizeBytes = 0;
};

class PdfWriter {
public:
    /**
     * @brief Write the stream to path, replacing any existing file.
     *
     * An empty stream is rejected.
     */
    static PdfWriteResult write(const std::shared_ptr<MuPdfContext>& context,
                                const PageStream& stream, const QString& path,
                                const PdfWriteOptions& options = PdfWriteOptions());

    /**
     * @brief Serialize the stream to PDF bytes.
     * @param errorMessage Set on failure (optional)
     * @return Empty on failure
     */
    static QByteArray toBytes(const std::shared_ptr<MuPdfContext>& context,
                              const PageStream& stream,
                              const PdfWriteOptions& options = PdfWriteOptions(),
                              QString* errorMessage = nullptr);
};
