#pragma once

// ============================================================================
// PdfSourceDocument - A loaded PDF exposed as a PageStream
// ============================================================================
// The whole file is read into memory and opened from there, so no file
// handle stays open after loading. Pages of the returned stream keep the
// document (and through it the MuPDF context) alive.
// ============================================================================

#include "../core/OperationError.h"
#include "../core/PageStream.h"

#include <QByteArray>
#include <QSizeF>
#include <QString>
#include <QVector>

#include <memory>

class MuPdfContext;
class PdfSourceDocument;

// Forward declarations for MuPDF types
struct fz_context;
struct pdf_document;

/**
 * @brief Result of loading or converting an input.
 */
struct LoadResult {
    bool success = false;
    OperationError error = OperationError::None;
    QString errorMessage;
    std::shared_ptr<PdfSourceDocument> document;
    PageStream stream;                  ///< All pages of the document, in order
};

class PdfSourceDocument : public std::enable_shared_from_this<PdfSourceDocument> {
public:
    /**
     * @brief Load a PDF file.
     *
     * Missing, unreadable, non-PDF, password-protected and zero-page files
     * give an InputError naming the file.
     */
    static LoadResult open(const std::shared_ptr<MuPdfContext>& context,
                           const QString& path);

    /**
     * @brief Load a PDF from memory.
     * @param name Display name used in messages
     */
    static LoadResult openFromData(const std::shared_ptr<MuPdfContext>& context,
                                   const QByteArray& data, const QString& name);

    /**
     * @brief Take ownership of an already built document.
     *
     * The document must belong to the given context. It is dropped on
     * failure as well.
     */
    static LoadResult adopt(const std::shared_ptr<MuPdfContext>& context,
                            pdf_document* document, const QString& name);

    ~PdfSourceDocument();

    PdfSourceDocument(const PdfSourceDocument&) = delete;
    PdfSourceDocument& operator=(const PdfSourceDocument&) = delete;

    QString name() const { return m_name; }
    int pageCount() const { return m_pageInfo.size(); }

    /**
     * @brief All pages with their stored rotation and MediaBox size.
     */
    PageStream pages() const;

    pdf_document* pdf() const { return m_doc; }
    fz_context* fzContext() const;
    const std::shared_ptr<MuPdfContext>& context() const { return m_context; }

    /**
     * @brief Decoded content stream bytes of a page (all parts concatenated).
     * @param index 0-based page index
     * @return Empty if the page has no content or the index is invalid
     */
    QByteArray pageContents(int index) const;

    /**
     * @brief True if the trailer has /Info or the catalog has /Metadata.
     */
    bool hasDocumentMetadata() const;

    /**
     * @brief True if the page dictionary has /Metadata or /PieceInfo.
     */
    bool hasPageMetadata(int index) const;

private:
    struct PageInfo {
        int rotation = 0;
        QSizeF size;
    };

    PdfSourceDocument(std::shared_ptr<MuPdfContext> context, pdf_document* doc,
                      const QString& name);

    std::shared_ptr<MuPdfContext> m_context;
    pdf_document* m_doc = nullptr;
    QString m_name;
    QVector<PageInfo> m_pageInfo;
};
