#pragma once

// ============================================================================
// PdfAssembler - Builds a fresh MuPDF document from a PageStream
// ============================================================================
// Pages are copied with pdf_graft_mapped_page(), which copies the page
// object and everything it references (content streams, fonts, images)
// without re-rendering. One graft map is kept per source document so shared
// resources are copied only once.
//
// The new document is created with pdf_create_document() and never gets an
// /Info dictionary or catalog /Metadata from this class.
// ============================================================================

#include <QString>

#include <memory>

class MuPdfContext;
class PageStream;

struct pdf_document;

class PdfAssembler {
public:
    explicit PdfAssembler(std::shared_ptr<MuPdfContext> context);
    ~PdfAssembler();

    PdfAssembler(const PdfAssembler&) = delete;
    PdfAssembler& operator=(const PdfAssembler&) = delete;

    /**
     * @brief Graft every page of the stream in order and apply its rotation.
     * @return false on failure; errorMessage() tells why.
     *
     * All pages must come from documents opened with this assembler's
     * context. A previously assembled document is discarded.
     */
    bool assemble(const PageStream& stream);

    /**
     * @brief The assembled document (still owned by the assembler).
     */
    pdf_document* document() const { return m_outputDoc; }

    /**
     * @brief Release ownership of the assembled document to the caller.
     */
    pdf_document* takeDocument();

    int pagesAssembled() const { return m_pagesAssembled; }
    QString errorMessage() const { return m_errorMessage; }

private:
    void cleanup();

    std::shared_ptr<MuPdfContext> m_context;
    pdf_document* m_outputDoc = nullptr;
    int m_pagesAssembled = 0;
    QString m_errorMessage;
};
