#pragma once

// ============================================================================
// PdfSanitizer - Rewrite pass that keeps only page content
// ============================================================================
// Exported documents carry no intentionally authored metadata. The sanitizer
// rebuilds the document from its pages alone:
// - pages are grafted into a fresh document (page /Metadata, /PieceInfo and
//   /LastModified are not carried over)
// - XObjects reachable from page resources lose /Metadata and /PieceInfo
// - the trailer /Info and catalog /Metadata are removed if present
//
// Removal is best effort. If the rewrite itself fails the input is handed
// back unchanged and the result is marked degraded; callers still save it.
// ============================================================================

#include "../core/PageStream.h"

#include <QString>

#include <memory>

class MuPdfContext;
class PdfSourceDocument;

/**
 * @brief Result of a sanitize pass.
 */
struct SanitizeResult {
    PageStream stream;              ///< Sanitized pages, or the input if degraded before rewrite
    bool degraded = false;          ///< True if some metadata may remain
    QString message;                ///< Why the pass degraded (empty otherwise)
    int pagesCopied = 0;            ///< Pages in the rewritten document
    std::shared_ptr<PdfSourceDocument> document;   ///< Rewritten document, null if not rewritten
};

class PdfSanitizer {
public:
    /**
     * @brief Rebuild the stream into a metadata-free in-memory document.
     *
     * Never fails: on error the returned stream is the input and
     * degraded is set.
     */
    static SanitizeResult sanitize(const std::shared_ptr<MuPdfContext>& context,
                                   const PageStream& stream);
};
