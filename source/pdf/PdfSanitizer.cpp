// ============================================================================
// PdfSanitizer - Rewrite pass that keeps only page content
// ============================================================================

#include "PdfSanitizer.h"
#include "MuPdfContext.h"
#include "PdfAssembler.h"
#include "PdfSourceDocument.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QObject>
#include <QSet>

// Nested form XObjects deeper than this are left alone
static constexpr int MAX_XOBJECT_DEPTH = 16;

static void stripObjectMetadata(fz_context* ctx, pdf_obj* obj)
{
    pdf_dict_del(ctx, obj, PDF_NAME(Metadata));
    pdf_dict_del(ctx, obj, PDF_NAME(PieceInfo));
}

/**
 * @brief Remove /Metadata and /PieceInfo from every XObject in a resource dict.
 *
 * Form XObjects carry their own resources, which are visited as well.
 * Each indirect object is visited once.
 */
static void stripResourceMetadata(fz_context* ctx, pdf_obj* resources,
                                  QSet<int>& visited, int depth)
{
    if (!resources || depth > MAX_XOBJECT_DEPTH) {
        return;
    }

    pdf_obj* xobjects = pdf_dict_get(ctx, resources, PDF_NAME(XObject));
    const int count = pdf_dict_len(ctx, xobjects);

    for (int i = 0; i < count; ++i) {
        pdf_obj* xobj = pdf_dict_get_val(ctx, xobjects, i);
        if (!pdf_is_dict(ctx, xobj)) {
            continue;
        }
        if (pdf_is_indirect(ctx, xobj)) {
            const int num = pdf_to_num(ctx, xobj);
            if (visited.contains(num)) {
                continue;
            }
            visited.insert(num);
        }

        stripObjectMetadata(ctx, xobj);
        stripResourceMetadata(ctx, pdf_dict_get(ctx, xobj, PDF_NAME(Resources)),
                              visited, depth + 1);
    }
}

SanitizeResult PdfSanitizer::sanitize(const std::shared_ptr<MuPdfContext>& context,
                                      const PageStream& stream)
{
    SanitizeResult result;
    result.stream = stream;

    if (stream.isEmpty()) {
        return result;
    }

    // Step 1: rewrite the pages into a fresh document
    PdfAssembler assembler(context);
    if (!assembler.assemble(stream)) {
        result.degraded = true;
        result.message = QObject::tr("Pages copied, metadata untouched: %1")
                         .arg(assembler.errorMessage());
        qWarning() << "[PdfSanitizer]" << result.message;
        return result;
    }

    fz_context* ctx = context->get();
    pdf_document* doc = assembler.document();
    bool stripped = true;
    QString failure;

    // Step 2: best-effort removal of per-object and document metadata
    fz_try(ctx) {
        QSet<int> visited;
        const int pageCount = pdf_count_pages(ctx, doc);
        for (int i = 0; i < pageCount; ++i) {
            pdf_obj* pageObj = pdf_lookup_page_obj(ctx, doc, i);
            stripObjectMetadata(ctx, pageObj);
            pdf_dict_dels(ctx, pageObj, "LastModified");
            stripResourceMetadata(ctx, pdf_dict_get(ctx, pageObj, PDF_NAME(Resources)),
                                  visited, 0);
        }

        pdf_obj* trailer = pdf_trailer(ctx, doc);
        pdf_dict_del(ctx, pdf_dict_get(ctx, trailer, PDF_NAME(Root)), PDF_NAME(Metadata));
        pdf_dict_del(ctx, trailer, PDF_NAME(Info));
    }
    fz_catch(ctx) {
        failure = QString::fromUtf8(fz_caught_message(ctx));
        stripped = false;
    }

    if (!stripped) {
        result.degraded = true;
        result.message = QObject::tr("Metadata removal incomplete: %1").arg(failure);
        qWarning() << "[PdfSanitizer]" << result.message;
    }

    // Step 3: expose the rewritten document as the new stream
    const int pagesCopied = assembler.pagesAssembled();
    LoadResult adopted = PdfSourceDocument::adopt(context, assembler.takeDocument(),
                                                  QStringLiteral("sanitized"));
    if (!adopted.success) {
        result.degraded = true;
        result.message = QObject::tr("Pages copied, metadata untouched: %1")
                         .arg(adopted.errorMessage);
        qWarning() << "[PdfSanitizer]" << result.message;
        return result;
    }

    result.stream = adopted.stream;
    result.document = adopted.document;
    result.pagesCopied = pagesCopied;

    qDebug() << "[PdfSanitizer] Rewrote" << pagesCopied << "pages"
             << (result.degraded ? "(degraded)" : "");
    return result;
}
