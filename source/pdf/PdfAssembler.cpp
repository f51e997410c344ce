// ============================================================================
// PdfAssembler - Builds a fresh MuPDF document from a PageStream
// ============================================================================

#include "PdfAssembler.h"
#include "MuPdfContext.h"
#include "PdfSourceDocument.h"
#include "../core/PageStream.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QHash>
#include <QObject>

PdfAssembler::PdfAssembler(std::shared_ptr<MuPdfContext> context)
    : m_context(std::move(context))
{
}

PdfAssembler::~PdfAssembler()
{
    cleanup();
}

void PdfAssembler::cleanup()
{
    if (m_outputDoc && m_context) {
        pdf_drop_document(m_context->get(), m_outputDoc);
    }
    m_outputDoc = nullptr;
    m_pagesAssembled = 0;
}

pdf_document* PdfAssembler::takeDocument()
{
    pdf_document* doc = m_outputDoc;
    m_outputDoc = nullptr;
    return doc;
}

bool PdfAssembler::assemble(const PageStream& stream)
{
    cleanup();
    m_errorMessage.clear();

    if (!m_context) {
        m_errorMessage = QObject::tr("No PDF context");
        return false;
    }

    // Every page must be graftable from this context
    for (int i = 0; i < stream.size(); ++i) {
        const Page& page = stream.at(i);
        if (!page.source || !page.source->pdf()) {
            m_errorMessage = QObject::tr("Page %1 has no source document").arg(i + 1);
            qWarning() << "[PdfAssembler]" << m_errorMessage;
            return false;
        }
        if (page.source->context() != m_context) {
            m_errorMessage = QObject::tr("Page %1 belongs to a different PDF context").arg(i + 1);
            qWarning() << "[PdfAssembler]" << m_errorMessage;
            return false;
        }
        if (page.sourceIndex < 0 || page.sourceIndex >= page.source->pageCount()) {
            m_errorMessage = QObject::tr("Page %1 refers to missing source page %2 of %3")
                             .arg(i + 1).arg(page.sourceIndex + 1).arg(page.source->name());
            qWarning() << "[PdfAssembler]" << m_errorMessage;
            return false;
        }
    }

    fz_context* ctx = m_context->get();
    // A graft map may only be used with the one source document it was first used with
    QHash<const PdfSourceDocument*, pdf_graft_map*> graftMaps;
    pdf_document* outputDoc = nullptr;
    bool ok = true;

    fz_var(outputDoc);

    fz_try(ctx) {
        outputDoc = pdf_create_document(ctx);

        for (int i = 0; i < stream.size(); ++i) {
            const Page& page = stream.at(i);
            const PdfSourceDocument* source = page.source.get();

            pdf_graft_map* map = graftMaps.value(source, nullptr);
            if (!map) {
                map = pdf_new_graft_map(ctx, outputDoc);
                graftMaps.insert(source, map);
            }

            pdf_graft_mapped_page(ctx, map, -1, source->pdf(), page.sourceIndex);

            // Grafting copies the inherited /Rotate; replace it with the stream's rotation
            pdf_obj* newPage = pdf_lookup_page_obj(ctx, outputDoc, i);
            if (page.rotation == 0) {
                pdf_dict_del(ctx, newPage, PDF_NAME(Rotate));
            } else {
                pdf_dict_put_int(ctx, newPage, PDF_NAME(Rotate), page.rotation);
            }
        }
    }
    fz_always(ctx) {
        for (pdf_graft_map* map : graftMaps) {
            pdf_drop_graft_map(ctx, map);
        }
    }
    fz_catch(ctx) {
        m_errorMessage = QObject::tr("Failed to copy pages: %1")
                         .arg(QString::fromUtf8(fz_caught_message(ctx)));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[PdfAssembler]" << m_errorMessage;
        if (outputDoc) {
            pdf_drop_document(ctx, outputDoc);
        }
        return false;
    }

    m_outputDoc = outputDoc;
    m_pagesAssembled = stream.size();

    qDebug() << "[PdfAssembler] Assembled" << m_pagesAssembled << "pages from"
             << graftMaps.size() << "source document(s)";
    return true;
}
