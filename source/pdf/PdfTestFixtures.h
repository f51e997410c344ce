#pragma once

// ============================================================================
// PdfTestFixtures - Small PDFs built in memory for the backend tests
// ============================================================================
// Every page gets a content stream that draws a rectangle whose width is
// tied to its page number, so page identity survives any copy. With
// withMetadata set the document also carries:
// - a trailer /Info dictionary and a catalog /Metadata stream
// - /Metadata, /PieceInfo and /LastModified on every page
// - a form XObject with its own /Metadata in every page's resources
// ============================================================================

#include "MuPdfContext.h"
#include "PdfSourceDocument.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QByteArray>
#include <QDebug>
#include <QSizeF>
#include <QVector>

namespace PdfTestFixtures {

struct PageSpec {
    QSizeF size = QSizeF(612, 792);
    int rotation = 0;
};

inline QByteArray pageContent(int pageNumber)
{
    return QByteArray("q 0 0 1 rg 36 36 ") + QByteArray::number(pageNumber * 10)
         + QByteArray(" 20 re f /Fm0 Do Q\n");
}

static const char XMP_PACKET[] =
    "<?xpacket begin='' id='W5M0MpCehiHzreSzNTczkc9d'?>"
    "<x:xmpmeta xmlns:x='adobe:ns:meta/'><rdf:RDF "
    "xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>"
    "<rdf:Description xmlns:dc='http://purl.org/dc/elements/1.1/'>"
    "<dc:creator>Secret Author</dc:creator></rdf:Description>"
    "</rdf:RDF></x:xmpmeta><?xpacket end='w'?>";

inline pdf_obj* addXmpStream(fz_context* ctx, pdf_document* doc)
{
    fz_buffer* xmp = fz_new_buffer_from_copied_data(
        ctx, reinterpret_cast<const unsigned char*>(XMP_PACKET), sizeof(XMP_PACKET) - 1);
    pdf_obj* dict = nullptr;
    pdf_obj* ref = nullptr;

    fz_var(dict);

    fz_try(ctx) {
        dict = pdf_new_dict(ctx, doc, 2);
        pdf_dict_put(ctx, dict, PDF_NAME(Type), PDF_NAME(Metadata));
        pdf_dict_put(ctx, dict, PDF_NAME(Subtype), PDF_NAME(XML));
        ref = pdf_add_stream(ctx, doc, xmp, dict, 0);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, dict);
        fz_drop_buffer(ctx, xmp);
    }
    fz_catch(ctx) {
        fz_rethrow(ctx);
    }
    return ref;
}

// Resources with one form XObject (/Fm0); returns a new reference
inline pdf_obj* addResources(fz_context* ctx, pdf_document* doc, bool withMetadata)
{
    static const char formContent[] = "0 1 0 rg 0 0 5 5 re f\n";

    pdf_obj* resources = pdf_new_dict(ctx, doc, 1);
    pdf_obj* form = nullptr;
    fz_buffer* buf = nullptr;

    fz_var(form);
    fz_var(buf);

    fz_try(ctx) {
        pdf_obj* formDict = pdf_new_dict(ctx, doc, 4);
        pdf_dict_put(ctx, formDict, PDF_NAME(Type), PDF_NAME(XObject));
        pdf_dict_put(ctx, formDict, PDF_NAME(Subtype), PDF_NAME(Form));
        pdf_dict_put_rect(ctx, formDict, PDF_NAME(BBox), fz_make_rect(0, 0, 5, 5));

        buf = fz_new_buffer_from_copied_data(
            ctx, reinterpret_cast<const unsigned char*>(formContent), sizeof(formContent) - 1);
        form = pdf_add_stream(ctx, doc, buf, formDict, 0);
        pdf_drop_obj(ctx, formDict);

        if (withMetadata) {
            pdf_dict_put_drop(ctx, form, PDF_NAME(Metadata), addXmpStream(ctx, doc));
            pdf_dict_put_dict(ctx, form, PDF_NAME(PieceInfo), 1);
        }

        pdf_obj* xobjects = pdf_dict_put_dict(ctx, resources, PDF_NAME(XObject), 1);
        pdf_dict_puts(ctx, xobjects, "Fm0", form);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, form);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        pdf_drop_obj(ctx, resources);
        fz_rethrow(ctx);
    }
    return resources;
}

/**
 * @brief Serialized PDF with one page per spec.
 * @return Empty on MuPDF failure
 */
inline QByteArray buildPdf(fz_context* ctx, const QVector<PageSpec>& pages, bool withMetadata)
{
    pdf_document* doc = nullptr;
    fz_buffer* out = nullptr;
    fz_output* output = nullptr;
    QByteArray bytes;

    fz_var(doc);
    fz_var(out);
    fz_var(output);

    fz_try(ctx) {
        doc = pdf_create_document(ctx);

        for (int i = 0; i < pages.size(); ++i) {
            const PageSpec& spec = pages.at(i);
            const QByteArray content = pageContent(i + 1);

            fz_buffer* contents = fz_new_buffer_from_copied_data(
                ctx, reinterpret_cast<const unsigned char*>(content.constData()),
                static_cast<size_t>(content.size()));
            pdf_obj* resources = nullptr;
            pdf_obj* page = nullptr;

            fz_var(resources);
            fz_var(page);

            fz_try(ctx) {
                resources = addResources(ctx, doc, withMetadata);
                page = pdf_add_page(ctx, doc,
                                    fz_make_rect(0, 0, spec.size.width(), spec.size.height()),
                                    spec.rotation, resources, contents);
                pdf_insert_page(ctx, doc, -1, page);

                if (withMetadata) {
                    pdf_obj* pageObj = pdf_lookup_page_obj(ctx, doc, i);
                    pdf_dict_put_drop(ctx, pageObj, PDF_NAME(Metadata), addXmpStream(ctx, doc));
                    pdf_obj* piece = pdf_dict_put_dict(ctx, pageObj, PDF_NAME(PieceInfo), 1);
                    pdf_dict_puts_drop(ctx, piece, "Editor", pdf_new_text_string(ctx, "Secret Tool"));
                    pdf_dict_put_text_string(ctx, pageObj, PDF_NAME(LastModified),
                                             "D:20240101120000Z");
                }
            }
            fz_always(ctx) {
                pdf_drop_obj(ctx, page);
                pdf_drop_obj(ctx, resources);
                fz_drop_buffer(ctx, contents);
            }
            fz_catch(ctx) {
                fz_rethrow(ctx);
            }
        }

        if (withMetadata) {
            pdf_obj* trailer = pdf_trailer(ctx, doc);
            pdf_obj* info = pdf_add_new_dict(ctx, doc, 3);
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Title), "Secret Title");
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Author), "Secret Author");
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Producer), "Secret Producer");
            pdf_dict_put_drop(ctx, trailer, PDF_NAME(Info), info);

            pdf_obj* root = pdf_dict_get(ctx, trailer, PDF_NAME(Root));
            pdf_dict_put_drop(ctx, root, PDF_NAME(Metadata), addXmpStream(ctx, doc));
        }

        out = fz_new_buffer(ctx, 8 * 1024);
        output = fz_new_output_with_buffer(ctx, out);
        pdf_write_options opts = pdf_default_write_options;
        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(ctx, out, &data);
        bytes = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(len));
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
        fz_drop_buffer(ctx, out);
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        qWarning() << "[PdfTestFixtures] Failed to build PDF:" << fz_caught_message(ctx);
        return QByteArray();
    }

    return bytes;
}

inline QByteArray buildPdf(fz_context* ctx, int pageCount, bool withMetadata)
{
    return buildPdf(ctx, QVector<PageSpec>(pageCount), withMetadata);
}

/**
 * @brief True if any XObject in the page's resources has /Metadata or /PieceInfo.
 */
inline bool hasXObjectMetadata(const PdfSourceDocument& document, int index)
{
    fz_context* ctx = document.fzContext();
    bool found = false;

    fz_try(ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, document.pdf(), index);
        pdf_obj* resources = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(Resources));
        pdf_obj* xobjects = pdf_dict_get(ctx, resources, PDF_NAME(XObject));
        const int count = pdf_dict_len(ctx, xobjects);
        for (int i = 0; i < count; ++i) {
            pdf_obj* xobject = pdf_dict_get_val(ctx, xobjects, i);
            if (pdf_dict_get(ctx, xobject, PDF_NAME(Metadata))
                || pdf_dict_get(ctx, xobject, PDF_NAME(PieceInfo))) {
                found = true;
            }
        }
    }
    fz_catch(ctx) {
        qWarning() << "[PdfTestFixtures] Failed to inspect XObjects:" << fz_caught_message(ctx);
    }
    return found;
}

/**
 * @brief Build a fixture and open it as a source document.
 */
inline LoadResult open(const std::shared_ptr<MuPdfContext>& context,
                       const QVector<PageSpec>& pages, bool withMetadata,
                       const QString& name = QStringLiteral("fixture.pdf"))
{
    return PdfSourceDocument::openFromData(
        context, buildPdf(context->get(), pages, withMetadata), name);
}

inline LoadResult open(const std::shared_ptr<MuPdfContext>& context, int pageCount,
                       bool withMetadata, const QString& name = QStringLiteral("fixture.pdf"))
{
    return open(context, QVector<PageSpec>(pageCount), withMetadata, name);
}

} // namespace PdfTestFixtures
