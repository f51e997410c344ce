// ============================================================================
// PdfSourceDocument - A loaded PDF exposed as a PageStream
// ============================================================================

#include "PdfSourceDocument.h"
#include "MuPdfContext.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QObject>

// Used when a page has no usable MediaBox (US Letter, as MuPDF does)
static const QSizeF FALLBACK_PAGE_SIZE(612.0, 792.0);

static LoadResult inputError(const QString& message)
{
    qWarning() << "[PdfSourceDocument]" << message;

    LoadResult result;
    result.error = OperationError::InputError;
    result.errorMessage = message;
    return result;
}

static void appendBuffer(fz_context* ctx, fz_buffer* buf, QByteArray& out)
{
    unsigned char* data = nullptr;
    size_t len = fz_buffer_storage(ctx, buf, &data);
    if (data && len > 0) {
        out.append(reinterpret_cast<const char*>(data), static_cast<int>(len));
    }
}

// ============================================================================
// Loading
// ============================================================================

LoadResult PdfSourceDocument::open(const std::shared_ptr<MuPdfContext>& context,
                                   const QString& path)
{
    const QString name = QFileInfo(path).fileName();

    QByteArray data;
    {
        QFile file(path);
        if (!file.exists()) {
            return inputError(QObject::tr("File not found: %1").arg(path));
        }
        if (!file.open(QIODevice::ReadOnly)) {
            return inputError(QObject::tr("Cannot read %1: %2").arg(path, file.errorString()));
        }
        data = file.readAll();
    }

    return openFromData(context, data, name);
}

LoadResult PdfSourceDocument::openFromData(const std::shared_ptr<MuPdfContext>& context,
                                           const QByteArray& data, const QString& name)
{
    if (!context) {
        return inputError(QObject::tr("No PDF context available to open %1").arg(name));
    }
    if (data.isEmpty()) {
        return inputError(QObject::tr("%1 is empty").arg(name));
    }

    fz_context* ctx = context->get();
    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    pdf_document* doc = nullptr;
    QString failure;

    fz_var(buf);
    fz_var(stm);
    fz_var(doc);

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx,
            reinterpret_cast<const unsigned char*>(data.constData()),
            static_cast<size_t>(data.size()));
        stm = fz_open_buffer(ctx, buf);
        doc = pdf_open_document_with_stream(ctx, stm);
    }
    fz_always(ctx) {
        // The document keeps its own reference to the stream
        fz_drop_stream(ctx, stm);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        failure = QString::fromUtf8(fz_caught_message(ctx));
    }

    if (!doc) {
        return inputError(QObject::tr("%1 is not a readable PDF: %2").arg(name, failure));
    }

    if (pdf_needs_password(ctx, doc)) {
        pdf_drop_document(ctx, doc);
        return inputError(QObject::tr("%1 is password protected").arg(name));
    }

    return adopt(context, doc, name);
}

LoadResult PdfSourceDocument::adopt(const std::shared_ptr<MuPdfContext>& context,
                                    pdf_document* document, const QString& name)
{
    if (!context || !document) {
        return inputError(QObject::tr("No document to load for %1").arg(name));
    }

    // Owned from here on, released by the destructor on every path
    std::shared_ptr<PdfSourceDocument> source(new PdfSourceDocument(context, document, name));
    fz_context* ctx = context->get();

    int pageCount = 0;
    QVector<PageInfo> pageInfo;
    QString failure;
    bool ok = true;

    fz_try(ctx) {
        pageCount = pdf_count_pages(ctx, document);
        pageInfo.reserve(pageCount);

        for (int i = 0; i < pageCount; ++i) {
            pdf_obj* pageObj = pdf_lookup_page_obj(ctx, document, i);

            PageInfo info;
            pdf_obj* rotateObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(Rotate));
            if (rotateObj) {
                // Invalid angles are rounded down to a quarter turn
                info.rotation = Page::normalizeRotation(pdf_to_int(ctx, rotateObj)) / 90 * 90;
            }

            pdf_obj* boxObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(MediaBox));
            fz_rect box = boxObj ? pdf_to_rect(ctx, boxObj) : fz_empty_rect;
            if (fz_is_empty_rect(box)) {
                info.size = FALLBACK_PAGE_SIZE;
            } else {
                info.size = QSizeF(box.x1 - box.x0, box.y1 - box.y0);
            }

            pageInfo.append(info);
        }
    }
    fz_catch(ctx) {
        failure = QString::fromUtf8(fz_caught_message(ctx));
        ok = false;
    }

    if (!ok) {
        return inputError(QObject::tr("%1 has a damaged page tree: %2").arg(name, failure));
    }
    if (pageCount <= 0) {
        return inputError(QObject::tr("%1 has no pages").arg(name));
    }

    source->m_pageInfo = pageInfo;

    qDebug() << "[PdfSourceDocument] Loaded" << name << "with" << pageCount << "pages";

    LoadResult result;
    result.success = true;
    result.document = source;
    result.stream = source->pages();
    return result;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

PdfSourceDocument::PdfSourceDocument(std::shared_ptr<MuPdfContext> context,
                                     pdf_document* doc, const QString& name)
    : m_context(std::move(context))
    , m_doc(doc)
    , m_name(name)
{
}

PdfSourceDocument::~PdfSourceDocument()
{
    if (m_doc && m_context) {
        pdf_drop_document(m_context->get(), m_doc);
        m_doc = nullptr;
    }
}

fz_context* PdfSourceDocument::fzContext() const
{
    return m_context ? m_context->get() : nullptr;
}

// ============================================================================
// Queries
// ============================================================================

PageStream PdfSourceDocument::pages() const
{
    std::shared_ptr<const PdfSourceDocument> self = shared_from_this();

    QVector<Page> pages;
    pages.reserve(m_pageInfo.size());
    for (int i = 0; i < m_pageInfo.size(); ++i) {
        Page page;
        page.source = self;
        page.sourceIndex = i;
        page.rotation = m_pageInfo[i].rotation;
        page.size = m_pageInfo[i].size;
        pages.append(page);
    }
    return PageStream(std::move(pages));
}

QByteArray PdfSourceDocument::pageContents(int index) const
{
    if (index < 0 || index >= m_pageInfo.size()) {
        return QByteArray();
    }

    fz_context* ctx = fzContext();
    QByteArray result;
    fz_buffer* buf = nullptr;

    fz_var(buf);

    fz_try(ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, m_doc, index);
        pdf_obj* contents = pdf_dict_get(ctx, pageObj, PDF_NAME(Contents));

        if (pdf_is_array(ctx, contents)) {
            const int parts = pdf_array_len(ctx, contents);
            for (int i = 0; i < parts; ++i) {
                buf = pdf_load_stream(ctx, pdf_array_get(ctx, contents, i));
                appendBuffer(ctx, buf, result);
                fz_drop_buffer(ctx, buf);
                buf = nullptr;
            }
        } else if (pdf_is_stream(ctx, contents)) {
            buf = pdf_load_stream(ctx, contents);
            appendBuffer(ctx, buf, result);
        }
    }
    fz_always(ctx) {
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSourceDocument] Failed to read contents of page" << index
                   << "in" << m_name << ":" << fz_caught_message(ctx);
        return QByteArray();
    }

    return result;
}

bool PdfSourceDocument::hasDocumentMetadata() const
{
    fz_context* ctx = fzContext();
    bool found = false;

    fz_try(ctx) {
        pdf_obj* trailer = pdf_trailer(ctx, m_doc);
        pdf_obj* root = pdf_dict_get(ctx, trailer, PDF_NAME(Root));
        found = pdf_dict_get(ctx, trailer, PDF_NAME(Info)) != nullptr
             || pdf_dict_get(ctx, root, PDF_NAME(Metadata)) != nullptr;
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSourceDocument] Failed to inspect trailer:" << fz_caught_message(ctx);
    }

    return found;
}

bool PdfSourceDocument::hasPageMetadata(int index) const
{
    if (index < 0 || index >= m_pageInfo.size()) {
        return false;
    }

    fz_context* ctx = fzContext();
    bool found = false;

    fz_try(ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, m_doc, index);
        found = pdf_dict_get(ctx, pageObj, PDF_NAME(Metadata)) != nullptr
             || pdf_dict_get(ctx, pageObj, PDF_NAME(PieceInfo)) != nullptr;
    }
    fz_catch(ctx) {
        qWarning() << "[PdfSourceDocument] Failed to inspect page" << index << ":"
                   << fz_caught_message(ctx);
    }

    return found;
}
