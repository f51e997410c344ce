// ============================================================================
// MuPdfContext - Owner of one MuPDF context
// ============================================================================

#include "MuPdfContext.h"

#include <mupdf/fitz.h>

#include <QDebug>

std::shared_ptr<MuPdfContext> MuPdfContext::create()
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        qWarning() << "[MuPdfContext] Failed to create MuPDF context";
        return nullptr;
    }

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    }
    fz_catch(ctx) {
        qWarning() << "[MuPdfContext] Failed to register handlers:" << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return nullptr;
    }

    return std::shared_ptr<MuPdfContext>(new MuPdfContext(ctx));
}

MuPdfContext::MuPdfContext(fz_context* ctx)
    : m_ctx(ctx)
{
}

MuPdfContext::~MuPdfContext()
{
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}
