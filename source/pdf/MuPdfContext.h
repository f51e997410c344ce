#pragma once

// ============================================================================
// MuPdfContext - Owner of one MuPDF context
// ============================================================================
// Every job creates its own context and shares it (through shared_ptr) with
// all documents it opens. Documents hold a reference, so the context is
// always dropped after the last document that uses it.
//
// A context must only be used from one thread at a time.
// ============================================================================

#include <memory>

// Forward declaration (avoid exposing mupdf headers in public API)
struct fz_context;

class MuPdfContext {
public:
    /**
     * @brief Create a context with the default store and all document handlers.
     * @return The context, or nullptr if MuPDF could not be initialized.
     */
    static std::shared_ptr<MuPdfContext> create();

    ~MuPdfContext();

    // Disable copy (MuPDF context is not copyable)
    MuPdfContext(const MuPdfContext&) = delete;
    MuPdfContext& operator=(const MuPdfContext&) = delete;

    fz_context* get() const { return m_ctx; }

private:
    explicit MuPdfContext(fz_context* ctx);

    fz_context* m_ctx = nullptr;
};
