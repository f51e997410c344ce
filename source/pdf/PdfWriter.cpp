// ============================================================================
// PdfWriter - Serializes a PageStream to a PDF file
// ============================================================================

#include "PdfWriter.h"
#include "MuPdfContext.h"
#include "PdfAssembler.h"
#include "../core/PageStream.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QSaveFile>

QByteArray PdfWriter::toBytes(const std::shared_ptr<MuPdfContext>& context,
                              const PageStream& stream,
                              const PdfWriteOptions& options,
                              QString* errorMessage)
{
    auto fail = [errorMessage](const QString& message) {
        qWarning() << "[PdfWriter]" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return QByteArray();
    };

    if (stream.isEmpty()) {
        return fail(QObject::tr("No pages to write"));
    }

    PdfAssembler assembler(context);
    if (!assembler.assemble(stream)) {
        return fail(assembler.errorMessage());
    }

    fz_context* ctx = context->get();
    fz_buffer* buf = nullptr;
    fz_output* out = nullptr;
    QByteArray bytes;
    QString failure;
    bool ok = true;

    fz_var(buf);
    fz_var(out);

    fz_try(ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = options.compress ? 1 : 0;
        opts.do_compress_images = options.compress ? 1 : 0;
        opts.do_compress_fonts = options.compress ? 1 : 0;
        opts.do_garbage = options.garbageCollect ? 1 : 0;

        buf = fz_new_buffer(ctx, 64 * 1024);
        out = fz_new_output_with_buffer(ctx, buf);
        pdf_write_document(ctx, assembler.document(), out, &opts);
        fz_close_output(ctx, out);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(ctx, buf, &data);
        bytes = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(len));
    }
    fz_always(ctx) {
        fz_drop_output(ctx, out);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        failure = QString::fromUtf8(fz_caught_message(ctx));
        ok = false;
    }

    if (!ok) {
        return fail(QObject::tr("Failed to serialize PDF: %1").arg(failure));
    }

    return bytes;
}

PdfWriteResult PdfWriter::write(const std::shared_ptr<MuPdfContext>& context,
                                const PageStream& stream, const QString& path,
                                const PdfWriteOptions& options)
{
    PdfWriteResult result;

    QByteArray bytes = toBytes(context, stream, options, &result.errorMessage);
    if (bytes.isEmpty()) {
        return result;
    }

    QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        result.errorMessage = QObject::tr("Cannot create directory %1").arg(info.absolutePath());
        qWarning() << "[PdfWriter]" << result.errorMessage;
        return result;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        result.errorMessage = QObject::tr("Cannot open %1 for writing: %2")
                              .arg(path, file.errorString());
        qWarning() << "[PdfWriter]" << result.errorMessage;
        return result;
    }

    if (file.write(bytes) != bytes.size() || !file.commit()) {
        result.errorMessage = QObject::tr("Failed to write %1: %2").arg(path, file.errorString());
        qWarning() << "[PdfWriter]" << result.errorMessage;
        return result;
    }

    result.success = true;
    result.pagesWritten = stream.size();
    result.fileSizeBytes = bytes.size();

    qDebug() << "[PdfWriter] Saved" << result.pagesWritten << "pages to" << path
             << "(" << result.fileSizeBytes << "bytes)";
    return result;
}
