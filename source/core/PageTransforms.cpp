// ============================================================================
// PageTransforms - Page-level operations over PageStreams
// ============================================================================

#include "PageTransforms.h"

#include <QDebug>
#include <QObject>

#include <algorithm>

namespace PageOps {

// ============================================================================
// Helpers
// ============================================================================

static TransformResult succeeded(QVector<PageStream> streams, QStringList warnings = {})
{
    TransformResult result;
    result.success = true;
    result.streams = std::move(streams);
    result.warnings = std::move(warnings);
    return result;
}

static TransformResult succeeded(const PageStream& stream, QStringList warnings = {})
{
    return succeeded(QVector<PageStream>{stream}, std::move(warnings));
}

static TransformResult invalid(const QString& message)
{
    qWarning() << "[PageOps]" << message;

    TransformResult result;
    result.error = OperationError::ValidationError;
    result.errorMessage = message;
    return result;
}

static bool isOdd(int position)
{
    return position % 2 == 1;
}

static bool isQuarterTurn(int degrees)
{
    return degrees % 90 == 0;
}

// ============================================================================
// Merge
// ============================================================================

TransformResult merge(const QVector<PageStream>& streams)
{
    if (streams.isEmpty()) {
        return invalid(QObject::tr("Merge needs at least one input document"));
    }

    QVector<Page> pages;
    for (const PageStream& stream : streams) {
        pages += stream.pages();
    }

    QStringList warnings;
    if (pages.isEmpty()) {
        warnings << QObject::tr("All input documents are empty");
    }
    return succeeded(PageStream(std::move(pages)), warnings);
}

// ============================================================================
// Interleave
// ============================================================================

TransformResult interleave(const PageStream& a, const PageStream& b,
                           const InterleaveSpec& spec)
{
    if (spec.startFrom < 1) {
        return invalid(QObject::tr("Interleave start position must be at least 1 (got %1)")
                       .arg(spec.startFrom));
    }

    const int countA = a.size();
    const int countB = b.size();
    const int start = spec.startFrom;
    QVector<Page> pages;

    switch (spec.mode) {
        case InterleaveMode::Alternate: {
            int ia = start - 1;
            int ib = start - 1;
            while (ia < countA || ib < countB) {
                if (ia < countA) {
                    pages.append(a.at(ia++));
                }
                if (ib < countB) {
                    pages.append(b.at(ib++));
                }
            }
            break;
        }
        case InterleaveMode::OddAEvenB:
            for (int i = start; i <= qMax(countA, countB); ++i) {
                if (i <= countA && isOdd(i)) {
                    pages.append(a.at(i - 1));
                }
                if (i <= countB && !isOdd(i)) {
                    pages.append(b.at(i - 1));
                }
            }
            break;
        case InterleaveMode::EvenAOddB:
            for (int i = start; i <= qMax(countA, countB); ++i) {
                if (i <= countA && !isOdd(i)) {
                    pages.append(a.at(i - 1));
                }
                if (i <= countB && isOdd(i)) {
                    pages.append(b.at(i - 1));
                }
            }
            break;
        case InterleaveMode::OddAOnly:
            for (int i = start; i <= countA; ++i) {
                if (isOdd(i)) {
                    pages.append(a.at(i - 1));
                }
            }
            break;
        case InterleaveMode::EvenBOnly:
            for (int i = start; i <= countB; ++i) {
                if (!isOdd(i)) {
                    pages.append(b.at(i - 1));
                }
            }
            break;
    }

    QStringList warnings;
    if (pages.isEmpty()) {
        warnings << QObject::tr("Interleave selected no pages (start position %1)").arg(start);
    }
    return succeeded(PageStream(std::move(pages)), warnings);
}

// ============================================================================
// Extract / Delete
// ============================================================================

TransformResult extract(const PageStream& source, const QVector<int>& positions)
{
    QVector<Page> pages;
    pages.reserve(positions.size());
    int dropped = 0;

    for (int position : positions) {
        if (!source.containsPosition(position)) {
            ++dropped;
            continue;
        }
        pages.append(source.at(position - 1));
    }

    QStringList warnings;
    if (source.isEmpty()) {
        warnings << QObject::tr("Source document has no pages");
    } else if (dropped > 0) {
        warnings << QObject::tr("Ignored %1 page number(s) outside 1-%2")
                    .arg(dropped).arg(source.size());
    }
    if (pages.isEmpty()) {
        warnings << QObject::tr("No pages selected");
    }
    return succeeded(PageStream(std::move(pages)), warnings);
}

TransformResult remove(const PageStream& source, const QSet<int>& positions)
{
    QVector<Page> pages;
    for (int i = 0; i < source.size(); ++i) {
        if (!positions.contains(i + 1)) {
            pages.append(source.at(i));
        }
    }

    QStringList warnings;
    if (pages.size() == source.size() && !source.isEmpty()) {
        warnings << QObject::tr("No pages matched the deletion range");
    }
    if (pages.isEmpty()) {
        warnings << QObject::tr("Every page was deleted");
    }
    return succeeded(PageStream(std::move(pages)), warnings);
}

// ============================================================================
// Rotate
// ============================================================================

TransformResult rotate(const PageStream& source, int degrees)
{
    if (!isQuarterTurn(degrees)) {
        return invalid(QObject::tr("Rotation must be a multiple of 90 degrees (got %1)")
                       .arg(degrees));
    }

    QVector<Page> pages;
    pages.reserve(source.size());
    for (const Page& page : source) {
        pages.append(page.rotated(degrees));
    }
    return succeeded(PageStream(std::move(pages)));
}

TransformResult rotate(const PageStream& source, const QSet<int>& positions, int degrees)
{
    if (!isQuarterTurn(degrees)) {
        return invalid(QObject::tr("Rotation must be a multiple of 90 degrees (got %1)")
                       .arg(degrees));
    }

    QVector<Page> pages;
    pages.reserve(source.size());
    int matched = 0;
    for (int i = 0; i < source.size(); ++i) {
        if (positions.contains(i + 1)) {
            pages.append(source.at(i).rotated(degrees));
            ++matched;
        } else {
            pages.append(source.at(i));
        }
    }

    QStringList warnings;
    if (matched == 0) {
        warnings << QObject::tr("No pages matched the rotation range");
    }
    return succeeded(PageStream(std::move(pages)), warnings);
}

// ============================================================================
// Reverse / Split
// ============================================================================

TransformResult reverse(const PageStream& source)
{
    QVector<Page> pages = source.pages();
    std::reverse(pages.begin(), pages.end());
    return succeeded(PageStream(std::move(pages)));
}

TransformResult split(const PageStream& source, int pagesPerChunk)
{
    if (pagesPerChunk <= 0) {
        return invalid(QObject::tr("Split size must be a positive number of pages (got %1)")
                       .arg(pagesPerChunk));
    }

    QVector<PageStream> chunks;
    const QVector<Page>& all = source.pages();
    for (int start = 0; start < all.size(); start += pagesPerChunk) {
        chunks.append(PageStream(all.mid(start, pagesPerChunk)));
    }

    QStringList warnings;
    if (chunks.isEmpty()) {
        warnings << QObject::tr("Source document has no pages to split");
    }
    return succeeded(chunks, warnings);
}

// ============================================================================
// Auto-landscape
// ============================================================================

TransformResult autoLandscape(const PageStream& source)
{
    QVector<Page> pages;
    pages.reserve(source.size());
    for (const Page& page : source) {
        pages.append(page.isPortrait() ? page.rotated(90) : page);
    }
    return succeeded(PageStream(std::move(pages)));
}

// ============================================================================
// Mode names
// ============================================================================

QString interleaveModeName(InterleaveMode mode)
{
    switch (mode) {
        case InterleaveMode::Alternate: return QStringLiteral("alternate");
        case InterleaveMode::OddAEvenB: return QStringLiteral("a-odd-b-even");
        case InterleaveMode::EvenAOddB: return QStringLiteral("a-even-b-odd");
        case InterleaveMode::OddAOnly:  return QStringLiteral("a-odd");
        case InterleaveMode::EvenBOnly: return QStringLiteral("b-even");
    }
    return QString();
}

InterleaveMode interleaveModeFromName(const QString& name, bool* ok)
{
    static const InterleaveMode modes[] = {
        InterleaveMode::Alternate, InterleaveMode::OddAEvenB, InterleaveMode::EvenAOddB,
        InterleaveMode::OddAOnly, InterleaveMode::EvenBOnly
    };

    const QString wanted = name.trimmed().toLower();
    for (InterleaveMode mode : modes) {
        if (interleaveModeName(mode) == wanted) {
            if (ok) *ok = true;
            return mode;
        }
    }

    if (ok) *ok = false;
    return InterleaveMode::Alternate;
}

} // namespace PageOps
