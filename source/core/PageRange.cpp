// ============================================================================
// PageRange - Parsing of user-supplied page range text
// ============================================================================

#include "PageRange.h"

#include <QDebug>
#include <QStringList>

#include <algorithm>

namespace PageRange {

// Appends start..end (either direction) clipped to [1, maxPage].
static void appendRun(QVector<int>& out, int start, int end, int maxPage)
{
    if (start <= end) {
        int first = qMax(start, 1);
        int last = qMin(end, maxPage);
        for (int page = first; page <= last; ++page) {
            out.append(page);
        }
    } else {
        int first = qMin(start, maxPage);
        int last = qMax(end, 1);
        for (int page = first; page >= last; --page) {
            out.append(page);
        }
    }
}

QVector<int> parse(const QString& spec, int maxPage, Order order)
{
    QVector<int> raw;

    if (maxPage <= 0 || spec.trimmed().isEmpty()) {
        return raw;
    }

    const QStringList parts = spec.split(QLatin1Char(','));

    for (const QString& rawPart : parts) {
        const QString part = rawPart.trimmed();
        if (part.isEmpty()) {
            continue;
        }

        int dash = part.indexOf(QLatin1Char('-'));
        if (dash >= 0) {
            // Range "A-B": split at the first dash only, so "1-2-3" and "-3" fail
            bool okStart = false;
            bool okEnd = false;
            int start = part.left(dash).trimmed().toInt(&okStart);
            int end = part.mid(dash + 1).trimmed().toInt(&okEnd);
            if (!okStart || !okEnd) {
                qDebug() << "[PageRange] Skipping malformed range:" << part;
                continue;
            }
            appendRun(raw, start, end, maxPage);
            continue;
        }

        bool ok = false;
        int page = part.toInt(&ok);
        if (!ok) {
            qDebug() << "[PageRange] Skipping malformed token:" << part;
            continue;
        }
        if (page >= 1 && page <= maxPage) {
            raw.append(page);
        }
    }

    QVector<int> result;
    result.reserve(raw.size());
    QSet<int> seen;
    for (int page : raw) {
        if (!seen.contains(page)) {
            seen.insert(page);
            result.append(page);
        }
    }

    if (order == Order::AscendingSet) {
        std::sort(result.begin(), result.end());
    }

    return result;
}

QSet<int> parseSet(const QString& spec, int maxPage)
{
    const QVector<int> pages = parse(spec, maxPage, Order::AscendingSet);
    return QSet<int>(pages.begin(), pages.end());
}

QVector<int> complement(const QSet<int>& pages, int maxPage)
{
    QVector<int> result;
    for (int page = 1; page <= maxPage; ++page) {
        if (!pages.contains(page)) {
            result.append(page);
        }
    }
    return result;
}

} // namespace PageRange
