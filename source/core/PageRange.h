#pragma once

// ============================================================================
// PageRange - Parsing of user-supplied page range text
// ============================================================================
// Turns text like "1-3,5,10" or "12-10" into 1-based page numbers.
//
// Parsing is lenient: malformed tokens are skipped and out-of-bounds pages
// are dropped. An empty result means "no pages selected", never an error.
// ============================================================================

#include <QString>
#include <QVector>
#include <QSet>

namespace PageRange {

/**
 * @brief How duplicates and ordering are resolved in the parsed result.
 */
enum class Order {
    ExtractionOrder,    ///< Order of the range text, first occurrence wins
    AscendingSet        ///< Unique pages, sorted ascending
};

/**
 * @brief Parse a page range string.
 * @param spec Range text, e.g. "1-3, 5, 10" (1-based, descending ranges allowed)
 * @param maxPage Number of pages in the target document
 * @param order Duplicate/ordering policy
 * @return 1-based page numbers, all within [1, maxPage]
 *
 * Examples (maxPage = 12):
 * - "1-3,5,10" → {1, 2, 3, 5, 10}
 * - "12-10"    → {12, 11, 10}
 * - "3,1-3"    → {3, 1, 2} (ExtractionOrder) or {1, 2, 3} (AscendingSet)
 * - "x, 0, 99" → {}
 */
QVector<int> parse(const QString& spec, int maxPage,
                   Order order = Order::ExtractionOrder);

/**
 * @brief Parse a page range string into a membership set.
 *
 * Used by delete and rotate, where only inclusion matters.
 */
QSet<int> parseSet(const QString& spec, int maxPage);

/**
 * @brief Pages in [1, maxPage] that are NOT in the given set, ascending.
 */
QVector<int> complement(const QSet<int>& pages, int maxPage);

} // namespace PageRange
