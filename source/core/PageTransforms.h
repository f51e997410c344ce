#pragma once

// ============================================================================
// PageTransforms - Page-level operations over PageStreams
// ============================================================================
// Merge, interleave, extract, delete, rotate, reverse, split and
// auto-landscape. Every operation is a pure function: inputs are never
// modified and the output is always a newly built stream.
//
// Operations fail only on structurally impossible requests (no input
// streams, non-positive split size, ...). Empty or out-of-range selections
// produce empty or shorter results with a warning attached.
// ============================================================================

#include "OperationError.h"
#include "PageStream.h"

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

namespace PageOps {

/**
 * @brief Interleave strategies.
 */
enum class InterleaveMode {
    Alternate,      ///< A1, B1, A2, B2, ... then the tail of the longer one
    OddAEvenB,      ///< Odd positions from A, even positions from B
    EvenAOddB,      ///< Even positions from A, odd positions from B
    OddAOnly,       ///< Only odd positions of A
    EvenBOnly       ///< Only even positions of B
};

/**
 * @brief Parameters of an interleave.
 */
struct InterleaveSpec {
    InterleaveMode mode = InterleaveMode::Alternate;
    int startFrom = 1;  ///< 1-based position to start from in both sources
};

/**
 * @brief Result of a page operation.
 *
 * Single-output operations put their result in streams[0]; split produces
 * one stream per chunk.
 */
struct TransformResult {
    bool success = false;
    OperationError error = OperationError::None;
    QString errorMessage;
    QVector<PageStream> streams;
    QStringList warnings;           ///< Non-fatal notes (dropped or empty selections)

    /// @brief First output stream, or an empty stream if there is none.
    PageStream stream() const { return streams.isEmpty() ? PageStream() : streams.first(); }
};

/**
 * @brief Concatenate all pages of all streams in list order.
 * @return ValidationError if streams is empty.
 */
TransformResult merge(const QVector<PageStream>& streams);

/**
 * @brief Combine two streams page by page.
 *
 * Positions are 1-based positions in each source. Pages before
 * spec.startFrom are skipped in both sources; parity is decided on the
 * original position.
 *
 * @return ValidationError if spec.startFrom < 1.
 */
TransformResult interleave(const PageStream& a, const PageStream& b,
                           const InterleaveSpec& spec);

/**
 * @brief Pages at the given 1-based positions, in the given order.
 *
 * Out-of-bounds positions are dropped with a warning.
 */
TransformResult extract(const PageStream& source, const QVector<int>& positions);

/**
 * @brief All pages whose 1-based position is not in the set, in order.
 */
TransformResult remove(const PageStream& source, const QSet<int>& positions);

/**
 * @brief Rotate every page by degrees (added to the existing rotation).
 * @return ValidationError unless degrees is a multiple of 90.
 */
TransformResult rotate(const PageStream& source, int degrees);

/**
 * @brief Rotate the pages at the given 1-based positions; others pass through.
 * @return ValidationError unless degrees is a multiple of 90.
 */
TransformResult rotate(const PageStream& source, const QSet<int>& positions, int degrees);

/**
 * @brief Pages in strictly descending original order.
 */
TransformResult reverse(const PageStream& source);

/**
 * @brief Consecutive chunks of at most pagesPerChunk pages.
 * @return ValidationError if pagesPerChunk <= 0.
 */
TransformResult split(const PageStream& source, int pagesPerChunk);

/**
 * @brief Rotate every displayed-portrait page by 90 degrees.
 */
TransformResult autoLandscape(const PageStream& source);

/**
 * @brief CLI name of an interleave mode (e.g. "a-odd-b-even").
 */
QString interleaveModeName(InterleaveMode mode);

/**
 * @brief Parse a CLI interleave mode name.
 * @param ok Set to false if the name is unknown
 */
InterleaveMode interleaveModeFromName(const QString& name, bool* ok = nullptr);

} // namespace PageOps
