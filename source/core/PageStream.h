#pragma once

// ============================================================================
// PageStream - Immutable ordered sequence of document pages
// ============================================================================
// A Page is a reference to one page of a loaded source document plus the
// rotation it should be written with. A PageStream is what every page
// operation consumes and produces.
//
// Pages keep their source document alive through shared ownership, so a
// stream stays valid after the code that loaded it has returned.
// ============================================================================

#include <QSizeF>
#include <QVector>

#include <memory>

class PdfSourceDocument;

/**
 * @brief A single page reference.
 *
 * A page has no identity beyond its position in a PageStream. Two pages are
 * equal when they point to the same source page with the same rotation.
 */
struct Page {
    std::shared_ptr<const PdfSourceDocument> source;  ///< Backing document (may be null in tests)
    int sourceIndex = -1;       ///< 0-based page index in the source document
    int rotation = 0;           ///< Absolute rotation: 0, 90, 180 or 270
    QSizeF size;                ///< Unrotated MediaBox size in PDF points

    /**
     * @brief Normalize any angle to 0..359 (e.g. -90 → 270, 450 → 90).
     */
    static int normalizeRotation(int degrees);

    /**
     * @brief Copy of this page with degrees added to its rotation.
     */
    Page rotated(int degrees) const;

    /**
     * @brief Size as displayed, i.e. width and height swapped for 90/270.
     */
    QSizeF displaySize() const;

    /**
     * @brief True when the displayed page is taller than it is wide.
     */
    bool isPortrait() const;

    bool operator==(const Page& other) const;
    bool operator!=(const Page& other) const { return !(*this == other); }
};

/**
 * @brief Ordered, immutable sequence of pages.
 *
 * There are no mutating members: transforms build a new stream.
 */
class PageStream {
public:
    using const_iterator = QVector<Page>::const_iterator;

    PageStream() = default;
    explicit PageStream(QVector<Page> pages);

    int size() const { return m_pages.size(); }
    bool isEmpty() const { return m_pages.isEmpty(); }

    /**
     * @brief Page at a 0-based position. Caller must check bounds.
     */
    const Page& at(int index) const { return m_pages.at(index); }

    /**
     * @brief Check a 1-based page number against the stream length.
     */
    bool containsPosition(int position) const { return position >= 1 && position <= m_pages.size(); }

    const QVector<Page>& pages() const { return m_pages; }

    const_iterator begin() const { return m_pages.cbegin(); }
    const_iterator end() const { return m_pages.cend(); }

    bool operator==(const PageStream& other) const { return m_pages == other.m_pages; }
    bool operator!=(const PageStream& other) const { return !(*this == other); }

private:
    QVector<Page> m_pages;
};
