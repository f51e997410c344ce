// ============================================================================
// PageStream - Immutable ordered sequence of document pages
// ============================================================================

#include "PageStream.h"

#include <utility>

// ============================================================================
// Page
// ============================================================================

int Page::normalizeRotation(int degrees)
{
    return ((degrees % 360) + 360) % 360;
}

Page Page::rotated(int degrees) const
{
    Page copy = *this;
    copy.rotation = normalizeRotation(rotation + normalizeRotation(degrees));
    return copy;
}

QSizeF Page::displaySize() const
{
    if (rotation == 90 || rotation == 270) {
        return size.transposed();
    }
    return size;
}

bool Page::isPortrait() const
{
    const QSizeF shown = displaySize();
    return shown.height() > shown.width();
}

bool Page::operator==(const Page& other) const
{
    return source == other.source
        && sourceIndex == other.sourceIndex
        && rotation == other.rotation
        && size == other.size;
}

// ============================================================================
// PageStream
// ============================================================================

PageStream::PageStream(QVector<Page> pages)
    : m_pages(std::move(pages))
{
}
