#include "InputDiscovery.h"

#include "../pdf/ImageConverter.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>

/**
 * @file InputDiscovery.cpp
 * @brief Implementation of input argument expansion.
 *
 * @see InputDiscovery.h for API documentation
 */

namespace MixerOps {

static QStringList nameFilters(const QStringList& suffixes)
{
    QStringList filters;
    for (const QString& suffix : suffixes) {
        filters << "*." + suffix;
    }
    return filters;
}

QStringList discoverFiles(const QString& directory, const QStringList& suffixes,
                          bool recursive)
{
    QStringList results;

    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "[InputDiscovery] Directory does not exist:" << directory;
        return results;
    }

    // Name filters are case-insensitive on every platform
    QDirIterator it(dir.absolutePath(), nameFilters(suffixes), QDir::Files,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        results.append(QFileInfo(it.next()).absoluteFilePath());
    }

    results.sort(Qt::CaseInsensitive);
    return results;
}

static DiscoveryResult collect(const QStringList& inputPaths, const QStringList& suffixes,
                               bool recursive)
{
    DiscoveryResult result;
    QSet<QString> seen;

    auto add = [&result, &seen](const QString& path) {
        if (!seen.contains(path)) {
            seen.insert(path);
            result.files.append(path);
        }
    };

    for (const QString& inputPath : inputPaths) {
        QFileInfo info(inputPath);

        if (!info.exists()) {
            qWarning() << "[InputDiscovery] Path does not exist:" << inputPath;
            result.missing.append(inputPath);
            continue;
        }

        if (info.isDir()) {
            const QStringList found = discoverFiles(info.absoluteFilePath(), suffixes, recursive);
            if (found.isEmpty()) {
                qWarning() << "[InputDiscovery] No matching files in" << inputPath;
            }
            for (const QString& file : found) {
                add(file);
            }
        } else {
            add(info.absoluteFilePath());
        }
    }

    qDebug() << "[InputDiscovery] Collected" << result.files.size() << "file(s),"
             << result.missing.size() << "missing";
    return result;
}

DiscoveryResult collectPdfs(const QStringList& inputPaths, bool recursive)
{
    return collect(inputPaths, QStringList{QStringLiteral("pdf")}, recursive);
}

DiscoveryResult collectImages(const QStringList& inputPaths, bool recursive)
{
    return collect(inputPaths, ImageConverter::supportedSuffixes(), recursive);
}

} // namespace MixerOps
