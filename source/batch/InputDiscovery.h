#ifndef INPUTDISCOVERY_H
#define INPUTDISCOVERY_H

/**
 * @file InputDiscovery.h
 * @brief Expansion of command-line input arguments into file lists.
 *
 * - Explicit files are kept in the order given
 * - Directories expand to the matching files inside, sorted by name
 * - Missing paths are reported separately
 * - Duplicates (same absolute path) are dropped, first occurrence wins
 */

#include <QString>
#include <QStringList>

namespace MixerOps {

/**
 * @brief Result of expanding input arguments.
 */
struct DiscoveryResult {
    QStringList files;      ///< Absolute paths, in argument order
    QStringList missing;    ///< Arguments that do not exist
};

/**
 * @brief Find files with one of the given suffixes in a directory.
 * @param suffixes Lower-case suffixes without dot (e.g. "pdf")
 * @return Absolute paths sorted case-insensitively
 */
QStringList discoverFiles(const QString& directory, const QStringList& suffixes,
                          bool recursive = false);

/**
 * @brief Expand PDF input arguments.
 */
DiscoveryResult collectPdfs(const QStringList& inputPaths, bool recursive = false);

/**
 * @brief Expand image input arguments.
 */
DiscoveryResult collectImages(const QStringList& inputPaths, bool recursive = false);

} // namespace MixerOps

#endif // INPUTDISCOVERY_H
