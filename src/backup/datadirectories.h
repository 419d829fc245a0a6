#ifndef DATADIRECTORIES_H
#define DATADIRECTORIES_H

#include <QString>
#include <QStringList>

namespace Backup {

/**
 * @brief The three user file roots that are backed up verbatim
 *
 * Default layout under the application data root:
 *   <root>/
 *   ├── upload/    - files attached to messages
 *   ├── images/    - generated and pasted images
 *   └── avatars/   - assistant and user avatars
 */
struct DataDirectories {
    QString uploadDir;
    QString imagesDir;
    QString avatarsDir;

    static DataDirectories fromRoot(const QString &dataRoot);

    /**
     * @brief Directory for the given archive tree name ("upload", ...)
     */
    QString directoryForTree(const QString &treeName) const;

    /**
     * @brief Archive tree names in backup order
     */
    static QStringList treeNames();
};

/**
 * @brief Filesystem helpers shared by the snapshot and restore paths
 */
namespace FileTree {

/**
 * @brief All regular files below @p root, relative and '/'-separated
 *
 * Symbolic links are not followed. Returns an empty list if @p root
 * does not exist.
 */
QStringList relativeFiles(const QString &root);

/**
 * @brief All sub-directories below @p root, relative and '/'-separated
 */
QStringList relativeDirectories(const QString &root);

/**
 * @brief Copy a file, writing to a temporary sibling first
 *
 * The destination only appears once fully written. Parent directories are
 * created on demand.
 */
bool copyFileStaged(const QString &source, const QString &destination, QString *error = nullptr);

/**
 * @brief Write bytes to a file the same staged way
 */
bool writeFileStaged(const QString &destination, const QByteArray &data, QString *error = nullptr);

} // namespace FileTree

} // namespace Backup

#endif // DATADIRECTORIES_H
