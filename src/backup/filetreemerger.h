#ifndef FILETREEMERGER_H
#define FILETREEMERGER_H

#include "backuptypes.h"

#include <QString>
#include <QStringList>

namespace Backup {

/**
 * @brief Restores one staged file tree into its destination directory
 *
 * A missing source tree is not an error: nothing happens. Files that fail
 * to copy are counted and reported as warnings; the rest of the tree is
 * still restored.
 */
class FileTreeMerger
{
public:
    /**
     * @brief Delete @p destination and recreate it from @p source
     */
    static void overwrite(const QString &source, const QString &destination,
                          RestoreStats *stats, QStringList *warnings);

    /**
     * @brief Copy only the files whose destination path does not exist yet
     */
    static void merge(const QString &source, const QString &destination,
                      RestoreStats *stats, QStringList *warnings);

private:
    static void copyTree(const QString &source, const QString &destination, bool skipExisting,
                         RestoreStats *stats, QStringList *warnings);
};

} // namespace Backup

#endif // FILETREEMERGER_H
