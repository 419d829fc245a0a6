#include "filetreemerger.h"
#include "datadirectories.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace Backup {

void FileTreeMerger::overwrite(const QString &source, const QString &destination,
                               RestoreStats *stats, QStringList *warnings)
{
    if (!QFileInfo(source).isDir()) return;

    QDir dst(destination);
    if (dst.exists() && !dst.removeRecursively()) {
        // Whatever survived is overwritten file by file below
        warnings->append(QString("Could not fully remove %1").arg(destination));
    }

    copyTree(source, destination, false, stats, warnings);
}

void FileTreeMerger::merge(const QString &source, const QString &destination,
                           RestoreStats *stats, QStringList *warnings)
{
    if (!QFileInfo(source).isDir()) return;

    copyTree(source, destination, true, stats, warnings);
}

void FileTreeMerger::copyTree(const QString &source, const QString &destination,
                              bool skipExisting, RestoreStats *stats, QStringList *warnings)
{
    if (!QDir().mkpath(destination)) {
        warnings->append(QString("Cannot create directory %1").arg(destination));
        return;
    }

    QDir srcDir(source);
    QDir dstDir(destination);

    // Empty directories survive the round trip too
    for (const QString &rel : FileTree::relativeDirectories(source)) {
        if (!dstDir.mkpath(rel)) {
            warnings->append(QString("Cannot create directory %1").arg(dstDir.filePath(rel)));
        }
    }

    int copied = 0;
    for (const QString &rel : FileTree::relativeFiles(source)) {
        const QString target = dstDir.filePath(rel);

        if (skipExisting && QFileInfo::exists(target)) {
            stats->filesSkipped++;
            continue;
        }

        QString error;
        if (FileTree::copyFileStaged(srcDir.filePath(rel), target, &error)) {
            stats->filesCopied++;
            copied++;
        } else {
            stats->filesFailed++;
            warnings->append(error);
            qWarning() << "[FileTreeMerger]" << error;
        }
    }

    qDebug() << "[FileTreeMerger]" << (skipExisting ? "Merged" : "Restored")
             << copied << "file(s) into" << destination;
}

} // namespace Backup
