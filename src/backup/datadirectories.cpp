#include "datadirectories.h"
#include "backuptypes.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace Backup {

DataDirectories DataDirectories::fromRoot(const QString &dataRoot)
{
    QDir root(dataRoot);
    DataDirectories dirs;
    dirs.uploadDir = root.filePath(ArchiveLayout::UploadTree);
    dirs.imagesDir = root.filePath(ArchiveLayout::ImagesTree);
    dirs.avatarsDir = root.filePath(ArchiveLayout::AvatarsTree);
    return dirs;
}

QString DataDirectories::directoryForTree(const QString &treeName) const
{
    if (treeName == ArchiveLayout::UploadTree) return uploadDir;
    if (treeName == ArchiveLayout::ImagesTree) return imagesDir;
    if (treeName == ArchiveLayout::AvatarsTree) return avatarsDir;
    return QString();
}

QStringList DataDirectories::treeNames()
{
    return {ArchiveLayout::UploadTree, ArchiveLayout::AvatarsTree, ArchiveLayout::ImagesTree};
}

// ========== FileTree ==========

namespace FileTree {

QStringList relativeFiles(const QString &root)
{
    QStringList files;
    QDir rootDir(root);
    if (!rootDir.exists()) {
        return files;
    }

    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        // QDir::relativeFilePath always answers with '/'
        files << rootDir.relativeFilePath(it.next());
    }
    files.sort();
    return files;
}

QStringList relativeDirectories(const QString &root)
{
    QStringList dirs;
    QDir rootDir(root);
    if (!rootDir.exists()) {
        return dirs;
    }

    QDirIterator it(root, QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        dirs << rootDir.relativeFilePath(it.next());
    }
    dirs.sort();
    return dirs;
}

bool writeFileStaged(const QString &destination, const QByteArray &data, QString *error)
{
    const QString parent = QFileInfo(destination).absolutePath();
    if (!QDir().mkpath(parent)) {
        if (error) *error = QString("Cannot create directory %1").arg(parent);
        return false;
    }

    QSaveFile out(destination);
    if (!out.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write %1: %2").arg(destination, out.errorString());
        return false;
    }
    if (out.write(data) != data.size()) {
        if (error) *error = QString("Short write to %1: %2").arg(destination, out.errorString());
        out.cancelWriting();
        return false;
    }
    if (!out.commit()) {
        if (error) *error = QString("Cannot commit %1: %2").arg(destination, out.errorString());
        return false;
    }
    return true;
}

bool copyFileStaged(const QString &source, const QString &destination, QString *error)
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read %1: %2").arg(source, in.errorString());
        return false;
    }

    const QString parent = QFileInfo(destination).absolutePath();
    if (!QDir().mkpath(parent)) {
        if (error) *error = QString("Cannot create directory %1").arg(parent);
        return false;
    }

    QSaveFile out(destination);
    if (!out.open(QIODevice::WriteOnly)) {
        if (error) *error = QString("Cannot write %1: %2").arg(destination, out.errorString());
        return false;
    }

    char buffer[64 * 1024];
    qint64 n;
    while ((n = in.read(buffer, sizeof(buffer))) > 0) {
        if (out.write(buffer, n) != n) {
            if (error) *error = QString("Short write to %1: %2").arg(destination, out.errorString());
            out.cancelWriting();
            return false;
        }
    }
    if (n < 0) {
        if (error) *error = QString("Read error on %1: %2").arg(source, in.errorString());
        out.cancelWriting();
        return false;
    }

    if (!out.commit()) {
        if (error) *error = QString("Cannot commit %1: %2").arg(destination, out.errorString());
        return false;
    }
    return true;
}

} // namespace FileTree

} // namespace Backup
