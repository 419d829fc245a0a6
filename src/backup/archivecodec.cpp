#include "archivecodec.h"
#include "datadirectories.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <QDebug>

#include <archive.h>
#include <archive_entry.h>

namespace Backup {

namespace {

la_ssize_t appendToByteArray(struct archive *, void *clientData,
                             const void *buffer, size_t length)
{
    auto *out = static_cast<QByteArray*>(clientData);
    out->append(static_cast<const char*>(buffer), static_cast<qsizetype>(length));
    return static_cast<la_ssize_t>(length);
}

bool writeDirectoryEntry(struct archive *a, const QString &path, QString *error)
{
    QString dirPath = path;
    if (!dirPath.endsWith('/')) dirPath += '/';

    struct archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, dirPath.toUtf8().constData());
    archive_entry_set_filetype(entry, AE_IFDIR);
    archive_entry_set_perm(entry, 0755);
    archive_entry_set_mtime(entry, QDateTime::currentSecsSinceEpoch(), 0);

    const int r = archive_write_header(a, entry);
    archive_entry_free(entry);

    if (r < ARCHIVE_WARN) {
        *error = QString("Failed to write directory %1: %2")
            .arg(path, QString::fromUtf8(archive_error_string(a)));
        return false;
    }
    return true;
}

bool writeFileEntry(struct archive *a, const QString &path, const QByteArray &data,
                    const QDateTime &mtime, QString *error)
{
    struct archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, path.toUtf8().constData());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, data.size());
    archive_entry_set_mtime(entry, mtime.toSecsSinceEpoch(), 0);

    int r = archive_write_header(a, entry);
    archive_entry_free(entry);

    if (r < ARCHIVE_WARN) {
        *error = QString("Failed to write header for %1: %2")
            .arg(path, QString::fromUtf8(archive_error_string(a)));
        return false;
    }

    if (!data.isEmpty()
        && archive_write_data(a, data.constData(), static_cast<size_t>(data.size())) < 0) {
        *error = QString("Failed to write data for %1: %2")
            .arg(path, QString::fromUtf8(archive_error_string(a)));
        return false;
    }
    return true;
}

bool writeSourceFile(struct archive *a, const QString &path, const QString &sourceFile,
                     QString *error)
{
    QFile file(sourceFile);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QString("Cannot read %1: %2").arg(sourceFile, file.errorString());
        return false;
    }
    const QByteArray data = file.readAll();
    file.close();
    return writeFileEntry(a, path, data, QFileInfo(sourceFile).lastModified(), error);
}

bool writeSourceDirectory(struct archive *a, const QString &path, const QString &sourceDir,
                          QString *error)
{
    const QString prefix = path.isEmpty() ? QString() : path + '/';
    QDir root(sourceDir);

    for (const QString &rel : FileTree::relativeDirectories(sourceDir)) {
        if (!writeDirectoryEntry(a, prefix + rel, error)) return false;
    }
    for (const QString &rel : FileTree::relativeFiles(sourceDir)) {
        if (!writeSourceFile(a, prefix + rel, root.filePath(rel), error)) return false;
    }
    return true;
}

} // namespace

// ========== Packing ==========

BackupResult ArchiveCodec::pack(const QList<ArchiveEntry> &entries, QByteArray *out)
{
    out->clear();

    struct archive *a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_options(a, "zip:compression=deflate");
    // No block padding after the central directory
    archive_write_set_bytes_in_last_block(a, 1);

    if (archive_write_open(a, out, nullptr, appendToByteArray, nullptr) != ARCHIVE_OK) {
        const QString message = QString("Failed to open archive for writing: %1")
            .arg(QString::fromUtf8(archive_error_string(a)));
        archive_write_free(a);
        qWarning() << "[ArchiveCodec]" << message;
        return BackupResult::failure(BackupError::FileError, message);
    }

    QString error;
    bool ok = true;
    int written = 0;

    for (const ArchiveEntry &entry : entries) {
        if (entry.sourcePath.isEmpty()) {
            ok = writeFileEntry(a, entry.path, entry.data, QDateTime::currentDateTime(), &error);
        } else {
            QFileInfo info(entry.sourcePath);
            if (info.isDir()) {
                ok = writeSourceDirectory(a, entry.path, entry.sourcePath, &error);
            } else if (info.isFile()) {
                ok = writeSourceFile(a, entry.path, entry.sourcePath, &error);
            } else {
                qDebug() << "[ArchiveCodec] Skipping missing source" << entry.sourcePath;
                continue;
            }
        }
        if (!ok) break;
        written++;
    }

    if (archive_write_close(a) != ARCHIVE_OK && ok) {
        ok = false;
        error = QString("Failed to finish archive: %1")
            .arg(QString::fromUtf8(archive_error_string(a)));
    }
    archive_write_free(a);

    if (!ok) {
        out->clear();
        qWarning() << "[ArchiveCodec]" << error;
        return BackupResult::failure(BackupError::FileError, error);
    }

    qDebug() << "[ArchiveCodec] Packed" << written << "entries," << out->size() << "bytes";
    return BackupResult();
}

// ========== Unpacking ==========

QStringList ArchiveCodec::sanitizeEntryName(const QString &name)
{
    QString normalized = name;
    normalized.replace('\\', '/');

    QStringList parts;
    for (const QString &seg : normalized.split('/')) {
        if (seg.isEmpty() || seg == "." || seg == "..") continue;
        parts << seg;
    }
    return parts;
}

BackupResult ArchiveCodec::unpack(const QByteArray &archive, const QString &stagingDir)
{
    if (archive.isEmpty()) {
        return BackupResult::failure(BackupError::ArchiveCorrupt, "Archive is empty");
    }

    QDir staging(stagingDir);
    if (!staging.mkpath(".")) {
        return BackupResult::failure(BackupError::FileError,
            QString("Cannot create staging directory %1").arg(stagingDir));
    }

    struct archive *a = archive_read_new();
    archive_read_support_format_zip(a);

    if (archive_read_open_memory(a, archive.constData(), static_cast<size_t>(archive.size()))
            != ARCHIVE_OK) {
        const QString message = QString("Cannot open archive: %1")
            .arg(QString::fromUtf8(archive_error_string(a)));
        archive_read_free(a);
        qWarning() << "[ArchiveCodec]" << message;
        return BackupResult::failure(BackupError::ArchiveCorrupt, message);
    }

    BackupResult result;
    int files = 0;
    int dirs = 0;
    struct archive_entry *entry;
    int r;

    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char *utf8 = archive_entry_pathname_utf8(entry);
        const QString name = utf8 ? QString::fromUtf8(utf8)
                                  : QString::fromLocal8Bit(archive_entry_pathname(entry));

        const QStringList parts = sanitizeEntryName(name);
        if (parts.isEmpty()) {
            archive_read_data_skip(a);
            continue;
        }
        const QString outPath = staging.filePath(parts.join('/'));

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            if (!QDir().mkpath(outPath)) {
                result.warnings << QString("Cannot create directory %1").arg(outPath);
            }
            dirs++;
            continue;
        }

        if (type != AE_IFREG) {
            qDebug() << "[ArchiveCodec] Skipping non-regular entry" << name;
            archive_read_data_skip(a);
            continue;
        }

        QByteArray data;
        char buffer[64 * 1024];
        la_ssize_t n;
        while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<qsizetype>(n));
        }
        if (n < 0) {
            const QString message = QString("Corrupt entry %1: %2")
                .arg(name, QString::fromUtf8(archive_error_string(a)));
            archive_read_free(a);
            qWarning() << "[ArchiveCodec]" << message;
            return BackupResult::failure(BackupError::ArchiveCorrupt, message);
        }

        QString error;
        if (!FileTree::writeFileStaged(outPath, data, &error)) {
            archive_read_free(a);
            qWarning() << "[ArchiveCodec]" << error;
            return BackupResult::failure(BackupError::FileError, error);
        }
        files++;
    }

    if (r != ARCHIVE_EOF) {
        const QString message = QString("Cannot read archive: %1")
            .arg(QString::fromUtf8(archive_error_string(a)));
        archive_read_free(a);
        qWarning() << "[ArchiveCodec]" << message;
        return BackupResult::failure(BackupError::ArchiveCorrupt, message);
    }

    archive_read_free(a);
    qDebug() << "[ArchiveCodec] Extracted" << files << "files and" << dirs
             << "directories to" << stagingDir;
    return result;
}

BackupResult ArchiveCodec::unpackFile(const QString &archivePath, const QString &stagingDir)
{
    QFile file(archivePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return BackupResult::failure(BackupError::FileError,
            QString("Cannot open backup file %1: %2").arg(archivePath, file.errorString()));
    }
    const QByteArray data = file.readAll();
    file.close();
    return unpack(data, stagingDir);
}

} // namespace Backup
