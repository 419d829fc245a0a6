#ifndef ARCHIVECODEC_H
#define ARCHIVECODEC_H

#include "backuptypes.h"

#include <QString>
#include <QByteArray>
#include <QList>

namespace Backup {

/**
 * @brief One member to write into an archive
 *
 * Exactly one source is used: inline data, or a file/directory on disk
 * (sourcePath). A directory source is written recursively below @c path.
 */
struct ArchiveEntry {
    QString path;           ///< In-archive path, '/'-separated
    QByteArray data;        ///< Inline content (when sourcePath is empty)
    QString sourcePath;     ///< File or directory to read from

    static ArchiveEntry fromData(const QString &path, const QByteArray &data) {
        ArchiveEntry e;
        e.path = path;
        e.data = data;
        return e;
    }

    static ArchiveEntry fromSource(const QString &path, const QString &sourcePath) {
        ArchiveEntry e;
        e.path = path;
        e.sourcePath = sourcePath;
        return e;
    }
};

/**
 * @brief ZIP container used for backups
 *
 * Usage:
 * @code
 * QByteArray blob;
 * ArchiveCodec::pack({ArchiveEntry::fromData("settings.json", json),
 *                     ArchiveEntry::fromSource("upload", uploadDir)}, &blob);
 *
 * QTemporaryDir staging;
 * BackupResult r = ArchiveCodec::unpack(blob, staging.path());
 * @endcode
 */
class ArchiveCodec
{
public:
    /**
     * @brief Write @p entries, in order, into a ZIP blob
     */
    static BackupResult pack(const QList<ArchiveEntry> &entries, QByteArray *out);

    /**
     * @brief Extract a ZIP blob into @p stagingDir
     *
     * Entry names are normalized: '\' becomes '/', and empty, "." and ".."
     * segments are dropped, so nothing can land outside @p stagingDir.
     * Fails with ArchiveCorrupt if the container cannot be parsed.
     */
    static BackupResult unpack(const QByteArray &archive, const QString &stagingDir);

    /**
     * @brief Extract a ZIP file from disk into @p stagingDir
     */
    static BackupResult unpackFile(const QString &archivePath, const QString &stagingDir);

    /**
     * @brief Normalize an entry name to safe relative segments
     * @return The segments; empty if nothing remains
     */
    static QStringList sanitizeEntryName(const QString &name);
};

} // namespace Backup

#endif // ARCHIVECODEC_H
