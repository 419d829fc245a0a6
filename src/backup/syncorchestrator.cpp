#include "syncorchestrator.h"
#include "archivecodec.h"
#include "restoreplanner.h"
#include "snapshotbuilder.h"
#include "webdavtransport.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QScopeGuard>
#include <QStandardPaths>
#include <QDebug>

namespace Backup {

namespace {

BackupResult invalidConfig()
{
    return BackupResult::failure(BackupError::InvalidConfig, "WebDAV server URL is not configured");
}

} // namespace

SyncOrchestrator::SyncOrchestrator(SettingsStore *settings, ChatService *chats,
                                   const DataDirectories &dirs, DavClient *client,
                                   QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_chats(chats)
    , m_dirs(dirs)
    , m_client(client)
    , m_tempDirectory(defaultTempDirectory())
{
}

SyncOrchestrator::~SyncOrchestrator()
{
}

QString SyncOrchestrator::defaultTempDirectory()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    return QDir(base.isEmpty() ? QDir::tempPath() : base).filePath("kelivosync");
}

QString SyncOrchestrator::ensureTempDirectory()
{
    if (QDir().mkpath(m_tempDirectory)) {
        return m_tempDirectory;
    }
    qWarning() << "[SyncOrchestrator] Cannot create" << m_tempDirectory
               << "- falling back to" << QDir::tempPath();
    return QDir::tempPath();
}

// ========== Operation bookkeeping ==========

bool SyncOrchestrator::beginOperation(const QString &operation, BackupResult *rejected)
{
    if (m_busy) {
        *rejected = BackupResult::failure(BackupError::Busy,
            QString("Cannot start %1: another operation is running").arg(operation));
        rejected->startTime = rejected->endTime = QDateTime::currentDateTime();
        qWarning() << "[SyncOrchestrator]" << rejected->errorMessage;
        emit errorOccurred(rejected->errorMessage);
        return false;
    }

    m_busy = true;
    qDebug() << "[SyncOrchestrator] Starting" << operation;
    emit operationStarted(operation);
    return true;
}

BackupResult SyncOrchestrator::finishOperation(const QString &operation, BackupResult result)
{
    m_busy = false;

    if (!result.startTime.isValid()) {
        result.startTime = QDateTime::currentDateTime();
    }
    if (!result.endTime.isValid()) {
        result.endTime = QDateTime::currentDateTime();
    }

    for (const QString &warning : result.warnings) {
        emit warningOccurred(warning);
    }

    if (result.success) {
        emit logMessage(QString("%1 finished").arg(operation));
    } else {
        qWarning() << "[SyncOrchestrator]" << operation << "failed:"
                   << backupErrorName(result.error) << result.errorMessage;
        emit errorOccurred(result.errorMessage);
    }

    emit operationFinished(operation, result);
    return result;
}

// ========== Archive building ==========

BackupResult SyncOrchestrator::buildArchive(const WebDavConfig &cfg, QByteArray *blob)
{
    SnapshotBuilder builder(m_settings, m_chats, m_dirs);
    const QList<ArchiveEntry> entries = builder.buildArchiveEntries(cfg);

    emit logMessage(QString("Packing %1 archive entries").arg(entries.size()));
    return ArchiveCodec::pack(entries, blob);
}

BackupResult SyncOrchestrator::writeArchive(const WebDavConfig &cfg, const QString &path)
{
    QByteArray blob;
    BackupResult result = buildArchive(cfg, &blob);
    if (!result.success) {
        return result;
    }

    QString error;
    if (!FileTree::writeFileStaged(path, blob, &error)) {
        return BackupResult::failure(BackupError::FileError, error);
    }

    qDebug() << "[SyncOrchestrator] Wrote" << blob.size() << "bytes to" << path;
    return result;
}

BackupResult SyncOrchestrator::runRestore(const QString &archivePath, const WebDavConfig &cfg,
                                          const RestoreOptions &options)
{
    RestorePlanner planner(m_settings, m_chats, m_dirs);
    planner.setTempRoot(ensureTempDirectory());

    emit logMessage(options.isFullOverwrite() ? QString("Restoring (full overwrite)")
                                              : QString("Restoring (%1)").arg(options.summary()));

    BackupResult result = planner.restore(archivePath, cfg, options);
    if (result.success) {
        emit logMessage(result.stats.summary());
    }
    return result;
}

// ========== Operations ==========

BackupResult SyncOrchestrator::testWebDav(const WebDavConfig &cfg)
{
    const QString op = "Connection test";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    if (!cfg.isValid()) {
        result = invalidConfig();
    } else {
        WebDavTransport transport(m_client);
        result = transport.testConnection(cfg);
    }
    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::prepareBackupFile(const WebDavConfig &cfg, QString *path)
{
    const QString op = "Prepare backup";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    const QString target = QDir(ensureTempDirectory()).filePath(SnapshotBuilder::backupFileName());

    result = writeArchive(cfg, target);
    if (result.success && path) {
        *path = target;
    }
    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::exportToFile(const WebDavConfig &cfg, const QString &destination,
                                            QString *writtenPath)
{
    const QString op = "Export";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    QString target = destination;
    if (QFileInfo(destination).isDir()) {
        target = QDir(destination).filePath(SnapshotBuilder::backupFileName());
    }

    result = writeArchive(cfg, target);
    if (result.success) {
        emit logMessage(QString("Exported backup to %1").arg(target));
        if (writtenPath) *writtenPath = target;
    }
    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::backupToWebDav(const WebDavConfig &cfg)
{
    const QString op = "Backup";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    if (!cfg.isValid()) {
        result = invalidConfig();
        result.startTime = start;
        return finishOperation(op, result);
    }

    const QString name = SnapshotBuilder::backupFileName();
    const QString archivePath = QDir(ensureTempDirectory()).filePath(name);
    auto removeArchive = qScopeGuard([&archivePath] { QFile::remove(archivePath); });

    emit progressUpdated(0, 3, "Building backup archive");
    QByteArray blob;
    result = buildArchive(cfg, &blob);

    QString error;
    if (result.success && !FileTree::writeFileStaged(archivePath, blob, &error)) {
        result = BackupResult::failure(BackupError::FileError, error);
    }

    WebDavTransport transport(m_client);
    if (result.success) {
        emit progressUpdated(1, 3, "Preparing remote collection");
        result = transport.ensureCollection(cfg);
    }

    if (result.success) {
        emit progressUpdated(2, 3, QString("Uploading %1").arg(name));
        result = transport.upload(cfg, blob, name);
    }

    if (result.success) {
        emit progressUpdated(3, 3, "Backup uploaded");
        emit logMessage(QString("Uploaded %1 (%2 bytes)").arg(name).arg(blob.size()));
    }

    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::listBackupFiles(const WebDavConfig &cfg, QList<BackupFileItem> *items)
{
    const QString op = "List backups";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    items->clear();
    if (!cfg.isValid()) {
        result = invalidConfig();
    } else {
        WebDavTransport transport(m_client);
        result = transport.listCollection(cfg, items);
        if (result.success) {
            emit logMessage(QString("Found %1 backup(s)").arg(items->size()));
        }
    }
    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::restoreFromWebDav(const WebDavConfig &cfg, const BackupFileItem &item,
                                                 const RestoreOptions &options)
{
    const QString op = "Restore";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    if (!cfg.isValid()) {
        result = invalidConfig();
        result.startTime = start;
        return finishOperation(op, result);
    }

    emit progressUpdated(0, 2, QString("Downloading %1").arg(item.displayName));

    WebDavTransport transport(m_client);
    QByteArray blob;
    result = transport.download(cfg, item, &blob);
    if (!result.success) {
        result.startTime = start;
        return finishOperation(op, result);
    }

    // The display name comes from the server; keep only its last segment
    QString localName = QFileInfo(item.displayName).fileName();
    if (localName.isEmpty()) {
        localName = "download.zip";
    }
    const QString archivePath = QDir(ensureTempDirectory()).filePath(localName);
    auto removeArchive = qScopeGuard([&archivePath] { QFile::remove(archivePath); });

    QString error;
    if (!FileTree::writeFileStaged(archivePath, blob, &error)) {
        result = BackupResult::failure(BackupError::FileError, error);
        result.startTime = start;
        return finishOperation(op, result);
    }

    emit progressUpdated(1, 2, "Restoring");
    result = runRestore(archivePath, cfg, options);
    emit progressUpdated(2, 2, "Restore complete");

    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::restoreFromLocalFile(const QString &path, const WebDavConfig &cfg,
                                                    const RestoreOptions &options)
{
    const QString op = "Import";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    if (!QFileInfo(path).isFile()) {
        result = BackupResult::failure(BackupError::FileError,
            QString("Backup file not found: %1").arg(path));
    } else {
        result = runRestore(path, cfg, options);
    }
    result.startTime = start;
    return finishOperation(op, result);
}

BackupResult SyncOrchestrator::deleteWebDavBackupFile(const WebDavConfig &cfg, const BackupFileItem &item)
{
    const QString op = "Delete backup";
    BackupResult result;
    if (!beginOperation(op, &result)) return result;

    const QDateTime start = QDateTime::currentDateTime();
    if (!cfg.isValid()) {
        result = invalidConfig();
    } else {
        WebDavTransport transport(m_client);
        result = transport.remove(cfg, item);
        if (result.success) {
            emit logMessage(QString("Deleted %1").arg(item.displayName));
        }
    }
    result.startTime = start;
    return finishOperation(op, result);
}

} // namespace Backup
