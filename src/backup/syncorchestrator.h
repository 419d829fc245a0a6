#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <QList>
#include "backuptypes.h"
#include "chatservice.h"
#include "datadirectories.h"
#include "davclient.h"
#include "settingsstore.h"

namespace Backup {

/**
 * @brief Entry point for every backup and restore operation
 *
 * The SyncOrchestrator coordinates:
 *   - Snapshot building and archive packing
 *   - WebDAV transport (test, list, upload, download, delete)
 *   - Restore through the RestorePlanner
 *   - Temporary files and staging directories
 *   - Progress and log reporting
 *
 * Only one operation runs at a time; a call made while another is in
 * flight fails with BackupError::Busy.
 *
 * Usage:
 * @code
 * NetworkDavClient client;
 * SyncOrchestrator orchestrator(&prefs, &chats, DataDirectories::fromRoot(root), &client);
 *
 * BackupResult r = orchestrator.backupToWebDav(cfg);
 *
 * QList<BackupFileItem> items;
 * orchestrator.listBackupFiles(cfg, &items);
 * orchestrator.restoreFromWebDav(cfg, items.first(), RestoreOptions());
 * @endcode
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    /**
     * Collaborators are not owned and must outlive the orchestrator.
     */
    SyncOrchestrator(SettingsStore *settings, ChatService *chats, const DataDirectories &dirs,
                     DavClient *client, QObject *parent = nullptr);
    ~SyncOrchestrator() override;

    // ========== Configuration ==========

    /**
     * @brief Set the directory for temporary archives and staging
     *
     * Default: <system temp>/kelivosync
     */
    void setTempDirectory(const QString &path) { m_tempDirectory = path; }
    QString tempDirectory() const { return m_tempDirectory; }

    bool isBusy() const { return m_busy; }

    // ========== Operations ==========

    /**
     * @brief Check that the remote collection answers
     */
    BackupResult testWebDav(const WebDavConfig &cfg);

    /**
     * @brief Build a backup archive in the temp directory
     * @param path Receives the archive location
     */
    BackupResult prepareBackupFile(const WebDavConfig &cfg, QString *path);

    /**
     * @brief Build a backup archive at a caller-chosen location
     *
     * If @p destination is an existing directory the archive gets its
     * default name inside it.
     */
    BackupResult exportToFile(const WebDavConfig &cfg, const QString &destination,
                              QString *writtenPath = nullptr);

    /**
     * @brief Build a backup and upload it to the remote collection
     */
    BackupResult backupToWebDav(const WebDavConfig &cfg);

    /**
     * @brief List remote backups, newest first
     */
    BackupResult listBackupFiles(const WebDavConfig &cfg, QList<BackupFileItem> *items);

    BackupResult restoreFromWebDav(const WebDavConfig &cfg, const BackupFileItem &item,
                                   const RestoreOptions &options);
    BackupResult restoreFromLocalFile(const QString &path, const WebDavConfig &cfg,
                                      const RestoreOptions &options);
    BackupResult deleteWebDavBackupFile(const WebDavConfig &cfg, const BackupFileItem &item);

    static QString defaultTempDirectory();

signals:
    void operationStarted(const QString &operation);
    void operationFinished(const QString &operation, const Backup::BackupResult &result);
    void progressUpdated(int current, int total, const QString &message);
    void logMessage(const QString &message);
    void warningOccurred(const QString &warning);
    void errorOccurred(const QString &error);

private:
    bool beginOperation(const QString &operation, BackupResult *rejected);
    BackupResult finishOperation(const QString &operation, BackupResult result);

    BackupResult buildArchive(const WebDavConfig &cfg, QByteArray *blob);
    BackupResult writeArchive(const WebDavConfig &cfg, const QString &path);
    BackupResult runRestore(const QString &archivePath, const WebDavConfig &cfg,
                            const RestoreOptions &options);
    QString ensureTempDirectory();

    SettingsStore *m_settings;
    ChatService *m_chats;
    DataDirectories m_dirs;
    DavClient *m_client;

    QString m_tempDirectory;
    bool m_busy = false;
};

} // namespace Backup

#endif // SYNCORCHESTRATOR_H
