#ifndef RESTOREPLANNER_H
#define RESTOREPLANNER_H

#include "backuptypes.h"
#include "chatservice.h"
#include "datadirectories.h"
#include "settingsstore.h"

#include <QString>
#include <QVariantMap>

namespace Backup {

/**
 * @brief Applies a backup archive to local state
 *
 * Restore runs in three phases, strictly in this order:
 *   1. Settings and providers (settings.json)
 *   2. Chats (chats.json)
 *   3. Files (upload/, images/, avatars/)
 *
 * Each phase is gated by its own RestoreAction and never fails the restore:
 * problems are logged and collected in BackupResult::warnings. Local-only
 * settings are never written.
 *
 * When every action is Overwrite the legacy full-overwrite restore runs
 * instead; it reuses the overwrite branches of the phases.
 *
 * Usage:
 * @code
 * RestorePlanner planner(&prefs, &chats, DataDirectories::fromRoot(root));
 * planner.setTempRoot(tempDir);
 * BackupResult r = planner.restore("backup.zip", cfg, RestoreOptions());
 * @endcode
 */
class RestorePlanner
{
public:
    RestorePlanner(SettingsStore *settings, ChatService *chats, const DataDirectories &dirs);

    /**
     * @brief Directory that receives the per-restore staging directories
     */
    void setTempRoot(const QString &path) { m_tempRoot = path; }
    QString tempRoot() const { return m_tempRoot; }

    /**
     * @brief Restore an archive file, dispatching on @p options
     */
    BackupResult restore(const QString &archivePath, const WebDavConfig &cfg,
                         const RestoreOptions &options);

    /**
     * @brief Three-phase restore honoring each category action
     */
    BackupResult restoreGranular(const QString &archivePath, const WebDavConfig &cfg,
                                 const RestoreOptions &options);

    /**
     * @brief Replace everything present in the archive
     *
     * Settings are written in one SettingsStore::restoreAll call.
     */
    BackupResult restoreLegacy(const QString &archivePath, const WebDavConfig &cfg);

    // ========== Phases ==========
    // Operate on an already unpacked archive

    void applySettings(const QString &stagingDir, const RestoreOptions &options,
                       BackupResult *result);
    void applyChats(const QString &stagingDir, RestoreAction action, BackupResult *result);
    void applyFiles(const QString &stagingDir, RestoreAction action, BackupResult *result);

private:
    BackupResult unpackTo(const QString &archivePath, const QString &stagingDir);
    bool readSettings(const QString &stagingDir, QVariantMap *values, BackupResult *result);
    QString stagingTemplate(const QString &prefix) const;

    SettingsStore *m_settings;
    ChatService *m_chats;
    DataDirectories m_dirs;
    QString m_tempRoot;
};

} // namespace Backup

#endif // RESTOREPLANNER_H
