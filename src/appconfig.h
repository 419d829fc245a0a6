#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>
#include <QSettings>

#include "backup/backuptypes.h"  // For WebDavConfig

/**
 * @brief Application configuration using QSettings
 *
 * Holds the settings of the sync tool itself (remote endpoint, paths,
 * network behavior). The user's application settings that get backed up
 * live in the PreferencesStore under the data root, not here.
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/KelivoSync/KelivoSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 *
 * Constructed once in main() and passed to whoever needs it.
 */
class AppConfig
{
public:
    AppConfig();

    /**
     * @brief Use an explicit INI file instead of the platform location
     */
    explicit AppConfig(const QString &iniPath);

    // ========== WebDAV ==========

    // Stored as the JSON string form of WebDavConfig
    Backup::WebDavConfig webDavConfig() const;
    void setWebDavConfig(const Backup::WebDavConfig &cfg);
    bool hasWebDavConfig() const;

    // ========== Paths ==========

    // Root holding preferences.json, chats.json, upload/, images/, avatars/
    QString dataRoot() const;
    void setDataRoot(const QString &path);

    // Empty means the orchestrator default
    QString tempDirectory() const;
    void setTempDirectory(const QString &path);

    // Directory of the last successful export, home until the first one
    QString lastExportPath() const;
    void setLastExportPath(const QString &path);

    // Where "export" writes when given no destination
    QString exportDestination(const QString &argument) const;

    // ========== Network ==========
    int transferTimeoutMs() const;
    void setTransferTimeoutMs(int msecs);

    static constexpr int DEFAULT_TRANSFER_TIMEOUT_MS = 60000;

    // ========== Advanced Settings ==========
    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    QString fileName() const { return m_settings.fileName(); }

    // Sync to disk
    void sync();

private:
    QSettings m_settings;
};

#endif // APPCONFIG_H
