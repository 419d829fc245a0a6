#ifndef BACKUPTYPES_H
#define BACKUPTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QSet>
#include <QUrl>
#include <QMetaType>

/**
 * @file backuptypes.h
 * @brief Common types and enums for the backup engine
 */

namespace Backup {

/**
 * @brief Legacy two-mode restore selector
 */
enum class RestoreMode {
    Overwrite,      ///< Clear local data, then restore
    Merge           ///< Incremental merge with de-duplication
};

/**
 * @brief Per-category restore action
 */
enum class RestoreAction {
    Ignore,         ///< Leave this category untouched
    Merge,          ///< Merge into local data, keeping local values
    Overwrite       ///< Replace local data with archived data
};

QString restoreActionName(RestoreAction action);
bool restoreActionFromName(const QString &name, RestoreAction *action);

/**
 * @brief One independent action per data category
 */
struct RestoreOptions {
    RestoreAction settingsAction = RestoreAction::Merge;
    RestoreAction providersAction = RestoreAction::Merge;
    RestoreAction chatsAction = RestoreAction::Merge;
    RestoreAction filesAction = RestoreAction::Merge;

    /**
     * @brief True when every category is Overwrite
     *
     * Such options are routed through the legacy full-overwrite restore.
     */
    bool isFullOverwrite() const {
        return settingsAction == RestoreAction::Overwrite
            && providersAction == RestoreAction::Overwrite
            && chatsAction == RestoreAction::Overwrite
            && filesAction == RestoreAction::Overwrite;
    }

    static RestoreOptions fromMode(RestoreMode mode);

    QString summary() const;
};

/**
 * @brief Remote WebDAV endpoint plus export toggles
 */
struct WebDavConfig {
    QString url;
    QString username;
    QString password;
    QString path = defaultPath();
    bool includeChats = true;
    bool includeFiles = true;

    static QString defaultPath() { return QStringLiteral("kelivo_backups"); }

    /**
     * @brief Path with empty segments removed (no leading/trailing slashes)
     */
    QString normalizedPath() const;

    /**
     * @brief Non-empty path segments, in order
     */
    QStringList pathSegments() const;

    bool isValid() const;

    QString toJsonString() const;
    static WebDavConfig fromJsonString(const QString &json);
};

/**
 * @brief A backup archive found on the remote collection
 */
struct BackupFileItem {
    QUrl href;              ///< Absolute location
    QString displayName;
    qint64 size = 0;
    QDateTime lastModified; ///< Invalid when unknown
};

/**
 * @brief Error taxonomy for backup operations
 */
enum class BackupError {
    None,
    AuthError,          ///< Server answered 401
    TransportError,     ///< Any other bad status or network failure
    ArchiveCorrupt,     ///< Archive container could not be parsed
    FileError,          ///< Local file missing or not writable
    InvalidConfig,      ///< Remote endpoint not configured
    Busy                ///< Another operation is already running
};

QString backupErrorName(BackupError error);

/**
 * @brief Counters collected while restoring
 */
struct RestoreStats {
    int settingsWritten = 0;
    int settingsSkipped = 0;
    int settingsFailed = 0;
    int conversationsRestored = 0;
    int messagesRestored = 0;
    int filesCopied = 0;
    int filesSkipped = 0;
    int filesFailed = 0;

    QString summary() const {
        return QString("Settings: %1 written, %2 skipped, %3 failed; "
                       "Chats: %4 conversations, %5 messages; "
                       "Files: %6 copied, %7 skipped, %8 failed")
            .arg(settingsWritten).arg(settingsSkipped).arg(settingsFailed)
            .arg(conversationsRestored).arg(messagesRestored)
            .arg(filesCopied).arg(filesSkipped).arg(filesFailed);
    }
};

/**
 * @brief Result of a backup, restore or transport operation
 */
struct BackupResult {
    bool success = true;
    BackupError error = BackupError::None;
    int httpStatus = 0;
    QString errorMessage;
    QStringList warnings;
    RestoreStats stats;
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    static BackupResult failure(BackupError error, const QString &message,
                                int httpStatus = 0)
    {
        BackupResult result;
        result.success = false;
        result.error = error;
        result.errorMessage = message;
        result.httpStatus = httpStatus;
        return result;
    }
};

// ========== Archive layout ==========

namespace ArchiveLayout {
inline const QString SettingsFile = QStringLiteral("settings.json");
inline const QString ChatsFile = QStringLiteral("chats.json");
inline const QString UploadTree = QStringLiteral("upload");
inline const QString ImagesTree = QStringLiteral("images");
inline const QString AvatarsTree = QStringLiteral("avatars");
constexpr int ChatsVersion = 1;
}

/**
 * @brief Settings that describe this device's window and never leave it
 */
const QSet<QString> &localOnlySettingKeys();

inline bool isLocalOnlySettingKey(const QString &key) {
    return localOnlySettingKeys().contains(key);
}

} // namespace Backup

Q_DECLARE_METATYPE(Backup::BackupResult)

#endif // BACKUPTYPES_H
