#include "restoreplanner.h"
#include "archivecodec.h"
#include "chatmerger.h"
#include "filetreemerger.h"
#include "settingsmerger.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace Backup {

RestorePlanner::RestorePlanner(SettingsStore *settings, ChatService *chats,
                               const DataDirectories &dirs)
    : m_settings(settings)
    , m_chats(chats)
    , m_dirs(dirs)
    , m_tempRoot(QDir::tempPath())
{
}

BackupResult RestorePlanner::restore(const QString &archivePath, const WebDavConfig &cfg,
                                     const RestoreOptions &options)
{
    if (options.isFullOverwrite()) {
        return restoreLegacy(archivePath, cfg);
    }
    return restoreGranular(archivePath, cfg, options);
}

// ========== Staging ==========

QString RestorePlanner::stagingTemplate(const QString &prefix) const
{
    QDir().mkpath(m_tempRoot);
    return QDir(m_tempRoot).filePath(prefix + QString::number(QDateTime::currentMSecsSinceEpoch())
                                     + "_XXXXXX");
}

BackupResult RestorePlanner::unpackTo(const QString &archivePath, const QString &stagingDir)
{
    if (!QFileInfo(archivePath).isFile()) {
        return BackupResult::failure(BackupError::FileError,
            QString("Backup file not found: %1").arg(archivePath));
    }
    return ArchiveCodec::unpackFile(archivePath, stagingDir);
}

bool RestorePlanner::readSettings(const QString &stagingDir, QVariantMap *values,
                                  BackupResult *result)
{
    QFile file(QDir(stagingDir).filePath(ArchiveLayout::SettingsFile));
    if (!file.exists()) {
        qDebug() << "[RestorePlanner] Archive has no settings";
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result->warnings << QString("Cannot read settings: %1").arg(file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result->warnings << "settings.json is not a JSON object, settings skipped";
        qWarning() << "[RestorePlanner] Invalid settings.json:" << parseError.errorString();
        return false;
    }

    *values = doc.object().toVariantMap();
    return true;
}

// ========== Granular restore ==========

BackupResult RestorePlanner::restoreGranular(const QString &archivePath, const WebDavConfig &cfg,
                                             const RestoreOptions &options)
{
    const QDateTime start = QDateTime::currentDateTime();

    QTemporaryDir staging(stagingTemplate("restore_"));
    if (!staging.isValid()) {
        BackupResult result = BackupResult::failure(BackupError::FileError,
            QString("Cannot create staging directory: %1").arg(staging.errorString()));
        result.startTime = start;
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    BackupResult result = unpackTo(archivePath, staging.path());
    result.startTime = start;
    if (!result.success) {
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    qDebug() << "[RestorePlanner] Granular restore:" << options.summary();

    applySettings(staging.path(), options, &result);

    if (cfg.includeChats) {
        applyChats(staging.path(), options.chatsAction, &result);
    }

    if (cfg.includeFiles) {
        applyFiles(staging.path(), options.filesAction, &result);
    }

    result.endTime = QDateTime::currentDateTime();
    qDebug() << "[RestorePlanner]" << result.stats.summary();
    return result;
}

void RestorePlanner::applySettings(const QString &stagingDir, const RestoreOptions &options,
                                   BackupResult *result)
{
    if (options.settingsAction == RestoreAction::Ignore
        && options.providersAction == RestoreAction::Ignore) {
        return;
    }

    QVariantMap incoming;
    if (!readSettings(stagingDir, &incoming, result)) {
        return;
    }

    const QVariantMap existing = m_settings->snapshot();
    RestoreStats &stats = result->stats;

    for (auto it = incoming.constBegin(); it != incoming.constEnd(); ++it) {
        const QString &key = it.key();

        if (isLocalOnlySettingKey(key)) {
            stats.settingsSkipped++;
            continue;
        }

        const RestoreAction action = SettingsMerger::isProviderKey(key)
            ? options.providersAction : options.settingsAction;

        QVariant toWrite;
        switch (action) {
        case RestoreAction::Ignore:
            stats.settingsSkipped++;
            continue;

        case RestoreAction::Overwrite:
            toWrite = it.value();
            break;

        case RestoreAction::Merge: {
            QString error;
            const MergeDecision decision =
                SettingsMerger::merge(key, existing, it.value(), &toWrite, &error);
            if (decision == MergeDecision::Keep) {
                stats.settingsSkipped++;
                continue;
            }
            if (decision == MergeDecision::Failed) {
                stats.settingsFailed++;
                result->warnings << QString("Could not merge %1").arg(error);
                qWarning() << "[RestorePlanner] Merge failed:" << error;
                continue;
            }
            break;
        }
        }

        if (m_settings->restoreSingle(key, toWrite)) {
            stats.settingsWritten++;
        } else {
            stats.settingsFailed++;
            result->warnings << QString("Could not write setting %1").arg(key);
        }
    }
}

void RestorePlanner::applyChats(const QString &stagingDir, RestoreAction action,
                                BackupResult *result)
{
    if (action == RestoreAction::Ignore) return;

    const QString path = QDir(stagingDir).filePath(ArchiveLayout::ChatsFile);
    if (!QFileInfo::exists(path)) {
        qDebug() << "[RestorePlanner] Archive has no chats";
        return;
    }

    ChatArchive archive;
    QString error;
    if (!ChatArchive::loadFile(path, &archive, &error)) {
        result->warnings << error;
        qWarning() << "[RestorePlanner]" << error;
        return;
    }

    ChatMerger merger(m_chats);
    if (action == RestoreAction::Overwrite) {
        merger.overwrite(archive, &result->stats, &result->warnings);
    } else {
        merger.merge(archive, &result->stats, &result->warnings);
    }
}

void RestorePlanner::applyFiles(const QString &stagingDir, RestoreAction action,
                                BackupResult *result)
{
    if (action == RestoreAction::Ignore) return;

    QDir staging(stagingDir);
    for (const QString &tree : DataDirectories::treeNames()) {
        const QString destination = m_dirs.directoryForTree(tree);
        if (destination.isEmpty()) continue;

        if (action == RestoreAction::Overwrite) {
            FileTreeMerger::overwrite(staging.filePath(tree), destination,
                                      &result->stats, &result->warnings);
        } else {
            FileTreeMerger::merge(staging.filePath(tree), destination,
                                  &result->stats, &result->warnings);
        }
    }
}

// ========== Legacy restore ==========

BackupResult RestorePlanner::restoreLegacy(const QString &archivePath, const WebDavConfig &cfg)
{
    const QDateTime start = QDateTime::currentDateTime();

    QTemporaryDir staging(stagingTemplate("restore_legacy_"));
    if (!staging.isValid()) {
        BackupResult result = BackupResult::failure(BackupError::FileError,
            QString("Cannot create staging directory: %1").arg(staging.errorString()));
        result.startTime = start;
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    BackupResult result = unpackTo(archivePath, staging.path());
    result.startTime = start;
    if (!result.success) {
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    qDebug() << "[RestorePlanner] Full overwrite restore";

    QVariantMap values;
    if (readSettings(staging.path(), &values, &result)) {
        for (const QString &key : localOnlySettingKeys()) {
            if (values.remove(key) > 0) {
                result.stats.settingsSkipped++;
            }
        }
        if (m_settings->restoreAll(values)) {
            result.stats.settingsWritten += values.size();
        } else {
            result.stats.settingsFailed += values.size();
            result.warnings << "Could not write restored settings";
        }
    }

    if (cfg.includeChats) {
        applyChats(staging.path(), RestoreAction::Overwrite, &result);
    }

    if (cfg.includeFiles) {
        applyFiles(staging.path(), RestoreAction::Overwrite, &result);
    }

    result.endTime = QDateTime::currentDateTime();
    qDebug() << "[RestorePlanner]" << result.stats.summary();
    return result;
}

} // namespace Backup
