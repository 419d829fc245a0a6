#include "backuptypes.h"

#include <QJsonDocument>
#include <QJsonObject>

namespace Backup {

QString restoreActionName(RestoreAction action)
{
    switch (action) {
    case RestoreAction::Ignore:    return "ignore";
    case RestoreAction::Merge:     return "merge";
    case RestoreAction::Overwrite: return "overwrite";
    }
    return QString();
}

bool restoreActionFromName(const QString &name, RestoreAction *action)
{
    const QString n = name.trimmed().toLower();
    if (n == "ignore") {
        *action = RestoreAction::Ignore;
    } else if (n == "merge") {
        *action = RestoreAction::Merge;
    } else if (n == "overwrite") {
        *action = RestoreAction::Overwrite;
    } else {
        return false;
    }
    return true;
}

RestoreOptions RestoreOptions::fromMode(RestoreMode mode)
{
    const RestoreAction action = (mode == RestoreMode::Overwrite)
        ? RestoreAction::Overwrite : RestoreAction::Merge;

    RestoreOptions options;
    options.settingsAction = action;
    options.providersAction = action;
    options.chatsAction = action;
    options.filesAction = action;
    return options;
}

QString RestoreOptions::summary() const
{
    return QString("settings=%1 providers=%2 chats=%3 files=%4")
        .arg(restoreActionName(settingsAction))
        .arg(restoreActionName(providersAction))
        .arg(restoreActionName(chatsAction))
        .arg(restoreActionName(filesAction));
}

// ========== WebDavConfig ==========

QStringList WebDavConfig::pathSegments() const
{
    QStringList segments;
    for (const QString &seg : path.split('/')) {
        if (!seg.trimmed().isEmpty()) {
            segments << seg.trimmed();
        }
    }
    return segments;
}

QString WebDavConfig::normalizedPath() const
{
    return pathSegments().join('/');
}

bool WebDavConfig::isValid() const
{
    const QUrl u(url.trimmed());
    return u.isValid() && !u.scheme().isEmpty() && !u.host().isEmpty();
}

QString WebDavConfig::toJsonString() const
{
    QJsonObject obj;
    obj["url"] = url;
    obj["username"] = username;
    obj["password"] = password;
    obj["path"] = path;
    obj["includeChats"] = includeChats;
    obj["includeFiles"] = includeFiles;
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

WebDavConfig WebDavConfig::fromJsonString(const QString &json)
{
    WebDavConfig cfg;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return cfg;
    }

    QJsonObject obj = doc.object();
    cfg.url = obj["url"].toString().trimmed();
    cfg.username = obj["username"].toString().trimmed();
    cfg.password = obj["password"].toString();

    const QString p = obj["path"].toString().trimmed();
    cfg.path = p.isEmpty() ? defaultPath() : p;

    cfg.includeChats = obj["includeChats"].toBool(true);
    cfg.includeFiles = obj["includeFiles"].toBool(true);
    return cfg;
}

// ========== Errors ==========

QString backupErrorName(BackupError error)
{
    switch (error) {
    case BackupError::None:           return "None";
    case BackupError::AuthError:      return "AuthError";
    case BackupError::TransportError: return "TransportError";
    case BackupError::ArchiveCorrupt: return "ArchiveCorrupt";
    case BackupError::FileError:      return "FileError";
    case BackupError::InvalidConfig:  return "InvalidConfig";
    case BackupError::Busy:           return "Busy";
    }
    return QString();
}

const QSet<QString> &localOnlySettingKeys()
{
    static const QSet<QString> keys = {
        "window_width_v1",
        "window_height_v1",
        "window_pos_x_v1",
        "window_pos_y_v1",
        "window_maximized_v1",
    };
    return keys;
}

} // namespace Backup
