#include "snapshotbuilder.h"

#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>

namespace Backup {

SnapshotBuilder::SnapshotBuilder(SettingsStore *settings, ChatService *chats,
                                 const DataDirectories &dirs)
    : m_settings(settings)
    , m_chats(chats)
    , m_dirs(dirs)
{
}

QByteArray SnapshotBuilder::buildSettingsBlob() const
{
    QVariantMap map = m_settings->snapshot();

    // The store already drops them; a snapshot must never carry them
    for (const QString &key : localOnlySettingKeys()) {
        map.remove(key);
    }

    qDebug() << "[SnapshotBuilder] Exporting" << map.size() << "settings";
    return QJsonDocument(QJsonObject::fromVariantMap(map)).toJson(QJsonDocument::Compact);
}

QByteArray SnapshotBuilder::buildChatsBlob() const
{
    const QList<Conversation> conversations = m_chats->allConversations();

    QJsonArray conversationArray;
    QJsonArray messageArray;
    QJsonObject toolEvents;
    QJsonObject thoughtSigs;

    for (const Conversation &c : conversations) {
        conversationArray.append(c.toJson());

        for (const ChatMessage &m : m_chats->messages(c.id)) {
            messageArray.append(m.toJson());

            if (m.role != QLatin1String("assistant")) continue;

            const QJsonArray events = m_chats->toolEvents(m.id);
            if (!events.isEmpty()) {
                toolEvents[m.id] = events;
            }
            const QString sig = m_chats->geminiThoughtSignature(m.id);
            if (!sig.isEmpty()) {
                thoughtSigs[m.id] = sig;
            }
        }
    }

    QJsonObject root;
    root["version"] = ArchiveLayout::ChatsVersion;
    root["conversations"] = conversationArray;
    root["messages"] = messageArray;
    root["toolEvents"] = toolEvents;
    root["geminiThoughtSigs"] = thoughtSigs;

    qDebug() << "[SnapshotBuilder] Exporting" << conversationArray.size() << "conversations,"
             << messageArray.size() << "messages";
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QList<ArchiveEntry> SnapshotBuilder::buildFileTrees() const
{
    QList<ArchiveEntry> entries;

    for (const QString &tree : DataDirectories::treeNames()) {
        const QString root = m_dirs.directoryForTree(tree);
        QDir rootDir(root);
        if (root.isEmpty() || !rootDir.exists()) continue;

        const QStringList files = FileTree::relativeFiles(root);
        for (const QString &rel : files) {
            entries.append(ArchiveEntry::fromSource(tree + '/' + rel, rootDir.filePath(rel)));
        }
        qDebug() << "[SnapshotBuilder] Exporting" << files.size() << "files from" << tree;
    }

    return entries;
}

QList<ArchiveEntry> SnapshotBuilder::buildArchiveEntries(const WebDavConfig &cfg) const
{
    QList<ArchiveEntry> entries;
    entries.append(ArchiveEntry::fromData(ArchiveLayout::SettingsFile, buildSettingsBlob()));

    if (cfg.includeChats) {
        entries.append(ArchiveEntry::fromData(ArchiveLayout::ChatsFile, buildChatsBlob()));
    }

    if (cfg.includeFiles) {
        entries.append(buildFileTrees());
    }
    return entries;
}

QString SnapshotBuilder::backupFileName(const QDateTime &when)
{
    return QString("kelivo_backup_%1.zip").arg(when.toString("yyyy-MM-dd'T'HH-mm-ss.zzz"));
}

} // namespace Backup
