#include "chatmerger.h"

#include <QFile>
#include <QHash>
#include <QSet>
#include <QJsonDocument>
#include <QDebug>

namespace Backup {

namespace {

QHash<QString, QList<ChatMessage>> groupByConversation(const QList<ChatMessage> &messages)
{
    QHash<QString, QList<ChatMessage>> grouped;
    for (const ChatMessage &m : messages) {
        grouped[m.conversationId].append(m);
    }
    return grouped;
}

} // namespace

// ========== ChatArchive ==========

bool ChatArchive::parse(const QByteArray &json, ChatArchive *out, QString *error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = "chats.json is not a JSON object: " + parseError.errorString();
        return false;
    }

    const QJsonObject root = doc.object();
    ChatArchive archive;

    for (const QJsonValue &v : root.value("conversations").toArray()) {
        if (!v.isObject()) continue;
        Conversation c = Conversation::fromJson(v.toObject());
        if (!c.id.isEmpty()) archive.conversations.append(c);
    }

    for (const QJsonValue &v : root.value("messages").toArray()) {
        if (!v.isObject()) continue;
        ChatMessage m = ChatMessage::fromJson(v.toObject());
        if (!m.id.isEmpty()) archive.messages.append(m);
    }

    const QJsonObject events = root.value("toolEvents").toObject();
    for (auto it = events.begin(); it != events.end(); ++it) {
        if (it.value().isArray()) {
            archive.toolEvents.insert(it.key(), it.value().toArray());
        }
    }

    const QJsonObject sigs = root.value("geminiThoughtSigs").toObject();
    for (auto it = sigs.begin(); it != sigs.end(); ++it) {
        const QString sig = it.value().toVariant().toString();
        if (!sig.isEmpty()) {
            archive.thoughtSigs.insert(it.key(), sig);
        }
    }

    *out = archive;
    return true;
}

bool ChatArchive::loadFile(const QString &path, ChatArchive *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }
    return parse(file.readAll(), out, error);
}

// ========== ChatMerger ==========

ChatMerger::ChatMerger(ChatService *chats)
    : m_chats(chats)
{
}

bool ChatMerger::overwrite(const ChatArchive &archive, RestoreStats *stats, QStringList *warnings)
{
    if (!m_chats->clearAllData()) {
        warnings->append("Could not clear local chats");
        return false;
    }

    const QHash<QString, QList<ChatMessage>> byConversation = groupByConversation(archive.messages);

    for (const Conversation &c : archive.conversations) {
        const QList<ChatMessage> msgs = byConversation.value(c.id);
        if (!m_chats->restoreConversation(c, msgs)) {
            warnings->append(QString("Could not restore conversation %1").arg(c.id));
            continue;
        }
        stats->conversationsRestored++;
        stats->messagesRestored += msgs.size();
    }

    applyAnnotations(archive, false, warnings);

    if (!m_chats->commit()) {
        warnings->append("Could not persist restored chats");
        return false;
    }

    qDebug() << "[ChatMerger] Overwrote chats:" << stats->conversationsRestored
             << "conversations," << stats->messagesRestored << "messages";
    return true;
}

bool ChatMerger::merge(const ChatArchive &archive, RestoreStats *stats, QStringList *warnings)
{
    QSet<QString> knownConversations;
    QSet<QString> knownMessages;
    for (const Conversation &c : m_chats->allConversations()) {
        knownConversations.insert(c.id);
        for (const ChatMessage &m : m_chats->messages(c.id)) {
            knownMessages.insert(m.id);
        }
    }

    // Message ids are global: anything already stored is skipped, wherever it lives
    QList<ChatMessage> fresh;
    for (const ChatMessage &m : archive.messages) {
        if (knownMessages.contains(m.id)) continue;
        knownMessages.insert(m.id);
        fresh.append(m);
    }
    QHash<QString, QList<ChatMessage>> byConversation = groupByConversation(fresh);

    for (const Conversation &c : archive.conversations) {
        // A conversation listed twice gets its messages only once
        const QList<ChatMessage> msgs = byConversation.take(c.id);

        if (!knownConversations.contains(c.id)) {
            if (!m_chats->restoreConversation(c, msgs)) {
                warnings->append(QString("Could not restore conversation %1").arg(c.id));
                continue;
            }
            knownConversations.insert(c.id);
            stats->conversationsRestored++;
            stats->messagesRestored += msgs.size();
            continue;
        }

        for (const ChatMessage &m : msgs) {
            if (m_chats->addMessageDirectly(c.id, m)) {
                stats->messagesRestored++;
            } else {
                warnings->append(QString("Could not add message %1 to %2").arg(m.id, c.id));
            }
        }
    }

    applyAnnotations(archive, true, warnings);

    if (!m_chats->commit()) {
        warnings->append("Could not persist merged chats");
        return false;
    }

    qDebug() << "[ChatMerger] Merged chats:" << stats->conversationsRestored
             << "new conversations," << stats->messagesRestored << "new messages";
    return true;
}

void ChatMerger::applyAnnotations(const ChatArchive &archive, bool onlyWhereMissing,
                                  QStringList *warnings)
{
    for (auto it = archive.toolEvents.begin(); it != archive.toolEvents.end(); ++it) {
        if (onlyWhereMissing && !m_chats->toolEvents(it.key()).isEmpty()) continue;
        if (!m_chats->setToolEvents(it.key(), it.value())) {
            warnings->append(QString("Could not set tool events of %1").arg(it.key()));
        }
    }

    for (auto it = archive.thoughtSigs.begin(); it != archive.thoughtSigs.end(); ++it) {
        if (onlyWhereMissing && !m_chats->geminiThoughtSignature(it.key()).isEmpty()) continue;
        if (!m_chats->setGeminiThoughtSignature(it.key(), it.value())) {
            warnings->append(QString("Could not set thought signature of %1").arg(it.key()));
        }
    }
}

} // namespace Backup
