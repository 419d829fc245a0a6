#include "jsonchatstore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QDebug>

namespace Backup {

JsonChatStore::JsonChatStore(const QString &filePath)
    : m_filePath(filePath)
{
    load();
}

JsonChatStore::~JsonChatStore()
{
    // Auto-save on destruction
    if (m_dirty) {
        commit();
    }
}

// ========== Queries ==========

QList<Conversation> JsonChatStore::allConversations() const
{
    QList<Conversation> list;
    for (const QString &id : m_conversationOrder) {
        list.append(m_conversations.value(id));
    }
    return list;
}

QList<ChatMessage> JsonChatStore::messages(const QString &conversationId) const
{
    return m_messages.value(conversationId);
}

QJsonArray JsonChatStore::toolEvents(const QString &messageId) const
{
    return m_toolEvents.value(messageId);
}

QString JsonChatStore::geminiThoughtSignature(const QString &messageId) const
{
    return m_thoughtSigs.value(messageId);
}

int JsonChatStore::messageCount() const
{
    int count = 0;
    for (const QList<ChatMessage> &list : m_messages) {
        count += list.size();
    }
    return count;
}

// ========== Mutations ==========

bool JsonChatStore::setToolEvents(const QString &messageId, const QJsonArray &events)
{
    if (messageId.isEmpty()) return false;

    if (events.isEmpty()) {
        m_toolEvents.remove(messageId);
    } else {
        m_toolEvents[messageId] = events;
    }
    m_dirty = true;
    return true;
}

bool JsonChatStore::setGeminiThoughtSignature(const QString &messageId, const QString &signature)
{
    if (messageId.isEmpty()) return false;

    if (signature.isEmpty()) {
        m_thoughtSigs.remove(messageId);
    } else {
        m_thoughtSigs[messageId] = signature;
    }
    m_dirty = true;
    return true;
}

bool JsonChatStore::clearAllData()
{
    m_conversationOrder.clear();
    m_conversations.clear();
    m_messages.clear();
    m_toolEvents.clear();
    m_thoughtSigs.clear();
    m_dirty = true;
    return true;
}

bool JsonChatStore::restoreConversation(const Conversation &conversation,
                                        const QList<ChatMessage> &messages)
{
    if (conversation.id.isEmpty()) {
        qWarning() << "[JsonChatStore] Refusing conversation without id";
        return false;
    }

    if (!m_conversations.contains(conversation.id)) {
        m_conversationOrder.append(conversation.id);
    }
    m_conversations[conversation.id] = conversation;

    QList<ChatMessage> &list = m_messages[conversation.id];
    list.clear();
    for (ChatMessage msg : messages) {
        msg.conversationId = conversation.id;
        list.append(msg);
    }

    m_dirty = true;
    return true;
}

bool JsonChatStore::addMessageDirectly(const QString &conversationId,
                                       const ChatMessage &message)
{
    if (!m_conversations.contains(conversationId)) {
        qWarning() << "[JsonChatStore] addMessageDirectly() - unknown conversation"
                   << conversationId;
        return false;
    }

    ChatMessage msg = message;
    msg.conversationId = conversationId;
    m_messages[conversationId].append(msg);
    m_dirty = true;
    return true;
}

// ========== Persistence ==========

bool JsonChatStore::load()
{
    m_conversationOrder.clear();
    m_conversations.clear();
    m_messages.clear();
    m_toolEvents.clear();
    m_thoughtSigs.clear();
    m_dirty = false;

    QFile file(m_filePath);
    if (!file.exists()) {
        // Nothing stored yet
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[JsonChatStore] Failed to open chat store:" << m_filePath;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[JsonChatStore] Failed to parse chat store:" << parseError.errorString();
        return false;
    }

    QJsonObject root = doc.object();

    for (const QJsonValue &val : root["conversations"].toArray()) {
        Conversation c = Conversation::fromJson(val.toObject());
        if (c.id.isEmpty() || m_conversations.contains(c.id)) continue;
        m_conversationOrder.append(c.id);
        m_conversations.insert(c.id, c);
    }

    for (const QJsonValue &val : root["messages"].toArray()) {
        ChatMessage m = ChatMessage::fromJson(val.toObject());
        if (!m_conversations.contains(m.conversationId)) continue;
        m_messages[m.conversationId].append(m);
    }

    QJsonObject events = root["toolEvents"].toObject();
    for (auto it = events.begin(); it != events.end(); ++it) {
        m_toolEvents[it.key()] = it.value().toArray();
    }

    QJsonObject sigs = root["geminiThoughtSigs"].toObject();
    for (auto it = sigs.begin(); it != sigs.end(); ++it) {
        m_thoughtSigs[it.key()] = it.value().toString();
    }

    qDebug() << "[JsonChatStore] Loaded" << m_conversationOrder.size() << "conversations,"
             << messageCount() << "messages";
    return true;
}

bool JsonChatStore::commit()
{
    QJsonObject root;
    root["version"] = 1;

    QJsonArray conversations;
    QJsonArray messages;
    for (const QString &id : m_conversationOrder) {
        conversations.append(m_conversations.value(id).toJson());
        for (const ChatMessage &m : m_messages.value(id)) {
            messages.append(m.toJson());
        }
    }
    root["conversations"] = conversations;
    root["messages"] = messages;

    QJsonObject events;
    for (auto it = m_toolEvents.constBegin(); it != m_toolEvents.constEnd(); ++it) {
        events[it.key()] = it.value();
    }
    root["toolEvents"] = events;

    QJsonObject sigs;
    for (auto it = m_thoughtSigs.constBegin(); it != m_thoughtSigs.constEnd(); ++it) {
        sigs[it.key()] = it.value();
    }
    root["geminiThoughtSigs"] = sigs;

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[JsonChatStore] Failed to save chat store:" << m_filePath;
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "[JsonChatStore] Failed to commit chat store:" << m_filePath;
        return false;
    }

    m_dirty = false;
    qDebug() << "[JsonChatStore] Saved" << m_conversationOrder.size() << "conversations";
    return true;
}

} // namespace Backup
