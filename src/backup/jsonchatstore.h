#ifndef JSONCHATSTORE_H
#define JSONCHATSTORE_H

#include "chatservice.h"

#include <QString>
#include <QStringList>
#include <QMap>
#include <QHash>

namespace Backup {

/**
 * @brief ChatService persisted as one JSON document
 *
 * Layout of the store file:
 * @code
 * {
 *   "version": 1,
 *   "conversations": [ {...}, ... ],
 *   "messages": [ {...}, ... ],
 *   "toolEvents": { "<messageId>": [ ... ] },
 *   "geminiThoughtSigs": { "<messageId>": "..." }
 * }
 * @endcode
 *
 * Mutations are kept in memory until commit(); the destructor commits
 * pending changes.
 */
class JsonChatStore : public ChatService
{
public:
    explicit JsonChatStore(const QString &filePath);
    ~JsonChatStore() override;

    // ========== ChatService ==========

    QList<Conversation> allConversations() const override;
    QList<ChatMessage> messages(const QString &conversationId) const override;
    QJsonArray toolEvents(const QString &messageId) const override;
    QString geminiThoughtSignature(const QString &messageId) const override;

    bool setToolEvents(const QString &messageId, const QJsonArray &events) override;
    bool setGeminiThoughtSignature(const QString &messageId, const QString &signature) override;
    bool clearAllData() override;
    bool restoreConversation(const Conversation &conversation,
                             const QList<ChatMessage> &messages) override;
    bool addMessageDirectly(const QString &conversationId,
                            const ChatMessage &message) override;
    bool commit() override;

    // ========== Persistence ==========

    bool load();
    bool isDirty() const { return m_dirty; }
    QString filePath() const { return m_filePath; }

    int conversationCount() const { return m_conversationOrder.size(); }
    int messageCount() const;

private:
    QString m_filePath;
    QStringList m_conversationOrder;
    QHash<QString, Conversation> m_conversations;
    QHash<QString, QList<ChatMessage>> m_messages;   // conversationId -> messages
    QMap<QString, QJsonArray> m_toolEvents;
    QMap<QString, QString> m_thoughtSigs;
    bool m_dirty = false;
};

} // namespace Backup

#endif // JSONCHATSTORE_H
