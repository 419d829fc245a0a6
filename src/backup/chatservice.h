#ifndef CHATSERVICE_H
#define CHATSERVICE_H

#include <QString>
#include <QList>
#include <QJsonObject>
#include <QJsonArray>

namespace Backup {

/**
 * @brief A conversation record
 *
 * Only the id is interpreted; every other field is carried verbatim.
 */
struct Conversation {
    QString id;
    QJsonObject fields;     ///< Full record as stored

    QJsonObject toJson() const;
    static Conversation fromJson(const QJsonObject &json);
};

/**
 * @brief A chat message record
 *
 * Message ids are globally unique, not scoped per conversation.
 */
struct ChatMessage {
    QString id;
    QString conversationId;
    QString role;           ///< "user", "assistant", ...
    QJsonObject fields;     ///< Full record as stored

    QJsonObject toJson() const;
    static ChatMessage fromJson(const QJsonObject &json);
};

/**
 * @brief Abstract interface to the chat storage engine
 *
 * The backup engine only reads and bulk-writes through this contract;
 * it never sees how conversations are stored.
 */
class ChatService
{
public:
    virtual ~ChatService() = default;

    // ========== Queries ==========

    virtual QList<Conversation> allConversations() const = 0;
    virtual QList<ChatMessage> messages(const QString &conversationId) const = 0;

    /**
     * @brief Tool invocation events of a message (empty if none)
     */
    virtual QJsonArray toolEvents(const QString &messageId) const = 0;

    /**
     * @brief Model thought signature of a message (empty if none)
     */
    virtual QString geminiThoughtSignature(const QString &messageId) const = 0;

    // ========== Mutations ==========

    virtual bool setToolEvents(const QString &messageId, const QJsonArray &events) = 0;
    virtual bool setGeminiThoughtSignature(const QString &messageId, const QString &signature) = 0;

    /**
     * @brief Remove all conversations, messages, tool events and signatures
     */
    virtual bool clearAllData() = 0;

    /**
     * @brief Insert a conversation together with its messages
     */
    virtual bool restoreConversation(const Conversation &conversation,
                                     const QList<ChatMessage> &messages) = 0;

    /**
     * @brief Append a message to an existing conversation as-is
     */
    virtual bool addMessageDirectly(const QString &conversationId,
                                    const ChatMessage &message) = 0;

    /**
     * @brief Flush pending writes
     *
     * Called once after a bulk restore. Default implementation does nothing.
     */
    virtual bool commit() { return true; }
};

} // namespace Backup

#endif // CHATSERVICE_H
