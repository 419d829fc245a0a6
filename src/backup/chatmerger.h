#ifndef CHATMERGER_H
#define CHATMERGER_H

#include "backuptypes.h"
#include "chatservice.h"

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

namespace Backup {

/**
 * @brief Parsed contents of chats.json
 */
struct ChatArchive {
    QList<Conversation> conversations;
    QList<ChatMessage> messages;
    QMap<QString, QJsonArray> toolEvents;       // messageId -> events
    QMap<QString, QString> thoughtSigs;         // messageId -> signature

    static bool parse(const QByteArray &json, ChatArchive *out, QString *error = nullptr);
    static bool loadFile(const QString &path, ChatArchive *out, QString *error = nullptr);
};

/**
 * @brief Applies an archived chat history to a ChatService
 *
 * Overwrite clears local chats and reloads the archive verbatim. Merge only
 * adds: unknown conversations come in whole, known conversations receive
 * the messages whose id is not present anywhere locally, and tool events
 * and thought signatures are only set for messages that have none yet.
 */
class ChatMerger
{
public:
    explicit ChatMerger(ChatService *chats);

    bool overwrite(const ChatArchive &archive, RestoreStats *stats, QStringList *warnings);
    bool merge(const ChatArchive &archive, RestoreStats *stats, QStringList *warnings);

private:
    void applyAnnotations(const ChatArchive &archive, bool onlyWhereMissing, QStringList *warnings);

    ChatService *m_chats;
};

} // namespace Backup

#endif // CHATMERGER_H
