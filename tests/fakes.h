/**
 * @file fakes.h
 * @brief In-memory collaborators shared by the backup tests
 *
 *   - MemoryChatService: ChatService kept in plain containers
 *   - FakeDavServer: DavClient answering like a small WebDAV server
 */

#ifndef KELIVOSYNC_TEST_FAKES_H
#define KELIVOSYNC_TEST_FAKES_H

#include <QHash>
#include <QMap>
#include <QSet>
#include <QList>
#include <QStringList>
#include <QUrl>
#include <QDateTime>
#include <QLocale>
#include <QJsonObject>
#include <QJsonArray>

#include "backup/chatservice.h"
#include "backup/davclient.h"

namespace Backup {

// ========== Chat records ==========

inline Conversation makeConversation(const QString &id, const QString &title = QString())
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title.isEmpty() ? id : title;
    return Conversation::fromJson(obj);
}

inline ChatMessage makeMessage(const QString &id, const QString &conversationId,
                               const QString &role = "user", const QString &content = QString())
{
    QJsonObject obj;
    obj["id"] = id;
    obj["conversationId"] = conversationId;
    obj["role"] = role;
    obj["content"] = content.isEmpty() ? id : content;
    return ChatMessage::fromJson(obj);
}

/**
 * @brief ChatService held entirely in memory
 */
class MemoryChatService : public ChatService
{
public:
    QList<Conversation> allConversations() const override
    {
        QList<Conversation> list;
        for (const QString &id : order) list.append(conversations.value(id));
        return list;
    }

    QList<ChatMessage> messages(const QString &conversationId) const override
    {
        return messagesByConversation.value(conversationId);
    }

    QJsonArray toolEvents(const QString &messageId) const override
    {
        return events.value(messageId);
    }

    QString geminiThoughtSignature(const QString &messageId) const override
    {
        return signatures.value(messageId);
    }

    bool setToolEvents(const QString &messageId, const QJsonArray &value) override
    {
        events[messageId] = value;
        return true;
    }

    bool setGeminiThoughtSignature(const QString &messageId, const QString &signature) override
    {
        signatures[messageId] = signature;
        return true;
    }

    bool clearAllData() override
    {
        order.clear();
        conversations.clear();
        messagesByConversation.clear();
        events.clear();
        signatures.clear();
        clearCount++;
        return true;
    }

    bool restoreConversation(const Conversation &conversation,
                             const QList<ChatMessage> &msgs) override
    {
        if (!conversations.contains(conversation.id)) order.append(conversation.id);
        conversations[conversation.id] = conversation;
        messagesByConversation[conversation.id] = msgs;
        return true;
    }

    bool addMessageDirectly(const QString &conversationId, const ChatMessage &message) override
    {
        if (!conversations.contains(conversationId)) return false;
        messagesByConversation[conversationId].append(message);
        return true;
    }

    bool commit() override
    {
        commitCount++;
        return true;
    }

    // Test helpers
    void add(const Conversation &c, const QList<ChatMessage> &msgs)
    {
        restoreConversation(c, msgs);
    }

    QStringList messageIds(const QString &conversationId) const
    {
        QStringList ids;
        for (const ChatMessage &m : messagesByConversation.value(conversationId)) ids << m.id;
        return ids;
    }

    int totalMessages() const
    {
        int n = 0;
        for (const QList<ChatMessage> &l : messagesByConversation) n += l.size();
        return n;
    }

    QStringList order;
    QHash<QString, Conversation> conversations;
    QHash<QString, QList<ChatMessage>> messagesByConversation;
    QHash<QString, QJsonArray> events;
    QHash<QString, QString> signatures;
    int clearCount = 0;
    int commitCount = 0;
};

// ========== WebDAV ==========

/**
 * @brief DavClient backed by an in-memory tree of collections and files
 *
 * Paths are URL paths without trailing slash. The root path ("") always
 * exists. Every request is recorded for inspection.
 */
class FakeDavServer : public DavClient
{
public:
    DavResponse send(const DavRequest &request) override
    {
        requests.append(request);

        DavResponse response;
        if (failAll) {
            response.status = 0;
            response.networkError = "Connection refused";
            return response;
        }
        if (forcedStatus.contains(request.method)) {
            response.status = forcedStatus.value(request.method);
            return response;
        }
        if (!requiredAuth.isEmpty() && request.headers.value("Authorization") != requiredAuth) {
            response.status = 401;
            return response;
        }

        const QString path = normalize(request.url.path());
        const QByteArray &m = request.method;

        if (m == "PROPFIND") {
            if (!collections.contains(path)) {
                response.status = files.contains(path) ? 207 : 404;
                return response;
            }
            response.status = 207;
            if (request.headers.value("Depth") == "1") {
                response.body = listing(path);
            }
        } else if (m == "MKCOL") {
            if (collections.contains(path)) {
                response.status = 405;
            } else if (!collections.contains(parentOf(path))) {
                response.status = 409;
            } else {
                collections.insert(path);
                response.status = 201;
            }
        } else if (m == "PUT") {
            if (!collections.contains(parentOf(path))) {
                response.status = 409;
            } else {
                response.status = files.contains(path) ? 204 : 201;
                files[path] = request.body;
                modified[path] = QDateTime::currentDateTimeUtc();
            }
        } else if (m == "GET") {
            if (files.contains(path)) {
                response.status = 200;
                response.body = files.value(path);
            } else {
                response.status = 404;
            }
        } else if (m == "DELETE") {
            response.status = files.remove(path) > 0 ? 204 : 404;
            modified.remove(path);
        } else {
            response.status = 405;
        }
        return response;
    }

    int countRequests(const QByteArray &method) const
    {
        int n = 0;
        for (const DavRequest &r : requests) {
            if (r.method == method) n++;
        }
        return n;
    }

    void addFile(const QString &path, const QByteArray &data, const QDateTime &when)
    {
        files[normalize(path)] = data;
        modified[normalize(path)] = when;
    }

    static QString normalize(QString path)
    {
        while (path.endsWith('/')) path.chop(1);
        return path;
    }

    static QString parentOf(const QString &path)
    {
        const int slash = path.lastIndexOf('/');
        return slash <= 0 ? QString() : path.left(slash);
    }

    QSet<QString> collections = {QString()};
    QMap<QString, QByteArray> files;
    QMap<QString, QDateTime> modified;
    QList<DavRequest> requests;

    QByteArray requiredAuth;                // e.g. "Basic dXNlcjpwYXNz"
    QMap<QByteArray, int> forcedStatus;     // method -> status
    bool failAll = false;

private:
    QByteArray listing(const QString &collection) const
    {
        QByteArray xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<D:multistatus xmlns:D=\"DAV:\">\n";
        xml += entry(collection + '/', QString(), QByteArray(), QDateTime());

        for (auto it = files.constBegin(); it != files.constEnd(); ++it) {
            if (parentOf(it.key()) != collection) continue;
            const QString name = it.key().mid(collection.size() + 1);
            xml += entry(it.key(), name, QByteArray::number(it.value().size()),
                         modified.value(it.key()));
        }
        for (const QString &sub : collections) {
            if (sub.isEmpty() || parentOf(sub) != collection) continue;
            xml += entry(sub + '/', sub.mid(collection.size() + 1), QByteArray(), QDateTime());
        }
        xml += "</D:multistatus>\n";
        return xml;
    }

    static QByteArray entry(const QString &href, const QString &name, const QByteArray &length,
                            const QDateTime &when)
    {
        QByteArray xml = "  <D:response>\n    <D:href>" + QUrl::toPercentEncoding(href, "/") + "</D:href>\n"
                         "    <D:propstat><D:prop>\n";
        xml += "      <D:displayname>" + name.toUtf8() + "</D:displayname>\n";
        if (!length.isEmpty()) {
            xml += "      <D:getcontentlength>" + length + "</D:getcontentlength>\n";
        }
        if (when.isValid()) {
            xml += "      <D:getlastmodified>"
                 + QLocale::c().toString(when.toUTC(), "ddd, dd MMM yyyy HH:mm:ss").toUtf8()
                 + " GMT</D:getlastmodified>\n";
        }
        xml += "    </D:prop><D:status>HTTP/1.1 200 OK</D:status></D:propstat>\n  </D:response>\n";
        return xml;
    }
};

} // namespace Backup

#endif // KELIVOSYNC_TEST_FAKES_H
