#include "chatservice.h"

namespace Backup {

QJsonObject Conversation::toJson() const
{
    QJsonObject obj = fields;
    obj["id"] = id;
    return obj;
}

Conversation Conversation::fromJson(const QJsonObject &json)
{
    Conversation c;
    c.id = json["id"].toString();
    c.fields = json;
    return c;
}

QJsonObject ChatMessage::toJson() const
{
    QJsonObject obj = fields;
    obj["id"] = id;
    obj["conversationId"] = conversationId;
    obj["role"] = role;
    return obj;
}

ChatMessage ChatMessage::fromJson(const QJsonObject &json)
{
    ChatMessage m;
    m.id = json["id"].toString();
    m.conversationId = json["conversationId"].toString();
    m.role = json["role"].toString();
    m.fields = json;
    return m;
}

} // namespace Backup
