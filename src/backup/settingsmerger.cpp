#include "settingsmerger.h"

#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

namespace Backup {

namespace {

bool parseArray(const QString &text, QJsonArray *out)
{
    if (text.trimmed().isEmpty()) {
        *out = QJsonArray();
        return true;
    }
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) return false;
    *out = doc.array();
    return true;
}

bool parseObject(const QString &text, QJsonObject *out)
{
    if (text.trimmed().isEmpty()) {
        *out = QJsonObject();
        return true;
    }
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return false;
    *out = doc.object();
    return true;
}

QString toText(const QJsonArray &array)
{
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

QString toText(const QJsonObject &object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

// Ids may be stored as strings or numbers
QString idOf(const QJsonValue &element)
{
    if (!element.isObject()) return QString();
    const QJsonValue id = element.toObject().value("id");
    if (id.isNull() || id.isUndefined()) return QString();
    return id.toVariant().toString();
}

bool isBlank(const QJsonValue &value)
{
    if (value.isNull() || value.isUndefined()) return true;
    return value.toVariant().toString().trimmed().isEmpty();
}

// Stored structured values are strings holding JSON
bool textOf(const QVariant &value, QString *out)
{
    if (!value.isValid() || value.isNull()) {
        out->clear();
        return true;
    }
    if (value.typeId() != QMetaType::QString) return false;
    *out = value.toString();
    return true;
}

} // namespace

// ========== Tables ==========

const QSet<QString> &SettingsMerger::providerKeys()
{
    static const QSet<QString> keys = {
        "provider_configs_v1",
        "providers_order_v1",
        "pinned_models_v1",
        "assistants_v1",
        "assistant_tags_v1",
        "assistant_tag_map_v1",
        "assistant_tag_collapsed_v1",
        "search_services_v1",
        "quick_phrases_v1",
    };
    return keys;
}

const QHash<QString, MergeStrategy> &SettingsMerger::strategyTable()
{
    static const QHash<QString, MergeStrategy> table = {
        {"assistants_v1",              MergeStrategy::AssistantsById},
        {"provider_configs_v1",        MergeStrategy::MapIncomingWins},
        {"pinned_models_v1",           MergeStrategy::StringSetUnion},
        {"assistant_tags_v1",          MergeStrategy::TagsAppendNew},
        {"assistant_tag_map_v1",       MergeStrategy::MapLocalWins},
        {"assistant_tag_collapsed_v1", MergeStrategy::MapLocalWins},
        {"providers_order_v1",         MergeStrategy::ReplaceWithIncoming},
        {"search_services_v1",         MergeStrategy::ReplaceWithIncoming},
    };
    return table;
}

MergeStrategy SettingsMerger::strategyFor(const QString &key)
{
    return strategyTable().value(key, MergeStrategy::AddIfAbsent);
}

// ========== Dispatch ==========

MergeDecision SettingsMerger::merge(const QString &key, const QVariantMap &existing,
                                    const QVariant &incoming, QVariant *result, QString *error)
{
    const MergeStrategy strategy = strategyFor(key);
    const bool hasLocal = existing.contains(key);

    bool (*mergeFn)(const QString &, const QString &, QString *) = nullptr;
    bool needsLocal = false;

    switch (strategy) {
    case MergeStrategy::AddIfAbsent:
        if (hasLocal) return MergeDecision::Keep;
        *result = incoming;
        return MergeDecision::Write;

    case MergeStrategy::ReplaceWithIncoming:
        *result = incoming;
        return MergeDecision::Write;

    case MergeStrategy::AssistantsById:
        mergeFn = &SettingsMerger::mergeAssistants;
        needsLocal = true;
        break;
    case MergeStrategy::MapIncomingWins:
        mergeFn = &SettingsMerger::mergeMapIncomingWins;
        needsLocal = true;
        break;
    case MergeStrategy::StringSetUnion:
        mergeFn = &SettingsMerger::mergeStringSet;
        needsLocal = true;
        break;

    // An absent local value parses as empty
    case MergeStrategy::TagsAppendNew:
        mergeFn = &SettingsMerger::mergeTags;
        break;
    case MergeStrategy::MapLocalWins:
        mergeFn = &SettingsMerger::mergeMapLocalWins;
        break;
    }

    // Nothing local to merge with
    if (needsLocal && !hasLocal) {
        *result = incoming;
        return MergeDecision::Write;
    }

    QString localText, incomingText;
    if (!textOf(existing.value(key), &localText) || !textOf(incoming, &incomingText)) {
        if (error) *error = QString("%1: expected a JSON string value").arg(key);
        return MergeDecision::Failed;
    }

    QString merged;
    const bool ok = mergeFn(localText, incomingText, &merged);

    if (!ok) {
        if (error) *error = QString("%1: malformed JSON").arg(key);
        return MergeDecision::Failed;
    }

    *result = merged;
    return MergeDecision::Write;
}

// ========== Strategies ==========

bool SettingsMerger::mergeAssistants(const QString &local, const QString &incoming, QString *out)
{
    QJsonArray localList, incomingList;
    if (!parseArray(local, &localList) || !parseArray(incoming, &incomingList)) return false;

    QStringList order;
    QHash<QString, QJsonObject> byId;

    for (const QJsonValue &v : localList) {
        const QString id = idOf(v);
        if (id.isEmpty()) continue;
        if (!byId.contains(id)) order << id;
        byId[id] = v.toObject();
    }

    for (const QJsonValue &v : incomingList) {
        const QString id = idOf(v);
        if (id.isEmpty()) continue;

        const QJsonObject in = v.toObject();
        if (!byId.contains(id)) {
            order << id;
            byId[id] = in;
            continue;
        }

        const QJsonObject localObj = byId.value(id);
        QJsonObject merged = localObj;
        for (auto it = in.begin(); it != in.end(); ++it) {
            merged[it.key()] = it.value();
        }

        // Locally chosen images survive the import
        for (const QString &field : {QStringLiteral("avatar"), QStringLiteral("background")}) {
            if (!isBlank(localObj.value(field))) {
                merged[field] = localObj.value(field);
            }
        }
        byId[id] = merged;
    }

    QJsonArray result;
    for (const QString &id : order) {
        result.append(byId.value(id));
    }
    *out = toText(result);
    return true;
}

bool SettingsMerger::mergeMapIncomingWins(const QString &local, const QString &incoming, QString *out)
{
    QJsonObject localMap, incomingMap;
    if (!parseObject(local, &localMap) || !parseObject(incoming, &incomingMap)) return false;

    QJsonObject merged = localMap;
    for (auto it = incomingMap.begin(); it != incomingMap.end(); ++it) {
        merged[it.key()] = it.value();
    }
    *out = toText(merged);
    return true;
}

bool SettingsMerger::mergeStringSet(const QString &local, const QString &incoming, QString *out)
{
    QJsonArray localList, incomingList;
    if (!parseArray(local, &localList) || !parseArray(incoming, &incomingList)) return false;

    QSet<QString> seen;
    QJsonArray merged;
    for (const QJsonArray &list : {localList, incomingList}) {
        for (const QJsonValue &v : list) {
            if (!v.isString()) continue;
            const QString s = v.toString();
            if (seen.contains(s)) continue;
            seen.insert(s);
            merged.append(s);
        }
    }
    *out = toText(merged);
    return true;
}

bool SettingsMerger::mergeTags(const QString &local, const QString &incoming, QString *out)
{
    QJsonArray localList, incomingList;
    if (!parseArray(local, &localList) || !parseArray(incoming, &incomingList)) return false;

    QSet<QString> seen;
    QJsonArray merged;
    for (const QJsonArray &list : {localList, incomingList}) {
        for (const QJsonValue &v : list) {
            const QString id = idOf(v);
            if (id.isEmpty() || seen.contains(id)) continue;
            seen.insert(id);
            merged.append(v);
        }
    }
    *out = toText(merged);
    return true;
}

bool SettingsMerger::mergeMapLocalWins(const QString &local, const QString &incoming, QString *out)
{
    QJsonObject localMap, incomingMap;
    if (!parseObject(local, &localMap) || !parseObject(incoming, &incomingMap)) return false;

    QJsonObject merged = incomingMap;
    for (auto it = localMap.begin(); it != localMap.end(); ++it) {
        merged[it.key()] = it.value();
    }
    *out = toText(merged);
    return true;
}

} // namespace Backup
