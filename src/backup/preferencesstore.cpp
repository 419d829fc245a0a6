#include "preferencesstore.h"
#include "backuptypes.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace Backup {

PreferencesStore::PreferencesStore(const QString &filePath)
    : m_filePath(filePath)
{
    load();
}

QVariantMap PreferencesStore::snapshot() const
{
    QVariantMap map;
    for (auto it = m_values.constBegin(); it != m_values.constEnd(); ++it) {
        if (isLocalOnlySettingKey(it.key())) continue;
        map.insert(it.key(), it.value());
    }
    return map;
}

bool PreferencesStore::restoreAll(const QVariantMap &values)
{
    int rejected = 0;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        if (isLocalOnlySettingKey(it.key())) continue;

        QVariant normalized;
        if (!normalizeValue(it.value(), &normalized)) {
            rejected++;
            continue;
        }
        m_values.insert(it.key(), normalized);
    }

    if (rejected > 0) {
        qDebug() << "[PreferencesStore] Dropped" << rejected << "values of unsupported type";
    }
    return save();
}

bool PreferencesStore::restoreSingle(const QString &key, const QVariant &value)
{
    if (isLocalOnlySettingKey(key)) {
        qDebug() << "[PreferencesStore] Refusing to restore local-only key" << key;
        return false;
    }
    return setValue(key, value);
}

bool PreferencesStore::contains(const QString &key) const
{
    return m_values.contains(key);
}

QVariant PreferencesStore::value(const QString &key) const
{
    return m_values.value(key);
}

bool PreferencesStore::setValue(const QString &key, const QVariant &value)
{
    QVariant normalized;
    if (!normalizeValue(value, &normalized)) {
        qWarning() << "[PreferencesStore] Unsupported value type for" << key
                   << value.typeName();
        return false;
    }
    m_values.insert(key, normalized);
    return save();
}

bool PreferencesStore::normalizeValue(const QVariant &value, QVariant *out)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        *out = value.toBool();
        return true;
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        *out = value.toLongLong();
        return true;
    case QMetaType::Double:
    case QMetaType::Float:
        *out = value.toDouble();
        return true;
    case QMetaType::QString:
        *out = value.toString();
        return true;
    case QMetaType::QStringList:
        *out = value.toStringList();
        return true;
    case QMetaType::QVariantList: {
        // Only string lists are storable; other elements are dropped
        QStringList strings;
        for (const QVariant &v : value.toList()) {
            if (v.typeId() == QMetaType::QString) {
                strings << v.toString();
            }
        }
        *out = strings;
        return true;
    }
    default:
        return false;
    }
}

// ========== Persistence ==========

bool PreferencesStore::load()
{
    m_values.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[PreferencesStore] Failed to open" << m_filePath;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[PreferencesStore] Failed to parse" << m_filePath
                   << parseError.errorString();
        return false;
    }

    const QVariantMap raw = doc.object().toVariantMap();
    for (auto it = raw.constBegin(); it != raw.constEnd(); ++it) {
        QVariant normalized;
        if (normalizeValue(it.value(), &normalized)) {
            m_values.insert(it.key(), normalized);
        }
    }

    qDebug() << "[PreferencesStore] Loaded" << m_values.size() << "values";
    return true;
}

bool PreferencesStore::save() const
{
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[PreferencesStore] Failed to save" << m_filePath;
        return false;
    }

    file.write(QJsonDocument(QJsonObject::fromVariantMap(m_values)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[PreferencesStore] Failed to commit" << m_filePath;
        return false;
    }
    return true;
}

} // namespace Backup
