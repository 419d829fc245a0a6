#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QString>
#include <QVariant>
#include <QVariantMap>

namespace Backup {

/**
 * @brief Abstract interface for the application's key-value settings
 *
 * Values are one of bool, integer, double, string or string list.
 * Implementations must refuse local-only keys (see localOnlySettingKeys())
 * in every write and leave them out of snapshot().
 */
class SettingsStore
{
public:
    virtual ~SettingsStore() = default;

    /**
     * @brief All settings except the local-only ones
     */
    virtual QVariantMap snapshot() const = 0;

    /**
     * @brief Write every entry of @p values (local-only keys are dropped)
     * @return true if everything was persisted
     */
    virtual bool restoreAll(const QVariantMap &values) = 0;

    /**
     * @brief Write one entry
     * @return false if the key is local-only, the value type is unsupported,
     *         or persisting failed
     */
    virtual bool restoreSingle(const QString &key, const QVariant &value) = 0;

    virtual bool contains(const QString &key) const = 0;
    virtual QVariant value(const QString &key) const = 0;
};

} // namespace Backup

#endif // SETTINGSSTORE_H
