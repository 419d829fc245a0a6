#ifndef PREFERENCESSTORE_H
#define PREFERENCESSTORE_H

#include "settingsstore.h"

#include <QString>
#include <QVariantMap>

namespace Backup {

/**
 * @brief SettingsStore persisted as a single JSON object on disk
 *
 * JSON keeps the value types intact across a reload (an integer stays an
 * integer, a string list stays a list), which an INI file would not.
 *
 * File layout:
 * @code
 * { "theme_mode_v1": "dark", "font_scale_v1": 1.1, "pinned_models_v1": "[...]" }
 * @endcode
 */
class PreferencesStore : public SettingsStore
{
public:
    /**
     * @param filePath JSON file holding the preferences (created on first write)
     */
    explicit PreferencesStore(const QString &filePath);
    ~PreferencesStore() override = default;

    QVariantMap snapshot() const override;
    bool restoreAll(const QVariantMap &values) override;
    bool restoreSingle(const QString &key, const QVariant &value) override;
    bool contains(const QString &key) const override;
    QVariant value(const QString &key) const override;

    /**
     * @brief Set a value directly, local-only keys included
     *
     * Used by the application itself for device-specific state.
     */
    bool setValue(const QString &key, const QVariant &value);

    bool load();
    bool save() const;

    QString filePath() const { return m_filePath; }

    /**
     * @brief Coerce a value to one of the supported types
     * @return false if the value has no supported representation
     */
    static bool normalizeValue(const QVariant &value, QVariant *out);

private:
    QString m_filePath;
    QVariantMap m_values;
};

} // namespace Backup

#endif // PREFERENCESSTORE_H
