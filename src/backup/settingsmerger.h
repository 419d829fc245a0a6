#ifndef SETTINGSMERGER_H
#define SETTINGSMERGER_H

#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QHash>
#include <QSet>

namespace Backup {

/**
 * @brief How a settings key family is merged
 */
enum class MergeStrategy {
    AssistantsById,     ///< Per-id shallow merge, local avatar/background protected
    MapIncomingWins,    ///< Shallow object merge, incoming wins on collision
    StringSetUnion,     ///< De-duplicated union of string lists
    TagsAppendNew,      ///< Local order kept, unseen incoming ids appended
    MapLocalWins,       ///< Object union, local wins on collision
    ReplaceWithIncoming,///< Incoming value replaces local
    AddIfAbsent         ///< Only written when the key is absent locally
};

/**
 * @brief Outcome of merging one settings key
 */
enum class MergeDecision {
    Write,              ///< Write the merged value
    Keep,               ///< Leave the local value as is
    Failed              ///< A side could not be parsed; key skipped
};

/**
 * @brief Merges incoming settings into local ones, one key at a time
 *
 * The key -> strategy table is built once and is the only place that knows
 * about individual keys. Structured values are JSON-encoded strings.
 */
class SettingsMerger
{
public:
    /**
     * @brief Keys restored under the providers action instead of settings
     */
    static const QSet<QString> &providerKeys();

    static bool isProviderKey(const QString &key) { return providerKeys().contains(key); }

    /**
     * @brief Strategy table (key -> strategy); unlisted keys are AddIfAbsent
     */
    static const QHash<QString, MergeStrategy> &strategyTable();

    static MergeStrategy strategyFor(const QString &key);

    /**
     * @brief Merge one incoming key against the local snapshot
     * @param key Setting key
     * @param existing Local settings snapshot
     * @param incoming Archived value
     * @param result Value to write when Write is returned
     * @param error Parse error when Failed is returned
     */
    static MergeDecision merge(const QString &key, const QVariantMap &existing,
                               const QVariant &incoming, QVariant *result,
                               QString *error = nullptr);

    // ========== Strategies ==========
    // Each takes the JSON text of both sides; false on malformed input

    static bool mergeAssistants(const QString &local, const QString &incoming, QString *out);
    static bool mergeMapIncomingWins(const QString &local, const QString &incoming, QString *out);
    static bool mergeStringSet(const QString &local, const QString &incoming, QString *out);
    static bool mergeTags(const QString &local, const QString &incoming, QString *out);
    static bool mergeMapLocalWins(const QString &local, const QString &incoming, QString *out);
};

} // namespace Backup

#endif // SETTINGSMERGER_H
