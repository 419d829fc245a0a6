#ifndef SNAPSHOTBUILDER_H
#define SNAPSHOTBUILDER_H

#include "archivecodec.h"
#include "backuptypes.h"
#include "chatservice.h"
#include "datadirectories.h"
#include "settingsstore.h"

#include <QByteArray>
#include <QDateTime>
#include <QList>

namespace Backup {

/**
 * @brief Serializes local state into the archive layout
 *
 *   settings.json  - flat settings map (local-only keys removed)
 *   chats.json     - conversations, messages, tool events, thought signatures
 *   upload/ images/ avatars/ - file trees, verbatim
 */
class SnapshotBuilder
{
public:
    SnapshotBuilder(SettingsStore *settings, ChatService *chats, const DataDirectories &dirs);

    QByteArray buildSettingsBlob() const;
    QByteArray buildChatsBlob() const;

    /**
     * @brief One entry per regular file of each existing file tree
     */
    QList<ArchiveEntry> buildFileTrees() const;

    /**
     * @brief Every archive member for a backup with the given toggles
     */
    QList<ArchiveEntry> buildArchiveEntries(const WebDavConfig &cfg) const;

    /**
     * @brief kelivo_backup_<yyyy-MM-ddTHH-mm-ss.zzz>.zip
     */
    static QString backupFileName(const QDateTime &when = QDateTime::currentDateTime());

private:
    SettingsStore *m_settings;
    ChatService *m_chats;
    DataDirectories m_dirs;
};

} // namespace Backup

#endif // SNAPSHOTBUILDER_H
