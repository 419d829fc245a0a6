#ifndef WEBDAVTRANSPORT_H
#define WEBDAVTRANSPORT_H

#include "backuptypes.h"
#include "davclient.h"

#include <QString>
#include <QByteArray>
#include <QList>
#include <QUrl>
#include <QDateTime>

namespace Backup {

/**
 * @brief Backup collection operations over WebDAV
 *
 * Methods used:
 *   - PROPFIND depth 0: collection existence check
 *   - PROPFIND depth 1: collection listing
 *   - MKCOL: collection creation
 *   - PUT / GET / DELETE: archive upload, download, removal
 *
 * 401 always maps to AuthError. Any other status outside what an operation
 * accepts maps to TransportError carrying the status.
 */
class WebDavTransport
{
public:
    /**
     * @param client Request channel (not owned, must outlive the transport)
     */
    explicit WebDavTransport(DavClient *client);

    // ========== Addressing ==========

    /**
     * @brief Collection URL, always ending in '/'
     */
    static QUrl collectionUrl(const WebDavConfig &cfg);

    /**
     * @brief URL of a file inside the collection
     */
    static QUrl fileUrl(const WebDavConfig &cfg, const QString &childName);

    /**
     * @brief "Basic base64(user:pass)", or empty if no username is set
     */
    static QByteArray authorizationHeader(const WebDavConfig &cfg);

    // ========== Operations ==========

    /**
     * @brief Create every missing collection along the configured path
     *
     * Walks the path one segment at a time. Safe to repeat: existing
     * collections are only checked.
     */
    BackupResult ensureCollection(const WebDavConfig &cfg);

    /**
     * @brief Check the collection with a depth-1 PROPFIND
     */
    BackupResult testConnection(const WebDavConfig &cfg);

    /**
     * @brief List backup files, newest first
     */
    BackupResult listCollection(const WebDavConfig &cfg, QList<BackupFileItem> *items);

    BackupResult upload(const WebDavConfig &cfg, const QByteArray &data, const QString &name);
    BackupResult download(const WebDavConfig &cfg, const BackupFileItem &item, QByteArray *data);
    BackupResult remove(const WebDavConfig &cfg, const BackupFileItem &item);

    // ========== Parsing ==========

    /**
     * @brief Parse a PROPFIND multistatus body into file items
     *
     * Namespace prefixes are ignored. The collection's own entry and any
     * sub-collection (location ending in '/') are skipped. Result is sorted
     * newest first, entries without a timestamp last.
     */
    static QList<BackupFileItem> parseMultiStatus(const QByteArray &xml, const QUrl &collection);

    /**
     * @brief Recover the timestamp embedded in a backup file name
     *
     * Expects kelivo_backup_YYYY-MM-DDTHH-MM-SS[.fraction].zip, where the
     * time part uses '-' instead of ':'. Returns an invalid QDateTime
     * otherwise.
     */
    static QDateTime timestampFromFileName(const QString &name);

    /**
     * @brief Parse a getlastmodified value (RFC 2822, or ISO 8601)
     */
    static QDateTime parseHttpDate(const QString &value);

private:
    DavResponse sendRequest(const WebDavConfig &cfg, const QByteArray &method, const QUrl &url,
                            const QByteArray &body = QByteArray(),
                            const QMap<QByteArray, QByteArray> &extraHeaders = {});
    static BackupResult statusFailure(const QString &what, const QUrl &url,
                                      const DavResponse &response);

    DavClient *m_client;
};

} // namespace Backup

#endif // WEBDAVTRANSPORT_H
