#ifndef DAVCLIENT_H
#define DAVCLIENT_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QUrl>
#include <QMap>

class QNetworkAccessManager;

namespace Backup {

/**
 * @brief A single WebDAV/HTTP request
 */
struct DavRequest {
    QByteArray method;                      ///< "PROPFIND", "MKCOL", "PUT", ...
    QUrl url;
    QMap<QByteArray, QByteArray> headers;
    QByteArray body;
};

/**
 * @brief Response to a DavRequest
 *
 * status is 0 when no HTTP response was received at all; networkError then
 * says why.
 */
struct DavResponse {
    int status = 0;
    QByteArray body;
    QString networkError;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Abstract request/response channel to a WebDAV server
 *
 * Implementations block until the response is complete.
 */
class DavClient
{
public:
    virtual ~DavClient() = default;

    virtual DavResponse send(const DavRequest &request) = 0;
};

/**
 * @brief DavClient on QNetworkAccessManager
 *
 * Each request runs a local event loop until the reply finishes, so calls
 * are synchronous from the caller's point of view. The transfer timeout is
 * an inactivity timeout: a long upload that keeps moving never times out.
 */
class NetworkDavClient : public QObject, public DavClient
{
    Q_OBJECT

public:
    explicit NetworkDavClient(QObject *parent = nullptr);
    ~NetworkDavClient() override;

    DavResponse send(const DavRequest &request) override;

    void setTransferTimeout(int msecs) { m_transferTimeoutMs = msecs; }
    int transferTimeout() const { return m_transferTimeoutMs; }

private:
    QNetworkAccessManager *m_networkManager = nullptr;
    int m_transferTimeoutMs = 60000;
};

} // namespace Backup

#endif // DAVCLIENT_H
