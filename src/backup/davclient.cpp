#include "davclient.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QEventLoop>
#include <QDebug>

#include "kelivosync_version.h"

namespace Backup {

NetworkDavClient::NetworkDavClient(QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
{
}

NetworkDavClient::~NetworkDavClient() = default;

DavResponse NetworkDavClient::send(const DavRequest &request)
{
    DavResponse response;

    QNetworkRequest req(request.url);
    req.setHeader(QNetworkRequest::UserAgentHeader,
                  QString("KelivoSync/%1").arg(KELIVOSYNC_VERSION_STRING));
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setTransferTimeout(m_transferTimeoutMs);
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it) {
        req.setRawHeader(it.key(), it.value());
    }

    qDebug() << "[NetworkDavClient]" << request.method << request.url.toString(QUrl::RemoveUserInfo);

    QNetworkReply *reply = m_networkManager->sendCustomRequest(req, request.method, request.body);

    QEventLoop loop;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    response.status = statusAttr.isValid() ? statusAttr.toInt() : 0;
    response.body = reply->readAll();

    // HTTP error statuses are reported through status; only keep errors
    // where no response arrived at all
    if (response.status == 0 && reply->error() != QNetworkReply::NoError) {
        response.networkError = reply->errorString();
        qWarning() << "[NetworkDavClient]" << request.method << "failed:" << response.networkError;
    } else {
        qDebug() << "[NetworkDavClient] Response: HTTP" << response.status
                 << "Size:" << response.body.size() << "bytes";
    }

    reply->deleteLater();
    return response;
}

} // namespace Backup
