#include "webdavtransport.h"

#include <QXmlStreamReader>
#include <QRegularExpression>
#include <QDebug>

#include <algorithm>
#include <limits>

namespace Backup {

namespace {

const QByteArray PropfindBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\" ?>"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop><d:displayname/></d:prop></d:propfind>";

const QByteArray ListBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\" ?>\n"
    "<d:propfind xmlns:d=\"DAV:\">\n"
    "  <d:prop>\n"
    "    <d:displayname/>\n"
    "    <d:getcontentlength/>\n"
    "    <d:getlastmodified/>\n"
    "  </d:prop>\n"
    "</d:propfind>";

QMap<QByteArray, QByteArray> propfindHeaders(const char *depth)
{
    QMap<QByteArray, QByteArray> headers;
    headers["Depth"] = depth;
    headers["Content-Type"] = "application/xml; charset=utf-8";
    return headers;
}

QString stripTrailingSlashes(QString s)
{
    while (s.endsWith('/')) s.chop(1);
    return s;
}

} // namespace

WebDavTransport::WebDavTransport(DavClient *client)
    : m_client(client)
{
}

// ========== Addressing ==========

QUrl WebDavTransport::collectionUrl(const WebDavConfig &cfg)
{
    const QString base = stripTrailingSlashes(cfg.url.trimmed());
    const QString path = cfg.normalizedPath();

    QString full = base;
    if (!path.isEmpty()) {
        full += '/' + path;
    }
    full += '/';
    return QUrl(full);
}

QUrl WebDavTransport::fileUrl(const WebDavConfig &cfg, const QString &childName)
{
    QString child = childName;
    while (child.startsWith('/')) child.remove(0, 1);
    return QUrl(collectionUrl(cfg).toString() + child);
}

QByteArray WebDavTransport::authorizationHeader(const WebDavConfig &cfg)
{
    if (cfg.username.trimmed().isEmpty()) {
        return QByteArray();
    }
    const QByteArray token = QString("%1:%2").arg(cfg.username, cfg.password).toUtf8().toBase64();
    return "Basic " + token;
}

DavResponse WebDavTransport::sendRequest(const WebDavConfig &cfg, const QByteArray &method,
                                         const QUrl &url, const QByteArray &body,
                                         const QMap<QByteArray, QByteArray> &extraHeaders)
{
    DavRequest request;
    request.method = method;
    request.url = url;
    request.body = body;
    request.headers = extraHeaders;

    const QByteArray auth = authorizationHeader(cfg);
    if (!auth.isEmpty()) {
        request.headers["Authorization"] = auth;
    }
    return m_client->send(request);
}

BackupResult WebDavTransport::statusFailure(const QString &what, const QUrl &url,
                                            const DavResponse &response)
{
    const QString location = url.toString(QUrl::RemoveUserInfo);

    if (response.status == 401) {
        qWarning() << "[WebDavTransport]" << what << "unauthorized at" << location;
        return BackupResult::failure(BackupError::AuthError, "Unauthorized", 401);
    }

    QString message;
    if (response.status == 0) {
        message = QString("%1 failed at %2: %3").arg(what, location,
            response.networkError.isEmpty() ? QString("no response") : response.networkError);
    } else {
        message = QString("%1 failed at %2: %3").arg(what, location).arg(response.status);
    }
    qWarning() << "[WebDavTransport]" << message;
    return BackupResult::failure(BackupError::TransportError, message, response.status);
}

// ========== Operations ==========

BackupResult WebDavTransport::ensureCollection(const WebDavConfig &cfg)
{
    QString acc = stripTrailingSlashes(cfg.url.trimmed());
    int created = 0;

    for (const QString &segment : cfg.pathSegments()) {
        acc += '/' + segment;
        const QUrl url(acc + '/');

        DavResponse existing = sendRequest(cfg, "PROPFIND", url, PropfindBody, propfindHeaders("0"));

        if (existing.status == 404) {
            DavResponse mk = sendRequest(cfg, "MKCOL", url);
            // 405: created by someone else in the meantime
            if (mk.status != 201 && mk.status != 200 && mk.status != 405) {
                return statusFailure("MKCOL", url, mk);
            }
            if (mk.status != 405) {
                created++;
                qDebug() << "[WebDavTransport] Created collection" << url.toString(QUrl::RemoveUserInfo);
            }
        } else if (existing.status == 401) {
            return statusFailure("PROPFIND", url, existing);
        } else if (!(existing.status >= 200 && existing.status < 400) && existing.status != 207) {
            return statusFailure("PROPFIND", url, existing);
        }
    }

    if (created > 0) {
        qDebug() << "[WebDavTransport] Created" << created << "collection(s)";
    }
    return BackupResult();
}

BackupResult WebDavTransport::testConnection(const WebDavConfig &cfg)
{
    const QUrl url = collectionUrl(cfg);
    DavResponse res = sendRequest(cfg, "PROPFIND", url, PropfindBody, propfindHeaders("1"));
    if (res.status != 207 && !res.isSuccess()) {
        return statusFailure("WebDAV test", url, res);
    }
    return BackupResult();
}

BackupResult WebDavTransport::listCollection(const WebDavConfig &cfg, QList<BackupFileItem> *items)
{
    items->clear();

    BackupResult ensured = ensureCollection(cfg);
    if (!ensured.success) {
        return ensured;
    }

    const QUrl url = collectionUrl(cfg);
    DavResponse res = sendRequest(cfg, "PROPFIND", url, ListBody, propfindHeaders("1"));
    if (!res.isSuccess()) {
        return statusFailure("PROPFIND", url, res);
    }

    *items = parseMultiStatus(res.body, url);
    qDebug() << "[WebDavTransport] Listed" << items->size() << "backup file(s)";
    return BackupResult();
}

BackupResult WebDavTransport::upload(const WebDavConfig &cfg, const QByteArray &data,
                                     const QString &name)
{
    const QUrl url = fileUrl(cfg, name);

    QMap<QByteArray, QByteArray> headers;
    headers["Content-Type"] = "application/zip";

    DavResponse res = sendRequest(cfg, "PUT", url, data, headers);
    if (!res.isSuccess()) {
        return statusFailure("Upload", url, res);
    }

    qDebug() << "[WebDavTransport] Uploaded" << data.size() << "bytes as" << name;
    return BackupResult();
}

BackupResult WebDavTransport::download(const WebDavConfig &cfg, const BackupFileItem &item,
                                       QByteArray *data)
{
    data->clear();

    DavResponse res = sendRequest(cfg, "GET", item.href);
    if (!res.isSuccess()) {
        return statusFailure("Download", item.href, res);
    }

    *data = res.body;
    qDebug() << "[WebDavTransport] Downloaded" << data->size() << "bytes from" << item.displayName;
    return BackupResult();
}

BackupResult WebDavTransport::remove(const WebDavConfig &cfg, const BackupFileItem &item)
{
    DavResponse res = sendRequest(cfg, "DELETE", item.href);
    if (!res.isSuccess()) {
        return statusFailure("Delete", item.href, res);
    }

    qDebug() << "[WebDavTransport] Deleted" << item.displayName;
    return BackupResult();
}

// ========== Parsing ==========

QList<BackupFileItem> WebDavTransport::parseMultiStatus(const QByteArray &xml, const QUrl &collection)
{
    QList<BackupFileItem> items;

    const QString collectionString = collection.toString();
    const QString collectionPath = stripTrailingSlashes(collection.path());

    QXmlStreamReader reader(xml);

    bool inResponse = false;
    QString href, displayName, contentLength, lastModified;
    bool haveName = false, haveLength = false, haveModified = false;

    while (!reader.atEnd()) {
        reader.readNext();

        if (reader.isStartElement()) {
            const QStringView name = reader.name();
            if (name == QLatin1String("response")) {
                inResponse = true;
                href.clear();
                displayName.clear();
                contentLength.clear();
                lastModified.clear();
                haveName = haveLength = haveModified = false;
            } else if (!inResponse) {
                continue;
            } else if (name == QLatin1String("href") && href.isEmpty()) {
                href = reader.readElementText().trimmed();
            } else if (name == QLatin1String("displayname") && !haveName) {
                displayName = reader.readElementText(QXmlStreamReader::IncludeChildElements);
                haveName = true;
            } else if (name == QLatin1String("getcontentlength") && !haveLength) {
                contentLength = reader.readElementText().trimmed();
                haveLength = true;
            } else if (name == QLatin1String("getlastmodified") && !haveModified) {
                lastModified = reader.readElementText().trimmed();
                haveModified = true;
            }
        } else if (reader.isEndElement() && reader.name() == QLatin1String("response")) {
            inResponse = false;
            if (href.isEmpty()) continue;

            const QUrl hrefUrl(href);
            const QUrl abs = hrefUrl.isRelative() ? collection.resolved(hrefUrl) : hrefUrl;

            // The collection itself
            if (abs.toString() == collectionString
                || stripTrailingSlashes(abs.path()) == collectionPath) {
                continue;
            }
            // Sub-collections
            if (abs.path().endsWith('/')) continue;

            BackupFileItem item;
            item.href = abs;
            item.size = contentLength.toLongLong();
            item.displayName = displayName.trimmed().isEmpty() ? abs.fileName()
                                                                : displayName.trimmed();
            if (!lastModified.isEmpty()) {
                item.lastModified = parseHttpDate(lastModified);
            }
            if (!item.lastModified.isValid()) {
                item.lastModified = timestampFromFileName(item.displayName);
            }
            items.append(item);
        }
    }

    if (reader.hasError()) {
        qWarning() << "[WebDavTransport] Multistatus parse error:" << reader.errorString();
    }

    auto sortKey = [](const BackupFileItem &i) {
        return i.lastModified.isValid() ? i.lastModified.toMSecsSinceEpoch()
                                        : std::numeric_limits<qint64>::min();
    };
    std::stable_sort(items.begin(), items.end(),
        [&](const BackupFileItem &a, const BackupFileItem &b) {
            return sortKey(a) > sortKey(b);
        });

    return items;
}

QDateTime WebDavTransport::timestampFromFileName(const QString &name)
{
    static const QRegularExpression re(
        QStringLiteral("kelivo_backup_(\\d{4}-\\d{2}-\\d{2})T(\\d{2})-(\\d{2})-(\\d{2})(?:\\.(\\d+))?\\.zip"));

    QRegularExpressionMatch match = re.match(name);
    if (!match.hasMatch()) {
        return QDateTime();
    }

    // Milliseconds only; longer fractions are truncated
    QString fraction = match.captured(5).left(3);
    while (fraction.size() < 3) fraction += '0';

    const QString iso = QString("%1T%2:%3:%4.%5")
        .arg(match.captured(1), match.captured(2), match.captured(3), match.captured(4), fraction);
    return QDateTime::fromString(iso, Qt::ISODateWithMs);
}

QDateTime WebDavTransport::parseHttpDate(const QString &value)
{
    QString v = value.trimmed();
    if (v.endsWith(QLatin1String(" GMT")) || v.endsWith(QLatin1String(" UTC"))) {
        v.chop(4);
        v += QLatin1String(" +0000");
    }

    QDateTime dt = QDateTime::fromString(v, Qt::RFC2822Date);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value.trimmed(), Qt::ISODateWithMs);
    }
    return dt;
}

} // namespace Backup
