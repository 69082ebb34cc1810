#include "httptransport.h"
#include "offlinesync_version.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QEventLoop>
#include <QTimer>
#include <QDebug>

namespace OfflineSync {

HttpTransport::HttpTransport(const QUrl &baseUrl, int timeoutMs)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(timeoutMs)
{
}

HttpTransport::~HttpTransport()
{
    delete m_networkManager;
}

QUrl HttpTransport::resolve(const QString &url) const
{
    QUrl target(url);
    if (target.isRelative() && m_baseUrl.isValid()) {
        return m_baseUrl.resolved(target);
    }
    return target;
}

TransportResponse HttpTransport::send(const TransportRequest &request)
{
    const QUrl url = resolve(request.url);
    if (!url.isValid() || url.isRelative()) {
        return TransportResponse::failure(QString("Invalid URL: %1").arg(request.url));
    }

    // Created on the calling thread on first use
    if (!m_networkManager) {
        m_networkManager = new QNetworkAccessManager();
    }

    QNetworkRequest networkRequest(url);
    networkRequest.setHeader(QNetworkRequest::UserAgentHeader,
                             QString("OfflineSync/%1").arg(OFFLINESYNC_VERSION_STRING));
    networkRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                                QNetworkRequest::NoLessSafeRedirectPolicy);
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it) {
        networkRequest.setRawHeader(it.key().toUtf8(), it.value().toUtf8());
    }

    qDebug() << "[HttpTransport]" << request.method << url.toString();

    QNetworkReply *reply = nullptr;
    if (request.body.isEmpty() && (request.method == "GET" || request.method == "DELETE")) {
        reply = m_networkManager->sendCustomRequest(networkRequest, request.method.toUtf8());
    } else {
        reply = m_networkManager->sendCustomRequest(networkRequest, request.method.toUtf8(),
                                                    request.body);
    }

    // Wait for completion with timeout
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(m_timeoutMs);
    loop.exec();

    if (timeout.isActive()) {
        timeout.stop();
    } else {
        reply->abort();
        reply->deleteLater();
        qDebug() << "[HttpTransport] Timeout after" << m_timeoutMs << "ms:" << url.toString();
        return TransportResponse::failure(QString("Timeout after %1 ms").arg(m_timeoutMs));
    }

    TransportResponse response;
    QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    // HTTP error statuses still carry a response; only missing status means no server reply
    if (!statusAttribute.isValid()) {
        response = TransportResponse::failure(reply->errorString());
        reply->deleteLater();
        qDebug() << "[HttpTransport] Network error:" << response.errorString;
        return response;
    }

    response.status = statusAttribute.toInt();
    response.body = reply->readAll();
    for (const QNetworkReply::RawHeaderPair &header : reply->rawHeaderPairs()) {
        response.headers.insert(QString::fromUtf8(header.first), QString::fromUtf8(header.second));
    }
    if (reply->error() != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
    }
    reply->deleteLater();

    qDebug() << "[HttpTransport] Response: HTTP" << response.status
             << "Size:" << response.body.size() << "bytes";
    return response;
}

} // namespace OfflineSync
