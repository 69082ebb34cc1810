#ifndef HTTPTRANSPORT_H
#define HTTPTRANSPORT_H

#include <QUrl>
#include "synctransport.h"

class QNetworkAccessManager;

namespace OfflineSync {

/**
 * @brief SyncTransport over QNetworkAccessManager
 *
 * Relative request URLs are resolved against the configured base URL.
 * Each call runs a local event loop until the reply finishes or the
 * timeout fires.
 *
 * The network manager is created lazily on first use, so the transport
 * can be constructed on one thread and used on another.
 */
class HttpTransport : public SyncTransport
{
public:
    explicit HttpTransport(const QUrl &baseUrl, int timeoutMs = 30000);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport &) = delete;
    HttpTransport &operator=(const HttpTransport &) = delete;

    TransportResponse send(const TransportRequest &request) override;

    QUrl baseUrl() const { return m_baseUrl; }
    void setBaseUrl(const QUrl &url) { m_baseUrl = url; }

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int ms) { m_timeoutMs = ms; }

    QUrl resolve(const QString &url) const;

private:
    QUrl m_baseUrl;
    int m_timeoutMs;
    QNetworkAccessManager *m_networkManager = nullptr;
};

} // namespace OfflineSync

#endif // HTTPTRANSPORT_H
