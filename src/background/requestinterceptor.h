#ifndef REQUESTINTERCEPTOR_H
#define REQUESTINTERCEPTOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include "responsecache.h"
#include "sync/synctransport.h"

namespace OfflineSync {

class OfflineStore;
class ConnectivityMonitor;

/**
 * @brief Outcome of one replay of the offline request log
 */
struct ReplayResult {
    int replayed = 0;       ///< Sent successfully and removed from the log
    int failed = 0;         ///< Rejected by the server, kept with retryCount bumped
    int deferred = 0;       ///< Not sent (network failure), kept untouched
    int remaining = 0;      ///< Entries left in the log afterwards
};

/**
 * @brief Routes outgoing requests through the offline policies
 *
 * Mutations on sync routes made while offline are written to the request
 * log and answered with 202. Reads follow a per-route caching strategy:
 *
 *   - API routes: network first, cached copy on network failure (flagged
 *     stale past the route's max age), 503 JSON if nothing is cached
 *   - /static/ and app shell assets: cache first, 503 text on failure
 *   - Everything else: stale-while-revalidate
 *
 * Store, transport and monitor are not owned and must live on the same
 * thread as the interceptor.
 */
class RequestInterceptor : public QObject
{
    Q_OBJECT

public:
    enum class Strategy {
        Passthrough,
        OfflineCapture,
        NetworkFirst,
        CacheFirst,
        StaleWhileRevalidate
    };

    RequestInterceptor(OfflineStore *store,
                       SyncTransport *transport,
                       ConnectivityMonitor *monitor,
                       QObject *parent = nullptr);
    ~RequestInterceptor() override;

    /**
     * @brief Origin treated as local for cache-first assets
     *
     * Relative URLs are always local.
     */
    void setOrigin(const QUrl &origin) { m_origin = origin; }

    ResponseCache &cache() { return m_cache; }

    Strategy strategyFor(const TransportRequest &request) const;

    /**
     * @brief Answer a request according to its strategy
     */
    TransportResponse handle(const TransportRequest &request);

    /**
     * @brief Send every logged request in order
     */
    ReplayResult replayOfflineRequests();

    /**
     * @brief Cache age past which an API route's cached copy is stale
     * @return Max age in ms, or 0 for paths that are not API routes
     */
    static qint64 maxAgeFor(const QString &path);

    static bool isSyncRoute(const QString &path);
    static QStringList appShellAssets();

signals:
    void requestQueued(qint64 requestId, const QString &url);
    void requestReplayed(qint64 requestId, const QString &url);
    void cacheRefreshed(const QString &url);

private:
    TransportResponse captureOfflineMutation(const TransportRequest &request);
    TransportResponse networkFirstWithCache(const TransportRequest &request);
    TransportResponse cacheFirst(const TransportRequest &request);
    TransportResponse staleWhileRevalidate(const TransportRequest &request);
    void revalidate(const TransportRequest &request);

    TransportResponse fetch(const TransportRequest &request);
    bool isOnline() const;
    bool isLocalAsset(const QUrl &url) const;

    static QString pathOf(const QString &url);

    OfflineStore *m_store;
    SyncTransport *m_transport;
    ConnectivityMonitor *m_monitor;
    ResponseCache m_cache;
    QUrl m_origin;
};

} // namespace OfflineSync

#endif // REQUESTINTERCEPTOR_H
