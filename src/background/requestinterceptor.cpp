#include "requestinterceptor.h"
#include "store/offlinestore.h"
#include "sync/connectivitymonitor.h"
#include "sync/synctypes.h"

#include <QJsonObject>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimer>
#include <QDebug>

namespace OfflineSync {

namespace {

struct ApiRoute {
    const char *prefix;
    qint64 maxAgeMs;
};

const ApiRoute kApiRoutes[] = {
    {"/api/campaigns", 60 * 60 * 1000},
    {"/api/websocket/filters", 30 * 60 * 1000},
    {"/api/websocket/filter-stats", 15 * 60 * 1000}
};

const char *const kSyncRoutes[] = {
    "/api/campaigns",
    "/api/websocket/filters"
};

TransportResponse textResponse(int status, const QByteArray &text)
{
    TransportResponse response;
    response.status = status;
    response.headers.insert("Content-Type", "text/plain");
    response.body = text;
    return response;
}

} // namespace

RequestInterceptor::RequestInterceptor(OfflineStore *store,
                                       SyncTransport *transport,
                                       ConnectivityMonitor *monitor,
                                       QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_transport(transport)
    , m_monitor(monitor)
    , m_cache(store->cacheDatabase())
{
}

RequestInterceptor::~RequestInterceptor() = default;

// ========== Routing ==========

qint64 RequestInterceptor::maxAgeFor(const QString &path)
{
    // Longest prefix wins: filter-stats must not match the filters route
    qint64 maxAge = 0;
    int matched = -1;
    for (const ApiRoute &route : kApiRoutes) {
        const QString prefix = QLatin1String(route.prefix);
        if (path.startsWith(prefix) && prefix.size() > matched) {
            matched = prefix.size();
            maxAge = route.maxAgeMs;
        }
    }
    return maxAge;
}

bool RequestInterceptor::isSyncRoute(const QString &path)
{
    for (const char *route : kSyncRoutes) {
        if (path.startsWith(QLatin1String(route))) {
            return true;
        }
    }
    return false;
}

QStringList RequestInterceptor::appShellAssets()
{
    return {
        "/",
        "/index.html",
        "/manifest.json",
        "/offline.html"
    };
}

QString RequestInterceptor::pathOf(const QString &url)
{
    return QUrl(url).path();
}

bool RequestInterceptor::isLocalAsset(const QUrl &url) const
{
    if (!url.isRelative() && (m_origin.isEmpty() || url.host() != m_origin.host())) {
        return false;
    }
    const QString path = url.path();
    return path.startsWith(QLatin1String("/static/")) || appShellAssets().contains(path);
}

RequestInterceptor::Strategy RequestInterceptor::strategyFor(const TransportRequest &request) const
{
    const QString path = pathOf(request.url);

    if (request.method != QLatin1String("GET")) {
        if (request.isMutation() && !isOnline() && isSyncRoute(path)) {
            return Strategy::OfflineCapture;
        }
        return Strategy::Passthrough;
    }

    if (maxAgeFor(path) > 0) {
        return Strategy::NetworkFirst;
    }
    if (isLocalAsset(QUrl(request.url))) {
        return Strategy::CacheFirst;
    }
    return Strategy::StaleWhileRevalidate;
}

TransportResponse RequestInterceptor::handle(const TransportRequest &request)
{
    switch (strategyFor(request)) {
    case Strategy::OfflineCapture:
        return captureOfflineMutation(request);
    case Strategy::NetworkFirst:
        return networkFirstWithCache(request);
    case Strategy::CacheFirst:
        return cacheFirst(request);
    case Strategy::StaleWhileRevalidate:
        return staleWhileRevalidate(request);
    case Strategy::Passthrough:
        break;
    }
    return fetch(request);
}

// ========== Strategies ==========

TransportResponse RequestInterceptor::captureOfflineMutation(const TransportRequest &request)
{
    OfflineRequest captured;
    captured.url = request.url;
    captured.method = request.method;
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it) {
        captured.headers.insert(it.key(), it.value());
    }
    captured.body = request.body;
    captured.timestamp = nowMs();

    qint64 id = m_store->saveOfflineRequest(captured);
    if (id == 0) {
        qWarning() << "[RequestInterceptor] Failed to store offline request:" << m_store->lastError();
        return TransportResponse::jsonResponse(503, QJsonObject{
            {"error", "offline"},
            {"message", "You are offline and the change could not be saved"}
        });
    }

    qDebug() << "[RequestInterceptor] Queued offline" << request.method << request.url << "as" << id;
    emit requestQueued(id, request.url);

    return TransportResponse::jsonResponse(202, QJsonObject{
        {"success", true},
        {"offline", true},
        {"message", "Your changes have been saved offline and will sync when you reconnect"}
    });
}

TransportResponse RequestInterceptor::networkFirstWithCache(const TransportRequest &request)
{
    TransportResponse response = fetch(request);
    if (!response.networkError) {
        m_cache.put(ResponseCache::ApiCache, request.url, response);
        return response;
    }

    qDebug() << "[RequestInterceptor] Network request failed, falling back to cache:" << request.url;

    CachedResponse cached = m_cache.matchAny(request.url);
    if (cached.isNull()) {
        return TransportResponse::jsonResponse(503, QJsonObject{
            {"error", "offline"},
            {"message", "You are offline and this content is not available in cache"}
        });
    }

    const qint64 maxAge = maxAgeFor(pathOf(request.url));
    if (maxAge > 0 && cached.ageMs(nowMs()) > maxAge) {
        const QString cachedAt = QDateTime::fromMSecsSinceEpoch(cached.cachedAt)
                                     .toUTC().toString(Qt::ISODateWithMs);
        QJsonDocument data = QJsonDocument::fromJson(cached.body);
        QJsonObject envelope{
            {"error", "offline-stale-data"},
            {"cachedAt", cachedAt}
        };
        if (data.isArray()) {
            envelope.insert("data", data.array());
        } else {
            envelope.insert("data", data.object());
        }
        return TransportResponse::jsonResponse(200, envelope);
    }

    return cached.toResponse();
}

TransportResponse RequestInterceptor::cacheFirst(const TransportRequest &request)
{
    CachedResponse cached = m_cache.matchAny(request.url);
    if (!cached.isNull()) {
        return cached.toResponse();
    }

    TransportResponse response = fetch(request);
    if (response.networkError) {
        qWarning() << "[RequestInterceptor] Cache first fetch failed:" << request.url << response.errorString;
        return textResponse(503, "Network error happened");
    }

    m_cache.put(ResponseCache::StaticCache, request.url, response);
    return response;
}

TransportResponse RequestInterceptor::staleWhileRevalidate(const TransportRequest &request)
{
    CachedResponse cached = m_cache.match(ResponseCache::DynamicCache, request.url);
    if (cached.isNull()) {
        TransportResponse response = fetch(request);
        m_cache.put(ResponseCache::DynamicCache, request.url, response);
        return response;
    }

    // Serve the cached copy now, refresh once control returns to the event loop
    QTimer::singleShot(0, this, [this, request]() { revalidate(request); });
    return cached.toResponse();
}

void RequestInterceptor::revalidate(const TransportRequest &request)
{
    TransportResponse response = fetch(request);
    if (response.networkError) {
        qDebug() << "[RequestInterceptor] Revalidation failed for" << request.url << response.errorString;
        return;
    }
    if (m_cache.put(ResponseCache::DynamicCache, request.url, response)) {
        emit cacheRefreshed(request.url);
    }
}

// ========== Replay ==========

ReplayResult RequestInterceptor::replayOfflineRequests()
{
    ReplayResult result;

    const QList<OfflineRequest> requests = m_store->pendingRequests();

    qDebug() << "[RequestInterceptor] Found" << requests.size() << "offline requests to sync";

    for (OfflineRequest stored : requests) {
        TransportRequest request;
        request.url = stored.url;
        request.method = stored.method;
        request.body = stored.body;
        for (auto it = stored.headers.constBegin(); it != stored.headers.constEnd(); ++it) {
            request.headers.insert(it.key(), it.value().toString());
        }

        TransportResponse response = fetch(request);

        if (response.ok()) {
            qDebug() << "[RequestInterceptor] Successfully synced request to" << stored.url;
            if (m_store->deleteSyncedRequest(stored.id)) {
                result.replayed++;
                emit requestReplayed(stored.id, stored.url);
            } else {
                qWarning() << "[RequestInterceptor] Sent request" << stored.id << "but could not remove it";
                result.failed++;
                result.remaining++;
            }
        } else if (response.networkError) {
            qWarning() << "[RequestInterceptor] Error during sync:" << response.errorString;
            result.deferred++;
            result.remaining++;
        } else {
            qWarning() << "[RequestInterceptor] Failed to sync request:" << response.status;
            stored.retryCount++;
            stored.lastRetry = nowMs();
            if (!m_store->updateOfflineRequest(stored)) {
                qWarning() << "[RequestInterceptor] Failed to record retry for request" << stored.id;
            }
            result.failed++;
            result.remaining++;
        }
    }

    return result;
}

// ========== Network ==========

bool RequestInterceptor::isOnline() const
{
    return !m_monitor || m_monitor->isOnline();
}

TransportResponse RequestInterceptor::fetch(const TransportRequest &request)
{
    if (!m_transport) {
        return TransportResponse::failure("No transport configured");
    }
    if (!isOnline()) {
        return TransportResponse::failure("Offline");
    }
    return m_transport->send(request);
}

} // namespace OfflineSync
