#ifndef RESPONSECACHE_H
#define RESPONSECACHE_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QMap>
#include <QDateTime>
#include <QJsonObject>
#include "sync/synctransport.h"

namespace OfflineSync {

class LocalDatabase;

/**
 * @brief A response stored in the offline cache
 */
struct CachedResponse {
    QString cacheName;
    QString url;
    int status = 0;
    QMap<QString, QString> headers;
    QByteArray body;
    qint64 cachedAt = 0;        ///< ms since epoch

    bool isNull() const { return status == 0; }

    qint64 ageMs(qint64 now) const { return now - cachedAt; }

    /**
     * @brief The response as served from cache, with an X-Cached-At header
     */
    TransportResponse toResponse() const;

    QJsonObject toJson() const;
    static CachedResponse fromJson(const QJsonObject &json);
};

/**
 * @brief Named response caches on top of the offline-cache database
 *
 * Entries are keyed by cache name and URL. Only 200 responses are stored.
 */
class ResponseCache
{
public:
    static const QString StaticCache;
    static const QString DynamicCache;
    static const QString ApiCache;

    /**
     * @param database The offline-cache database (not owned)
     */
    explicit ResponseCache(LocalDatabase *database);

    /**
     * @brief Store @p response under @p url if its status is 200
     * @return false if the response was not cacheable or could not be written
     */
    bool put(const QString &cacheName, const QString &url, const TransportResponse &response);

    CachedResponse match(const QString &cacheName, const QString &url);

    /**
     * @brief Look @p url up in every known cache, API cache first
     */
    CachedResponse matchAny(const QString &url);

    bool remove(const QString &cacheName, const QString &url);
    bool clear(const QString &cacheName);
    int count(const QString &cacheName);

    static QStringList cacheNames();

private:
    static QString entryKey(const QString &cacheName, const QString &url);

    LocalDatabase *m_database;
};

} // namespace OfflineSync

#endif // RESPONSECACHE_H
