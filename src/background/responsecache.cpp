#include "responsecache.h"
#include "store/localdatabase.h"
#include "sync/synctypes.h"

#include <QDebug>

namespace OfflineSync {

const QString ResponseCache::StaticCache = QStringLiteral("offlinesync-static-v1");
const QString ResponseCache::DynamicCache = QStringLiteral("offlinesync-dynamic-v1");
const QString ResponseCache::ApiCache = QStringLiteral("offlinesync-api-v1");

// ========== CachedResponse ==========

TransportResponse CachedResponse::toResponse() const
{
    TransportResponse response;
    response.status = status;
    response.headers = headers;
    response.body = body;
    response.headers.insert("X-Cached-At",
        QDateTime::fromMSecsSinceEpoch(cachedAt).toUTC().toString(Qt::ISODateWithMs));
    return response;
}

QJsonObject CachedResponse::toJson() const
{
    QJsonObject headerObject;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        headerObject.insert(it.key(), it.value());
    }

    QJsonObject json;
    json["cacheName"] = cacheName;
    json["url"] = url;
    json["status"] = status;
    json["headers"] = headerObject;
    json["body"] = QString::fromLatin1(body.toBase64());
    json["cachedAt"] = cachedAt;
    return json;
}

CachedResponse CachedResponse::fromJson(const QJsonObject &json)
{
    CachedResponse entry;
    entry.cacheName = json.value("cacheName").toString();
    entry.url = json.value("url").toString();
    entry.status = json.value("status").toInt();
    entry.body = QByteArray::fromBase64(json.value("body").toString().toLatin1());
    entry.cachedAt = json.value("cachedAt").toInteger();

    const QJsonObject headerObject = json.value("headers").toObject();
    for (auto it = headerObject.constBegin(); it != headerObject.constEnd(); ++it) {
        entry.headers.insert(it.key(), it.value().toString());
    }
    return entry;
}

// ========== ResponseCache ==========

ResponseCache::ResponseCache(LocalDatabase *database)
    : m_database(database)
{
}

QStringList ResponseCache::cacheNames()
{
    return {ApiCache, StaticCache, DynamicCache};
}

QString ResponseCache::entryKey(const QString &cacheName, const QString &url)
{
    return cacheName + QLatin1Char(' ') + url;
}

bool ResponseCache::put(const QString &cacheName, const QString &url, const TransportResponse &response)
{
    if (response.networkError || response.status != 200) {
        return false;
    }

    CachedResponse entry;
    entry.cacheName = cacheName;
    entry.url = url;
    entry.status = response.status;
    entry.headers = response.headers;
    entry.headers.remove("X-Cached-At");
    entry.body = response.body;
    entry.cachedAt = nowMs();

    QJsonObject item = entry.toJson();
    item["key"] = entryKey(cacheName, url);

    if (!m_database->put(Schema::Responses, item).isValid()) {
        qWarning() << "[ResponseCache] Failed to cache" << url << "in" << cacheName;
        return false;
    }
    return true;
}

CachedResponse ResponseCache::match(const QString &cacheName, const QString &url)
{
    QJsonObject item = m_database->get(Schema::Responses, entryKey(cacheName, url));
    if (item.isEmpty()) {
        return CachedResponse();
    }
    return CachedResponse::fromJson(item);
}

CachedResponse ResponseCache::matchAny(const QString &url)
{
    for (const QString &cacheName : cacheNames()) {
        CachedResponse entry = match(cacheName, url);
        if (!entry.isNull()) {
            return entry;
        }
    }
    return CachedResponse();
}

bool ResponseCache::remove(const QString &cacheName, const QString &url)
{
    return m_database->remove(Schema::Responses, entryKey(cacheName, url));
}

bool ResponseCache::clear(const QString &cacheName)
{
    bool ok = true;
    for (const QJsonObject &item : m_database->getByIndex(Schema::Responses, "cacheName", cacheName)) {
        if (!m_database->remove(Schema::Responses, item.value("key").toString())) {
            ok = false;
        }
    }
    return ok;
}

int ResponseCache::count(const QString &cacheName)
{
    return m_database->count(Schema::Responses, IndexQuery::equals("cacheName", cacheName));
}

} // namespace OfflineSync
