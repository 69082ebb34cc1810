#include "offlinestore.h"

#include <QDebug>
#include <algorithm>

namespace OfflineSync {

OfflineStore::OfflineStore(const QString &storagePath, QObject *parent)
    : QObject(parent)
    , m_storagePath(storagePath)
{
    m_requests = createDatabase(Schema::offlineRequests());
    m_data = createDatabase(Schema::offlineData());
    m_settings = createDatabase(Schema::localSettings());
    m_cache = createDatabase(Schema::offlineCache());
}

OfflineStore::~OfflineStore()
{
    close();
}

LocalDatabase *OfflineStore::createDatabase(const DatabaseDef &definition)
{
    LocalDatabase *db = new LocalDatabase(definition, m_storagePath, this);
    connect(db, &LocalDatabase::errorOccurred, this, &OfflineStore::onDatabaseError);
    return db;
}

bool OfflineStore::open()
{
    bool ok = m_requests->open();
    ok = m_data->open() && ok;
    ok = m_settings->open() && ok;
    ok = m_cache->open() && ok;
    return ok;
}

void OfflineStore::close()
{
    m_requests->close();
    m_data->close();
    m_settings->close();
    m_cache->close();
}

void OfflineStore::onDatabaseError(const QString &error)
{
    m_lastError = error;
    emit errorOccurred(error);
}

// ========== Offline Requests ==========

qint64 OfflineStore::saveOfflineRequest(const OfflineRequest &request)
{
    OfflineRequest stored = request;
    stored.id = 0;
    if (stored.timestamp == 0) {
        stored.timestamp = nowMs();
    }

    QVariant id = m_requests->add(Schema::Requests, stored.toJson());
    if (!id.isValid()) {
        return 0;
    }

    qDebug() << "[OfflineStore] Saved offline request" << id.toLongLong()
             << stored.method << stored.url;
    return id.toLongLong();
}

QList<OfflineRequest> OfflineStore::pendingRequests()
{
    QList<OfflineRequest> requests;
    for (const QJsonObject &json : m_requests->getAll(Schema::Requests)) {
        requests.append(OfflineRequest::fromJson(json));
    }
    return requests;
}

bool OfflineStore::updateOfflineRequest(const OfflineRequest &request)
{
    if (request.id <= 0) {
        onDatabaseError("Cannot update an offline request without an id");
        return false;
    }
    return m_requests->put(Schema::Requests, request.toJson()).isValid();
}

bool OfflineStore::deleteSyncedRequest(qint64 requestId)
{
    return m_requests->remove(Schema::Requests, requestId);
}

// ========== Cached Entities ==========

bool OfflineStore::cacheEntity(EntityType type, const QJsonObject &entity)
{
    EntityData data(type, entity);
    const QString id = data.id();
    if (id.isEmpty()) {
        onDatabaseError(QString("Cannot cache %1 without an id").arg(entityTypeToString(type)));
        return false;
    }

    data.setId(id);
    data.setValue("entityType", entityTypeToString(type));
    data.setValue("cachedAt", nowMs());

    return m_data->put(entityTypeInfo(type).collection, data.toJson()).isValid();
}

QJsonObject OfflineStore::cachedEntity(EntityType type, const QString &id)
{
    return m_data->get(entityTypeInfo(type).collection, id);
}

QList<QJsonObject> OfflineStore::allCachedEntities(EntityType type)
{
    return m_data->getAll(entityTypeInfo(type).collection);
}

bool OfflineStore::removeCachedEntity(EntityType type, const QString &id)
{
    return m_data->remove(entityTypeInfo(type).collection, id);
}

// ========== Pending Changes ==========

qint64 OfflineStore::savePendingChange(const PendingChange &change)
{
    PendingChange stored = change;
    stored.id = 0;

    QVariant id = m_data->add(Schema::PendingChanges, stored.toJson());
    if (!id.isValid()) {
        return 0;
    }

    qDebug() << "[OfflineStore] Queued change" << id.toLongLong() << stored.description();
    return id.toLongLong();
}

QList<PendingChange> OfflineStore::toChanges(const QList<QJsonObject> &objects) const
{
    QList<PendingChange> changes;
    changes.reserve(objects.size());
    for (const QJsonObject &json : objects) {
        changes.append(PendingChange::fromJson(json));
    }
    return changes;
}

QList<PendingChange> OfflineStore::pendingChanges()
{
    return toChanges(m_data->getByIndex(Schema::PendingChanges, "status",
                                        changeStatusToString(ChangeStatus::Pending)));
}

QList<PendingChange> OfflineStore::allChanges()
{
    return toChanges(m_data->getAll(Schema::PendingChanges));
}

QList<PendingChange> OfflineStore::changesForEntity(const QString &entityId)
{
    return toChanges(m_data->getByIndex(Schema::PendingChanges, "entityId", entityId));
}

PendingChange OfflineStore::change(qint64 changeId, bool *found)
{
    QJsonObject json = m_data->get(Schema::PendingChanges, changeId);
    if (found) *found = !json.isEmpty();
    return json.isEmpty() ? PendingChange() : PendingChange::fromJson(json);
}

bool OfflineStore::updateChange(const PendingChange &change)
{
    if (change.id <= 0) {
        onDatabaseError("Cannot update a change without an id");
        return false;
    }

    // Terminal states are final
    bool found = false;
    const PendingChange stored = this->change(change.id, &found);
    if (found && stored.isTerminal() && stored.status != change.status) {
        onDatabaseError(QString("Change %1 is already %2")
                        .arg(change.id).arg(changeStatusToString(stored.status)));
        return false;
    }

    return m_data->put(Schema::PendingChanges, change.toJson()).isValid();
}

bool OfflineStore::markChangeAsSynced(qint64 changeId)
{
    bool found = false;
    PendingChange stored = change(changeId, &found);
    if (!found) {
        onDatabaseError(QString("Change %1 not found").arg(changeId));
        return false;
    }

    stored.status = ChangeStatus::Synced;
    stored.syncedAt = nowMs();
    return updateChange(stored);
}

int OfflineStore::pendingChangeCount()
{
    return m_data->count(Schema::PendingChanges,
                         IndexQuery::equals("status", changeStatusToString(ChangeStatus::Pending)));
}

// ========== Sync Log ==========

qint64 OfflineStore::appendSyncLog(const SyncLogEntry &entry)
{
    SyncLogEntry stored = entry;
    stored.id = 0;
    if (stored.timestamp == 0) {
        stored.timestamp = nowMs();
    }

    QVariant id = m_data->add(Schema::SyncLog, stored.toJson());
    return id.isValid() ? id.toLongLong() : 0;
}

QList<SyncLogEntry> OfflineStore::syncLog(int limit)
{
    QList<QJsonObject> objects = m_data->getAll(Schema::SyncLog, IndexQuery("timestamp", KeyRange()));
    std::reverse(objects.begin(), objects.end());

    QList<SyncLogEntry> entries;
    for (const QJsonObject &json : objects) {
        if (limit >= 0 && entries.size() >= limit) break;
        entries.append(SyncLogEntry::fromJson(json));
    }
    return entries;
}

// ========== Preferences & Settings ==========

bool OfflineStore::saveKeyValue(const QString &collection, const QString &key, const QJsonValue &value)
{
    QJsonObject item;
    item["key"] = key;
    item["value"] = value;
    item["updatedAt"] = nowMs();
    return m_settings->put(collection, item).isValid();
}

QJsonValue OfflineStore::keyValue(const QString &collection, const QString &key,
                                  const QJsonValue &defaultValue)
{
    QJsonObject item = m_settings->get(collection, key);
    if (item.isEmpty() || !item.contains("value")) {
        return defaultValue;
    }
    return item.value("value");
}

bool OfflineStore::saveUserPreference(const QString &key, const QJsonValue &value)
{
    return saveKeyValue(Schema::UserPreferences, key, value);
}

QJsonValue OfflineStore::userPreference(const QString &key, const QJsonValue &defaultValue)
{
    return keyValue(Schema::UserPreferences, key, defaultValue);
}

bool OfflineStore::saveSetting(const QString &key, const QJsonValue &value)
{
    return saveKeyValue(Schema::Settings, key, value);
}

QJsonValue OfflineStore::setting(const QString &key, const QJsonValue &defaultValue)
{
    return keyValue(Schema::Settings, key, defaultValue);
}

bool OfflineStore::removeSetting(const QString &key)
{
    return m_settings->remove(Schema::Settings, key);
}

// ========== Maintenance ==========

bool OfflineStore::clearAllOfflineData()
{
    bool ok = true;
    for (LocalDatabase *db : {m_requests, m_data, m_cache}) {
        for (const QString &collection : db->collectionNames()) {
            if (!db->clear(collection)) {
                ok = false;
            }
        }
    }

    if (ok) {
        qDebug() << "[OfflineStore] Cleared all offline data";
    }
    return ok;
}

} // namespace OfflineSync
