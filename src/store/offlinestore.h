#ifndef OFFLINESTORE_H
#define OFFLINESTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QJsonObject>
#include <QJsonValue>
#include "localdatabase.h"
#include "sync/synctypes.h"
#include "sync/entitydata.h"

namespace OfflineSync {

/**
 * @brief Offline storage facade over the logical databases
 *
 * Owns one LocalDatabase per logical database (request log, entity data,
 * local settings, response cache), all under one storage directory, and
 * exposes the typed operations the sync core needs.
 *
 * An OfflineStore (and its connections) belongs to the thread that
 * created it. Other threads open their own OfflineStore on the same
 * directory.
 */
class OfflineStore : public QObject
{
    Q_OBJECT

public:
    explicit OfflineStore(const QString &storagePath, QObject *parent = nullptr);
    ~OfflineStore() override;

    QString storagePath() const { return m_storagePath; }

    /**
     * @brief Open every database (each also opens lazily on first use)
     */
    bool open();
    void close();

    LocalDatabase *requestsDatabase() const { return m_requests; }
    LocalDatabase *dataDatabase() const { return m_data; }
    LocalDatabase *settingsDatabase() const { return m_settings; }
    LocalDatabase *cacheDatabase() const { return m_cache; }

    // ========== Offline Requests ==========

    /**
     * @brief Append a captured request to the request log
     * @return Assigned id, or 0 on failure
     */
    qint64 saveOfflineRequest(const OfflineRequest &request);

    /**
     * @brief All logged requests, oldest (lowest id) first
     */
    QList<OfflineRequest> pendingRequests();

    bool updateOfflineRequest(const OfflineRequest &request);
    bool deleteSyncedRequest(qint64 requestId);

    // ========== Cached Entities ==========

    /**
     * @brief Store the last known value of an entity
     *
     * Stamps entityType and cachedAt. The entity must carry an id.
     */
    bool cacheEntity(EntityType type, const QJsonObject &entity);
    QJsonObject cachedEntity(EntityType type, const QString &id);
    QList<QJsonObject> allCachedEntities(EntityType type);
    bool removeCachedEntity(EntityType type, const QString &id);

    // ========== Pending Changes ==========

    /**
     * @brief Append a change to the queue
     * @return Assigned id, or 0 on failure
     */
    qint64 savePendingChange(const PendingChange &change);

    /**
     * @brief Changes still waiting to be synced, in id order
     */
    QList<PendingChange> pendingChanges();

    /**
     * @brief Every change regardless of status, in id order
     */
    QList<PendingChange> allChanges();

    QList<PendingChange> changesForEntity(const QString &entityId);
    PendingChange change(qint64 changeId, bool *found = nullptr);
    bool updateChange(const PendingChange &change);
    bool markChangeAsSynced(qint64 changeId);

    /**
     * @brief Number of pending changes, or -1 on failure
     */
    int pendingChangeCount();

    // ========== Sync Log ==========

    qint64 appendSyncLog(const SyncLogEntry &entry);

    /**
     * @brief Most recent entries first
     */
    QList<SyncLogEntry> syncLog(int limit = 10);

    // ========== Preferences & Settings ==========

    bool saveUserPreference(const QString &key, const QJsonValue &value);
    QJsonValue userPreference(const QString &key, const QJsonValue &defaultValue = QJsonValue());

    bool saveSetting(const QString &key, const QJsonValue &value);
    QJsonValue setting(const QString &key, const QJsonValue &defaultValue = QJsonValue());
    bool removeSetting(const QString &key);

    // ========== Maintenance ==========

    /**
     * @brief Delete the request log, entity data and response cache
     *
     * Local settings and preferences are kept.
     */
    bool clearAllOfflineData();

    QString lastError() const { return m_lastError; }

signals:
    void errorOccurred(const QString &error);

private:
    LocalDatabase *createDatabase(const DatabaseDef &definition);
    QList<PendingChange> toChanges(const QList<QJsonObject> &objects) const;
    bool saveKeyValue(const QString &collection, const QString &key, const QJsonValue &value);
    QJsonValue keyValue(const QString &collection, const QString &key, const QJsonValue &defaultValue);
    void onDatabaseError(const QString &error);

    QString m_storagePath;
    LocalDatabase *m_requests = nullptr;
    LocalDatabase *m_data = nullptr;
    LocalDatabase *m_settings = nullptr;
    LocalDatabase *m_cache = nullptr;
    QString m_lastError;
};

} // namespace OfflineSync

#endif // OFFLINESTORE_H
