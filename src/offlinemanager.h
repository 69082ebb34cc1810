#ifndef OFFLINEMANAGER_H
#define OFFLINEMANAGER_H

#include <QObject>
#include <QString>
#include <QList>
#include <QJsonObject>
#include <QJsonValue>

#include "sync/synctypes.h"
#include "sync/entitydata.h"
#include "sync/conflictresolver.h"
#include "sync/synctransport.h"

class Profile;

namespace OfflineSync {

class OfflineStore;
class ConnectivityMonitor;
class SyncManager;
class BackgroundScheduler;
class BackgroundSyncService;
class RequestInterceptor;

/**
 * @brief Entry point for applications using the offline sync core
 *
 * Wires the store, connectivity monitor, sync manager, background
 * scheduler and request interceptor together and exposes the operations
 * application code needs: queueing changes, entity helpers that keep the
 * local cache and the queue consistent, preferences and manual sync.
 *
 * Usage:
 *   1. Construct with the storage path and a foreground transport
 *   2. Optionally configure() from a Profile
 *   3. Call initialize()
 *   4. Optionally enableBackgroundSync() with a second transport
 *   5. Queue changes with addOfflineChange() or the entity helpers
 */
class OfflineManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @param transport Foreground transport (not owned)
     */
    OfflineManager(const QString &storagePath, SyncTransport *transport,
                   QObject *parent = nullptr);
    ~OfflineManager() override;

    /**
     * @brief Apply a profile's sync and conflict settings
     */
    void configure(const Profile &profile);

    /**
     * @brief Open the databases and start following connectivity
     */
    bool initialize();
    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Replay the offline request log on a background thread when woken
     * @param workerTransport Transport for the worker thread (ownership is taken)
     */
    bool enableBackgroundSync(SyncTransport *workerTransport);

    // ========== Components ==========

    OfflineStore *store() const { return m_store; }
    ConnectivityMonitor *connectivityMonitor() const { return m_monitor; }
    SyncManager *syncManager() const { return m_syncManager; }
    BackgroundScheduler *scheduler() const { return m_scheduler; }
    RequestInterceptor *interceptor() const { return m_interceptor; }
    BackgroundSyncService *backgroundService() const { return m_backgroundService; }

    // ========== Sync ==========

    bool isOnline() const;
    SyncResult syncNow();
    SyncStatusInfo syncStatus() const;

    /**
     * @brief Queue a change made while offline
     * @throws std::invalid_argument on invalid arguments (see SyncManager)
     */
    qint64 addOfflineChange(const QString &entityType, const QString &operation,
                            const QJsonValue &data, const QString &entityId = QString());

    QList<PendingChange> pendingChanges();
    int pendingChangesCount();

    /**
     * @brief Route every conflict to @p handler
     */
    void setConflictHandler(const ManualResolver &handler);

    /**
     * @brief Send a request through the offline policies
     */
    TransportResponse fetch(const TransportRequest &request);

    // ========== Entities ==========

    bool saveEntityOffline(EntityType type, const QJsonObject &entity);
    QJsonObject offlineEntity(EntityType type, const QString &id);
    QList<QJsonObject> allOfflineEntities(EntityType type);

    /**
     * @brief Apply @p changes to the cached entity and queue an update
     * @return false if the entity is not cached or the change was rejected
     */
    bool updateEntityOffline(EntityType type, const QString &id, const QJsonObject &changes);

    /**
     * @brief Queue a create under a temporary id
     * @return The entity as queued (with id, createdAt and updatedAt), or
     *         an empty object on failure
     */
    QJsonObject createEntityOffline(EntityType type, const QJsonObject &entity);

    bool deleteEntityOffline(EntityType type, const QString &id);

    bool saveFilterOffline(const QJsonObject &filter) { return saveEntityOffline(EntityType::Filter, filter); }
    QJsonObject offlineFilter(const QString &id) { return offlineEntity(EntityType::Filter, id); }
    QList<QJsonObject> allOfflineFilters() { return allOfflineEntities(EntityType::Filter); }
    bool updateFilterOffline(const QString &id, const QJsonObject &changes) {
        return updateEntityOffline(EntityType::Filter, id, changes);
    }
    QJsonObject createFilterOffline(const QJsonObject &filter) {
        return createEntityOffline(EntityType::Filter, filter);
    }
    bool deleteFilterOffline(const QString &id) { return deleteEntityOffline(EntityType::Filter, id); }

    // ========== Preferences ==========

    bool savePreference(const QString &key, const QJsonValue &value);
    QJsonValue preference(const QString &key, const QJsonValue &defaultValue = QJsonValue());

    // ========== Maintenance ==========

    /**
     * @brief Stop auto sync and delete all queued and cached data
     */
    bool clearOfflineData();

signals:
    void connectivityChanged(bool online);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private slots:
    void onConnectivityChanged(bool online);
    void onRequestQueued(qint64 requestId, const QString &url);
    void onReplayFinished(int replayed, int failed, int remaining);

private:
    QString m_storagePath;
    SyncTransport *m_transport;

    OfflineStore *m_store = nullptr;
    ConnectivityMonitor *m_monitor = nullptr;
    SyncManager *m_syncManager = nullptr;
    BackgroundScheduler *m_scheduler = nullptr;
    RequestInterceptor *m_interceptor = nullptr;
    BackgroundSyncService *m_backgroundService = nullptr;

    bool m_initialized = false;
    bool m_syncOnReconnect = true;
};

} // namespace OfflineSync

#endif // OFFLINEMANAGER_H
