#ifndef SYNCMANAGER_H
#define SYNCMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QTimer>
#include "synctypes.h"
#include "entitydata.h"
#include "conflictresolver.h"
#include "synctransport.h"

namespace OfflineSync {

class OfflineStore;
class ConnectivityMonitor;
class BackgroundScheduler;

/**
 * @brief Sync Manager configuration
 */
struct SyncManagerOptions {
    bool autoSync = true;
    int syncIntervalMs = 60000;
    int maxRetries = 3;
    QStringList priorityEntities = {QStringLiteral("campaign"), QStringLiteral("filter")};
};

/**
 * @brief Replays queued offline changes against the server
 *
 * The SyncManager coordinates:
 *   - The pending change queue in the OfflineStore
 *   - Request building and sending through a SyncTransport
 *   - Conflict resolution (412 responses) via the ConflictResolver
 *   - Retry accounting and the per-cycle sync log
 *   - Auto sync on a timer and on connectivity restoration
 *
 * Store, transport and monitor are not owned and must outlive the manager.
 *
 * Usage:
 * @code
 * OfflineStore store(storagePath);
 * HttpTransport transport(QUrl("https://example.com"));
 * ConnectivityMonitor monitor;
 *
 * SyncManager manager(&store, &transport, &monitor);
 * manager.addOfflineChange("campaign", "update", QJsonObject{{"name", "Spring"}}, "42");
 *
 * SyncResult result = manager.syncNow();
 * qDebug() << result.summary();
 * @endcode
 */
class SyncManager : public QObject
{
    Q_OBJECT

public:
    SyncManager(OfflineStore *store,
                SyncTransport *transport,
                ConnectivityMonitor *monitor,
                QObject *parent = nullptr);
    ~SyncManager() override;

    // ========== Configuration ==========

    const SyncManagerOptions &options() const { return m_options; }
    void setOptions(const SyncManagerOptions &options);

    ConflictResolver &conflictResolver() { return m_resolver; }
    void setConflictResolver(const ConflictResolver &resolver) { m_resolver = resolver; }

    /**
     * @brief Scheduler used to register the background sync tag (not owned)
     */
    void setBackgroundScheduler(BackgroundScheduler *scheduler) { m_scheduler = scheduler; }

    // ========== State ==========

    SyncStatus status() const { return m_status; }
    bool isSyncing() const { return m_syncInProgress; }
    bool isAutoSyncActive() const { return m_autoSyncTimer.isActive(); }
    QDateTime lastSyncTime() const { return m_lastSyncTime; }

    /**
     * @brief Follow connectivity and start auto sync if enabled and online
     */
    void start();

    // ========== Sync Operations ==========

    /**
     * @brief Run one sync cycle over all pending changes
     *
     * Returns immediately with status Syncing if a cycle is running, or
     * Failed ("Offline") when disconnected. Never throws.
     */
    SyncResult syncNow();

    void startAutoSync();
    void stopAutoSync();

    SyncStatusInfo syncStatus() const;

    /**
     * @brief Sync log entries, newest first
     */
    QList<SyncLogEntry> syncLog(int limit = 10);

    QList<PendingChange> pendingChanges();

    /**
     * @brief Mark an entity's pending changes as disabled
     */
    bool disableSyncForEntity(EntityType type, const QString &entityId);

    // ========== Offline Changes ==========

    /**
     * @brief Queue a change made while offline
     *
     * Validates the arguments, persists the change as pending, caches the
     * data for local display and registers the background sync tag.
     * Creates without an id get a temporary id ("temp_<ms>_<random>").
     *
     * @throws std::invalid_argument for unknown entity types or operations,
     *         missing data on create/update, or a missing entityId on
     *         update/delete
     * @return The queued change's id, or 0 if it could not be stored
     */
    qint64 addOfflineChange(const QString &entityType,
                            const QString &operation,
                            const QJsonValue &data,
                            const QString &entityId = QString());

    qint64 addOfflineChange(EntityType type,
                            Operation operation,
                            const EntityData &data,
                            const QString &entityId = QString());

    // ========== Helpers ==========

    /**
     * @brief Order changes by entity priority, operation, then timestamp
     */
    QList<PendingChange> sortByPriority(const QList<PendingChange> &changes) const;

    /**
     * @brief The server request that replays @p change
     */
    TransportRequest buildRequest(const PendingChange &change) const;

    static QString generateTemporaryId();
    static bool isTemporaryId(const QString &id);

public slots:
    void handleConnectivityChange(bool online);
    void handleBackgroundSyncComplete(const OfflineSync::SyncResult &result);

signals:
    void syncStarted();
    void syncProgress(const OfflineSync::SyncProgress &progress);
    void syncFinished(const OfflineSync::SyncResult &result);
    void conflictDetected(const OfflineSync::PendingChange &change, const QJsonObject &serverData);
    void statusChanged(OfflineSync::SyncStatus status);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private slots:
    void onAutoSyncTimer();
    void runScheduledSync();

private:
    enum class Outcome { Synced, Conflict, Error };

    struct Attempt {
        Outcome outcome = Outcome::Error;
        QJsonObject serverData;
        int statusCode = 0;
        QString error;
    };

    Attempt processChange(const PendingChange &change);
    bool completeChange(PendingChange &change, const QJsonObject &serverData,
                        QList<PendingChange> &queue, int index);
    bool acceptServerVersion(PendingChange &change, const QJsonObject &serverData);
    void recordFailure(PendingChange &change, const QString &error);
    void replaceTemporaryId(const QString &tempId, const QString &serverId, EntityType type,
                            QList<PendingChange> &queue, int from);
    void registerBackgroundSync();
    void setStatus(SyncStatus status);
    SyncResult finishCycle(SyncResult result);

    OfflineStore *m_store;
    SyncTransport *m_transport;
    ConnectivityMonitor *m_monitor;
    BackgroundScheduler *m_scheduler = nullptr;

    SyncManagerOptions m_options;
    ConflictResolver m_resolver;
    QTimer m_autoSyncTimer;

    SyncStatus m_status = SyncStatus::Idle;
    SyncStatus m_lastResult = SyncStatus::Idle;
    bool m_syncInProgress = false;
    QDateTime m_lastSyncTime;
};

} // namespace OfflineSync

#endif // SYNCMANAGER_H
