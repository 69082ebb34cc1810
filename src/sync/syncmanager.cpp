#include "syncmanager.h"
#include "connectivitymonitor.h"
#include "store/offlinestore.h"
#include "background/backgroundscheduler.h"

#include <QJsonDocument>
#include <QRandomGenerator>
#include <QDebug>

#include <algorithm>
#include <stdexcept>

namespace OfflineSync {

SyncManager::SyncManager(OfflineStore *store,
                         SyncTransport *transport,
                         ConnectivityMonitor *monitor,
                         QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_transport(transport)
    , m_monitor(monitor)
{
    m_autoSyncTimer.setInterval(m_options.syncIntervalMs);
    connect(&m_autoSyncTimer, &QTimer::timeout, this, &SyncManager::onAutoSyncTimer);

    if (m_monitor) {
        connect(m_monitor, &ConnectivityMonitor::connectivityChanged,
                this, &SyncManager::handleConnectivityChange);
    }
}

SyncManager::~SyncManager()
{
    stopAutoSync();
}

void SyncManager::setOptions(const SyncManagerOptions &options)
{
    m_options = options;
    m_autoSyncTimer.setInterval(m_options.syncIntervalMs);

    if (!m_options.autoSync) {
        stopAutoSync();
    }
}

void SyncManager::start()
{
    if (m_options.autoSync && m_monitor && m_monitor->isOnline()) {
        startAutoSync();
    }
}

// ========== Auto Sync ==========

void SyncManager::startAutoSync()
{
    if (m_autoSyncTimer.isActive()) {
        return;
    }

    qDebug() << "[SyncManager] Starting auto sync with interval" << m_options.syncIntervalMs << "ms";
    m_autoSyncTimer.start();
    registerBackgroundSync();
}

void SyncManager::stopAutoSync()
{
    if (m_autoSyncTimer.isActive()) {
        m_autoSyncTimer.stop();
        qDebug() << "[SyncManager] Auto sync stopped";
    }
}

void SyncManager::onAutoSyncTimer()
{
    if (m_monitor && m_monitor->isOnline() && !m_syncInProgress) {
        syncNow();
    }
}

void SyncManager::runScheduledSync()
{
    if (m_monitor && m_monitor->isOnline() && !m_syncInProgress) {
        syncNow();
    }
}

void SyncManager::handleConnectivityChange(bool online)
{
    emit logMessage(QString("Network status changed. Online: %1").arg(online ? "yes" : "no"));

    if (online) {
        if (m_options.autoSync) {
            startAutoSync();
            // Deferred so the connectivity signal finishes delivering first
            QTimer::singleShot(0, this, &SyncManager::runScheduledSync);
        }
    } else {
        stopAutoSync();
    }
}

void SyncManager::registerBackgroundSync()
{
    if (m_scheduler) {
        m_scheduler->registerTag(BackgroundScheduler::SyncTag);
    }
}

// ========== Sync Operations ==========

SyncResult SyncManager::syncNow()
{
    SyncResult result;
    result.startTime = QDateTime::currentDateTime();

    if (m_syncInProgress) {
        qDebug() << "[SyncManager] Sync already in progress";
        result.status = SyncStatus::Syncing;
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    if (!m_monitor || !m_monitor->isOnline()) {
        emit logMessage("Cannot sync: offline");
        result.status = SyncStatus::Failed;
        result.errorMessage = "Offline";
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    m_syncInProgress = true;
    setStatus(SyncStatus::Syncing);
    emit syncStarted();

    QList<PendingChange> queue = sortByPriority(m_store->pendingChanges());
    result.total = queue.size();

    if (queue.isEmpty()) {
        emit logMessage("No pending changes to sync");
        return finishCycle(result);
    }

    emit logMessage(QString("Found %1 pending changes to sync").arg(queue.size()));

    for (int i = 0; i < queue.size(); ++i) {
        if (!m_monitor->isOnline()) {
            result.errorMessage = "Connection lost during sync";
            emit logMessage(QString("Connection lost, %1 changes left for the next sync")
                            .arg(queue.size() - i));
            break;
        }

        PendingChange &change = queue[i];

        if (change.operation != Operation::Create && isTemporaryId(change.entityId)) {
            // The create that assigns the real id has not synced yet
            emit logMessage(QString("Deferring %1 until its create is synced").arg(change.description()));
        } else {
            Attempt attempt = processChange(change);

            switch (attempt.outcome) {
            case Outcome::Synced:
                if (completeChange(change, attempt.serverData, queue, i)) {
                    result.synced++;
                } else {
                    result.errors++;
                }
                break;

            case Outcome::Conflict: {
                result.conflicts++;
                emit conflictDetected(change, attempt.serverData);
                setStatus(SyncStatus::Conflict);

                Resolution resolution = m_resolver.resolve(change, attempt.serverData);
                if (!resolution.error.isEmpty()) {
                    emit logMessage(QString("Conflict resolver failed: %1").arg(resolution.error));
                }

                if (!resolution.resolved) {
                    emit logMessage(QString("Conflict on %1 left for manual resolution")
                                    .arg(change.description()));
                    setStatus(SyncStatus::Syncing);
                    break;
                }

                qDebug() << "[SyncManager] Conflict on" << change.description() << "resolved as"
                         << resolutionActionToString(resolution.action) << resolution.reason;

                if (resolution.action == ResolutionAction::Server) {
                    if (acceptServerVersion(change, attempt.serverData)) {
                        result.synced++;
                        result.conflicts--;
                    } else {
                        result.errors++;
                    }
                } else if (resolution.action == ResolutionAction::Local
                           || resolution.action == ResolutionAction::Merge) {
                    if (resolution.action == ResolutionAction::Merge) {
                        change.data = EntityData(change.entityType, resolution.mergedData);
                        if (!m_store->updateChange(change)) {
                            qWarning() << "[SyncManager] Failed to store merged data for"
                                       << change.description();
                        }
                    }

                    Attempt retry = processChange(change);
                    if (retry.outcome == Outcome::Synced) {
                        if (completeChange(change, retry.serverData, queue, i)) {
                            result.synced++;
                            result.conflicts--;
                        } else {
                            result.errors++;
                        }
                    } else {
                        recordFailure(change, retry.outcome == Outcome::Conflict
                                      ? QString("Conflict persisted after resolution")
                                      : retry.error);
                    }
                }

                setStatus(SyncStatus::Syncing);
                break;
            }

            case Outcome::Error:
                result.errors++;
                recordFailure(change, attempt.error);
                break;
            }
        }

        SyncProgress progress;
        progress.processed = i + 1;
        progress.total = queue.size();
        emit syncProgress(progress);
    }

    return finishCycle(result);
}

SyncManager::Attempt SyncManager::processChange(const PendingChange &change)
{
    Attempt attempt;

    if (!m_transport) {
        attempt.error = "No transport configured";
        return attempt;
    }

    qDebug() << "[SyncManager] Processing change:" << change.description();

    TransportResponse response = m_transport->send(buildRequest(change));
    attempt.statusCode = response.status;

    if (response.ok()) {
        attempt.outcome = Outcome::Synced;
        if (change.operation != Operation::Delete) {
            attempt.serverData = response.json();
        }
        return attempt;
    }

    if (!response.networkError && response.status == 412) {
        QJsonObject body = response.json();
        attempt.outcome = Outcome::Conflict;
        attempt.serverData = body.value("currentData").isObject()
            ? body.value("currentData").toObject()
            : body;
        return attempt;
    }

    attempt.outcome = Outcome::Error;
    if (response.networkError) {
        attempt.error = response.errorString;
    } else {
        attempt.error = QString("HTTP %1").arg(response.status);
        if (!response.errorString.isEmpty()) {
            attempt.error += ": " + response.errorString;
        }
    }
    emit logMessage(QString("Failed to sync %1: %2").arg(change.description(), attempt.error));
    return attempt;
}

bool SyncManager::completeChange(PendingChange &change, const QJsonObject &serverData,
                                 QList<PendingChange> &queue, int index)
{
    change.status = ChangeStatus::Synced;
    change.syncedAt = nowMs();
    change.lastError.clear();

    if (!m_store->updateChange(change)) {
        change.status = ChangeStatus::Pending;
        change.syncedAt = 0;
        emit errorOccurred(QString("Failed to mark %1 as synced: %2")
                           .arg(change.description(), m_store->lastError()));
        return false;
    }

    if (change.operation == Operation::Delete) {
        if (!change.entityId.isEmpty()) {
            m_store->removeCachedEntity(change.entityType, change.entityId);
        }
        return true;
    }

    QJsonObject entity = serverData.isEmpty() ? change.data.toJson() : serverData;

    const QString localId = change.data.id();
    if (change.operation == Operation::Create && isTemporaryId(localId)) {
        const QString serverId = EntityData(change.entityType, serverData).id();
        if (!serverId.isEmpty() && serverId != localId) {
            m_store->removeCachedEntity(change.entityType, localId);
            replaceTemporaryId(localId, serverId, change.entityType, queue, index + 1);
        } else if (serverId.isEmpty()) {
            entity.insert("id", localId);
        }
    }

    if (EntityData(change.entityType, entity).id().isEmpty() && !change.entityId.isEmpty()) {
        entity.insert("id", change.entityId);
    }

    if (!m_store->cacheEntity(change.entityType, entity)) {
        qWarning() << "[SyncManager] Failed to refresh cache for" << change.description();
    }
    return true;
}

bool SyncManager::acceptServerVersion(PendingChange &change, const QJsonObject &serverData)
{
    change.status = ChangeStatus::Synced;
    change.syncedAt = nowMs();
    change.lastError.clear();

    if (!m_store->updateChange(change)) {
        change.status = ChangeStatus::Pending;
        change.syncedAt = 0;
        emit errorOccurred(QString("Failed to mark %1 as synced: %2")
                           .arg(change.description(), m_store->lastError()));
        return false;
    }

    if (!change.entityId.isEmpty() && !EntityData(change.entityType, serverData).id().isEmpty()) {
        m_store->cacheEntity(change.entityType, serverData);
    }
    return true;
}

void SyncManager::recordFailure(PendingChange &change, const QString &error)
{
    change.retryCount++;
    change.lastError = error;

    if (change.retryCount >= m_options.maxRetries) {
        change.status = ChangeStatus::Failed;
        emit logMessage(QString("Giving up on %1 after %2 attempts")
                        .arg(change.description()).arg(change.retryCount));
    }

    if (!m_store->updateChange(change)) {
        qWarning() << "[SyncManager] Failed to record retry for" << change.description()
                   << m_store->lastError();
    }
}

void SyncManager::replaceTemporaryId(const QString &tempId, const QString &serverId, EntityType type,
                                     QList<PendingChange> &queue, int from)
{
    int rewritten = 0;
    for (int i = from; i < queue.size(); ++i) {
        PendingChange &later = queue[i];
        if (later.entityType != type) continue;

        bool touched = false;
        if (later.entityId == tempId) {
            later.entityId = serverId;
            touched = true;
        }
        if (!later.data.isNull() && later.data.id() == tempId) {
            later.data.setId(serverId);
            touched = true;
        }

        if (touched) {
            rewritten++;
            if (!m_store->updateChange(later)) {
                qWarning() << "[SyncManager] Failed to rewrite temporary id in change" << later.id;
            }
        }
    }

    qDebug() << "[SyncManager] Temporary id" << tempId << "is now" << serverId
             << "-" << rewritten << "later changes rewritten";
}

SyncResult SyncManager::finishCycle(SyncResult result)
{
    result.endTime = QDateTime::currentDateTime();
    result.status = (result.errors == 0 && result.errorMessage.isEmpty())
        ? SyncStatus::Completed
        : SyncStatus::Failed;

    m_lastSyncTime = result.endTime;
    m_lastResult = result.status;

    SyncLogEntry entry;
    entry.timestamp = nowMs();
    entry.status = result.status;
    entry.synced = result.synced;
    entry.conflicts = result.conflicts;
    entry.errors = result.errors;
    entry.error = result.errorMessage;
    if (m_store->appendSyncLog(entry) == 0) {
        qWarning() << "[SyncManager] Failed to write sync log:" << m_store->lastError();
    }

    m_syncInProgress = false;
    setStatus(result.status);

    emit logMessage(QString("Sync %1 - %2")
                    .arg(syncStatusToString(result.status), result.summary()));
    emit syncFinished(result);

    setStatus(SyncStatus::Idle);
    return result;
}

void SyncManager::setStatus(SyncStatus status)
{
    if (m_status == status) {
        return;
    }
    m_status = status;
    emit statusChanged(status);
}

void SyncManager::handleBackgroundSyncComplete(const SyncResult &result)
{
    emit logMessage(QString("Background sync finished - %1").arg(result.summary()));

    m_lastSyncTime = result.endTime.isValid() ? result.endTime : QDateTime::currentDateTime();
    m_lastResult = result.status;
    emit syncFinished(result);
}

// ========== Queries ==========

SyncStatusInfo SyncManager::syncStatus() const
{
    SyncStatusInfo info;
    info.status = m_status;
    info.lastResult = m_lastResult;
    info.lastSyncTime = m_lastSyncTime;
    info.pendingChanges = qMax(0, m_store->pendingChangeCount());
    info.autoSyncEnabled = m_options.autoSync && m_autoSyncTimer.isActive();
    return info;
}

QList<SyncLogEntry> SyncManager::syncLog(int limit)
{
    return m_store->syncLog(limit);
}

QList<PendingChange> SyncManager::pendingChanges()
{
    return m_store->pendingChanges();
}

bool SyncManager::disableSyncForEntity(EntityType type, const QString &entityId)
{
    bool ok = true;
    int disabled = 0;

    for (PendingChange change : m_store->changesForEntity(entityId)) {
        if (change.entityType != type || change.status != ChangeStatus::Pending) {
            continue;
        }
        change.status = ChangeStatus::Disabled;
        if (m_store->updateChange(change)) {
            disabled++;
        } else {
            ok = false;
        }
    }

    emit logMessage(QString("Disabled sync for %1 %2 (%3 changes)")
                    .arg(entityTypeToString(type), entityId).arg(disabled));
    return ok;
}

// ========== Offline Changes ==========

qint64 SyncManager::addOfflineChange(const QString &entityType,
                                     const QString &operation,
                                     const QJsonValue &data,
                                     const QString &entityId)
{
    bool ok = false;
    EntityType type = entityTypeFromString(entityType, &ok);
    if (!ok) {
        throw std::invalid_argument(QString("Invalid entity type: %1").arg(entityType).toStdString());
    }

    Operation op = operationFromString(operation, &ok);
    if (!ok) {
        throw std::invalid_argument(QString("Invalid operation: %1").arg(operation).toStdString());
    }

    EntityData payload;
    if (data.isObject()) {
        payload = EntityData(type, data.toObject());
    } else if (!data.isNull() && !data.isUndefined()) {
        throw std::invalid_argument("Data must be a JSON object");
    }

    return addOfflineChange(type, op, payload, entityId);
}

qint64 SyncManager::addOfflineChange(EntityType type,
                                     Operation operation,
                                     const EntityData &data,
                                     const QString &entityId)
{
    if (operation != Operation::Delete && data.isNull()) {
        throw std::invalid_argument("Data is required for create and update operations");
    }
    if (operation != Operation::Create && entityId.isEmpty()) {
        throw std::invalid_argument("Entity ID is required for update and delete operations");
    }

    PendingChange change;
    change.entityType = type;
    change.entityId = entityId;
    change.operation = operation;
    if (!data.isNull()) {
        change.data = EntityData(type, data.toJson());
    }

    if (operation == Operation::Create && change.data.id().isEmpty()) {
        change.data.setId(entityId.isEmpty() ? generateTemporaryId() : entityId);
    }

    QString error;
    if (!change.isValid(&error)) {
        throw std::invalid_argument(error.toStdString());
    }

    change.timestamp = nowMs();
    change.retryCount = 0;
    change.status = ChangeStatus::Pending;

    qint64 id = m_store->savePendingChange(change);
    if (id == 0) {
        emit errorOccurred(QString("Failed to queue %1: %2")
                           .arg(change.description(), m_store->lastError()));
        return 0;
    }

    // Optimistic local copy for display until the server answers
    if (operation != Operation::Delete) {
        const QString cacheId = entityId.isEmpty() ? change.data.id() : entityId;
        QJsonObject entity = m_store->cachedEntity(type, cacheId);
        const QJsonObject fields = change.data.toJson();
        for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
            entity.insert(it.key(), it.value());
        }
        entity.insert("id", cacheId);
        if (!m_store->cacheEntity(type, entity)) {
            qWarning() << "[SyncManager] Failed to cache" << change.description();
        }
    }

    registerBackgroundSync();

    emit logMessage(QString("Queued offline change: %1").arg(change.description()));
    return id;
}

// ========== Helpers ==========

QList<PendingChange> SyncManager::sortByPriority(const QList<PendingChange> &changes) const
{
    QList<PendingChange> sorted = changes;
    const QStringList priorities = m_options.priorityEntities;

    auto typeRank = [&priorities](const PendingChange &change) {
        // Unlisted types follow the list, in declaration order among themselves
        int index = priorities.indexOf(entityTypeToString(change.entityType));
        return index < 0 ? int(priorities.size()) + static_cast<int>(change.entityType) : index;
    };

    std::stable_sort(sorted.begin(), sorted.end(),
                     [&typeRank](const PendingChange &a, const PendingChange &b) {
        int rankA = typeRank(a);
        int rankB = typeRank(b);
        if (rankA != rankB) {
            return rankA < rankB;
        }
        if (a.operation != b.operation) {
            return static_cast<int>(a.operation) < static_cast<int>(b.operation);
        }
        return a.timestamp < b.timestamp;
    });

    return sorted;
}

TransportRequest SyncManager::buildRequest(const PendingChange &change) const
{
    TransportRequest request;
    request.url = entityTypeInfo(change.entityType).basePath;
    if (!change.entityId.isEmpty()) {
        request.url += "/" + change.entityId;
    }

    switch (change.operation) {
    case Operation::Create:
        request.method = "POST";
        break;
    case Operation::Update:
        request.method = "PUT";
        break;
    case Operation::Delete:
        request.method = "DELETE";
        break;
    }

    request.headers.insert("Content-Type", "application/json");

    if (change.operation != Operation::Delete) {
        request.headers.insert("X-Client-Timestamp", QString::number(change.timestamp));

        QJsonObject body = change.data.toJson();
        if (change.operation == Operation::Create && isTemporaryId(change.data.id())) {
            body.remove("id");
        }
        body.insert("clientTimestamp", change.timestamp);
        request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    }

    return request;
}

QString SyncManager::generateTemporaryId()
{
    // Nine base-36 digits
    const quint64 range = 101559956668416ULL;
    quint64 random = QRandomGenerator::global()->bounded(range);
    return QString("temp_%1_%2").arg(nowMs()).arg(QString::number(random, 36));
}

bool SyncManager::isTemporaryId(const QString &id)
{
    return id.startsWith(QLatin1String("temp_"));
}

} // namespace OfflineSync
