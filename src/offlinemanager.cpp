#include "offlinemanager.h"
#include "profile.h"
#include "store/offlinestore.h"
#include "sync/connectivitymonitor.h"
#include "sync/syncmanager.h"
#include "background/backgroundscheduler.h"
#include "background/backgroundsyncworker.h"
#include "background/requestinterceptor.h"

#include <QDateTime>
#include <QDebug>
#include <stdexcept>

namespace OfflineSync {

OfflineManager::OfflineManager(const QString &storagePath, SyncTransport *transport, QObject *parent)
    : QObject(parent)
    , m_storagePath(storagePath)
    , m_transport(transport)
{
    m_store = new OfflineStore(m_storagePath, this);
    m_monitor = new ConnectivityMonitor(this);
    m_scheduler = new BackgroundScheduler(m_store, this);
    m_syncManager = new SyncManager(m_store, m_transport, m_monitor, this);
    m_syncManager->setBackgroundScheduler(m_scheduler);
    m_interceptor = new RequestInterceptor(m_store, m_transport, m_monitor, this);

    connect(m_store, &OfflineStore::errorOccurred, this, &OfflineManager::errorOccurred);
    connect(m_syncManager, &SyncManager::errorOccurred, this, &OfflineManager::errorOccurred);
    connect(m_syncManager, &SyncManager::logMessage, this, &OfflineManager::logMessage);
    connect(m_monitor, &ConnectivityMonitor::connectivityChanged,
            this, &OfflineManager::connectivityChanged);
    connect(m_monitor, &ConnectivityMonitor::connectivityChanged,
            this, &OfflineManager::onConnectivityChanged);
    connect(m_interceptor, &RequestInterceptor::requestQueued,
            this, &OfflineManager::onRequestQueued);
}

OfflineManager::~OfflineManager()
{
    m_syncManager->stopAutoSync();
}

void OfflineManager::configure(const Profile &profile)
{
    SyncManagerOptions options;
    options.autoSync = profile.autoSync();
    options.syncIntervalMs = profile.syncIntervalMs();
    options.maxRetries = profile.maxRetries();
    options.priorityEntities = profile.priorityEntities();
    m_syncManager->setOptions(options);

    ConflictResolver &resolver = m_syncManager->conflictResolver();

    bool ok = false;
    ResolutionAction defaultAction = resolutionActionFromString(profile.defaultResolution(), &ok);
    if (ok) {
        resolver.setDefaultResolution(defaultAction);
    } else {
        qWarning() << "[OfflineManager] Unknown default resolution" << profile.defaultResolution();
    }
    resolver.setAutoResolveThreshold(profile.autoResolveThresholdMs());

    const QMap<QString, QString> fields = profile.fieldResolutions();
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        ResolutionAction action = resolutionActionFromString(it.value(), &ok);
        if (ok) {
            resolver.setFieldResolution(it.key(), action);
        } else {
            qWarning() << "[OfflineManager] Unknown resolution" << it.value() << "for field" << it.key();
        }
    }

    m_interceptor->setOrigin(profile.serverBaseUrl());
    m_syncOnReconnect = profile.syncOnReconnect();
}

bool OfflineManager::initialize()
{
    if (m_initialized) {
        return true;
    }

    if (!m_store->open()) {
        emit errorOccurred(QString("Failed to open offline storage: %1").arg(m_store->lastError()));
        return false;
    }

    m_syncManager->start();
    m_initialized = true;

    qDebug() << "[OfflineManager] Initialized with storage" << m_storagePath;
    return true;
}

bool OfflineManager::enableBackgroundSync(SyncTransport *workerTransport)
{
    if (m_backgroundService) {
        delete workerTransport;
        return m_backgroundService->isRunning();
    }

    m_backgroundService = new BackgroundSyncService(m_storagePath, workerTransport, this);
    m_backgroundService->setOnline(m_monitor->isOnline());

    connect(m_backgroundService, &BackgroundSyncService::syncCompleted,
            m_syncManager, &SyncManager::handleBackgroundSyncComplete);
    connect(m_backgroundService, &BackgroundSyncService::replayFinished,
            this, &OfflineManager::onReplayFinished);
    connect(m_backgroundService, &BackgroundSyncService::logMessage,
            this, &OfflineManager::logMessage);
    connect(m_backgroundService, &BackgroundSyncService::errorOccurred,
            this, &OfflineManager::errorOccurred);

    BackgroundSyncService *service = m_backgroundService;
    m_scheduler->schedule(BackgroundScheduler::SyncTag, [service]() {
        return service->requestReplay();
    });

    return m_backgroundService->start();
}

// ========== Sync ==========

bool OfflineManager::isOnline() const
{
    return m_monitor->isOnline();
}

SyncResult OfflineManager::syncNow()
{
    return m_syncManager->syncNow();
}

SyncStatusInfo OfflineManager::syncStatus() const
{
    return m_syncManager->syncStatus();
}

qint64 OfflineManager::addOfflineChange(const QString &entityType, const QString &operation,
                                        const QJsonValue &data, const QString &entityId)
{
    return m_syncManager->addOfflineChange(entityType, operation, data, entityId);
}

QList<PendingChange> OfflineManager::pendingChanges()
{
    return m_syncManager->pendingChanges();
}

int OfflineManager::pendingChangesCount()
{
    return qMax(0, m_store->pendingChangeCount());
}

void OfflineManager::setConflictHandler(const ManualResolver &handler)
{
    if (!handler) {
        return;
    }

    ConflictResolverOptions options;
    options.defaultResolution = ResolutionAction::Manual;
    options.manualResolutionCallback = handler;
    m_syncManager->setConflictResolver(ConflictResolver(options));
}

TransportResponse OfflineManager::fetch(const TransportRequest &request)
{
    return m_interceptor->handle(request);
}

void OfflineManager::onConnectivityChanged(bool online)
{
    // The worker must see the new state before any replay the wake queues
    if (m_backgroundService) {
        m_backgroundService->setOnline(online);
    }
    if (m_initialized && m_syncOnReconnect) {
        m_scheduler->onConnectivityChanged(online);
    }
}

void OfflineManager::onRequestQueued(qint64 requestId, const QString &url)
{
    Q_UNUSED(requestId)
    emit logMessage(QString("Saved offline request to %1").arg(url));
    m_scheduler->registerTag(BackgroundScheduler::SyncTag);
}

void OfflineManager::onReplayFinished(int replayed, int failed, int remaining)
{
    Q_UNUSED(replayed)
    Q_UNUSED(failed)

    if (remaining == 0 && m_store->pendingChangeCount() == 0) {
        m_scheduler->unregisterTag(BackgroundScheduler::SyncTag);
    }
}

// ========== Entities ==========

bool OfflineManager::saveEntityOffline(EntityType type, const QJsonObject &entity)
{
    if (EntityData(type, entity).id().isEmpty()) {
        qWarning() << "[OfflineManager] Cannot cache" << entityTypeToString(type) << "without an id";
        return false;
    }
    return m_store->cacheEntity(type, entity);
}

QJsonObject OfflineManager::offlineEntity(EntityType type, const QString &id)
{
    return m_store->cachedEntity(type, id);
}

QList<QJsonObject> OfflineManager::allOfflineEntities(EntityType type)
{
    return m_store->allCachedEntities(type);
}

bool OfflineManager::updateEntityOffline(EntityType type, const QString &id, const QJsonObject &changes)
{
    QJsonObject entity = m_store->cachedEntity(type, id);
    if (entity.isEmpty()) {
        qWarning() << "[OfflineManager]" << entityTypeToString(type) << id << "not found in offline cache";
        return false;
    }

    for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
        entity.insert(it.key(), it.value());
    }

    try {
        return m_syncManager->addOfflineChange(type, Operation::Update, EntityData(type, entity), id) > 0;
    } catch (const std::invalid_argument &e) {
        qWarning() << "[OfflineManager] Error updating" << entityTypeToString(type) << "offline:" << e.what();
        return false;
    }
}

QJsonObject OfflineManager::createEntityOffline(EntityType type, const QJsonObject &entity)
{
    const QString now = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);

    QJsonObject created = entity;
    created["id"] = SyncManager::generateTemporaryId();
    created["createdAt"] = now;
    created["updatedAt"] = now;

    try {
        if (m_syncManager->addOfflineChange(type, Operation::Create, EntityData(type, created)) == 0) {
            return QJsonObject();
        }
    } catch (const std::invalid_argument &e) {
        qWarning() << "[OfflineManager] Error creating" << entityTypeToString(type) << "offline:" << e.what();
        return QJsonObject();
    }
    return created;
}

bool OfflineManager::deleteEntityOffline(EntityType type, const QString &id)
{
    try {
        return m_syncManager->addOfflineChange(type, Operation::Delete, EntityData(), id) > 0;
    } catch (const std::invalid_argument &e) {
        qWarning() << "[OfflineManager] Error deleting" << entityTypeToString(type) << "offline:" << e.what();
        return false;
    }
}

// ========== Preferences ==========

bool OfflineManager::savePreference(const QString &key, const QJsonValue &value)
{
    return m_store->saveUserPreference(key, value);
}

QJsonValue OfflineManager::preference(const QString &key, const QJsonValue &defaultValue)
{
    return m_store->userPreference(key, defaultValue);
}

// ========== Maintenance ==========

bool OfflineManager::clearOfflineData()
{
    m_syncManager->stopAutoSync();

    if (!m_store->clearAllOfflineData()) {
        emit errorOccurred(QString("Failed to clear offline data: %1").arg(m_store->lastError()));
        return false;
    }

    emit logMessage("Offline data cleared");
    return true;
}

} // namespace OfflineSync
