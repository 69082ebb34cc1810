#include "backgroundsyncworker.h"
#include "requestinterceptor.h"
#include "store/offlinestore.h"
#include "sync/synctransport.h"
#include "sync/connectivitymonitor.h"

#include <QMetaObject>
#include <QDebug>

namespace OfflineSync {

// ========== BackgroundSyncWorker ==========

BackgroundSyncWorker::BackgroundSyncWorker(const QString &storagePath, SyncTransport *transport,
                                           QObject *parent)
    : QObject(parent)
    , m_storagePath(storagePath)
    , m_transport(transport)
{
}

BackgroundSyncWorker::~BackgroundSyncWorker()
{
    // Children (store, monitor, interceptor) go with the QObject tree
    delete m_transport;
}

void BackgroundSyncWorker::initialize()
{
    if (m_store) {
        return;
    }

    m_store = new OfflineStore(m_storagePath, this);
    m_monitor = new ConnectivityMonitor(this);
    m_interceptor = new RequestInterceptor(m_store, m_transport, m_monitor, this);

    connect(m_store, &OfflineStore::errorOccurred, this, &BackgroundSyncWorker::error);

    if (!m_store->open()) {
        emit error(QString("Background store failed to open: %1").arg(m_store->lastError()));
        return;
    }

    qDebug() << "[BackgroundSyncWorker] Initialized on" << m_storagePath;
}

void BackgroundSyncWorker::setOnline(bool online)
{
    if (!m_monitor) {
        initialize();
    }
    m_monitor->setOnline(online);
}

void BackgroundSyncWorker::doReplay()
{
    if (!m_store) {
        initialize();
    }

    SyncResult result;
    result.startTime = QDateTime::currentDateTime();

    emit logMessage("Replaying offline requests");

    ReplayResult replay = m_interceptor->replayOfflineRequests();

    result.synced = replay.replayed;
    result.errors = replay.failed + replay.deferred;
    result.total = replay.replayed + replay.failed + replay.deferred;
    result.endTime = QDateTime::currentDateTime();
    result.status = result.errors == 0 ? SyncStatus::Completed : SyncStatus::Failed;
    if (replay.deferred > 0) {
        result.errorMessage = QString("%1 requests could not reach the server").arg(replay.deferred);
    }

    qDebug() << "[BackgroundSyncWorker] Replay done -" << result.summary();

    emit replayFinished(replay.replayed, replay.failed, replay.remaining);
    emit syncCompleted(result);
}

// ========== BackgroundSyncService ==========

BackgroundSyncService::BackgroundSyncService(const QString &storagePath, SyncTransport *transport,
                                             QObject *parent)
    : QObject(parent)
    , m_storagePath(storagePath)
    , m_pendingTransport(transport)
{
    qRegisterMetaType<OfflineSync::SyncResult>("OfflineSync::SyncResult");
}

BackgroundSyncService::~BackgroundSyncService()
{
    stop();
    delete m_pendingTransport;
}

bool BackgroundSyncService::start()
{
    if (isRunning()) {
        return true;
    }

    if (!m_pendingTransport) {
        qWarning() << "[BackgroundSyncService] No transport for the worker (already started once?)";
        return false;
    }

    m_workerThread = new QThread(this);
    m_workerThread->setObjectName("OfflineSyncBackground");
    m_worker = new BackgroundSyncWorker(m_storagePath, m_pendingTransport);
    m_pendingTransport = nullptr;
    m_worker->moveToThread(m_workerThread);

    connect(m_worker, &BackgroundSyncWorker::replayFinished,
            this, &BackgroundSyncService::onWorkerReplayFinished);
    connect(m_worker, &BackgroundSyncWorker::syncCompleted,
            this, &BackgroundSyncService::syncCompleted);
    connect(m_worker, &BackgroundSyncWorker::logMessage,
            this, &BackgroundSyncService::logMessage);
    connect(m_worker, &BackgroundSyncWorker::error,
            this, &BackgroundSyncService::errorOccurred);

    // Clean up worker when thread finishes
    connect(m_workerThread, &QThread::finished,
            m_worker, &QObject::deleteLater);

    m_workerThread->start();

    QMetaObject::invokeMethod(m_worker, "initialize", Qt::QueuedConnection);
    QMetaObject::invokeMethod(m_worker, "setOnline", Qt::QueuedConnection,
                              Q_ARG(bool, m_online));

    qDebug() << "[BackgroundSyncService] Worker thread started";
    return true;
}

void BackgroundSyncService::stop()
{
    if (m_workerThread) {
        m_workerThread->quit();
        if (!m_workerThread->wait(5000)) {
            qWarning() << "[BackgroundSyncService] Worker thread didn't stop, terminating";
            m_workerThread->terminate();
            m_workerThread->wait();
        }
        delete m_workerThread;
        m_workerThread = nullptr;
        m_worker = nullptr;  // Deleted by thread finished signal
        m_busy = false;
        qDebug() << "[BackgroundSyncService] Worker thread stopped";
    }
}

bool BackgroundSyncService::requestReplay()
{
    if (!isRunning()) {
        return false;
    }

    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true)) {
        qDebug() << "[BackgroundSyncService] Replay already in progress";
        return false;
    }

    QMetaObject::invokeMethod(m_worker, "doReplay", Qt::QueuedConnection);
    return true;
}

void BackgroundSyncService::setOnline(bool online)
{
    m_online = online;
    if (m_worker) {
        QMetaObject::invokeMethod(m_worker, "setOnline", Qt::QueuedConnection,
                                  Q_ARG(bool, online));
    }
}

void BackgroundSyncService::onWorkerReplayFinished(int replayed, int failed, int remaining)
{
    m_busy = false;
    emit logMessage(QString("Background replay: %1 sent, %2 failed, %3 remaining")
                    .arg(replayed).arg(failed).arg(remaining));
    emit replayFinished(replayed, failed, remaining);
}

} // namespace OfflineSync
