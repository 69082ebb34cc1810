#ifndef BACKGROUNDSYNCWORKER_H
#define BACKGROUNDSYNCWORKER_H

#include <QObject>
#include <QThread>
#include <QString>
#include <atomic>

#include "sync/synctypes.h"

namespace OfflineSync {

class OfflineStore;
class SyncTransport;
class ConnectivityMonitor;
class RequestInterceptor;

/**
 * @brief Worker that replays the offline request log on its own thread
 *
 * Lives on the BackgroundSyncService thread. It opens its own store
 * connections on the shared storage directory and talks to the
 * foreground only through queued signals and slots.
 */
class BackgroundSyncWorker : public QObject
{
    Q_OBJECT

public:
    /**
     * @param storagePath Directory of the offline databases
     * @param transport Transport used for replays (takes ownership)
     */
    BackgroundSyncWorker(const QString &storagePath, SyncTransport *transport,
                         QObject *parent = nullptr);
    ~BackgroundSyncWorker() override;

public slots:
    /**
     * @brief Open the store on the worker thread
     */
    void initialize();

    /**
     * @brief Replay every logged request
     */
    void doReplay();

    void setOnline(bool online);

signals:
    void replayFinished(int replayed, int failed, int remaining);
    void syncCompleted(const OfflineSync::SyncResult &result);
    void logMessage(const QString &message);
    void error(const QString &message);

private:
    QString m_storagePath;
    SyncTransport *m_transport;
    OfflineStore *m_store = nullptr;
    ConnectivityMonitor *m_monitor = nullptr;
    RequestInterceptor *m_interceptor = nullptr;
};

/**
 * @brief Hosts the BackgroundSyncWorker on a dedicated QThread
 *
 * Usage:
 *   1. Construct with the storage path and a transport for the worker
 *   2. Call start()
 *   3. Call requestReplay() (directly or from a BackgroundScheduler handler)
 *   4. Results arrive via replayFinished() and syncCompleted()
 *   5. Call stop() (or destroy the service) when done
 */
class BackgroundSyncService : public QObject
{
    Q_OBJECT

public:
    /**
     * @param transport Handed to the worker, which owns it from then on
     */
    BackgroundSyncService(const QString &storagePath, SyncTransport *transport,
                          QObject *parent = nullptr);
    ~BackgroundSyncService() override;

    bool start();
    void stop();

    bool isRunning() const { return m_workerThread && m_workerThread->isRunning(); }
    bool isBusy() const { return m_busy.load(); }

    /**
     * @brief Queue a replay on the worker thread
     * @return false if the service is not running or a replay is in progress
     */
    bool requestReplay();

public slots:
    void setOnline(bool online);

signals:
    void replayFinished(int replayed, int failed, int remaining);
    void syncCompleted(const OfflineSync::SyncResult &result);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private slots:
    void onWorkerReplayFinished(int replayed, int failed, int remaining);

private:
    QString m_storagePath;
    SyncTransport *m_pendingTransport;
    QThread *m_workerThread = nullptr;
    BackgroundSyncWorker *m_worker = nullptr;
    std::atomic<bool> m_busy{false};
    bool m_online = true;
};

} // namespace OfflineSync

#endif // BACKGROUNDSYNCWORKER_H
