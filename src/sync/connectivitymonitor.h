#ifndef CONNECTIVITYMONITOR_H
#define CONNECTIVITYMONITOR_H

#include <QObject>

namespace OfflineSync {

/**
 * @brief Tracks online/offline transitions
 *
 * State can be driven by the platform (QNetworkInformation reachability)
 * or set explicitly, e.g. by the host application or tests. Signals fire
 * only on actual transitions.
 */
class ConnectivityMonitor : public QObject
{
    Q_OBJECT

public:
    explicit ConnectivityMonitor(QObject *parent = nullptr);

    bool isOnline() const { return m_online; }

    /**
     * @brief Follow the platform's network reachability
     * @return false if no reachability backend is available
     */
    bool startSystemMonitoring();
    bool isSystemMonitoring() const { return m_systemMonitoring; }

public slots:
    void setOnline(bool online);

signals:
    void connectivityChanged(bool online);
    void wentOnline();
    void wentOffline();

private:
    bool m_online = true;
    bool m_systemMonitoring = false;
};

} // namespace OfflineSync

#endif // CONNECTIVITYMONITOR_H
