#include "connectivitymonitor.h"

#include <QNetworkInformation>
#include <QDebug>

namespace OfflineSync {

namespace {

bool isReachable(QNetworkInformation::Reachability reachability)
{
    return reachability == QNetworkInformation::Reachability::Online
        || reachability == QNetworkInformation::Reachability::Site;
}

} // namespace

ConnectivityMonitor::ConnectivityMonitor(QObject *parent)
    : QObject(parent)
{
}

bool ConnectivityMonitor::startSystemMonitoring()
{
    if (m_systemMonitoring) {
        return true;
    }

    if (!QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qWarning() << "[ConnectivityMonitor] No reachability backend available";
        return false;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    connect(info, &QNetworkInformation::reachabilityChanged, this,
            [this](QNetworkInformation::Reachability reachability) {
        if (reachability == QNetworkInformation::Reachability::Unknown) {
            return;
        }
        setOnline(isReachable(reachability));
    });

    m_systemMonitoring = true;
    qDebug() << "[ConnectivityMonitor] Using backend" << info->backendName();

    if (info->reachability() != QNetworkInformation::Reachability::Unknown) {
        setOnline(isReachable(info->reachability()));
    }
    return true;
}

void ConnectivityMonitor::setOnline(bool online)
{
    if (m_online == online) {
        return;
    }

    m_online = online;
    qDebug() << "[ConnectivityMonitor] Connection" << (online ? "online" : "offline");

    emit connectivityChanged(online);
    if (online) {
        emit wentOnline();
    } else {
        emit wentOffline();
    }
}

} // namespace OfflineSync
