#ifndef SYNCTRANSPORT_H
#define SYNCTRANSPORT_H

#include <QString>
#include <QByteArray>
#include <QMap>
#include <QJsonObject>
#include <QJsonDocument>

namespace OfflineSync {

/**
 * @brief An HTTP-style request handed to a transport
 */
struct TransportRequest {
    QString method = QStringLiteral("GET");
    QString url;                        ///< Absolute URL or server-relative path
    QMap<QString, QString> headers;
    QByteArray body;

    bool isMutation() const {
        return method == "POST" || method == "PUT" || method == "PATCH" || method == "DELETE";
    }
};

/**
 * @brief Outcome of a transport call
 *
 * A networkError response never reached the server; status is then 0.
 */
struct TransportResponse {
    int status = 0;
    QMap<QString, QString> headers;
    QByteArray body;
    bool networkError = false;
    QString errorString;

    bool ok() const { return !networkError && status >= 200 && status < 300; }

    QJsonObject json() const {
        return QJsonDocument::fromJson(body).object();
    }

    static TransportResponse jsonResponse(int status, const QJsonObject &json) {
        TransportResponse response;
        response.status = status;
        response.headers.insert("Content-Type", "application/json");
        response.body = QJsonDocument(json).toJson(QJsonDocument::Compact);
        return response;
    }

    static TransportResponse failure(const QString &error) {
        TransportResponse response;
        response.networkError = true;
        response.errorString = error;
        return response;
    }
};

/**
 * @brief Abstract request/response channel to the server
 *
 * Implementations block the caller until the response arrives (or a
 * timeout elapses) and must be used from a single thread.
 */
class SyncTransport
{
public:
    virtual ~SyncTransport() = default;

    /**
     * @brief Send a request and wait for the response
     */
    virtual TransportResponse send(const TransportRequest &request) = 0;
};

} // namespace OfflineSync

#endif // SYNCTRANSPORT_H
