#ifndef MOCKTRANSPORT_H
#define MOCKTRANSPORT_H

#include <QList>
#include <QQueue>
#include <functional>
#include "sync/synctransport.h"

/**
 * @brief Scripted in-memory transport for tests
 *
 * Responses are served from the queue first, then from the handler if one
 * is set, then the default response (200 with an empty JSON object).
 * Every request is recorded.
 */
class MockTransport : public OfflineSync::SyncTransport
{
public:
    typedef std::function<OfflineSync::TransportResponse(const OfflineSync::TransportRequest &)> Handler;

    OfflineSync::TransportResponse send(const OfflineSync::TransportRequest &request) override
    {
        requests.append(request);
        if (!responses.isEmpty()) {
            return responses.dequeue();
        }
        if (handler) {
            return handler(request);
        }
        return defaultResponse;
    }

    void enqueueJson(int status, const QJsonObject &body)
    {
        responses.enqueue(OfflineSync::TransportResponse::jsonResponse(status, body));
    }

    void enqueueNetworkError(const QString &error = QStringLiteral("Connection refused"))
    {
        responses.enqueue(OfflineSync::TransportResponse::failure(error));
    }

    int requestCount() const { return requests.size(); }
    const OfflineSync::TransportRequest &lastRequest() const { return requests.last(); }

    QList<OfflineSync::TransportRequest> requests;
    QQueue<OfflineSync::TransportResponse> responses;
    Handler handler;
    OfflineSync::TransportResponse defaultResponse =
        OfflineSync::TransportResponse::jsonResponse(200, QJsonObject());
};

#endif // MOCKTRANSPORT_H
