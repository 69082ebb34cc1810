/**
 * @file test_syncmanager.cpp
 * @brief Unit tests for SyncManager
 *
 * Drives sync cycles against a scripted MockTransport: ordering, retries,
 * 412 conflict handling, temporary id rewriting and connectivity.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QRegularExpression>
#include <stdexcept>
#include "sync/syncmanager.h"
#include "sync/connectivitymonitor.h"
#include "store/offlinestore.h"
#include "background/backgroundscheduler.h"
#include "mocktransport.h"

using namespace OfflineSync;

namespace {

template<typename Fn>
bool throwsInvalidArgument(Fn fn)
{
    try {
        fn();
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

QJsonObject bodyOf(const TransportRequest &request)
{
    return QJsonDocument::fromJson(request.body).object();
}

TransportResponse conflictResponse(const QJsonObject &current)
{
    return TransportResponse::jsonResponse(412, QJsonObject{
        {"error", "Conflict"},
        {"currentData", current}
    });
}

} // namespace

class TestSyncManager : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Queueing ==========
    void testAddOfflineChangeRejectsBadArguments();
    void testAddOfflineChangeAssignsTemporaryId();
    void testAddOfflineChangeUpdatesCache();
    void testAddOfflineChangeRegistersBackgroundSync();
    void testGenerateTemporaryId();

    // ========== Requests ==========
    void testBuildRequest();
    void testSortByPriority();

    // ========== Cycles ==========
    void testSyncWhileOffline();
    void testEmptyQueueCompletes();
    void testSyncOrder();
    void testSyncIsIdempotent();
    void testDeleteRemovesCachedEntity();
    void testStatusSignals();
    void testProgressSignals();
    void testReentrantSyncReturnsSyncing();
    void testConnectionLostMidCycle();

    // ========== Failures ==========
    void testHttpErrorRecordsRetry();
    void testNetworkErrorRecordsRetry();
    void testRetryExhaustion();

    // ========== Conflicts ==========
    void testConflictServerWins();
    void testConflictLocalWinsRetries();
    void testConflictMergeSendsMergedData();
    void testConflictLeftForManualResolution();
    void testConflictPersistingAfterRetry();
    void testThrowingResolverDoesNotStallSync();

    // ========== Temporary ids ==========
    void testTemporaryIdReplacedAfterCreate();
    void testChangeDeferredUntilCreateSyncs();

    // ========== Status & control ==========
    void testSyncStatusAndLog();
    void testDisableSyncForEntity();
    void testReconnectTriggersSync();

private:
    SyncManagerOptions manualOptions() const;

    QTemporaryDir *m_tempDir;
    OfflineStore *m_store;
    MockTransport *m_transport;
    ConnectivityMonitor *m_monitor;
    SyncManager *m_manager;
};

void TestSyncManager::initTestCase()
{
    qDebug() << "Starting SyncManager tests";
}

void TestSyncManager::cleanupTestCase()
{
    qDebug() << "SyncManager tests complete";
}

SyncManagerOptions TestSyncManager::manualOptions() const
{
    SyncManagerOptions options;
    options.autoSync = false;
    return options;
}

void TestSyncManager::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new OfflineStore(m_tempDir->path());
    QVERIFY(m_store->open());

    m_transport = new MockTransport();
    m_monitor = new ConnectivityMonitor();
    m_monitor->setOnline(true);

    m_manager = new SyncManager(m_store, m_transport, m_monitor);
    m_manager->setOptions(manualOptions());
}

void TestSyncManager::cleanup()
{
    delete m_manager;
    m_manager = nullptr;
    delete m_monitor;
    m_monitor = nullptr;
    delete m_transport;
    m_transport = nullptr;
    delete m_store;
    m_store = nullptr;
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ========== Queueing ==========

void TestSyncManager::testAddOfflineChangeRejectsBadArguments()
{
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("user", "update", QJsonObject{{"name", "x"}}, "1");
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "upsert", QJsonObject{{"name", "x"}}, "1");
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "x"}});
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "create", QJsonValue());
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "delete", QJsonValue());
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "update", QJsonValue(5), "1");
    }));
    QVERIFY(throwsInvalidArgument([this] {
        m_manager->addOfflineChange("campaign", "create", QJsonObject{{"budget", "lots"}});
    }));

    QCOMPARE(m_store->allChanges().size(), 0);

    // A delete needs only the id
    QVERIFY(m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "1") > 0);
}

void TestSyncManager::testAddOfflineChangeAssignsTemporaryId()
{
    qint64 id = m_manager->addOfflineChange("campaign", "create", QJsonObject{{"name", "New"}});
    QVERIFY(id > 0);

    PendingChange stored = m_store->change(id);
    QVERIFY(SyncManager::isTemporaryId(stored.data.id()));
    QVERIFY(stored.entityId.isEmpty());
    QCOMPARE(stored.status, ChangeStatus::Pending);
    QCOMPARE(stored.retryCount, 0);

    QJsonObject cached = m_store->cachedEntity(EntityType::Campaign, stored.data.id());
    QCOMPARE(cached.value("name").toString(), QString("New"));

    // A create that names its id keeps it
    qint64 named = m_manager->addOfflineChange("filter", "create", QJsonObject{{"name", "F"}}, "f-1");
    QCOMPARE(m_store->change(named).data.id(), QString("f-1"));
}

void TestSyncManager::testAddOfflineChangeUpdatesCache()
{
    QVERIFY(m_store->cacheEntity(EntityType::Campaign,
                                 QJsonObject{{"id", "c1"}, {"name", "Spring"}, {"budget", 10}}));

    QVERIFY(m_manager->addOfflineChange("campaign", "update", QJsonObject{{"budget", 20}}, "c1") > 0);

    QJsonObject cached = m_store->cachedEntity(EntityType::Campaign, "c1");
    QCOMPARE(cached.value("name").toString(), QString("Spring"));
    QCOMPARE(cached.value("budget").toInt(), 20);
}

void TestSyncManager::testAddOfflineChangeRegistersBackgroundSync()
{
    BackgroundScheduler scheduler(m_store);
    m_manager->setBackgroundScheduler(&scheduler);
    QSignalSpy logSpy(m_manager, &SyncManager::logMessage);

    QVERIFY(!scheduler.isRegistered(BackgroundScheduler::SyncTag));
    m_manager->addOfflineChange("filter", "delete", QJsonValue(), "f1");
    QVERIFY(scheduler.isRegistered(BackgroundScheduler::SyncTag));
    QVERIFY(logSpy.count() >= 1);

    m_manager->setBackgroundScheduler(nullptr);
}

void TestSyncManager::testGenerateTemporaryId()
{
    QRegularExpression pattern("^temp_\\d+_[0-9a-z]+$");
    QString first = SyncManager::generateTemporaryId();
    QString second = SyncManager::generateTemporaryId();

    QVERIFY(pattern.match(first).hasMatch());
    QVERIFY(first != second);
    QVERIFY(SyncManager::isTemporaryId(first));
    QVERIFY(!SyncManager::isTemporaryId("42"));
}

// ========== Requests ==========

void TestSyncManager::testBuildRequest()
{
    PendingChange update;
    update.entityType = EntityType::Campaign;
    update.entityId = "c1";
    update.operation = Operation::Update;
    update.data = EntityData(EntityType::Campaign, QJsonObject{{"name", "A"}});
    update.timestamp = 1234;

    TransportRequest request = m_manager->buildRequest(update);
    QCOMPARE(request.method, QString("PUT"));
    QCOMPARE(request.url, QString("/api/campaigns/c1"));
    QCOMPARE(request.headers.value("Content-Type"), QString("application/json"));
    QCOMPARE(request.headers.value("X-Client-Timestamp"), QString("1234"));
    QCOMPARE(bodyOf(request).value("name").toString(), QString("A"));
    QCOMPARE(bodyOf(request).value("clientTimestamp").toInteger(), qint64(1234));

    PendingChange create;
    create.entityType = EntityType::Filter;
    create.operation = Operation::Create;
    create.data = EntityData(EntityType::Filter, QJsonObject{{"id", "temp_1_abc"}, {"name", "F"}});
    create.timestamp = 5;

    request = m_manager->buildRequest(create);
    QCOMPARE(request.method, QString("POST"));
    QCOMPARE(request.url, QString("/api/websocket/filters"));
    QVERIFY(!bodyOf(request).contains("id"));

    PendingChange removal;
    removal.entityType = EntityType::Campaign;
    removal.entityId = "c2";
    removal.operation = Operation::Delete;

    request = m_manager->buildRequest(removal);
    QCOMPARE(request.method, QString("DELETE"));
    QCOMPARE(request.url, QString("/api/campaigns/c2"));
    QVERIFY(request.body.isEmpty());
    QVERIFY(!request.headers.contains("X-Client-Timestamp"));
}

void TestSyncManager::testSortByPriority()
{
    auto make = [](EntityType type, Operation op, qint64 timestamp) {
        PendingChange change;
        change.entityType = type;
        change.operation = op;
        change.timestamp = timestamp;
        return change;
    };

    QList<PendingChange> changes;
    changes << make(EntityType::Filter, Operation::Create, 1)
            << make(EntityType::Campaign, Operation::Delete, 2)
            << make(EntityType::Campaign, Operation::Update, 5)
            << make(EntityType::Campaign, Operation::Update, 3)
            << make(EntityType::Campaign, Operation::Create, 9);

    QList<PendingChange> sorted = m_manager->sortByPriority(changes);
    QCOMPARE(sorted.at(0).operation, Operation::Create);
    QCOMPARE(sorted.at(0).entityType, EntityType::Campaign);
    QCOMPARE(sorted.at(1).timestamp, qint64(3));
    QCOMPARE(sorted.at(2).timestamp, qint64(5));
    QCOMPARE(sorted.at(3).operation, Operation::Delete);
    QCOMPARE(sorted.at(4).entityType, EntityType::Filter);

    // Types missing from the priority list go last
    SyncManagerOptions options = manualOptions();
    options.priorityEntities = QStringList({"filter"});
    m_manager->setOptions(options);
    sorted = m_manager->sortByPriority(changes);
    QCOMPARE(sorted.first().entityType, EntityType::Filter);

    // Without a list, types keep their declaration order before operation order
    options.priorityEntities = QStringList();
    m_manager->setOptions(options);
    QList<PendingChange> unlisted;
    unlisted << make(EntityType::Filter, Operation::Create, 1)
             << make(EntityType::Campaign, Operation::Update, 2);
    sorted = m_manager->sortByPriority(unlisted);
    QCOMPARE(sorted.at(0).entityType, EntityType::Campaign);
    QCOMPARE(sorted.at(1).entityType, EntityType::Filter);
}

// ========== Cycles ==========

void TestSyncManager::testSyncWhileOffline()
{
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");
    m_monitor->setOnline(false);

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Failed);
    QCOMPARE(result.errorMessage, QString("Offline"));
    QCOMPARE(m_transport->requestCount(), 0);
    QCOMPARE(m_store->pendingChangeCount(), 1);
}

void TestSyncManager::testEmptyQueueCompletes()
{
    QSignalSpy startedSpy(m_manager, &SyncManager::syncStarted);
    QSignalSpy finishedSpy(m_manager, &SyncManager::syncFinished);

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Completed);
    QCOMPARE(result.total, 0);
    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(m_manager->status(), SyncStatus::Idle);
    QVERIFY(!m_manager->isSyncing());
}

void TestSyncManager::testSyncOrder()
{
    m_manager->addOfflineChange("filter", "update", QJsonObject{{"name", "F"}}, "f1");
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c2");
    m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "C1"}}, "c1");
    m_manager->addOfflineChange("campaign", "create", QJsonObject{{"name", "New"}});

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Completed);
    QCOMPARE(result.synced, 4);
    QCOMPARE(result.total, 4);

    QCOMPARE(m_transport->requestCount(), 4);
    QCOMPARE(m_transport->requests.at(0).method, QString("POST"));
    QCOMPARE(m_transport->requests.at(0).url, QString("/api/campaigns"));
    QCOMPARE(m_transport->requests.at(1).method, QString("PUT"));
    QCOMPARE(m_transport->requests.at(1).url, QString("/api/campaigns/c1"));
    QCOMPARE(m_transport->requests.at(2).method, QString("DELETE"));
    QCOMPARE(m_transport->requests.at(2).url, QString("/api/campaigns/c2"));
    QCOMPARE(m_transport->requests.at(3).url, QString("/api/websocket/filters/f1"));
}

void TestSyncManager::testSyncIsIdempotent()
{
    m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "A"}}, "c1");
    m_manager->addOfflineChange("filter", "delete", QJsonValue(), "f1");

    QCOMPARE(m_manager->syncNow().synced, 2);
    QCOMPARE(m_transport->requestCount(), 2);

    SyncResult second = m_manager->syncNow();
    QCOMPARE(second.status, SyncStatus::Completed);
    QCOMPARE(second.total, 0);
    QCOMPARE(m_transport->requestCount(), 2);

    for (const PendingChange &change : m_store->allChanges()) {
        QCOMPARE(change.status, ChangeStatus::Synced);
        QVERIFY(change.syncedAt > 0);
    }
}

void TestSyncManager::testDeleteRemovesCachedEntity()
{
    m_store->cacheEntity(EntityType::Campaign, QJsonObject{{"id", "c2"}, {"name", "Old"}});
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c2");

    m_manager->syncNow();
    QVERIFY(m_store->cachedEntity(EntityType::Campaign, "c2").isEmpty());
}

void TestSyncManager::testStatusSignals()
{
    QSignalSpy statusSpy(m_manager, &SyncManager::statusChanged);
    m_manager->syncNow();

    QCOMPARE(statusSpy.count(), 3);
    QCOMPARE(statusSpy.at(0).at(0).value<SyncStatus>(), SyncStatus::Syncing);
    QCOMPARE(statusSpy.at(1).at(0).value<SyncStatus>(), SyncStatus::Completed);
    QCOMPARE(statusSpy.at(2).at(0).value<SyncStatus>(), SyncStatus::Idle);
}

void TestSyncManager::testProgressSignals()
{
    for (const QString &id : {"a", "b", "c"}) {
        m_manager->addOfflineChange("campaign", "delete", QJsonValue(), id);
    }

    QSignalSpy progressSpy(m_manager, &SyncManager::syncProgress);
    m_manager->syncNow();

    QCOMPARE(progressSpy.count(), 3);
    SyncProgress first = progressSpy.first().at(0).value<SyncProgress>();
    SyncProgress last = progressSpy.last().at(0).value<SyncProgress>();
    QCOMPARE(first.processed, 1);
    QCOMPARE(first.total, 3);
    QCOMPARE(last.percentage(), 100);
}

void TestSyncManager::testReentrantSyncReturnsSyncing()
{
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");

    SyncResult nested;
    m_transport->handler = [this, &nested](const TransportRequest &) {
        nested = m_manager->syncNow();
        return TransportResponse::jsonResponse(200, QJsonObject());
    };

    SyncResult outer = m_manager->syncNow();
    QCOMPARE(nested.status, SyncStatus::Syncing);
    QCOMPARE(outer.status, SyncStatus::Completed);
    QCOMPARE(m_transport->requestCount(), 1);
}

void TestSyncManager::testConnectionLostMidCycle()
{
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c2");

    m_transport->handler = [this](const TransportRequest &) {
        m_monitor->setOnline(false);
        return TransportResponse::jsonResponse(200, QJsonObject());
    };

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Failed);
    QCOMPARE(result.errorMessage, QString("Connection lost during sync"));
    QCOMPARE(result.synced, 1);
    QCOMPARE(m_transport->requestCount(), 1);
    QCOMPARE(m_store->pendingChangeCount(), 1);
}

// ========== Failures ==========

void TestSyncManager::testHttpErrorRecordsRetry()
{
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "A"}}, "c1");
    m_transport->enqueueJson(500, QJsonObject{{"error", "boom"}});

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Failed);
    QCOMPARE(result.errors, 1);
    QCOMPARE(result.synced, 0);

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.status, ChangeStatus::Pending);
    QCOMPARE(stored.retryCount, 1);
    QCOMPARE(stored.lastError, QString("HTTP 500"));
}

void TestSyncManager::testNetworkErrorRecordsRetry()
{
    qint64 id = m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");
    m_transport->enqueueNetworkError();

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.errors, 1);

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.retryCount, 1);
    QCOMPARE(stored.lastError, QString("Connection refused"));
}

void TestSyncManager::testRetryExhaustion()
{
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "A"}}, "c1");
    m_transport->defaultResponse = TransportResponse::jsonResponse(503, QJsonObject());

    for (int i = 0; i < 3; ++i) {
        QCOMPARE(m_manager->syncNow().errors, 1);
    }

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.status, ChangeStatus::Failed);
    QCOMPARE(stored.retryCount, 3);
    QCOMPARE(m_store->pendingChangeCount(), 0);

    // Failed changes are not retried
    SyncResult after = m_manager->syncNow();
    QCOMPARE(after.total, 0);
    QCOMPARE(m_transport->requestCount(), 3);
}

// ========== Conflicts ==========

void TestSyncManager::testConflictServerWins()
{
    m_manager->conflictResolver().setFieldResolution("name", ResolutionAction::Server);
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "Local"}}, "c1");

    m_transport->responses.enqueue(conflictResponse(QJsonObject{
        {"id", "c1"}, {"name", "Server"}, {"updatedAt", double(nowMs())}
    }));

    QSignalSpy conflictSpy(m_manager, &SyncManager::conflictDetected);
    SyncResult result = m_manager->syncNow();

    QCOMPARE(conflictSpy.count(), 1);
    QCOMPARE(result.status, SyncStatus::Completed);
    QCOMPARE(result.synced, 1);
    QCOMPARE(result.conflicts, 0);
    QCOMPARE(m_transport->requestCount(), 1);
    QCOMPARE(m_store->change(id).status, ChangeStatus::Synced);
    QCOMPARE(m_store->cachedEntity(EntityType::Campaign, "c1").value("name").toString(),
             QString("Server"));
}

void TestSyncManager::testThrowingResolverDoesNotStallSync()
{
    m_manager->conflictResolver().setEntityTypeResolution(EntityType::Campaign,
        [](const PendingChange &, const QJsonObject &) -> Resolution {
            throw 42;
        });
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "Local"}}, "c1");

    m_transport->responses.enqueue(conflictResponse(QJsonObject{
        {"id", "c1"}, {"name", "Server"}, {"updatedAt", double(nowMs())}
    }));

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Completed);
    QCOMPARE(result.synced, 1);
    QVERIFY(!m_manager->isSyncing());
    QCOMPARE(m_store->change(id).status, ChangeStatus::Synced);
    QCOMPARE(m_manager->syncLog(1).size(), 1);

    // The next cycle runs instead of reporting a cycle still in progress
    result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Completed);
}

void TestSyncManager::testConflictLocalWinsRetries()
{
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "Local"}}, "c1");

    m_transport->responses.enqueue(conflictResponse(QJsonObject{
        {"id", "c1"}, {"name", "Server"}, {"updatedAt", double(nowMs())}
    }));
    m_transport->enqueueJson(200, QJsonObject{{"id", "c1"}, {"name", "Local"}});

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.synced, 1);
    QCOMPARE(result.conflicts, 0);
    QCOMPARE(m_transport->requestCount(), 2);
    QCOMPARE(m_transport->requests.at(1).method, QString("PUT"));
    QCOMPARE(bodyOf(m_transport->requests.at(1)).value("name").toString(), QString("Local"));
    QCOMPARE(m_store->change(id).status, ChangeStatus::Synced);
}

void TestSyncManager::testConflictMergeSendsMergedData()
{
    m_manager->conflictResolver().setFieldResolution("budget", ResolutionAction::Server);
    qint64 id = m_manager->addOfflineChange("campaign", "update",
                                            QJsonObject{{"name", "Local"}, {"budget", 10}}, "c1");

    m_transport->responses.enqueue(conflictResponse(QJsonObject{
        {"id", "c1"}, {"name", "Server"}, {"budget", 99}, {"updatedAt", double(nowMs())}
    }));
    m_transport->enqueueJson(200, QJsonObject{{"id", "c1"}, {"name", "Local"}, {"budget", 99}});

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.synced, 1);

    QJsonObject retried = bodyOf(m_transport->requests.at(1));
    QCOMPARE(retried.value("name").toString(), QString("Local"));
    QCOMPARE(retried.value("budget").toInt(), 99);

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.status, ChangeStatus::Synced);
    QCOMPARE(stored.data.value("budget").toInt(), 99);
    QCOMPARE(m_store->cachedEntity(EntityType::Campaign, "c1").value("budget").toInt(), 99);
}

void TestSyncManager::testConflictLeftForManualResolution()
{
    ConflictResolverOptions options;
    options.defaultResolution = ResolutionAction::Manual;
    int asked = 0;
    options.manualResolutionCallback = [&asked](const PendingChange &, const QJsonObject &) {
        asked++;
        return Resolution();
    };
    m_manager->setConflictResolver(ConflictResolver(options));

    qint64 id = m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c9");
    m_transport->responses.enqueue(conflictResponse(QJsonObject{
        {"id", "c9"}, {"name", "Still here"}, {"updatedAt", double(nowMs())}
    }));

    SyncResult result = m_manager->syncNow();
    QCOMPARE(asked, 1);
    QCOMPARE(result.conflicts, 1);
    QCOMPARE(result.synced, 0);
    QCOMPARE(result.status, SyncStatus::Completed);

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.status, ChangeStatus::Pending);
    QCOMPARE(stored.retryCount, 0);
}

void TestSyncManager::testConflictPersistingAfterRetry()
{
    qint64 id = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "Local"}}, "c1");

    // 412 without a currentData wrapper: the body is the server entity
    TransportResponse conflict = TransportResponse::jsonResponse(412, QJsonObject{
        {"id", "c1"}, {"name", "Server"}, {"updatedAt", double(nowMs())}
    });
    m_transport->responses.enqueue(conflict);
    m_transport->responses.enqueue(conflict);

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.conflicts, 1);
    QCOMPARE(m_transport->requestCount(), 2);

    PendingChange stored = m_store->change(id);
    QCOMPARE(stored.status, ChangeStatus::Pending);
    QCOMPARE(stored.retryCount, 1);
    QCOMPARE(stored.lastError, QString("Conflict persisted after resolution"));
}

// ========== Temporary ids ==========

void TestSyncManager::testTemporaryIdReplacedAfterCreate()
{
    qint64 createId = m_manager->addOfflineChange("campaign", "create", QJsonObject{{"name", "New"}});
    const QString tempId = m_store->change(createId).data.id();
    qint64 updateId = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "Renamed"}}, tempId);

    m_transport->handler = [](const TransportRequest &request) {
        if (request.method == "POST") {
            return TransportResponse::jsonResponse(201, QJsonObject{{"id", "srv-1"}, {"name", "New"}});
        }
        return TransportResponse::jsonResponse(200, QJsonObject());
    };

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.synced, 2);

    QCOMPARE(m_transport->requestCount(), 2);
    QVERIFY(!bodyOf(m_transport->requests.at(0)).contains("id"));
    QCOMPARE(m_transport->requests.at(1).url, QString("/api/campaigns/srv-1"));

    QCOMPARE(m_store->change(updateId).entityId, QString("srv-1"));
    QVERIFY(m_store->cachedEntity(EntityType::Campaign, tempId).isEmpty());
    QCOMPARE(m_store->cachedEntity(EntityType::Campaign, "srv-1").value("name").toString(),
             QString("Renamed"));
}

void TestSyncManager::testChangeDeferredUntilCreateSyncs()
{
    qint64 createId = m_manager->addOfflineChange("campaign", "create", QJsonObject{{"name", "New"}});
    const QString tempId = m_store->change(createId).data.id();
    qint64 deleteId = m_manager->addOfflineChange("campaign", "delete", QJsonValue(), tempId);

    m_transport->enqueueJson(500, QJsonObject());

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.errors, 1);
    QCOMPARE(m_transport->requestCount(), 1);

    PendingChange deferred = m_store->change(deleteId);
    QCOMPARE(deferred.status, ChangeStatus::Pending);
    QCOMPARE(deferred.retryCount, 0);
    QCOMPARE(deferred.entityId, tempId);
    QCOMPARE(m_store->change(createId).retryCount, 1);
}

// ========== Status & control ==========

void TestSyncManager::testSyncStatusAndLog()
{
    SyncStatusInfo before = m_manager->syncStatus();
    QVERIFY(!before.lastSyncTime.isValid());
    QCOMPARE(before.pendingChanges, 0);
    QVERIFY(!before.autoSyncEnabled);

    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c2");
    QCOMPARE(m_manager->syncStatus().pendingChanges, 2);

    m_transport->enqueueJson(500, QJsonObject());
    m_manager->syncNow();

    SyncStatusInfo after = m_manager->syncStatus();
    QVERIFY(after.lastSyncTime.isValid());
    QCOMPARE(after.lastResult, SyncStatus::Failed);
    QCOMPARE(after.status, SyncStatus::Idle);
    QCOMPARE(after.pendingChanges, 1);

    QList<SyncLogEntry> log = m_manager->syncLog(5);
    QCOMPARE(log.size(), 1);
    QCOMPARE(log.first().status, SyncStatus::Failed);
    QCOMPARE(log.first().synced, 1);
    QCOMPARE(log.first().errors, 1);
}

void TestSyncManager::testDisableSyncForEntity()
{
    qint64 a = m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "A"}}, "c1");
    m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "B"}}, "c1");
    m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "C"}}, "c2");
    m_manager->addOfflineChange("filter", "update", QJsonObject{{"name", "F"}}, "c1");

    QVERIFY(m_manager->disableSyncForEntity(EntityType::Campaign, "c1"));
    QCOMPARE(m_store->change(a).status, ChangeStatus::Disabled);
    QCOMPARE(m_manager->pendingChanges().size(), 2);

    m_manager->syncNow();
    QCOMPARE(m_transport->requestCount(), 2);
}

void TestSyncManager::testReconnectTriggersSync()
{
    SyncManagerOptions options;
    options.autoSync = true;
    options.syncIntervalMs = 3600000;
    m_manager->setOptions(options);

    m_monitor->setOnline(false);
    m_manager->addOfflineChange("campaign", "delete", QJsonValue(), "c1");
    QVERIFY(!m_manager->isAutoSyncActive());

    m_monitor->setOnline(true);
    QVERIFY(m_manager->isAutoSyncActive());
    QTRY_COMPARE(m_transport->requestCount(), 1);
    QCOMPARE(m_store->pendingChangeCount(), 0);

    m_monitor->setOnline(false);
    QVERIFY(!m_manager->isAutoSyncActive());
}

QTEST_MAIN(TestSyncManager)
#include "test_syncmanager.moc"
