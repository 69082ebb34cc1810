/**
 * @file test_offlinemanager.cpp
 * @brief Integration tests for OfflineManager
 *
 * Exercises the wired-up components: profile configuration, the entity
 * helpers, offline capture and the background replay thread.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QDir>
#include "offlinemanager.h"
#include "profile.h"
#include "store/offlinestore.h"
#include "sync/syncmanager.h"
#include "sync/connectivitymonitor.h"
#include "background/backgroundscheduler.h"
#include "background/backgroundsyncworker.h"
#include "mocktransport.h"

using namespace OfflineSync;

class TestOfflineManager : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Setup ==========
    void testInitialize();
    void testConfigureFromProfile();
    void testConfigureIgnoresUnknownResolutions();

    // ========== Entity helpers ==========
    void testSaveAndReadFilters();
    void testUpdateFilterOffline();
    void testUpdateMissingFilterFails();
    void testUpdateFilterRejectsInvalidData();
    void testCreateFilterOffline();
    void testDeleteFilterOffline();
    void testCampaignHelpers();

    // ========== Sync ==========
    void testAddOfflineChangeAndSync();
    void testConflictHandler();

    // ========== Requests ==========
    void testOfflineFetchRegistersSyncTag();
    void testBackgroundReplay();

    // ========== Preferences & maintenance ==========
    void testPreferences();
    void testClearOfflineData();

private:
    QString storagePath() const { return m_tempDir->filePath("store"); }

    QTemporaryDir *m_tempDir;
    MockTransport *m_transport;
    OfflineManager *m_manager;
};

void TestOfflineManager::initTestCase()
{
    qDebug() << "Starting OfflineManager tests";
}

void TestOfflineManager::cleanupTestCase()
{
    qDebug() << "OfflineManager tests complete";
}

void TestOfflineManager::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    QVERIFY(QDir().mkpath(storagePath()));

    m_transport = new MockTransport();
    m_manager = new OfflineManager(storagePath(), m_transport);

    Profile profile(m_tempDir->path());
    profile.setAutoSync(false);
    m_manager->configure(profile);
    QVERIFY(m_manager->initialize());
}

void TestOfflineManager::cleanup()
{
    delete m_manager;
    m_manager = nullptr;
    delete m_transport;
    m_transport = nullptr;
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ========== Setup ==========

void TestOfflineManager::testInitialize()
{
    QVERIFY(m_manager->isInitialized());
    QVERIFY(m_manager->initialize());
    QVERIFY(m_manager->isOnline());
    QVERIFY(QFile::exists(QDir(storagePath()).filePath("offline-data.sqlite")));
    QCOMPARE(m_manager->pendingChangesCount(), 0);
    QVERIFY(!m_manager->syncManager()->isAutoSyncActive());
}

void TestOfflineManager::testConfigureFromProfile()
{
    Profile profile(m_tempDir->path());
    profile.setAutoSync(false);
    profile.setSyncIntervalMs(5000);
    profile.setMaxRetries(5);
    profile.setPriorityEntities(QStringList({"filter", "campaign"}));
    profile.setDefaultResolution("local");
    profile.setAutoResolveThresholdMs(30000);
    profile.setFieldResolution("budget", "server");
    profile.setFieldResolution("tags", "merge");

    m_manager->configure(profile);

    const SyncManagerOptions &options = m_manager->syncManager()->options();
    QCOMPARE(options.syncIntervalMs, 5000);
    QCOMPARE(options.maxRetries, 5);
    QCOMPARE(options.priorityEntities, QStringList({"filter", "campaign"}));

    const ConflictResolverOptions &resolver = m_manager->syncManager()->conflictResolver().options();
    QCOMPARE(resolver.defaultResolution, ResolutionAction::Local);
    QCOMPARE(resolver.autoResolveThresholdMs, qint64(30000));
    QCOMPARE(resolver.fieldResolutions.value("budget"), ResolutionAction::Server);
    QCOMPARE(resolver.fieldResolutions.value("tags"), ResolutionAction::Merge);
}

void TestOfflineManager::testConfigureIgnoresUnknownResolutions()
{
    Profile profile(m_tempDir->path());
    profile.setAutoSync(false);
    profile.setDefaultResolution("coin-toss");
    profile.setFieldResolution("budget", "whatever");

    m_manager->configure(profile);

    const ConflictResolverOptions &resolver = m_manager->syncManager()->conflictResolver().options();
    QCOMPARE(resolver.defaultResolution, ResolutionAction::Server);
    QVERIFY(!resolver.fieldResolutions.contains("budget"));
}

// ========== Entity helpers ==========

void TestOfflineManager::testSaveAndReadFilters()
{
    QVERIFY(!m_manager->saveFilterOffline(QJsonObject{{"name", "No id"}}));

    QVERIFY(m_manager->saveFilterOffline(QJsonObject{{"id", "f1"}, {"name", "Errors"}}));
    QVERIFY(m_manager->saveFilterOffline(QJsonObject{{"id", 2}, {"name", "Warnings"}}));

    QCOMPARE(m_manager->offlineFilter("f1").value("name").toString(), QString("Errors"));
    QCOMPARE(m_manager->offlineFilter("2").value("name").toString(), QString("Warnings"));
    QCOMPARE(m_manager->allOfflineFilters().size(), 2);
    QVERIFY(m_manager->offlineFilter("missing").isEmpty());

    // Caching is not a change
    QCOMPARE(m_manager->pendingChangesCount(), 0);
}

void TestOfflineManager::testUpdateFilterOffline()
{
    m_manager->saveFilterOffline(QJsonObject{{"id", "f1"}, {"name", "Errors"}, {"category", "logs"}});

    QVERIFY(m_manager->updateFilterOffline("f1", QJsonObject{{"name", "Critical"}}));

    QList<PendingChange> pending = m_manager->pendingChanges();
    QCOMPARE(pending.size(), 1);
    QCOMPARE(pending.first().operation, Operation::Update);
    QCOMPARE(pending.first().entityType, EntityType::Filter);
    QCOMPARE(pending.first().entityId, QString("f1"));
    QCOMPARE(pending.first().data.value("name").toString(), QString("Critical"));
    QCOMPARE(pending.first().data.value("category").toString(), QString("logs"));

    QCOMPARE(m_manager->offlineFilter("f1").value("name").toString(), QString("Critical"));
}

void TestOfflineManager::testUpdateMissingFilterFails()
{
    QVERIFY(!m_manager->updateFilterOffline("nope", QJsonObject{{"name", "x"}}));
    QCOMPARE(m_manager->pendingChangesCount(), 0);
}

void TestOfflineManager::testUpdateFilterRejectsInvalidData()
{
    m_manager->saveFilterOffline(QJsonObject{{"id", "f1"}, {"name", "Errors"}});

    QVERIFY(!m_manager->updateFilterOffline("f1", QJsonObject{{"active", "yes"}}));
    QCOMPARE(m_manager->pendingChangesCount(), 0);
}

void TestOfflineManager::testCreateFilterOffline()
{
    QJsonObject created = m_manager->createFilterOffline(QJsonObject{{"name", "New"}});
    QVERIFY(!created.isEmpty());

    const QString id = created.value("id").toString();
    QVERIFY(SyncManager::isTemporaryId(id));
    QVERIFY(QDateTime::fromString(created.value("createdAt").toString(), Qt::ISODateWithMs).isValid());
    QCOMPARE(created.value("createdAt"), created.value("updatedAt"));

    QCOMPARE(m_manager->pendingChangesCount(), 1);
    QCOMPARE(m_manager->pendingChanges().first().operation, Operation::Create);
    QCOMPARE(m_manager->offlineFilter(id).value("name").toString(), QString("New"));

    // Invalid payloads are rejected without queueing
    QVERIFY(m_manager->createFilterOffline(QJsonObject{{"conditions", 5}}).isEmpty());
    QCOMPARE(m_manager->pendingChangesCount(), 1);
}

void TestOfflineManager::testDeleteFilterOffline()
{
    QVERIFY(m_manager->deleteFilterOffline("f1"));
    QVERIFY(!m_manager->deleteFilterOffline(QString()));

    QList<PendingChange> pending = m_manager->pendingChanges();
    QCOMPARE(pending.size(), 1);
    QCOMPARE(pending.first().operation, Operation::Delete);
    QVERIFY(pending.first().data.isNull());
}

void TestOfflineManager::testCampaignHelpers()
{
    QVERIFY(m_manager->saveEntityOffline(EntityType::Campaign, QJsonObject{{"id", "c1"}, {"budget", 10}}));
    QVERIFY(m_manager->updateEntityOffline(EntityType::Campaign, "c1", QJsonObject{{"budget", 25}}));
    QCOMPARE(m_manager->offlineEntity(EntityType::Campaign, "c1").value("budget").toInt(), 25);
    QCOMPARE(m_manager->allOfflineEntities(EntityType::Campaign).size(), 1);
    QVERIFY(m_manager->allOfflineFilters().isEmpty());
}

// ========== Sync ==========

void TestOfflineManager::testAddOfflineChangeAndSync()
{
    QVERIFY(m_manager->addOfflineChange("campaign", "update", QJsonObject{{"name", "A"}}, "c1") > 0);
    QCOMPARE(m_manager->syncStatus().pendingChanges, 1);

    SyncResult result = m_manager->syncNow();
    QCOMPARE(result.status, SyncStatus::Completed);
    QCOMPARE(result.synced, 1);
    QCOMPARE(m_transport->requestCount(), 1);
    QCOMPARE(m_manager->pendingChangesCount(), 0);

    bool threw = false;
    try {
        m_manager->addOfflineChange("widget", "update", QJsonObject(), "1");
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    QVERIFY(threw);
}

void TestOfflineManager::testConflictHandler()
{
    QStringList seen;
    m_manager->setConflictHandler([&seen](const PendingChange &change, const QJsonObject &serverData) {
        seen.append(change.entityId + ":" + serverData.value("name").toString());
        return Resolution::make(ResolutionAction::Server, "user-choice");
    });

    m_manager->deleteFilterOffline("f1");
    m_transport->responses.enqueue(TransportResponse::jsonResponse(412, QJsonObject{
        {"currentData", QJsonObject{{"id", "f1"}, {"name", "Kept"}, {"updatedAt", double(nowMs())}}}
    }));

    SyncResult result = m_manager->syncNow();
    QCOMPARE(seen, QStringList({"f1:Kept"}));
    QCOMPARE(result.synced, 1);
    QCOMPARE(m_manager->offlineFilter("f1").value("name").toString(), QString("Kept"));
}

// ========== Requests ==========

void TestOfflineManager::testOfflineFetchRegistersSyncTag()
{
    BackgroundScheduler *scheduler = m_manager->scheduler();
    QVERIFY(!scheduler->isRegistered(BackgroundScheduler::SyncTag));

    m_manager->connectivityMonitor()->setOnline(false);
    QVERIFY(!m_manager->isOnline());

    TransportRequest request;
    request.method = "PUT";
    request.url = "/api/websocket/filters/f1";
    request.body = "{\"name\":\"x\"}";

    TransportResponse response = m_manager->fetch(request);
    QCOMPARE(response.status, 202);
    QVERIFY(scheduler->isRegistered(BackgroundScheduler::SyncTag));
    QCOMPARE(m_manager->store()->pendingRequests().size(), 1);
}

void TestOfflineManager::testBackgroundReplay()
{
    MockTransport *workerTransport = new MockTransport();
    workerTransport->defaultResponse = TransportResponse::jsonResponse(200, QJsonObject{{"ok", true}});
    QVERIFY(m_manager->enableBackgroundSync(workerTransport));
    QVERIFY(m_manager->backgroundService()->isRunning());

    m_manager->connectivityMonitor()->setOnline(false);

    TransportRequest request;
    request.method = "POST";
    request.url = "/api/campaigns";
    request.body = "{\"name\":\"Offline\"}";
    QCOMPARE(m_manager->fetch(request).status, 202);
    QVERIFY(m_manager->scheduler()->isRegistered(BackgroundScheduler::SyncTag));

    QSignalSpy replaySpy(m_manager->backgroundService(), &BackgroundSyncService::replayFinished);

    // Reconnecting wakes the tag and the worker thread replays the log
    m_manager->connectivityMonitor()->setOnline(true);

    QTRY_COMPARE(replaySpy.count(), 1);
    QCOMPARE(replaySpy.first().at(0).toInt(), 1);
    QCOMPARE(replaySpy.first().at(2).toInt(), 0);
    QVERIFY(m_manager->store()->pendingRequests().isEmpty());
    QVERIFY(!m_manager->scheduler()->isRegistered(BackgroundScheduler::SyncTag));
    QVERIFY(!m_manager->backgroundService()->isBusy());
}

// ========== Preferences & maintenance ==========

void TestOfflineManager::testPreferences()
{
    QCOMPARE(m_manager->preference("pageSize", 25).toInt(), 25);
    QVERIFY(m_manager->savePreference("pageSize", 50));
    QCOMPARE(m_manager->preference("pageSize", 25).toInt(), 50);
}

void TestOfflineManager::testClearOfflineData()
{
    m_manager->saveFilterOffline(QJsonObject{{"id", "f1"}});
    m_manager->deleteFilterOffline("f2");
    m_manager->savePreference("theme", "dark");

    QVERIFY(m_manager->clearOfflineData());

    QCOMPARE(m_manager->pendingChangesCount(), 0);
    QVERIFY(m_manager->allOfflineFilters().isEmpty());
    QCOMPARE(m_manager->preference("theme").toString(), QString("dark"));
}

QTEST_MAIN(TestOfflineManager)
#include "test_offlinemanager.moc"
