#include "storeschema.h"

namespace OfflineSync {
namespace Schema {

const QString OfflineRequests = QStringLiteral("offline-requests");
const QString OfflineData = QStringLiteral("offline-data");
const QString LocalSettings = QStringLiteral("local-settings");
const QString OfflineCache = QStringLiteral("offline-cache");

const QString Requests = QStringLiteral("requests");
const QString Campaigns = QStringLiteral("campaigns");
const QString Filters = QStringLiteral("filters");
const QString SyncLog = QStringLiteral("syncLog");
const QString PendingChanges = QStringLiteral("pendingChanges");
const QString Settings = QStringLiteral("settings");
const QString UserPreferences = QStringLiteral("userPreferences");
const QString Responses = QStringLiteral("responses");

DatabaseDef offlineRequests()
{
    DatabaseDef db;
    db.name = OfflineRequests;
    db.version = 1;

    CollectionDef requests;
    requests.name = Requests;
    requests.keyPath = "id";
    requests.autoIncrement = true;
    requests.indexes = {
        {"url", "url", false},
        {"timestamp", "timestamp", false}
    };
    db.collections << requests;

    return db;
}

DatabaseDef offlineData()
{
    DatabaseDef db;
    db.name = OfflineData;
    // v2 added the status index on pendingChanges
    db.version = 2;

    CollectionDef campaigns;
    campaigns.name = Campaigns;
    campaigns.keyPath = "id";
    campaigns.indexes = {
        {"entityType", "entityType", false},
        {"updatedAt", "updatedAt", false}
    };

    CollectionDef filters;
    filters.name = Filters;
    filters.keyPath = "id";
    filters.indexes = {
        {"category", "category", false},
        {"updatedAt", "updatedAt", false}
    };

    CollectionDef syncLog;
    syncLog.name = SyncLog;
    syncLog.keyPath = "id";
    syncLog.autoIncrement = true;
    syncLog.indexes = {
        {"timestamp", "timestamp", false},
        {"status", "status", false}
    };

    CollectionDef pendingChanges;
    pendingChanges.name = PendingChanges;
    pendingChanges.keyPath = "id";
    pendingChanges.autoIncrement = true;
    pendingChanges.indexes = {
        {"entityId", "entityId", false},
        {"entityType", "entityType", false},
        {"operation", "operation", false},
        {"timestamp", "timestamp", false},
        {"status", "status", false}
    };

    db.collections << campaigns << filters << syncLog << pendingChanges;
    return db;
}

DatabaseDef localSettings()
{
    DatabaseDef db;
    db.name = LocalSettings;
    db.version = 1;

    CollectionDef settings;
    settings.name = Settings;
    settings.keyPath = "key";

    CollectionDef preferences;
    preferences.name = UserPreferences;
    preferences.keyPath = "key";

    db.collections << settings << preferences;
    return db;
}

DatabaseDef offlineCache()
{
    DatabaseDef db;
    db.name = OfflineCache;
    db.version = 1;

    CollectionDef responses;
    responses.name = Responses;
    responses.keyPath = "key";
    responses.indexes = {
        {"cacheName", "cacheName", false},
        {"cachedAt", "cachedAt", false}
    };

    db.collections << responses;
    return db;
}

DatabaseDef byName(const QString &databaseName)
{
    if (databaseName == OfflineRequests) return offlineRequests();
    if (databaseName == OfflineData) return offlineData();
    if (databaseName == LocalSettings) return localSettings();
    if (databaseName == OfflineCache) return offlineCache();
    return DatabaseDef();
}

QStringList databaseNames()
{
    return {OfflineRequests, OfflineData, LocalSettings, OfflineCache};
}

} // namespace Schema
} // namespace OfflineSync
