#include "synctypes.h"
#include "store/storeschema.h"

#include <QJsonValue>

namespace OfflineSync {

namespace {

template<typename Enum>
struct EnumName {
    Enum value;
    const char *name;
};

const EnumName<EntityType> kEntityTypes[] = {
    {EntityType::Campaign, "campaign"},
    {EntityType::Filter, "filter"}
};

const EnumName<Operation> kOperations[] = {
    {Operation::Create, "create"},
    {Operation::Update, "update"},
    {Operation::Delete, "delete"}
};

const EnumName<ChangeStatus> kChangeStatuses[] = {
    {ChangeStatus::Pending, "pending"},
    {ChangeStatus::Synced, "synced"},
    {ChangeStatus::Failed, "failed"},
    {ChangeStatus::Disabled, "disabled"}
};

const EnumName<SyncStatus> kSyncStatuses[] = {
    {SyncStatus::Idle, "idle"},
    {SyncStatus::Syncing, "syncing"},
    {SyncStatus::Completed, "completed"},
    {SyncStatus::Failed, "failed"},
    {SyncStatus::Conflict, "conflict"}
};

const EnumName<ResolutionAction> kResolutionActions[] = {
    {ResolutionAction::Local, "local"},
    {ResolutionAction::Server, "server"},
    {ResolutionAction::Merge, "merge"},
    {ResolutionAction::Manual, "manual"}
};

template<typename Enum, size_t N>
QString toName(const EnumName<Enum> (&table)[N], Enum value)
{
    for (const auto &entry : table) {
        if (entry.value == value) return QString::fromLatin1(entry.name);
    }
    return QString();
}

template<typename Enum, size_t N>
Enum fromName(const EnumName<Enum> (&table)[N], const QString &name, bool *ok)
{
    for (const auto &entry : table) {
        if (name == QLatin1String(entry.name)) {
            if (ok) *ok = true;
            return entry.value;
        }
    }
    if (ok) *ok = false;
    return table[0].value;
}

} // namespace

QString entityTypeToString(EntityType type) { return toName(kEntityTypes, type); }
EntityType entityTypeFromString(const QString &name, bool *ok) { return fromName(kEntityTypes, name, ok); }

QString operationToString(Operation operation) { return toName(kOperations, operation); }
Operation operationFromString(const QString &name, bool *ok) { return fromName(kOperations, name, ok); }

QString changeStatusToString(ChangeStatus status) { return toName(kChangeStatuses, status); }
ChangeStatus changeStatusFromString(const QString &name, bool *ok) { return fromName(kChangeStatuses, name, ok); }

QString syncStatusToString(SyncStatus status) { return toName(kSyncStatuses, status); }
SyncStatus syncStatusFromString(const QString &name, bool *ok) { return fromName(kSyncStatuses, name, ok); }

QString resolutionActionToString(ResolutionAction action) { return toName(kResolutionActions, action); }
ResolutionAction resolutionActionFromString(const QString &name, bool *ok) { return fromName(kResolutionActions, name, ok); }

const QList<EntityTypeInfo> &allEntityTypes()
{
    static const QList<EntityTypeInfo> types = {
        {EntityType::Campaign, "campaign", "/api/campaigns", Schema::Campaigns},
        {EntityType::Filter, "filter", "/api/websocket/filters", Schema::Filters}
    };
    return types;
}

EntityTypeInfo entityTypeInfo(EntityType type)
{
    for (const EntityTypeInfo &info : allEntityTypes()) {
        if (info.type == type) return info;
    }
    return allEntityTypes().first();
}

// ========== SyncLogEntry ==========

QJsonObject SyncLogEntry::toJson() const
{
    QJsonObject json;
    if (id > 0) json["id"] = id;
    json["timestamp"] = timestamp;
    json["status"] = syncStatusToString(status);
    json["synced"] = synced;
    json["conflicts"] = conflicts;
    json["errors"] = errors;
    if (!error.isEmpty()) json["error"] = error;
    return json;
}

SyncLogEntry SyncLogEntry::fromJson(const QJsonObject &json)
{
    SyncLogEntry entry;
    entry.id = json.value("id").toInteger();
    entry.timestamp = json.value("timestamp").toInteger();
    entry.status = syncStatusFromString(json.value("status").toString());
    entry.synced = json.value("synced").toInt();
    entry.conflicts = json.value("conflicts").toInt();
    entry.errors = json.value("errors").toInt();
    entry.error = json.value("error").toString();
    return entry;
}

// ========== OfflineRequest ==========

QJsonObject OfflineRequest::toJson() const
{
    QJsonObject json;
    if (id > 0) json["id"] = id;
    json["url"] = url;
    json["method"] = method;
    json["headers"] = headers;
    json["body"] = QString::fromUtf8(body);
    json["timestamp"] = timestamp;
    json["retryCount"] = retryCount;
    if (lastRetry > 0) json["lastRetry"] = lastRetry;
    return json;
}

OfflineRequest OfflineRequest::fromJson(const QJsonObject &json)
{
    OfflineRequest request;
    request.id = json.value("id").toInteger();
    request.url = json.value("url").toString();
    request.method = json.value("method").toString();
    request.headers = json.value("headers").toObject();
    request.body = json.value("body").toString().toUtf8();
    request.timestamp = json.value("timestamp").toInteger();
    request.retryCount = json.value("retryCount").toInt();
    request.lastRetry = json.value("lastRetry").toInteger();
    return request;
}

} // namespace OfflineSync
