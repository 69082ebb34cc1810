#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the offline sync core
 */

namespace OfflineSync {

/**
 * @brief Kinds of entity that can be queued for sync
 */
enum class EntityType {
    Campaign,
    Filter
};

/**
 * @brief Mutation kinds, in the order they are replayed for one type
 */
enum class Operation {
    Create,
    Update,
    Delete
};

/**
 * @brief Lifecycle of a queued change
 *
 * Only moves from Pending to one of the terminal states.
 */
enum class ChangeStatus {
    Pending,
    Synced,
    Failed,         ///< Retries exhausted
    Disabled        ///< Sync switched off for the entity
};

/**
 * @brief Sync Manager state / cycle outcome
 */
enum class SyncStatus {
    Idle,
    Syncing,
    Completed,      ///< Cycle finished without errors
    Failed,         ///< Cycle finished with errors, or could not start
    Conflict        ///< A conflict is being resolved
};

/**
 * @brief Conflict resolution decisions
 */
enum class ResolutionAction {
    Local,          ///< Client version wins
    Server,         ///< Server version wins
    Merge,          ///< Combine both versions
    Manual          ///< Defer to a callback
};

QString entityTypeToString(EntityType type);
EntityType entityTypeFromString(const QString &name, bool *ok = nullptr);

QString operationToString(Operation operation);
Operation operationFromString(const QString &name, bool *ok = nullptr);

QString changeStatusToString(ChangeStatus status);
ChangeStatus changeStatusFromString(const QString &name, bool *ok = nullptr);

QString syncStatusToString(SyncStatus status);
SyncStatus syncStatusFromString(const QString &name, bool *ok = nullptr);

QString resolutionActionToString(ResolutionAction action);
ResolutionAction resolutionActionFromString(const QString &name, bool *ok = nullptr);

/**
 * @brief Static description of a syncable entity type
 */
struct EntityTypeInfo {
    EntityType type;
    QString name;           ///< "campaign", "filter"
    QString basePath;       ///< REST collection path on the server
    QString collection;     ///< Local cache collection
};

const QList<EntityTypeInfo> &allEntityTypes();
EntityTypeInfo entityTypeInfo(EntityType type);

/**
 * @brief Milliseconds since epoch, the unit of every stored timestamp
 */
inline qint64 nowMs() { return QDateTime::currentMSecsSinceEpoch(); }

/**
 * @brief One row of the sync history, written once per cycle
 */
struct SyncLogEntry {
    qint64 id = 0;
    qint64 timestamp = 0;
    SyncStatus status = SyncStatus::Idle;
    int synced = 0;
    int conflicts = 0;
    int errors = 0;
    QString error;          ///< Empty unless the cycle aborted

    QJsonObject toJson() const;
    static SyncLogEntry fromJson(const QJsonObject &json);
};

/**
 * @brief Progress report emitted after each processed change
 */
struct SyncProgress {
    int processed = 0;
    int total = 0;

    int percentage() const {
        return total > 0 ? (processed * 200 + total) / (2 * total) : 100;
    }
};

/**
 * @brief Result of one sync cycle
 */
struct SyncResult {
    SyncStatus status = SyncStatus::Idle;
    int synced = 0;
    int conflicts = 0;
    int errors = 0;
    int total = 0;
    QString errorMessage;
    QDateTime startTime;
    QDateTime endTime;

    bool success() const { return status == SyncStatus::Completed; }

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const {
        return QString("Synced: %1, Conflicts: %2, Errors: %3, Total: %4")
            .arg(synced).arg(conflicts).arg(errors).arg(total);
    }
};

/**
 * @brief Snapshot returned by SyncManager::syncStatus()
 */
struct SyncStatusInfo {
    SyncStatus status = SyncStatus::Idle;
    SyncStatus lastResult = SyncStatus::Idle;   ///< Outcome of the last cycle
    QDateTime lastSyncTime;     ///< Invalid until the first finished cycle
    int pendingChanges = 0;
    bool autoSyncEnabled = false;
};

/**
 * @brief A mutation captured while offline by the request interceptor
 */
struct OfflineRequest {
    qint64 id = 0;
    QString url;
    QString method;
    QJsonObject headers;
    QByteArray body;
    qint64 timestamp = 0;
    int retryCount = 0;
    qint64 lastRetry = 0;

    QJsonObject toJson() const;
    static OfflineRequest fromJson(const QJsonObject &json);
};

} // namespace OfflineSync

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(OfflineSync::SyncStatus)
Q_DECLARE_METATYPE(OfflineSync::SyncResult)
Q_DECLARE_METATYPE(OfflineSync::SyncProgress)

#endif // SYNCTYPES_H
