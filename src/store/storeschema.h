#ifndef STORESCHEMA_H
#define STORESCHEMA_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QVariant>

/**
 * @file storeschema.h
 * @brief Collection/index definitions for the local store
 *
 * A logical database is a named set of collections. Each collection has a
 * primary key (taken from a top-level field of the stored object, or
 * assigned by the store when autoIncrement is set) and zero or more
 * secondary indexes on other top-level fields.
 */

namespace OfflineSync {

/**
 * @brief Secondary index on a top-level field
 */
struct IndexDef {
    QString name;           ///< Index name (e.g. "timestamp")
    QString keyPath;        ///< Field the index reads
    bool unique = false;
};

/**
 * @brief A collection (object store) inside a logical database
 */
struct CollectionDef {
    QString name;
    QString keyPath = QStringLiteral("id");
    bool autoIncrement = false;
    QList<IndexDef> indexes;

    const IndexDef *index(const QString &indexName) const {
        for (const IndexDef &def : indexes) {
            if (def.name == indexName) return &def;
        }
        return nullptr;
    }
};

/**
 * @brief A versioned logical database
 *
 * Bumping the version makes the next open() re-run schema creation, which
 * adds any collections or indexes missing from the file on disk.
 */
struct DatabaseDef {
    QString name;
    int version = 1;
    QList<CollectionDef> collections;

    const CollectionDef *collection(const QString &collectionName) const {
        for (const CollectionDef &def : collections) {
            if (def.name == collectionName) return &def;
        }
        return nullptr;
    }
};

/**
 * @brief Range over index (or primary key) values
 *
 * A null range matches everything. Bounds are inclusive unless the
 * matching open flag is set.
 */
struct KeyRange {
    QVariant lower;
    QVariant upper;
    bool lowerOpen = false;
    bool upperOpen = false;

    bool isNull() const { return !lower.isValid() && !upper.isValid(); }

    static KeyRange only(const QVariant &value) {
        KeyRange range;
        range.lower = value;
        range.upper = value;
        return range;
    }

    static KeyRange lowerBound(const QVariant &value, bool open = false) {
        KeyRange range;
        range.lower = value;
        range.lowerOpen = open;
        return range;
    }

    static KeyRange upperBound(const QVariant &value, bool open = false) {
        KeyRange range;
        range.upper = value;
        range.upperOpen = open;
        return range;
    }

    static KeyRange bound(const QVariant &lower, const QVariant &upper,
                          bool lowerOpen = false, bool upperOpen = false) {
        KeyRange range;
        range.lower = lower;
        range.upper = upper;
        range.lowerOpen = lowerOpen;
        range.upperOpen = upperOpen;
        return range;
    }
};

/**
 * @brief Query against a collection
 *
 * An empty index name queries the primary key.
 */
struct IndexQuery {
    QString index;
    KeyRange range;

    IndexQuery() = default;
    IndexQuery(const QString &indexName, const KeyRange &keyRange)
        : index(indexName), range(keyRange) {}

    static IndexQuery equals(const QString &indexName, const QVariant &value) {
        return IndexQuery(indexName, KeyRange::only(value));
    }
};

namespace Schema {

// Logical database names
extern const QString OfflineRequests;   ///< "offline-requests"
extern const QString OfflineData;       ///< "offline-data"
extern const QString LocalSettings;     ///< "local-settings"
extern const QString OfflineCache;      ///< "offline-cache"

// Collection names
extern const QString Requests;
extern const QString Campaigns;
extern const QString Filters;
extern const QString SyncLog;
extern const QString PendingChanges;
extern const QString Settings;
extern const QString UserPreferences;
extern const QString Responses;

DatabaseDef offlineRequests();
DatabaseDef offlineData();
DatabaseDef localSettings();
DatabaseDef offlineCache();

/**
 * @brief Definition for a database by name, or an empty def if unknown
 */
DatabaseDef byName(const QString &databaseName);

QStringList databaseNames();

} // namespace Schema

} // namespace OfflineSync

#endif // STORESCHEMA_H
