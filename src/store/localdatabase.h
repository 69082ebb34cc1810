#ifndef LOCALDATABASE_H
#define LOCALDATABASE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QVariant>
#include <QJsonObject>
#include "storeschema.h"

struct sqlite3;

namespace OfflineSync {

/**
 * @brief One logical database of the local store, backed by SQLite
 *
 * Each logical database lives in its own file:
 *   <directory>/<name>.sqlite
 *
 * Every collection is a table holding the JSON form of the stored object
 * plus one column per secondary index. Objects go in and come out as
 * QJsonObject; the primary key is read from (or, for autoIncrement
 * collections, written back into) the object's keyPath field.
 *
 * Each public operation is its own transaction scoped to one collection.
 * There is no cross-collection atomicity.
 *
 * Operations never throw. On failure they return false / an invalid
 * QVariant / an empty object / -1, set lastError() and emit
 * errorOccurred().
 *
 * Usage:
 * @code
 * LocalDatabase db(Schema::offlineData(), storageDir);
 * QVariant id = db.add(Schema::PendingChanges, change.toJson());
 * auto pending = db.getAll(Schema::PendingChanges,
 *                          IndexQuery::equals("status", "pending"));
 * @endcode
 */
class LocalDatabase : public QObject
{
    Q_OBJECT

public:
    /**
     * @param definition Collections and version for this database
     * @param directory Directory holding the database file
     */
    LocalDatabase(const DatabaseDef &definition,
                  const QString &directory,
                  QObject *parent = nullptr);
    ~LocalDatabase() override;

    // ========== Connection ==========

    /**
     * @brief Open the database, creating missing collections and indexes
     *
     * Idempotent. Called lazily by every operation.
     */
    bool open();

    /**
     * @brief Close the connection (reopened lazily on next use)
     */
    void close();

    bool isOpen() const { return m_db != nullptr; }

    QString name() const { return m_definition.name; }
    QString filePath() const;
    const DatabaseDef &definition() const { return m_definition; }

    /**
     * @brief Schema version recorded in the file (0 if never opened)
     */
    int storedVersion();

    bool hasCollection(const QString &collection) const;
    QStringList collectionNames() const;

    // ========== Collection Operations ==========

    /**
     * @brief Get one object by primary key
     * @return The object, or an empty object if not found
     */
    QJsonObject get(const QString &collection, const QVariant &key);

    /**
     * @brief Get all objects matching a query
     *
     * Results are ordered by the queried index (then primary key).
     * A default query returns everything in primary key order.
     *
     * @param limit Maximum number of results, -1 for no limit
     */
    QList<QJsonObject> getAll(const QString &collection,
                              const IndexQuery &query = IndexQuery(),
                              int limit = -1);

    /**
     * @brief Get all objects whose index value equals @p value
     */
    QList<QJsonObject> getByIndex(const QString &collection,
                                  const QString &indexName,
                                  const QVariant &value);

    /**
     * @brief Insert a new object
     *
     * Fails if an object with the same key exists.
     * @return The primary key, or an invalid QVariant on failure
     */
    QVariant add(const QString &collection, const QJsonObject &item);

    /**
     * @brief Insert or replace an object
     * @return The primary key, or an invalid QVariant on failure
     */
    QVariant put(const QString &collection, const QJsonObject &item);

    /**
     * @brief Delete by primary key (deleting a missing key succeeds)
     */
    bool remove(const QString &collection, const QVariant &key);

    /**
     * @brief Count objects matching a query
     * @return Count, or -1 on failure
     */
    int count(const QString &collection, const IndexQuery &query = IndexQuery());

    /**
     * @brief Remove every object from a collection
     */
    bool clear(const QString &collection);

    // ========== Errors ==========

    QString lastError() const { return m_lastError; }

    /**
     * @brief Delete a database file (and its WAL/SHM side files)
     */
    static bool deleteDatabase(const QString &directory, const QString &name);

signals:
    void errorOccurred(const QString &error);

private:
    enum class WriteMode { Insert, Upsert };

    QVariant write(const QString &collection, const QJsonObject &item, WriteMode mode);
    bool ensureSchema();
    bool ensureCollection(const CollectionDef &def);
    bool backfillIndexColumn(const CollectionDef &def, const IndexDef &index);
    bool exec(const QString &sql);
    bool beginTransaction();
    bool commitTransaction();
    void rollbackTransaction();
    QString buildWhere(const CollectionDef &def, const IndexQuery &query,
                       QVariantList &bindings);
    const CollectionDef *collectionFor(const QString &collection);
    void reportError(const QString &message);
    QString sqliteError() const;

    static QString tableName(const QString &collection);
    static QString indexColumn(const QString &indexName);
    static QVariant keyFromItem(const CollectionDef &def, const QJsonObject &item);
    static QVariant indexValue(const QJsonValue &value);

    DatabaseDef m_definition;
    QString m_directory;
    sqlite3 *m_db = nullptr;
    QString m_lastError;
};

} // namespace OfflineSync

#endif // LOCALDATABASE_H
