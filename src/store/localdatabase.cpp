#include "localdatabase.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QSet>
#include <QDebug>

#include <sqlite3.h>

#include <cmath>

namespace OfflineSync {

namespace {

const int kBusyTimeoutMs = 5000;

/**
 * Prepared statement wrapper. Finalizes on destruction.
 */
class Statement
{
public:
    Statement(sqlite3 *db, const QString &sql)
    {
        const QByteArray utf8 = sql.toUtf8();
        m_rc = sqlite3_prepare_v2(db, utf8.constData(), -1, &m_stmt, nullptr);
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    bool isValid() const { return m_rc == SQLITE_OK && m_stmt != nullptr; }

    bool bind(int index, const QVariant &value)
    {
        int rc = SQLITE_OK;
        if (!value.isValid() || value.typeId() == QMetaType::Nullptr) {
            rc = sqlite3_bind_null(m_stmt, index);
        } else {
            switch (value.typeId()) {
            case QMetaType::Bool:
                rc = sqlite3_bind_int(m_stmt, index, value.toBool() ? 1 : 0);
                break;
            case QMetaType::Int:
            case QMetaType::UInt:
            case QMetaType::Long:
            case QMetaType::LongLong:
            case QMetaType::ULongLong:
                rc = sqlite3_bind_int64(m_stmt, index, value.toLongLong());
                break;
            case QMetaType::Double:
            case QMetaType::Float: {
                double d = value.toDouble();
                if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
                    rc = sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(d));
                } else {
                    rc = sqlite3_bind_double(m_stmt, index, d);
                }
                break;
            }
            default: {
                const QByteArray utf8 = value.toString().toUtf8();
                rc = sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(),
                                       SQLITE_TRANSIENT);
                break;
            }
            }
        }
        return rc == SQLITE_OK;
    }

    bool bindAll(const QVariantList &values)
    {
        for (int i = 0; i < values.size(); ++i) {
            if (!bind(i + 1, values.at(i))) return false;
        }
        return true;
    }

    int step() { return sqlite3_step(m_stmt); }

    QVariant column(int index) const
    {
        switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return QVariant(static_cast<qint64>(sqlite3_column_int64(m_stmt, index)));
        case SQLITE_FLOAT:
            return QVariant(sqlite3_column_double(m_stmt, index));
        case SQLITE_TEXT:
            return QVariant(text(index));
        default:
            return QVariant();
        }
    }

    QString text(int index) const
    {
        const char *raw = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, index));
        if (!raw) return QString();
        return QString::fromUtf8(raw, sqlite3_column_bytes(m_stmt, index));
    }

    QJsonObject object(int index) const
    {
        return QJsonDocument::fromJson(text(index).toUtf8()).object();
    }

private:
    sqlite3_stmt *m_stmt = nullptr;
    int m_rc = SQLITE_ERROR;
};

QString quoted(const QString &identifier)
{
    QString escaped = identifier;
    escaped.replace('"', "\"\"");
    return '"' + escaped + '"';
}

} // namespace

LocalDatabase::LocalDatabase(const DatabaseDef &definition,
                             const QString &directory,
                             QObject *parent)
    : QObject(parent)
    , m_definition(definition)
    , m_directory(directory)
{
}

LocalDatabase::~LocalDatabase()
{
    close();
}

QString LocalDatabase::filePath() const
{
    return QDir(m_directory).filePath(m_definition.name + ".sqlite");
}

bool LocalDatabase::hasCollection(const QString &collection) const
{
    return m_definition.collection(collection) != nullptr;
}

QStringList LocalDatabase::collectionNames() const
{
    QStringList names;
    for (const CollectionDef &def : m_definition.collections) {
        names << def.name;
    }
    return names;
}

// ========== Connection ==========

bool LocalDatabase::open()
{
    if (m_db) {
        return true;
    }

    if (m_definition.name.isEmpty()) {
        reportError("Cannot open a database without a name");
        return false;
    }

    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(".")) {
        reportError(QString("Failed to create storage directory: %1").arg(m_directory));
        return false;
    }

    const QByteArray path = filePath().toUtf8();
    int rc = sqlite3_open_v2(path.constData(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        QString error = m_db ? QString::fromUtf8(sqlite3_errmsg(m_db))
                             : QString("out of memory");
        sqlite3_close(m_db);
        m_db = nullptr;
        reportError(QString("Failed to open %1: %2").arg(filePath(), error));
        return false;
    }

    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    if (!exec("PRAGMA journal_mode=WAL") || !ensureSchema()) {
        close();
        return false;
    }

    qDebug() << "[LocalDatabase] Opened" << m_definition.name
             << "version" << m_definition.version << "at" << filePath();
    return true;
}

void LocalDatabase::close()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

int LocalDatabase::storedVersion()
{
    if (!open()) {
        return 0;
    }

    Statement stmt(m_db, "PRAGMA user_version");
    if (!stmt.isValid() || stmt.step() != SQLITE_ROW) {
        reportError(QString("Failed to read schema version: %1").arg(sqliteError()));
        return 0;
    }
    return stmt.column(0).toInt();
}

bool LocalDatabase::ensureSchema()
{
    int current = 0;
    {
        Statement stmt(m_db, "PRAGMA user_version");
        if (stmt.isValid() && stmt.step() == SQLITE_ROW) {
            current = stmt.column(0).toInt();
        }
    }

    if (current == m_definition.version) {
        return true;
    }

    if (current > m_definition.version) {
        reportError(QString("Database %1 has version %2, newer than supported %3")
                    .arg(m_definition.name).arg(current).arg(m_definition.version));
        return false;
    }

    if (!beginTransaction()) {
        return false;
    }

    for (const CollectionDef &def : m_definition.collections) {
        if (!ensureCollection(def)) {
            rollbackTransaction();
            return false;
        }
    }

    if (!exec(QString("PRAGMA user_version = %1").arg(m_definition.version))) {
        rollbackTransaction();
        return false;
    }

    if (!commitTransaction()) {
        return false;
    }

    qDebug() << "[LocalDatabase] Upgraded" << m_definition.name
             << "from version" << current << "to" << m_definition.version;
    return true;
}

bool LocalDatabase::ensureCollection(const CollectionDef &def)
{
    const QString table = tableName(def.name);
    const QString pkColumn = def.autoIncrement
        ? QString("pk INTEGER PRIMARY KEY AUTOINCREMENT")
        : QString("pk NOT NULL PRIMARY KEY");

    if (!exec(QString("CREATE TABLE IF NOT EXISTS %1 (%2, value TEXT NOT NULL)")
              .arg(table, pkColumn))) {
        return false;
    }

    QSet<QString> columns;
    {
        Statement info(m_db, QString("PRAGMA table_info(%1)").arg(table));
        if (!info.isValid()) {
            reportError(QString("Failed to inspect %1: %2").arg(def.name, sqliteError()));
            return false;
        }
        while (info.step() == SQLITE_ROW) {
            columns.insert(info.text(1));
        }
    }

    for (const IndexDef &index : def.indexes) {
        const QString column = indexColumn(index.name);
        if (!columns.contains(column)) {
            if (!exec(QString("ALTER TABLE %1 ADD COLUMN %2").arg(table, quoted(column)))) {
                return false;
            }
            if (!backfillIndexColumn(def, index)) {
                return false;
            }
        }

        const QString sqlIndex = quoted(QString("idx_%1_%2").arg(def.name, index.name));
        if (!exec(QString("CREATE %1INDEX IF NOT EXISTS %2 ON %3 (%4)")
                  .arg(index.unique ? "UNIQUE " : "", sqlIndex, table, quoted(column)))) {
            return false;
        }
    }

    return true;
}

bool LocalDatabase::backfillIndexColumn(const CollectionDef &def, const IndexDef &index)
{
    const QString table = tableName(def.name);
    QList<QPair<QVariant, QVariant>> updates;

    {
        Statement select(m_db, QString("SELECT pk, value FROM %1").arg(table));
        if (!select.isValid()) {
            reportError(QString("Failed to scan %1: %2").arg(def.name, sqliteError()));
            return false;
        }
        while (select.step() == SQLITE_ROW) {
            QJsonObject item = select.object(1);
            updates.append(qMakePair(select.column(0), indexValue(item.value(index.keyPath))));
        }
    }

    for (const auto &update : updates) {
        Statement stmt(m_db, QString("UPDATE %1 SET %2 = ? WHERE pk = ?")
                       .arg(table, quoted(indexColumn(index.name))));
        if (!stmt.isValid() || !stmt.bind(1, update.second) || !stmt.bind(2, update.first)
            || stmt.step() != SQLITE_DONE) {
            reportError(QString("Failed to backfill index %1 on %2: %3")
                        .arg(index.name, def.name, sqliteError()));
            return false;
        }
    }

    if (!updates.isEmpty()) {
        qDebug() << "[LocalDatabase] Backfilled index" << index.name
                 << "on" << def.name << "for" << updates.size() << "objects";
    }
    return true;
}

// ========== Collection Operations ==========

QJsonObject LocalDatabase::get(const QString &collection, const QVariant &key)
{
    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return QJsonObject();
    }

    Statement stmt(m_db, QString("SELECT value FROM %1 WHERE pk = ?").arg(tableName(def->name)));
    if (!stmt.isValid() || !stmt.bind(1, key)) {
        reportError(QString("get on %1 failed: %2").arg(collection, sqliteError()));
        return QJsonObject();
    }

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return stmt.object(0);
    }
    if (rc != SQLITE_DONE) {
        reportError(QString("get on %1 failed: %2").arg(collection, sqliteError()));
    }
    return QJsonObject();
}

QList<QJsonObject> LocalDatabase::getAll(const QString &collection,
                                         const IndexQuery &query,
                                         int limit)
{
    QList<QJsonObject> results;

    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return results;
    }

    QVariantList bindings;
    QString where = buildWhere(*def, query, bindings);
    if (where.isNull()) {
        return results;
    }

    QString orderColumn = query.index.isEmpty() ? QString("pk") : quoted(indexColumn(query.index));
    QString sql = QString("SELECT value FROM %1%2 ORDER BY %3, pk")
                  .arg(tableName(def->name), where, orderColumn);
    if (limit >= 0) {
        sql += QString(" LIMIT %1").arg(limit);
    }

    Statement stmt(m_db, sql);
    if (!stmt.isValid() || !stmt.bindAll(bindings)) {
        reportError(QString("getAll on %1 failed: %2").arg(collection, sqliteError()));
        return results;
    }

    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.append(stmt.object(0));
    }
    if (rc != SQLITE_DONE) {
        reportError(QString("getAll on %1 failed: %2").arg(collection, sqliteError()));
        results.clear();
    }

    return results;
}

QList<QJsonObject> LocalDatabase::getByIndex(const QString &collection,
                                             const QString &indexName,
                                             const QVariant &value)
{
    return getAll(collection, IndexQuery::equals(indexName, value));
}

QVariant LocalDatabase::add(const QString &collection, const QJsonObject &item)
{
    return write(collection, item, WriteMode::Insert);
}

QVariant LocalDatabase::put(const QString &collection, const QJsonObject &item)
{
    return write(collection, item, WriteMode::Upsert);
}

QVariant LocalDatabase::write(const QString &collection, const QJsonObject &item, WriteMode mode)
{
    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return QVariant();
    }

    QVariant key = keyFromItem(*def, item);
    if (!key.isValid() && !def->autoIncrement) {
        reportError(QString("Object for %1 has no '%2' key").arg(collection, def->keyPath));
        return QVariant();
    }

    QStringList columns;
    QVariantList values;
    if (key.isValid()) {
        columns << "pk";
        values << key;
    }
    columns << "value";
    values << QString::fromUtf8(QJsonDocument(item).toJson(QJsonDocument::Compact));
    for (const IndexDef &index : def->indexes) {
        columns << quoted(indexColumn(index.name));
        values << indexValue(item.value(index.keyPath));
    }

    QStringList placeholders;
    for (int i = 0; i < columns.size(); ++i) {
        placeholders << "?";
    }

    const QString table = tableName(def->name);
    const QString verb = mode == WriteMode::Insert ? "INSERT" : "INSERT OR REPLACE";

    if (!beginTransaction()) {
        return QVariant();
    }

    {
        Statement stmt(m_db, QString("%1 INTO %2 (%3) VALUES (%4)")
                       .arg(verb, table, columns.join(", "), placeholders.join(", ")));
        if (!stmt.isValid() || !stmt.bindAll(values) || stmt.step() != SQLITE_DONE) {
            reportError(QString("Write to %1 failed: %2").arg(collection, sqliteError()));
            rollbackTransaction();
            return QVariant();
        }
    }

    if (!key.isValid()) {
        // Store-assigned key goes back into the stored object
        qint64 rowId = sqlite3_last_insert_rowid(m_db);
        key = QVariant(rowId);

        QJsonObject stored = item;
        stored.insert(def->keyPath, QJsonValue(rowId));

        Statement update(m_db, QString("UPDATE %1 SET value = ? WHERE pk = ?").arg(table));
        if (!update.isValid()
            || !update.bind(1, QString::fromUtf8(QJsonDocument(stored).toJson(QJsonDocument::Compact)))
            || !update.bind(2, key)
            || update.step() != SQLITE_DONE) {
            reportError(QString("Write to %1 failed: %2").arg(collection, sqliteError()));
            rollbackTransaction();
            return QVariant();
        }
    }

    if (!commitTransaction()) {
        return QVariant();
    }

    return key;
}

bool LocalDatabase::remove(const QString &collection, const QVariant &key)
{
    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return false;
    }

    if (!beginTransaction()) {
        return false;
    }

    {
        Statement stmt(m_db, QString("DELETE FROM %1 WHERE pk = ?").arg(tableName(def->name)));
        if (!stmt.isValid() || !stmt.bind(1, key) || stmt.step() != SQLITE_DONE) {
            reportError(QString("Delete from %1 failed: %2").arg(collection, sqliteError()));
            rollbackTransaction();
            return false;
        }
    }

    return commitTransaction();
}

int LocalDatabase::count(const QString &collection, const IndexQuery &query)
{
    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return -1;
    }

    QVariantList bindings;
    QString where = buildWhere(*def, query, bindings);
    if (where.isNull()) {
        return -1;
    }

    Statement stmt(m_db, QString("SELECT COUNT(*) FROM %1%2").arg(tableName(def->name), where));
    if (!stmt.isValid() || !stmt.bindAll(bindings) || stmt.step() != SQLITE_ROW) {
        reportError(QString("count on %1 failed: %2").arg(collection, sqliteError()));
        return -1;
    }

    return stmt.column(0).toInt();
}

bool LocalDatabase::clear(const QString &collection)
{
    const CollectionDef *def = collectionFor(collection);
    if (!def || !open()) {
        return false;
    }

    if (!beginTransaction()) {
        return false;
    }
    if (!exec(QString("DELETE FROM %1").arg(tableName(def->name)))) {
        rollbackTransaction();
        return false;
    }
    return commitTransaction();
}

bool LocalDatabase::deleteDatabase(const QString &directory, const QString &name)
{
    const QString path = QDir(directory).filePath(name + ".sqlite");
    QFile::remove(path + "-wal");
    QFile::remove(path + "-shm");

    if (!QFile::exists(path)) {
        return true;
    }
    if (!QFile::remove(path)) {
        qWarning() << "[LocalDatabase] Failed to delete" << path;
        return false;
    }

    qDebug() << "[LocalDatabase] Deleted database" << name;
    return true;
}

// ========== Helpers ==========

QString LocalDatabase::buildWhere(const CollectionDef &def, const IndexQuery &query,
                                  QVariantList &bindings)
{
    if (!query.index.isEmpty() && !def.index(query.index)) {
        reportError(QString("Collection %1 has no index '%2'").arg(def.name, query.index));
        return QString();
    }

    if (query.range.isNull()) {
        return QString("");
    }

    const QString column = query.index.isEmpty() ? QString("pk") : quoted(indexColumn(query.index));
    QStringList clauses;

    if (query.range.lower.isValid()) {
        clauses << QString("%1 %2 ?").arg(column, query.range.lowerOpen ? ">" : ">=");
        bindings << query.range.lower;
    }
    if (query.range.upper.isValid()) {
        clauses << QString("%1 %2 ?").arg(column, query.range.upperOpen ? "<" : "<=");
        bindings << query.range.upper;
    }

    return " WHERE " + clauses.join(" AND ");
}

const CollectionDef *LocalDatabase::collectionFor(const QString &collection)
{
    const CollectionDef *def = m_definition.collection(collection);
    if (!def) {
        reportError(QString("Unknown collection '%1' in %2").arg(collection, m_definition.name));
    }
    return def;
}

bool LocalDatabase::exec(const QString &sql)
{
    char *errorMessage = nullptr;
    const QByteArray utf8 = sql.toUtf8();
    int rc = sqlite3_exec(m_db, utf8.constData(), nullptr, nullptr, &errorMessage);
    if (rc != SQLITE_OK) {
        QString error = errorMessage ? QString::fromUtf8(errorMessage) : sqliteError();
        sqlite3_free(errorMessage);
        reportError(QString("%1: %2").arg(sql, error));
        return false;
    }
    return true;
}

bool LocalDatabase::beginTransaction()
{
    return exec("BEGIN IMMEDIATE");
}

bool LocalDatabase::commitTransaction()
{
    if (!exec("COMMIT")) {
        rollbackTransaction();
        return false;
    }
    return true;
}

void LocalDatabase::rollbackTransaction()
{
    if (m_db && !sqlite3_get_autocommit(m_db)) {
        sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
    }
}

void LocalDatabase::reportError(const QString &message)
{
    m_lastError = message;
    qWarning() << "[LocalDatabase]" << m_definition.name << message;
    emit errorOccurred(message);
}

QString LocalDatabase::sqliteError() const
{
    return m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QString("database not open");
}

QString LocalDatabase::tableName(const QString &collection)
{
    return quoted(collection);
}

QString LocalDatabase::indexColumn(const QString &indexName)
{
    return "ix_" + indexName;
}

QVariant LocalDatabase::keyFromItem(const CollectionDef &def, const QJsonObject &item)
{
    return indexValue(item.value(def.keyPath));
}

QVariant LocalDatabase::indexValue(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Double: {
        double d = value.toDouble();
        if (std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return QVariant(static_cast<qint64>(d));
        }
        return QVariant(d);
    }
    case QJsonValue::Bool:
        return QVariant(value.toBool() ? 1 : 0);
    default:
        // Null, missing, arrays and objects are not indexed
        return QVariant();
    }
}

} // namespace OfflineSync
