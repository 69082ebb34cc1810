#include "entitydata.h"

#include <cmath>

namespace OfflineSync {

namespace {

QString idFromValue(const QJsonValue &value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        double d = value.toDouble();
        if (std::floor(d) == d) {
            return QString::number(static_cast<qint64>(d));
        }
        return QString::number(d);
    }
    return QString();
}

QDateTime dateFromValue(const QJsonValue &value)
{
    qint64 msecs = 0;
    if (!parseTimestamp(value, &msecs)) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(msecs).toUTC();
}

QString isoString(const QDateTime &time)
{
    return time.toUTC().toString(Qt::ISODateWithMs);
}

} // namespace

bool parseTimestamp(const QJsonValue &value, qint64 *msecs)
{
    if (value.isDouble()) {
        if (msecs) *msecs = static_cast<qint64>(value.toDouble());
        return true;
    }

    if (value.isString()) {
        const QString text = value.toString();
        QDateTime time = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (!time.isValid()) {
            time = QDateTime::fromString(text, Qt::ISODate);
        }
        if (!time.isValid()) {
            bool ok = false;
            qint64 numeric = text.toLongLong(&ok);
            if (!ok) return false;
            if (msecs) *msecs = numeric;
            return true;
        }
        if (msecs) *msecs = time.toMSecsSinceEpoch();
        return true;
    }

    return false;
}

// ========== EntityData ==========

EntityData::EntityData(EntityType type, const QJsonObject &fields)
    : m_type(type)
    , m_fields(fields)
    , m_null(false)
{
}

QString EntityData::id() const
{
    return idFromValue(m_fields.value("id"));
}

void EntityData::setId(const QString &id)
{
    setValue("id", id);
}

void EntityData::setValue(const QString &field, const QJsonValue &value)
{
    m_fields.insert(field, value);
    m_null = false;
}

void EntityData::remove(const QString &field)
{
    m_fields.remove(field);
}

QDateTime EntityData::updatedAt() const
{
    return dateFromValue(m_fields.value("updatedAt"));
}

CampaignData EntityData::campaign() const
{
    return CampaignData(m_type == EntityType::Campaign ? m_fields : QJsonObject());
}

FilterData EntityData::filter() const
{
    return FilterData(m_type == EntityType::Filter ? m_fields : QJsonObject());
}

bool EntityData::isValid(QString *error) const
{
    auto fail = [error](const QString &message) {
        if (error) *error = message;
        return false;
    };

    if (m_null) {
        return fail("Entity data is missing");
    }

    if (m_fields.contains("name") && !m_fields.value("name").isString()) {
        return fail("'name' must be a string");
    }

    switch (m_type) {
    case EntityType::Campaign:
        if (m_fields.contains("budget") && !m_fields.value("budget").isDouble()) {
            return fail("'budget' must be a number");
        }
        break;
    case EntityType::Filter:
        if (m_fields.contains("conditions") && !m_fields.value("conditions").isArray()) {
            return fail("'conditions' must be an array");
        }
        if (m_fields.contains("active") && !m_fields.value("active").isBool()) {
            return fail("'active' must be a boolean");
        }
        break;
    }

    return true;
}

bool EntityData::operator==(const EntityData &other) const
{
    if (m_null || other.m_null) {
        return m_null == other.m_null;
    }
    return m_type == other.m_type && m_fields == other.m_fields;
}

// ========== CampaignData ==========

CampaignData::CampaignData(const QJsonObject &fields)
    : m_fields(fields)
{
}

QString CampaignData::id() const
{
    return idFromValue(m_fields.value("id"));
}

QDateTime CampaignData::updatedAt() const
{
    return dateFromValue(m_fields.value("updatedAt"));
}

void CampaignData::setUpdatedAt(const QDateTime &time)
{
    m_fields["updatedAt"] = isoString(time);
}

// ========== FilterData ==========

FilterData::FilterData(const QJsonObject &fields)
    : m_fields(fields)
{
}

QString FilterData::id() const
{
    return idFromValue(m_fields.value("id"));
}

QDateTime FilterData::updatedAt() const
{
    return dateFromValue(m_fields.value("updatedAt"));
}

void FilterData::setUpdatedAt(const QDateTime &time)
{
    m_fields["updatedAt"] = isoString(time);
}

// ========== PendingChange ==========

bool PendingChange::isValid(QString *error) const
{
    auto fail = [error](const QString &message) {
        if (error) *error = message;
        return false;
    };

    if (operation != Operation::Delete) {
        if (data.isNull()) {
            return fail(QString("Data is required for %1 operations")
                        .arg(operationToString(operation)));
        }
        if (data.type() != entityType) {
            return fail("Data entity type does not match the change");
        }
        QString dataError;
        if (!data.isValid(&dataError)) {
            return fail(dataError);
        }
    }

    if (operation != Operation::Create && entityId.isEmpty()) {
        return fail(QString("Entity ID is required for %1 operations")
                    .arg(operationToString(operation)));
    }

    return true;
}

QString PendingChange::description() const
{
    QString text = operationToString(operation) + " " + entityTypeToString(entityType);
    if (!entityId.isEmpty()) {
        text += " " + entityId;
    }
    return text;
}

QJsonObject PendingChange::toJson() const
{
    QJsonObject json;
    if (id > 0) json["id"] = id;
    json["entityType"] = entityTypeToString(entityType);
    json["entityId"] = entityId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(entityId);
    json["operation"] = operationToString(operation);
    json["data"] = data.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(data.toJson());
    json["timestamp"] = timestamp;
    json["retryCount"] = retryCount;
    json["status"] = changeStatusToString(status);
    if (syncedAt > 0) json["syncedAt"] = syncedAt;
    if (!lastError.isEmpty()) json["lastError"] = lastError;
    return json;
}

PendingChange PendingChange::fromJson(const QJsonObject &json)
{
    PendingChange change;
    change.id = json.value("id").toInteger();
    change.entityType = entityTypeFromString(json.value("entityType").toString());
    change.entityId = idFromValue(json.value("entityId"));
    change.operation = operationFromString(json.value("operation").toString());
    if (json.value("data").isObject()) {
        change.data = EntityData(change.entityType, json.value("data").toObject());
    }
    change.timestamp = json.value("timestamp").toInteger();
    change.retryCount = json.value("retryCount").toInt();
    change.status = changeStatusFromString(json.value("status").toString());
    change.syncedAt = json.value("syncedAt").toInteger();
    change.lastError = json.value("lastError").toString();
    return change;
}

} // namespace OfflineSync
