#ifndef ENTITYDATA_H
#define ENTITYDATA_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include "synctypes.h"

namespace OfflineSync {

class CampaignData;
class FilterData;

/**
 * @brief Parse a timestamp given as ISO-8601 text or epoch milliseconds
 * @return true if @p value held a usable timestamp
 */
bool parseTimestamp(const QJsonValue &value, qint64 *msecs);

/**
 * @brief Payload of a queued change, tagged with its entity type
 *
 * Holds the entity's fields as a JSON object. Conflict resolution and the
 * transport work on the raw field map; CampaignData and FilterData give
 * typed access to the known fields of each kind.
 *
 * A default-constructed EntityData is null (a delete carries no payload).
 */
class EntityData
{
public:
    EntityData() = default;
    EntityData(EntityType type, const QJsonObject &fields);

    EntityType type() const { return m_type; }
    bool isNull() const { return m_null; }

    /**
     * @brief Entity id as a string (numeric ids are normalized), or empty
     */
    QString id() const;
    void setId(const QString &id);

    QJsonValue value(const QString &field) const { return m_fields.value(field); }
    void setValue(const QString &field, const QJsonValue &value);
    void remove(const QString &field);
    bool contains(const QString &field) const { return m_fields.contains(field); }
    QStringList fieldNames() const { return m_fields.keys(); }

    /**
     * @brief Last modification time, invalid if absent or unparseable
     */
    QDateTime updatedAt() const;

    QJsonObject toJson() const { return m_fields; }

    CampaignData campaign() const;
    FilterData filter() const;

    /**
     * @brief Check the fields required for the entity's kind
     */
    bool isValid(QString *error = nullptr) const;

    bool operator==(const EntityData &other) const;
    bool operator!=(const EntityData &other) const { return !(*this == other); }

private:
    EntityType m_type = EntityType::Campaign;
    QJsonObject m_fields;
    bool m_null = true;
};

/**
 * @brief Typed view of a campaign payload
 */
class CampaignData
{
public:
    explicit CampaignData(const QJsonObject &fields = QJsonObject());

    QString id() const;
    void setId(const QString &id) { m_fields["id"] = id; }

    QString name() const { return m_fields.value("name").toString(); }
    void setName(const QString &name) { m_fields["name"] = name; }

    QString status() const { return m_fields.value("status").toString(); }
    void setStatus(const QString &status) { m_fields["status"] = status; }

    double budget() const { return m_fields.value("budget").toDouble(); }
    void setBudget(double budget) { m_fields["budget"] = budget; }

    QString platform() const { return m_fields.value("platform").toString(); }
    void setPlatform(const QString &platform) { m_fields["platform"] = platform; }

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &time);

    QJsonObject toJson() const { return m_fields; }
    EntityData toEntityData() const { return EntityData(EntityType::Campaign, m_fields); }

private:
    QJsonObject m_fields;
};

/**
 * @brief Typed view of a filter payload
 */
class FilterData
{
public:
    explicit FilterData(const QJsonObject &fields = QJsonObject());

    QString id() const;
    void setId(const QString &id) { m_fields["id"] = id; }

    QString name() const { return m_fields.value("name").toString(); }
    void setName(const QString &name) { m_fields["name"] = name; }

    QString category() const { return m_fields.value("category").toString(); }
    void setCategory(const QString &category) { m_fields["category"] = category; }

    QJsonArray conditions() const { return m_fields.value("conditions").toArray(); }
    void setConditions(const QJsonArray &conditions) { m_fields["conditions"] = conditions; }

    bool isActive() const { return m_fields.value("active").toBool(true); }
    void setActive(bool active) { m_fields["active"] = active; }

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &time);

    QJsonObject toJson() const { return m_fields; }
    EntityData toEntityData() const { return EntityData(EntityType::Filter, m_fields); }

private:
    QJsonObject m_fields;
};

/**
 * @brief A queued mutation waiting to be replayed against the server
 */
struct PendingChange {
    qint64 id = 0;                  ///< Store-assigned, 0 until saved
    EntityType entityType = EntityType::Campaign;
    QString entityId;               ///< Empty for a create without id
    Operation operation = Operation::Create;
    EntityData data;                ///< Null for deletes
    qint64 timestamp = 0;           ///< Client time at enqueue (ms)
    int retryCount = 0;
    ChangeStatus status = ChangeStatus::Pending;
    qint64 syncedAt = 0;
    QString lastError;

    bool isTerminal() const { return status != ChangeStatus::Pending; }

    /**
     * @brief Check the invariants a change must satisfy to be queued
     */
    bool isValid(QString *error = nullptr) const;

    /**
     * @brief Short human-readable form, e.g. "update campaign 42"
     */
    QString description() const;

    QJsonObject toJson() const;
    static PendingChange fromJson(const QJsonObject &json);
};

} // namespace OfflineSync

Q_DECLARE_METATYPE(OfflineSync::PendingChange)

#endif // ENTITYDATA_H
