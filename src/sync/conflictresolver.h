#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include <QMap>
#include <QJsonObject>
#include <QJsonValue>
#include <functional>
#include "synctypes.h"
#include "entitydata.h"

namespace OfflineSync {

/**
 * @brief Outcome of resolving one conflict
 */
struct Resolution {
    bool resolved = false;
    ResolutionAction action = ResolutionAction::Server;
    QJsonObject mergedData;     ///< Set for Merge (and the field-level pass)
    QString reason;             ///< e.g. "auto-timestamp", "field-resolution"
    QString error;              ///< Set when a strategy threw
    QString field;              ///< Deciding field, for field-priority decisions

    static Resolution make(ResolutionAction action, const QString &reason) {
        Resolution r;
        r.resolved = true;
        r.action = action;
        r.reason = reason;
        return r;
    }
};

/**
 * @brief Whole-entity strategy; returns an unresolved Resolution to abstain
 */
using EntityResolver = std::function<Resolution(const PendingChange &change,
                                                const QJsonObject &serverData)>;

/**
 * @brief Per-field strategy; returns QJsonValue::Undefined to abstain
 */
using FieldResolver = std::function<QJsonValue(const QJsonValue &localValue,
                                               const QJsonValue &serverValue,
                                               const QString &field)>;

/**
 * @brief Custom merge of one field's local and server values
 */
using FieldMergeFunction = std::function<QJsonValue(const QJsonValue &localValue,
                                                    const QJsonValue &serverValue)>;

/**
 * @brief Callback deciding conflicts nothing else could
 */
using ManualResolver = std::function<Resolution(const PendingChange &change,
                                                const QJsonObject &serverData)>;

/**
 * @brief Conflict resolution configuration
 *
 * Where both an action and a resolver function are registered for the
 * same field or entity type, the function is used.
 */
struct ConflictResolverOptions {
    ResolutionAction defaultResolution = ResolutionAction::Server;
    qint64 autoResolveThresholdMs = 120000;     ///< 2 minutes

    QMap<QString, ResolutionAction> fieldResolutions;
    QMap<QString, FieldResolver> fieldResolvers;
    QMap<QString, FieldMergeFunction> fieldMergeFunctions;

    QMap<EntityType, ResolutionAction> entityTypeResolutions;
    QMap<EntityType, EntityResolver> entityTypeResolvers;

    ManualResolver manualResolutionCallback;
};

/**
 * @brief Decides how a conflicting local change and server entity combine
 *
 * Decision order, first applicable wins:
 *   1. No server data: local wins
 *   2. Strategy registered for the entity type
 *   3. Timestamps further apart than the auto-resolve threshold: newest wins
 *   4. Field-by-field resolution (not for deletes)
 *   5. Manual resolution callback
 *   6. Default strategy
 *
 * A strategy that throws yields a Server resolution carrying the error.
 *
 * Usage:
 * @code
 * ConflictResolver resolver;
 * resolver.setFieldResolution("budget", ResolutionAction::Server);
 * resolver.setEntityTypeResolution(EntityType::Filter,
 *     ConflictResolver::createTimestampResolver(60000));
 *
 * Resolution r = resolver.resolve(change, serverEntity);
 * if (r.action == ResolutionAction::Merge) change.data = ...(r.mergedData);
 * @endcode
 */
class ConflictResolver
{
public:
    ConflictResolver() = default;
    explicit ConflictResolver(const ConflictResolverOptions &options);

    Resolution resolve(const PendingChange &change, const QJsonObject &serverData) const;

    // ========== Configuration ==========

    const ConflictResolverOptions &options() const { return m_options; }
    void setOptions(const ConflictResolverOptions &options) { m_options = options; }

    void setDefaultResolution(ResolutionAction action) { m_options.defaultResolution = action; }
    void setAutoResolveThreshold(qint64 ms) { m_options.autoResolveThresholdMs = ms; }

    void setFieldResolution(const QString &field, ResolutionAction action);
    void setFieldResolution(const QString &field, const FieldResolver &resolver);
    void setFieldMergeFunction(const QString &field, const FieldMergeFunction &merge);

    void setEntityTypeResolution(EntityType type, ResolutionAction action);
    void setEntityTypeResolution(EntityType type, const EntityResolver &resolver);

    void setManualResolutionCallback(const ManualResolver &callback);

    // ========== Reusable strategies ==========

    /**
     * @brief Newest wins when the timestamps differ by more than @p thresholdMs
     */
    static EntityResolver createTimestampResolver(qint64 thresholdMs = 3600000);

    /**
     * @brief Local wins when its highest-priority changed field differs
     *
     * Fields missing from @p priorities have priority 0 and never decide.
     */
    static EntityResolver createFieldPriorityResolver(const QMap<QString, int> &priorities);

    /**
     * @brief Recursive merge of objects; source wins on scalar clashes
     */
    static QJsonObject deepMerge(const QJsonObject &target, const QJsonObject &source);

    /**
     * @brief Fields that never take part in field-level resolution
     */
    static bool isBookkeepingField(const QString &field);

private:
    bool canAutoResolve(const PendingChange &change, const QJsonObject &serverData) const;
    Resolution autoResolve(const PendingChange &change, const QJsonObject &serverData) const;
    Resolution resolveByFields(const PendingChange &change, const QJsonObject &serverData) const;
    Resolution resolveWithStrategy(ResolutionAction strategy, const PendingChange &change,
                                   const QJsonObject &serverData) const;

    ConflictResolverOptions m_options;
};

} // namespace OfflineSync

Q_DECLARE_METATYPE(OfflineSync::Resolution)

#endif // CONFLICTRESOLVER_H
