#include "conflictresolver.h"

#include <QDebug>
#include <cstdlib>
#include <exception>

namespace OfflineSync {

namespace {

bool serverTimestamp(const QJsonObject &serverData, qint64 *msecs)
{
    return parseTimestamp(serverData.value("updatedAt"), msecs);
}

} // namespace

ConflictResolver::ConflictResolver(const ConflictResolverOptions &options)
    : m_options(options)
{
}

Resolution ConflictResolver::resolve(const PendingChange &change, const QJsonObject &serverData) const
{
    if (serverData.isEmpty()) {
        return Resolution::make(ResolutionAction::Local, "no-server-data");
    }

    try {
        // Entity-type strategy: a function may abstain, an action always decides
        if (m_options.entityTypeResolvers.contains(change.entityType)) {
            Resolution result = m_options.entityTypeResolvers.value(change.entityType)(change, serverData);
            if (result.resolved) {
                return result;
            }
        } else if (m_options.entityTypeResolutions.contains(change.entityType)) {
            return resolveWithStrategy(m_options.entityTypeResolutions.value(change.entityType),
                                       change, serverData);
        }

        if (canAutoResolve(change, serverData)) {
            return autoResolve(change, serverData);
        }

        Resolution byFields = resolveByFields(change, serverData);
        if (byFields.resolved) {
            return byFields;
        }

        if (m_options.manualResolutionCallback) {
            return m_options.manualResolutionCallback(change, serverData);
        }

        return resolveWithStrategy(m_options.defaultResolution, change, serverData);
    } catch (const std::exception &e) {
        qWarning() << "[ConflictResolver] Error resolving conflict for"
                   << change.description() << ":" << e.what();
        Resolution fallback = Resolution::make(ResolutionAction::Server, "resolver-error");
        fallback.error = QString::fromUtf8(e.what());
        return fallback;
    } catch (...) {
        qWarning() << "[ConflictResolver] Unknown error resolving conflict for" << change.description();
        Resolution fallback = Resolution::make(ResolutionAction::Server, "resolver-error");
        fallback.error = QStringLiteral("Unknown resolver error");
        return fallback;
    }
}

bool ConflictResolver::canAutoResolve(const PendingChange &change, const QJsonObject &serverData) const
{
    qint64 serverTime = 0;
    if (!serverTimestamp(serverData, &serverTime) || serverTime == 0) {
        return false;
    }
    return std::llabs(change.timestamp - serverTime) > m_options.autoResolveThresholdMs;
}

Resolution ConflictResolver::autoResolve(const PendingChange &change, const QJsonObject &serverData) const
{
    qint64 serverTime = 0;
    serverTimestamp(serverData, &serverTime);

    if (change.timestamp > serverTime) {
        return Resolution::make(ResolutionAction::Local, "auto-timestamp");
    }
    return Resolution::make(ResolutionAction::Server, "auto-timestamp");
}

Resolution ConflictResolver::resolveByFields(const PendingChange &change,
                                             const QJsonObject &serverData) const
{
    if (change.operation == Operation::Delete || change.data.isNull()) {
        return Resolution();
    }

    const QJsonObject local = change.data.toJson();
    QJsonObject merged = serverData;
    int changedFields = 0;
    int totalFields = 0;

    for (auto it = local.constBegin(); it != local.constEnd(); ++it) {
        const QString field = it.key();
        if (isBookkeepingField(field)) {
            continue;
        }
        totalFields++;

        const QJsonValue localValue = it.value();
        const QJsonValue serverValue = serverData.value(field);

        if (m_options.fieldResolvers.contains(field)) {
            QJsonValue result = m_options.fieldResolvers.value(field)(localValue, serverValue, field);
            if (!result.isUndefined()) {
                merged.insert(field, result);
                changedFields++;
            }
            continue;
        }

        if (!m_options.fieldResolutions.contains(field)) {
            // Unregistered fields keep the local value
            merged.insert(field, localValue);
            changedFields++;
            continue;
        }

        switch (m_options.fieldResolutions.value(field)) {
        case ResolutionAction::Local:
            merged.insert(field, localValue);
            changedFields++;
            break;
        case ResolutionAction::Server:
            break;
        case ResolutionAction::Merge:
            if (m_options.fieldMergeFunctions.contains(field)) {
                merged.insert(field, m_options.fieldMergeFunctions.value(field)(localValue, serverValue));
            } else if (localValue.isObject() && serverValue.isObject()) {
                merged.insert(field, deepMerge(serverValue.toObject(), localValue.toObject()));
            } else {
                merged.insert(field, localValue);
            }
            changedFields++;
            break;
        case ResolutionAction::Manual:
            // No per-field manual step; leave the server value
            break;
        }
    }

    ResolutionAction action = ResolutionAction::Merge;
    if (changedFields == 0) {
        action = ResolutionAction::Server;
    } else if (changedFields == totalFields) {
        action = ResolutionAction::Local;
    }

    Resolution result = Resolution::make(action, "field-resolution");
    result.mergedData = merged;
    return result;
}

Resolution ConflictResolver::resolveWithStrategy(ResolutionAction strategy,
                                                 const PendingChange &change,
                                                 const QJsonObject &serverData) const
{
    switch (strategy) {
    case ResolutionAction::Local:
        return Resolution::make(ResolutionAction::Local, "strategy");

    case ResolutionAction::Server:
        return Resolution::make(ResolutionAction::Server, "strategy");

    case ResolutionAction::Merge: {
        if (change.operation == Operation::Delete || change.data.isNull()) {
            return Resolution::make(ResolutionAction::Server, "cannot-merge-delete");
        }

        QJsonObject merged = serverData;
        const QJsonObject local = change.data.toJson();
        for (auto it = local.constBegin(); it != local.constEnd(); ++it) {
            merged.insert(it.key(), it.value());
        }

        Resolution result = Resolution::make(ResolutionAction::Merge, "strategy");
        result.mergedData = merged;
        return result;
    }

    case ResolutionAction::Manual:
        if (!m_options.manualResolutionCallback) {
            return Resolution::make(ResolutionAction::Server, "manual-fallback");
        }
        {
            Resolution pending;
            pending.action = ResolutionAction::Manual;
            pending.reason = "manual-required";
            return pending;
        }
    }

    return Resolution::make(ResolutionAction::Server, "unknown-strategy");
}

// ========== Configuration ==========

void ConflictResolver::setFieldResolution(const QString &field, ResolutionAction action)
{
    m_options.fieldResolvers.remove(field);
    m_options.fieldResolutions.insert(field, action);
}

void ConflictResolver::setFieldResolution(const QString &field, const FieldResolver &resolver)
{
    if (!resolver) return;
    m_options.fieldResolutions.remove(field);
    m_options.fieldResolvers.insert(field, resolver);
}

void ConflictResolver::setFieldMergeFunction(const QString &field, const FieldMergeFunction &merge)
{
    if (!merge) return;
    m_options.fieldMergeFunctions.insert(field, merge);
}

void ConflictResolver::setEntityTypeResolution(EntityType type, ResolutionAction action)
{
    m_options.entityTypeResolvers.remove(type);
    m_options.entityTypeResolutions.insert(type, action);
}

void ConflictResolver::setEntityTypeResolution(EntityType type, const EntityResolver &resolver)
{
    if (!resolver) return;
    m_options.entityTypeResolutions.remove(type);
    m_options.entityTypeResolvers.insert(type, resolver);
}

void ConflictResolver::setManualResolutionCallback(const ManualResolver &callback)
{
    if (!callback) return;
    m_options.manualResolutionCallback = callback;
}

// ========== Reusable strategies ==========

EntityResolver ConflictResolver::createTimestampResolver(qint64 thresholdMs)
{
    return [thresholdMs](const PendingChange &change, const QJsonObject &serverData) {
        qint64 serverTime = 0;
        serverTimestamp(serverData, &serverTime);

        if (std::llabs(change.timestamp - serverTime) > thresholdMs) {
            return Resolution::make(change.timestamp > serverTime ? ResolutionAction::Local
                                                                  : ResolutionAction::Server,
                                    "timestamp-threshold");
        }
        return Resolution();
    };
}

EntityResolver ConflictResolver::createFieldPriorityResolver(const QMap<QString, int> &priorities)
{
    return [priorities](const PendingChange &change, const QJsonObject &serverData) {
        if (change.operation == Operation::Delete || change.data.isNull()) {
            return Resolution();
        }

        int highestPriority = -1;
        QString highestField;
        for (const QString &field : change.data.fieldNames()) {
            if (isBookkeepingField(field)) continue;
            int priority = priorities.value(field, 0);
            if (priority > highestPriority) {
                highestPriority = priority;
                highestField = field;
            }
        }

        if (highestField.isEmpty() || highestPriority <= 0) {
            return Resolution();
        }

        if (change.data.value(highestField) != serverData.value(highestField)) {
            Resolution result = Resolution::make(ResolutionAction::Local, "field-priority");
            result.field = highestField;
            return result;
        }
        return Resolution();
    };
}

QJsonObject ConflictResolver::deepMerge(const QJsonObject &target, const QJsonObject &source)
{
    QJsonObject output = target;
    for (auto it = source.constBegin(); it != source.constEnd(); ++it) {
        if (it.value().isObject() && target.value(it.key()).isObject()) {
            output.insert(it.key(), deepMerge(target.value(it.key()).toObject(),
                                              it.value().toObject()));
        } else {
            output.insert(it.key(), it.value());
        }
    }
    return output;
}

bool ConflictResolver::isBookkeepingField(const QString &field)
{
    return field == QLatin1String("id") || field == QLatin1String("clientTimestamp");
}

} // namespace OfflineSync
