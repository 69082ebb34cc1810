#include "backgroundscheduler.h"
#include "store/offlinestore.h"

#include <QJsonArray>
#include <QDebug>

namespace OfflineSync {

namespace {
const QString kTagsSetting = QStringLiteral("backgroundSyncTags");
}

const QString BackgroundScheduler::SyncTag = QStringLiteral("offlinesync-sync");

BackgroundScheduler::BackgroundScheduler(OfflineStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    loadTags();
}

BackgroundScheduler::~BackgroundScheduler() = default;

// ========== Registration ==========

bool BackgroundScheduler::registerTag(const QString &tag)
{
    if (tag.isEmpty()) {
        return false;
    }
    if (m_tags.contains(tag)) {
        return true;
    }

    m_tags.append(tag);
    if (!saveTags()) {
        qWarning() << "[BackgroundScheduler] Failed to persist tag" << tag;
    }

    qDebug() << "[BackgroundScheduler] Registered tag" << tag;
    emit tagRegistered(tag);
    return true;
}

bool BackgroundScheduler::unregisterTag(const QString &tag)
{
    if (!m_tags.removeOne(tag)) {
        return false;
    }

    if (!saveTags()) {
        qWarning() << "[BackgroundScheduler] Failed to persist removal of tag" << tag;
    }

    qDebug() << "[BackgroundScheduler] Unregistered tag" << tag;
    emit tagUnregistered(tag);
    return true;
}

void BackgroundScheduler::schedule(const QString &tag, const Handler &handler)
{
    if (handler) {
        m_handlers.insert(tag, handler);
    } else {
        m_handlers.remove(tag);
    }
}

// ========== Waking ==========

bool BackgroundScheduler::wake(const QString &tag)
{
    if (!m_tags.contains(tag) || !m_handlers.contains(tag)) {
        return false;
    }

    qDebug() << "[BackgroundScheduler] Waking" << tag;
    bool success = m_handlers.value(tag)();
    emit tagWoken(tag, success);
    return success;
}

int BackgroundScheduler::wakeAll()
{
    int succeeded = 0;
    // Copy: a handler may unregister its own tag
    const QStringList tags = m_tags;
    for (const QString &tag : tags) {
        if (wake(tag)) {
            succeeded++;
        }
    }
    return succeeded;
}

void BackgroundScheduler::onConnectivityChanged(bool online)
{
    if (online && !m_tags.isEmpty()) {
        wakeAll();
    }
}

// ========== Persistence ==========

void BackgroundScheduler::loadTags()
{
    m_tags.clear();
    if (!m_store) {
        return;
    }

    const QJsonArray stored = m_store->setting(kTagsSetting, QJsonArray()).toArray();
    for (const QJsonValue &value : stored) {
        const QString tag = value.toString();
        if (!tag.isEmpty() && !m_tags.contains(tag)) {
            m_tags.append(tag);
        }
    }
}

bool BackgroundScheduler::saveTags()
{
    if (!m_store) {
        return false;
    }
    return m_store->saveSetting(kTagsSetting, QJsonArray::fromStringList(m_tags));
}

} // namespace OfflineSync
