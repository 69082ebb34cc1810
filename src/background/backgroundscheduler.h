#ifndef BACKGROUNDSCHEDULER_H
#define BACKGROUNDSCHEDULER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QMap>
#include <functional>

namespace OfflineSync {

class OfflineStore;

/**
 * @brief Wake-up registry for deferred background work
 *
 * Work that must run "when the network is back" registers a tag. Tags
 * survive restarts (they are kept in the local-settings database under
 * "backgroundSyncTags"). A handler is scheduled per tag by whoever
 * performs the work; when connectivity returns every registered tag with
 * a handler is woken.
 *
 * Waking a tag does not unregister it. The handler's owner unregisters
 * once nothing is left to do.
 */
class BackgroundScheduler : public QObject
{
    Q_OBJECT

public:
    typedef std::function<bool()> Handler;

    /**
     * @brief Tag used for replaying offline changes
     */
    static const QString SyncTag;

    explicit BackgroundScheduler(OfflineStore *store, QObject *parent = nullptr);
    ~BackgroundScheduler() override;

    // ========== Registration ==========

    bool registerTag(const QString &tag);
    bool unregisterTag(const QString &tag);
    bool isRegistered(const QString &tag) const { return m_tags.contains(tag); }
    QStringList registeredTags() const { return m_tags; }

    /**
     * @brief Install the handler run when @p tag is woken
     *
     * Replaces any previous handler. An empty handler removes it.
     */
    void schedule(const QString &tag, const Handler &handler);
    bool hasHandler(const QString &tag) const { return m_handlers.contains(tag); }

    // ========== Waking ==========

    /**
     * @brief Run the handler for a registered tag
     * @return The handler's result, false if the tag is not registered or has no handler
     */
    bool wake(const QString &tag);

    /**
     * @brief Wake every registered tag
     * @return Number of handlers that reported success
     */
    int wakeAll();

public slots:
    void onConnectivityChanged(bool online);

signals:
    void tagRegistered(const QString &tag);
    void tagUnregistered(const QString &tag);
    void tagWoken(const QString &tag, bool success);

private:
    void loadTags();
    bool saveTags();

    OfflineStore *m_store;
    QStringList m_tags;
    QMap<QString, Handler> m_handlers;
};

} // namespace OfflineSync

#endif // BACKGROUNDSCHEDULER_H
