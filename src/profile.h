#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <QUrl>

/**
 * @brief Profile represents an offline sync profile with its settings
 *
 * Profile settings are stored in the profile folder itself as
 * .offlinesync.conf, making profiles portable - you can move the entire
 * folder and the settings (and, by default, the offline databases)
 * travel with it.
 *
 * Each profile corresponds to:
 *   - A server base URL the queued changes are replayed against
 *   - A storage directory holding the offline databases
 *   - Sync and conflict resolution policies
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given folder path
     * @param profileFolderPath Path to the profile folder (e.g., ~/OfflineSync)
     */
    explicit Profile(const QString &profileFolderPath = QString());

    // Profile location
    QString profileFolderPath() const { return m_profileFolderPath; }
    void setProfileFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Storage & Server ==========

    /**
     * @brief Directory of the offline databases
     *
     * Relative paths are resolved against the profile folder. Defaults to
     * .offline inside the profile folder.
     */
    QString storagePath() const;
    void setStoragePath(const QString &path);

    QUrl serverBaseUrl() const { return m_serverBaseUrl; }
    void setServerBaseUrl(const QUrl &url) { m_serverBaseUrl = url; }

    int serverTimeoutMs() const { return m_serverTimeoutMs; }
    void setServerTimeoutMs(int ms) { m_serverTimeoutMs = ms; }

    // ========== Sync Settings ==========

    bool autoSync() const { return m_autoSync; }
    void setAutoSync(bool enabled) { m_autoSync = enabled; }

    int syncIntervalMs() const { return m_syncIntervalMs; }
    void setSyncIntervalMs(int ms) { m_syncIntervalMs = ms; }

    int maxRetries() const { return m_maxRetries; }
    void setMaxRetries(int retries) { m_maxRetries = retries; }

    QStringList priorityEntities() const { return m_priorityEntities; }
    void setPriorityEntities(const QStringList &entities) { m_priorityEntities = entities; }

    // Replay the offline request log in the background when connectivity returns
    bool syncOnReconnect() const { return m_syncOnReconnect; }
    void setSyncOnReconnect(bool enabled) { m_syncOnReconnect = enabled; }

    // ========== Conflict Settings ==========

    // "local", "server", "merge" or "manual"
    QString defaultResolution() const { return m_defaultResolution; }
    void setDefaultResolution(const QString &resolution) { m_defaultResolution = resolution; }

    qint64 autoResolveThresholdMs() const { return m_autoResolveThresholdMs; }
    void setAutoResolveThresholdMs(qint64 ms) { m_autoResolveThresholdMs = ms; }

    // Per-field resolution, field name -> "local" / "server" / "merge" / "manual"
    QMap<QString, QString> fieldResolutions() const { return m_fieldResolutions; }
    void setFieldResolution(const QString &field, const QString &resolution);

    // ========== General ==========

    bool debugLogging() const { return m_debugLogging; }
    void setDebugLogging(bool enabled) { m_debugLogging = enabled; }

    // ========== Persistence ==========

    // Load settings from .offlinesync.conf in the profile folder
    bool load();

    // Save settings to .offlinesync.conf in the profile folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    // Get the path to the profile config file
    QString configFilePath() const;

private:
    QString m_profileFolderPath;
    QString m_name;

    // Storage & server
    QString m_storagePath;
    QUrl m_serverBaseUrl;
    int m_serverTimeoutMs;

    // Sync settings
    bool m_autoSync;
    int m_syncIntervalMs;
    int m_maxRetries;
    QStringList m_priorityEntities;
    bool m_syncOnReconnect;

    // Conflict settings
    QString m_defaultResolution;
    qint64 m_autoResolveThresholdMs;
    QMap<QString, QString> m_fieldResolutions;

    bool m_debugLogging;

    // Default values
    static const QString DEFAULT_STORAGE_PATH;
    static const int DEFAULT_TIMEOUT_MS;
    static const int DEFAULT_SYNC_INTERVAL_MS;
    static const int DEFAULT_MAX_RETRIES;
    static const QStringList DEFAULT_PRIORITY_ENTITIES;
    static const QString DEFAULT_RESOLUTION;
    static const qint64 DEFAULT_AUTO_RESOLVE_THRESHOLD_MS;
};

#endif // PROFILE_H
