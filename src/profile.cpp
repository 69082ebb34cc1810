#include "profile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>

const QString Profile::DEFAULT_STORAGE_PATH = ".offline";
const int Profile::DEFAULT_TIMEOUT_MS = 30000;
const int Profile::DEFAULT_SYNC_INTERVAL_MS = 60000;
const int Profile::DEFAULT_MAX_RETRIES = 3;
const QStringList Profile::DEFAULT_PRIORITY_ENTITIES = {"campaign", "filter"};
const QString Profile::DEFAULT_RESOLUTION = "server";
const qint64 Profile::DEFAULT_AUTO_RESOLVE_THRESHOLD_MS = 120000;

Profile::Profile(const QString &profileFolderPath)
    : m_profileFolderPath(profileFolderPath)
    , m_storagePath(DEFAULT_STORAGE_PATH)
    , m_serverTimeoutMs(DEFAULT_TIMEOUT_MS)
    , m_autoSync(true)
    , m_syncIntervalMs(DEFAULT_SYNC_INTERVAL_MS)
    , m_maxRetries(DEFAULT_MAX_RETRIES)
    , m_priorityEntities(DEFAULT_PRIORITY_ENTITIES)
    , m_syncOnReconnect(true)
    , m_defaultResolution(DEFAULT_RESOLUTION)
    , m_autoResolveThresholdMs(DEFAULT_AUTO_RESOLVE_THRESHOLD_MS)
    , m_debugLogging(false)
{
    // Try to load existing settings if path is set
    if (!m_profileFolderPath.isEmpty()) {
        load();
    }
}

void Profile::setProfileFolderPath(const QString &path)
{
    m_profileFolderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_profileFolderPath.isEmpty()) {
        return QFileInfo(m_profileFolderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_profileFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Storage & Server ==========

QString Profile::storagePath() const
{
    if (QDir::isAbsolutePath(m_storagePath) || m_profileFolderPath.isEmpty()) {
        return m_storagePath;
    }
    return QDir(m_profileFolderPath).filePath(m_storagePath);
}

void Profile::setStoragePath(const QString &path)
{
    m_storagePath = path.isEmpty() ? DEFAULT_STORAGE_PATH : path;
}

// ========== Conflict Settings ==========

void Profile::setFieldResolution(const QString &field, const QString &resolution)
{
    if (resolution.isEmpty()) {
        m_fieldResolutions.remove(field);
    } else {
        m_fieldResolutions[field] = resolution;
    }
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();

    // Storage & server
    m_storagePath = settings.value("storage/path", DEFAULT_STORAGE_PATH).toString();
    m_serverBaseUrl = QUrl(settings.value("server/baseUrl", QString()).toString());
    m_serverTimeoutMs = settings.value("server/timeoutMs", DEFAULT_TIMEOUT_MS).toInt();

    // Sync settings
    m_autoSync = settings.value("sync/autoSync", true).toBool();
    m_syncIntervalMs = settings.value("sync/intervalMs", DEFAULT_SYNC_INTERVAL_MS).toInt();
    m_maxRetries = settings.value("sync/maxRetries", DEFAULT_MAX_RETRIES).toInt();
    m_priorityEntities = settings.value("sync/priorityEntities", DEFAULT_PRIORITY_ENTITIES).toStringList();
    m_syncOnReconnect = settings.value("sync/syncOnReconnect", true).toBool();

    // Conflict settings
    m_defaultResolution = settings.value("conflicts/defaultResolution", DEFAULT_RESOLUTION).toString();
    m_autoResolveThresholdMs = settings.value("conflicts/autoResolveThresholdMs",
                                              DEFAULT_AUTO_RESOLVE_THRESHOLD_MS).toLongLong();

    m_fieldResolutions.clear();
    settings.beginGroup("conflicts/fieldResolutions");
    for (const QString &field : settings.childKeys()) {
        m_fieldResolutions[field] = settings.value(field).toString();
    }
    settings.endGroup();

    // General
    m_debugLogging = settings.value("general/debugLogging", false).toBool();

    return true;
}

bool Profile::save()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_profileFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QString configPath = configFilePath();
    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }

    // Storage & server
    settings.setValue("storage/path", m_storagePath);
    settings.setValue("server/baseUrl", m_serverBaseUrl.toString());
    settings.setValue("server/timeoutMs", m_serverTimeoutMs);

    // Sync settings
    settings.setValue("sync/autoSync", m_autoSync);
    settings.setValue("sync/intervalMs", m_syncIntervalMs);
    settings.setValue("sync/maxRetries", m_maxRetries);
    settings.setValue("sync/priorityEntities", m_priorityEntities);
    settings.setValue("sync/syncOnReconnect", m_syncOnReconnect);

    // Conflict settings
    settings.setValue("conflicts/defaultResolution", m_defaultResolution);
    settings.setValue("conflicts/autoResolveThresholdMs", m_autoResolveThresholdMs);
    settings.remove("conflicts/fieldResolutions");
    for (auto it = m_fieldResolutions.constBegin(); it != m_fieldResolutions.constEnd(); ++it) {
        settings.setValue(QString("conflicts/fieldResolutions/%1").arg(it.key()), it.value());
    }

    // General
    settings.setValue("general/debugLogging", m_debugLogging);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_profileFolderPath);

    // Create main directory
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    // Create the storage directory
    if (!QDir().mkpath(storagePath())) {
        return false;
    }

    // Save default settings
    return save();
}

QString Profile::configFilePath() const
{
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath(".offlinesync.conf");
}
