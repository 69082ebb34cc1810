#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <cstdio>
#include <stdexcept>

#include "offlinesync_version.h"
#include "profile.h"
#include "offlinemanager.h"
#include "store/offlinestore.h"
#include "sync/connectivitymonitor.h"
#include "sync/httptransport.h"
#include "sync/syncmanager.h"
#include "background/requestinterceptor.h"

using namespace OfflineSync;

namespace {

bool g_verbose = false;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    Q_UNUSED(context)

    const char *level = "INFO";
    switch (type) {
    case QtDebugMsg:
        if (!g_verbose) return;
        level = "DEBUG";
        break;
    case QtInfoMsg:
        level = "INFO";
        break;
    case QtWarningMsg:
        level = "WARNING";
        break;
    case QtCriticalMsg:
        level = "ERROR";
        break;
    case QtFatalMsg:
        level = "FATAL";
        break;
    }

    const QByteArray line = QString("%1 [%2] %3\n")
        .arg(QDateTime::currentDateTime().toString("HH:mm:ss.zzz"), level, message)
        .toLocal8Bit();
    fputs(line.constData(), stderr);
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QString formatTime(qint64 msecs)
{
    if (msecs <= 0) return "-";
    return QDateTime::fromMSecsSinceEpoch(msecs).toString("yyyy-MM-dd HH:mm:ss");
}

void printChange(const PendingChange &change)
{
    out() << QString("%1  %2  %3  retries=%4  queued=%5")
                 .arg(change.id, 5)
                 .arg(changeStatusToString(change.status), -8)
                 .arg(change.description())
                 .arg(change.retryCount)
                 .arg(formatTime(change.timestamp));
    if (!change.lastError.isEmpty()) {
        out() << "  error=" << change.lastError;
    }
    out() << Qt::endl;
}

// ========== Commands ==========

int runStatus(OfflineManager &manager)
{
    SyncStatusInfo info = manager.syncStatus();
    OfflineStore *store = manager.store();

    out() << "Storage:          " << store->storagePath() << Qt::endl;
    out() << "Online:           " << (manager.isOnline() ? "yes" : "no") << Qt::endl;
    out() << "Pending changes:  " << info.pendingChanges << Qt::endl;
    out() << "Offline requests: " << store->pendingRequests().size() << Qt::endl;

    QList<SyncLogEntry> last = store->syncLog(1);
    if (last.isEmpty()) {
        out() << "Last sync:        never" << Qt::endl;
    } else {
        const SyncLogEntry &entry = last.first();
        out() << "Last sync:        " << formatTime(entry.timestamp) << " ("
              << syncStatusToString(entry.status) << ", synced " << entry.synced
              << ", conflicts " << entry.conflicts << ", errors " << entry.errors << ")" << Qt::endl;
    }
    return 0;
}

int runPending(OfflineManager &manager, bool all)
{
    QList<PendingChange> changes = all ? manager.store()->allChanges() : manager.pendingChanges();
    if (changes.isEmpty()) {
        out() << "No changes" << Qt::endl;
        return 0;
    }
    for (const PendingChange &change : changes) {
        printChange(change);
    }
    return 0;
}

int runLog(OfflineManager &manager, int limit)
{
    QList<SyncLogEntry> entries = manager.syncManager()->syncLog(limit);
    if (entries.isEmpty()) {
        out() << "Sync log is empty" << Qt::endl;
        return 0;
    }
    for (const SyncLogEntry &entry : entries) {
        out() << QString("%1  %2  synced=%3 conflicts=%4 errors=%5")
                     .arg(formatTime(entry.timestamp))
                     .arg(syncStatusToString(entry.status), -9)
                     .arg(entry.synced).arg(entry.conflicts).arg(entry.errors);
        if (!entry.error.isEmpty()) {
            out() << "  " << entry.error;
        }
        out() << Qt::endl;
    }
    return 0;
}

int runEnqueue(OfflineManager &manager, const QStringList &args,
               const QString &entityId, const QString &dataText)
{
    if (args.size() < 3) {
        qCritical() << "Usage: enqueue <campaign|filter> <create|update|delete> [--id ID] [--data JSON]";
        return 2;
    }

    QJsonValue data;
    if (!dataText.isEmpty()) {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(dataText.toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qCritical() << "Invalid --data JSON:" << parseError.errorString();
            return 2;
        }
        data = doc.object();
    }

    try {
        qint64 id = manager.addOfflineChange(args.at(1), args.at(2), data, entityId);
        if (id == 0) {
            qCritical() << "Failed to queue change";
            return 1;
        }
        out() << "Queued change " << id << Qt::endl;
        return 0;
    } catch (const std::invalid_argument &e) {
        qCritical() << e.what();
        return 2;
    }
}

int runSync(OfflineManager &manager)
{
    QObject::connect(manager.syncManager(), &SyncManager::syncProgress,
                     [](const SyncProgress &progress) {
        qInfo().noquote() << QString("Progress %1/%2 (%3%)")
                                 .arg(progress.processed).arg(progress.total)
                                 .arg(progress.percentage());
    });

    SyncResult result = manager.syncNow();
    out() << syncStatusToString(result.status) << ": " << result.summary();
    if (!result.errorMessage.isEmpty()) {
        out() << " - " << result.errorMessage;
    }
    out() << Qt::endl;
    return result.success() ? 0 : 1;
}

int runReplay(OfflineManager &manager)
{
    ReplayResult replay = manager.interceptor()->replayOfflineRequests();
    out() << QString("Replayed %1, failed %2, unreachable %3, remaining %4")
                 .arg(replay.replayed).arg(replay.failed)
                 .arg(replay.deferred).arg(replay.remaining) << Qt::endl;
    return replay.remaining == 0 ? 0 : 1;
}

int runFetch(OfflineManager &manager, const QStringList &args, const QString &dataText)
{
    if (args.size() < 3) {
        qCritical() << "Usage: fetch <METHOD> <url> [--data BODY]";
        return 2;
    }

    TransportRequest request;
    request.method = args.at(1).toUpper();
    request.url = args.at(2);
    if (!dataText.isEmpty()) {
        request.body = dataText.toUtf8();
        request.headers.insert("Content-Type", "application/json");
    }

    TransportResponse response = manager.fetch(request);
    if (response.networkError) {
        qCritical() << "Request failed:" << response.errorString;
        return 1;
    }

    out() << "HTTP " << response.status << Qt::endl;
    out() << QString::fromUtf8(response.body) << Qt::endl;
    return response.ok() ? 0 : 1;
}

int runDaemon(QCoreApplication &app, OfflineManager &manager, const Profile &profile)
{
    if (!manager.connectivityMonitor()->startSystemMonitoring()) {
        qWarning() << "No network reachability backend, assuming online";
    }

    auto *workerTransport = new HttpTransport(profile.serverBaseUrl(), profile.serverTimeoutMs());
    if (!manager.enableBackgroundSync(workerTransport)) {
        qWarning() << "Background sync service did not start";
    }

    QObject::connect(&manager, &OfflineManager::logMessage, [](const QString &message) {
        qInfo().noquote() << message;
    });
    QObject::connect(&manager, &OfflineManager::errorOccurred, [](const QString &error) {
        qWarning().noquote() << error;
    });

    qInfo().noquote() << QString("OfflineSync %1 running for profile %2")
                             .arg(OFFLINESYNC_VERSION_STRING, profile.name());
    return app.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("offlinesync");
    app.setApplicationVersion(OFFLINESYNC_VERSION_STRING);
    app.setOrganizationName("OfflineSync");

    qInstallMessageHandler(messageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline change queue and sync for the campaign server");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command",
        "init | status | pending | log | enqueue | sync | replay | fetch | clear | daemon");

    QCommandLineOption profileOption({"p", "profile"}, "Profile folder (default: current directory)", "dir");
    QCommandLineOption serverOption("server", "Override the server base URL", "url");
    QCommandLineOption idOption("id", "Entity id for enqueue", "id");
    QCommandLineOption dataOption("data", "JSON payload for enqueue or request body for fetch", "json");
    QCommandLineOption limitOption("limit", "Number of log entries", "n", "10");
    QCommandLineOption allOption("all", "Include synced, failed and disabled changes");
    QCommandLineOption offlineOption("offline", "Treat the network as unavailable");
    QCommandLineOption verboseOption({"v", "verbose"}, "Show debug output");
    parser.addOptions({profileOption, serverOption, idOption, dataOption, limitOption,
                       allOption, offlineOption, verboseOption});

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }
    const QString command = args.first();

    Profile profile(parser.isSet(profileOption) ? parser.value(profileOption) : QDir::currentPath());
    if (parser.isSet(serverOption)) {
        profile.setServerBaseUrl(QUrl(parser.value(serverOption)));
    }
    g_verbose = parser.isSet(verboseOption) || profile.debugLogging();

    if (command == "init") {
        if (!profile.initialize()) {
            qCritical() << "Failed to initialize profile in" << profile.profileFolderPath();
            return 1;
        }
        out() << "Initialized profile " << profile.configFilePath() << Qt::endl;
        return 0;
    }

    if (!QDir().mkpath(profile.storagePath())) {
        qCritical() << "Cannot create storage directory" << profile.storagePath();
        return 1;
    }

    HttpTransport transport(profile.serverBaseUrl(), profile.serverTimeoutMs());
    OfflineManager manager(profile.storagePath(), &transport);
    manager.configure(profile);

    if (parser.isSet(offlineOption)) {
        manager.connectivityMonitor()->setOnline(false);
    }
    if (command != "daemon") {
        // One-shot commands never run the timer
        SyncManagerOptions options = manager.syncManager()->options();
        options.autoSync = false;
        manager.syncManager()->setOptions(options);
    }

    if (!manager.initialize()) {
        return 1;
    }

    if (command == "status") {
        return runStatus(manager);
    } else if (command == "pending") {
        return runPending(manager, parser.isSet(allOption));
    } else if (command == "log") {
        return runLog(manager, parser.value(limitOption).toInt());
    } else if (command == "enqueue") {
        return runEnqueue(manager, args, parser.value(idOption), parser.value(dataOption));
    } else if (command == "sync") {
        return runSync(manager);
    } else if (command == "replay") {
        return runReplay(manager);
    } else if (command == "fetch") {
        return runFetch(manager, args, parser.value(dataOption));
    } else if (command == "clear") {
        return manager.clearOfflineData() ? 0 : 1;
    } else if (command == "daemon") {
        return runDaemon(app, manager, profile);
    }

    qCritical().noquote() << "Unknown command:" << command;
    parser.showHelp(2);
}
