#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QStandardPaths>
#include <QTextStream>
#include <QUrl>

#include <csignal>

#include "logger/logger.h"
#include "sessioncore/agentcontrolclient.h"
#include "sessioncore/configmanager.h"
#include "sessioncore/restsessionstore.h"
#include "WatchClient.h"

void signalHandler(int signal)
{
    LOG_INFO(QString("Received signal: %1").arg(signal));
    QCoreApplication::quit();
}

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("DeskPulse");
    QGuiApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("DeskPulse session companion");
    parser.addHelpOption();
    parser.addVersionOption();

    // Identity
    QCommandLineOption userOption("user", "Signed-in user id", "uid");
    QCommandLineOption nameOption("name", "Display name", "name");
    QCommandLineOption emailOption("email", "E-mail handed to the desktop agent", "email");
    QCommandLineOption photoOption("photo", "Photo URL handed to the desktop agent", "url");
    QCommandLineOption credentialOption("credential", "Bearer credential (defaults to $DESKPULSE_CREDENTIAL)", "token");

    // Actions
    QCommandLineOption checkInOption("checkin", "Check in from this client");
    QCommandLineOption checkInDesktopOption("checkin-desktop", "Check in through the desktop agent");
    QCommandLineOption breakOption("break", "Start a break");
    QCommandLineOption resumeOption("resume", "End the current break");
    QCommandLineOption checkOutOption("checkout", "Check out with the given report", "report");
    QCommandLineOption proofOption("proof", "Proof-of-work link attached at checkout", "link");
    QCommandLineOption reconnectOption("reconnect", "Reconnect to the desktop agent");
    QCommandLineOption forceCloseOption("force-close", "Close an unresponsive desktop session as flagged");
    QCommandLineOption syncOption("sync", "Re-read the session from the store");
    QCommandLineOption watchOption("watch", "Keep running and report heartbeat staleness");

    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level", "info");

    parser.addOptions({userOption, nameOption, emailOption, photoOption, credentialOption,
                       checkInOption, checkInDesktopOption, breakOption, resumeOption,
                       checkOutOption, proofOption, reconnectOption, forceCloseOption,
                       syncOption, watchOption, logFileOption, logLevelOption});

    parser.process(app);

    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    } else {
        QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(logDir);
        Logger::instance()->setLogFile(logDir + "/deskpulse_watch.log");
    }
    Logger::instance()->setLogLevel(Logger::levelFromString(parser.value(logLevelOption), Logger::Info));

    QTextStream out(stdout);

    ConfigManager config;
    if (!config.initialize() || !config.loadLocalConfig()) {
        LOG_WARNING("Using default configuration");
    }

    // The command line wins over the configuration file
    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    }
    if (parser.isSet(logLevelOption)) {
        Logger::instance()->setLogLevel(Logger::levelFromString(parser.value(logLevelOption), Logger::Info));
    }

    RestSessionStore store;
    if (!store.initialize(config.storeUrl(), config.projectId())) {
        out << "Session store is not configured: " << store.lastError() << Qt::endl;
        return 1;
    }
    store.setWatchInterval(config.storeWatchIntervalSeconds() * 1000);

    AgentControlClient agent;
    agent.setBaseUrl(QUrl(QString("http://127.0.0.1:%1").arg(config.controlPort())));

    WatchClient client(&store, &agent);
    LivenessMonitor* monitor = client.monitor();
    monitor->setStaleThreshold(config.staleThresholdSeconds());
    monitor->setPollInterval(config.stalePollSeconds() * 1000);
    monitor->setLaunchScheme(config.launchScheme());
    monitor->setProfile(parser.value(emailOption), parser.value(photoOption));

    QObject::connect(&client, &WatchClient::statusMessage, [&out](const QString& message) {
        out << message << Qt::endl;
    });

    const QString credential = parser.isSet(credentialOption)
        ? parser.value(credentialOption) : qEnvironmentVariable("DESKPULSE_CREDENTIAL");
    if (!client.initialize(parser.value(userOption), parser.value(nameOption), credential)) {
        out << client.lastError() << Qt::endl;
        return 1;
    }

    bool ok = true;
    if (ok && parser.isSet(syncOption)) {
        ok = client.sync();
    }
    if (ok && parser.isSet(checkInOption)) {
        ok = client.checkIn();
    }
    if (ok && parser.isSet(checkInDesktopOption)) {
        ok = client.checkInDesktop();
    }
    if (ok && parser.isSet(breakOption)) {
        ok = client.startBreak();
    }
    if (ok && parser.isSet(resumeOption)) {
        ok = client.resumeWork();
    }
    if (ok && parser.isSet(reconnectOption)) {
        ok = client.reconnect();
    }
    if (ok && parser.isSet(forceCloseOption)) {
        ok = client.forceClose();
    }
    if (ok && parser.isSet(checkOutOption)) {
        ok = client.checkOut(parser.value(checkOutOption), parser.value(proofOption));
    }

    if (!ok) {
        out << "Failed: " << client.lastError() << Qt::endl;
        return 1;
    }

    out << client.describe() << Qt::endl;

    if (!parser.isSet(watchOption)) {
        return 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        LOG_INFO("Companion shutting down...");
        client.controller()->stopWatching();
    });

    monitor->evaluate();
    return app.exec();
}
