#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QStandardPaths>

#include <csignal>

#include "logger/logger.h"
#include "AgentService.h"

#ifdef Q_OS_UNIX
#include "ShutdownSignalWatcher.h"
#else
// Signal handler for graceful shutdown; the checkout guard runs from aboutToQuit
void signalHandler(int signal)
{
    LOG_INFO(QString("Received signal: %1").arg(signal));
    QCoreApplication::quit();
}
#endif

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("DeskPulse");
    QGuiApplication::setApplicationVersion("1.0.0");
    QGuiApplication::setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription("DeskPulse desktop agent");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level", "info");
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);
    parser.addPositionalArgument("url", "Launch URL handed over by the web app", "[url]");

    parser.process(app);

    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    } else {
        QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(logDir);
        Logger::instance()->setLogFile(logDir + "/deskpulse_agent.log");
    }
    Logger::instance()->setLogLevel(Logger::levelFromString(parser.value(logLevelOption), Logger::Info));

    LOG_INFO("DeskPulse agent starting...");

    AgentService service;
    if (!service.initialize()) {
        LOG_ERROR("Failed to initialize agent");
        return 1;
    }

    // The command line wins over the configuration file
    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    }
    if (parser.isSet(logLevelOption)) {
        Logger::instance()->setLogLevel(Logger::levelFromString(parser.value(logLevelOption), Logger::Info));
    }

    LaunchHandshake handshake;
    const bool hasHandshake = LaunchHandshake::fromArguments(parser.positionalArguments(),
                                                             service.launchScheme(), handshake);
    if (hasHandshake) {
        LOG_INFO(QString("Launch handshake: %1").arg(LaunchHandshake::actionName(handshake.action)));
    }

    if (!service.start()) {
        // Another agent owns the control port; hand the launch over and leave
        if (hasHandshake) {
            if (AgentService::forwardToRunningAgent(handshake, service.controlPort())) {
                LOG_INFO("Launch handed to the running agent");
                return 0;
            }
            LOG_ERROR("Running agent did not accept the launch");
        }
        LOG_ERROR("Failed to start agent");
        return 1;
    }

#ifdef Q_OS_UNIX
    ShutdownSignalWatcher signalWatcher;
    if (!signalWatcher.install({SIGINT, SIGTERM})) {
        LOG_WARNING(QString("Shutdown signals not watched: %1").arg(signalWatcher.lastError()));
    }
    QObject::connect(&signalWatcher, &ShutdownSignalWatcher::terminationRequested,
                     &app, &QCoreApplication::quit);
#else
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#endif

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        LOG_INFO("Application shutting down...");
        service.stop();
    });

    if (hasHandshake && !service.consumeHandshake(handshake)) {
        LOG_WARNING("Launch handshake was not applied");
    }

    return app.exec();
}
