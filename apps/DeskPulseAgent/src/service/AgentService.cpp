#include "AgentService.h"
#include "AgentControlController.h"
#include "AgentHost.h"
#include "CheckoutGuard.h"
#include "capture/CameraCapturer.h"
#include "capture/CaptureOrchestrator.h"
#include "capture/EvidenceUploader.h"
#include "logger/logger.h"
#include "sessioncore/agentcontrolclient.h"
#include "sessioncore/configmanager.h"
#include "sessioncore/restsessionstore.h"
#include "sessioncore/sessioncontroller.h"

#include <QUrl>

AgentService::AgentService(QObject* parent)
    : QObject(parent)
    , m_configManager(nullptr)
    , m_store(nullptr)
    , m_sessionController(nullptr)
    , m_uploader(nullptr)
    , m_guard(nullptr)
    , m_host(nullptr)
    , m_camera(nullptr)
    , m_orchestrator(nullptr)
    , m_server(nullptr)
    , m_isRunning(false)
{
}

AgentService::~AgentService()
{
    if (m_isRunning) {
        stop();
    }
}

bool AgentService::initialize()
{
    LOG_INFO("Initializing AgentService");

    m_configManager = new ConfigManager(this);
    if (!m_configManager->initialize()) {
        LOG_ERROR("Failed to initialize ConfigManager");
        return false;
    }
    if (!m_configManager->loadLocalConfig()) {
        LOG_WARNING("Using default configuration");
    }

    m_store = new RestSessionStore(this);
    if (!m_store->initialize(m_configManager->storeUrl(), m_configManager->projectId())) {
        LOG_ERROR(QString("Failed to initialize session store: %1").arg(m_store->lastError()));
        return false;
    }
    m_store->setWatchInterval(m_configManager->storeWatchIntervalSeconds() * 1000);

    m_sessionController = new SessionController(m_store, Clock::system(), WorkSession::Source::Desktop, this);
    m_sessionController->setHeartbeatInterval(m_configManager->heartbeatIntervalSeconds() * 1000);
    if (!m_sessionController->initialize()) {
        LOG_ERROR("Failed to initialize SessionController");
        return false;
    }

    m_uploader = new EvidenceUploader(Clock::system(), this);
    m_uploader->initialize(m_configManager->storageUrl(), m_configManager->storageBucket(),
                           m_configManager->storageApiKey());

    m_guard = new CheckoutGuard(Clock::system(), this);
    if (!m_guard->initialize(m_configManager->storeUrl(), m_configManager->projectId())) {
        return false;
    }
    m_guard->setTimeouts(m_configManager->emergencyTimeoutMs());

    m_host = new AgentHost(m_uploader, m_guard, this);
    m_camera = new QtCameraCapturer(this);

    m_orchestrator = new CaptureOrchestrator(m_host, m_camera, m_store, Clock::system(), this);
    m_orchestrator->setTimings(timingsFromConfig());

    connect(m_sessionController, &SessionController::stateChanged, this, &AgentService::onSessionStateChanged);
    connect(m_sessionController, &SessionController::mirrorChanged, this, &AgentService::onMirrorChanged);
    connect(m_orchestrator, &CaptureOrchestrator::countdownStarted, this, &AgentService::onCountdownStarted);
    connect(m_orchestrator, &CaptureOrchestrator::captureFinished, this, &AgentService::onCaptureFinished);
    connect(m_configManager, &ConfigManager::configChanged, this, [this]() {
        m_orchestrator->setTimings(timingsFromConfig());
        m_sessionController->setHeartbeatInterval(m_configManager->heartbeatIntervalSeconds() * 1000);
    });

    m_server = new Http::Server(this);
    m_server->registerController(std::make_shared<AgentControlController>(this));

    LOG_INFO("AgentService initialized successfully");
    return true;
}

CaptureTimings AgentService::timingsFromConfig() const
{
    CaptureTimings timings;
    timings.countdownSeconds = m_configManager->countdownSeconds();
    timings.firstDelayMinMs = qint64(m_configManager->firstCaptureMinMinutes()) * 60 * 1000;
    timings.firstDelayMaxMs = qint64(m_configManager->firstCaptureMaxMinutes()) * 60 * 1000;
    timings.cooldownMs = qint64(m_configManager->captureCooldownSeconds()) * 1000;
    timings.jitterMinMs = qint64(m_configManager->captureJitterMinMinutes()) * 60 * 1000;
    timings.jitterMaxMs = qint64(m_configManager->captureJitterMaxMinutes()) * 60 * 1000;
    timings.pollIntervalMs = m_configManager->remotePollSeconds() * 1000;
    timings.pollInitialDelayMs = m_configManager->remotePollInitialDelaySeconds() * 1000;
    return timings;
}

bool AgentService::start()
{
    if (m_isRunning) {
        LOG_WARNING("AgentService is already running");
        return true;
    }

    if (!m_server->start(controlPort())) {
        LOG_ERROR(QString("Control port %1 unavailable: %2").arg(controlPort()).arg(m_server->lastError()));
        return false;
    }

    m_isRunning = true;
    m_host->updateStatus("idle");
    LOG_INFO("AgentService started");
    return true;
}

bool AgentService::stop()
{
    if (!m_isRunning) {
        return true;
    }
    LOG_INFO("Stopping AgentService");

    m_orchestrator->stop();

    // Only reached with a mirror when the session was not checked out by hand
    if (m_guard->hasMirror()) {
        m_guard->emergencyCheckout();
    }

    m_sessionController->stopWatching();
    m_server->stop();
    m_isRunning = false;

    LOG_INFO("AgentService stopped");
    return true;
}

bool AgentService::isRunning() const
{
    return m_isRunning;
}

QString AgentService::launchScheme() const
{
    return m_configManager ? m_configManager->launchScheme() : QString("deskpulse");
}

quint16 AgentService::controlPort() const
{
    return m_configManager ? static_cast<quint16>(m_configManager->controlPort()) : 59210;
}

bool AgentService::consumeHandshake(const LaunchHandshake& handshake)
{
    QString error;
    switch (handshake.action) {
    case LaunchHandshake::Action::CheckIn: {
        bool resumed = false;
        if (!checkIn(handshake.credential, handshake.userId, handshake.name, resumed, error)) {
            LOG_ERROR(QString("Launch check-in failed: %1").arg(error));
            return false;
        }
        return true;
    }
    case LaunchHandshake::Action::Refresh:
        if (!refreshCredential(handshake.credential, error)) {
            LOG_ERROR(QString("Launch refresh failed: %1").arg(error));
            return false;
        }
        return true;
    case LaunchHandshake::Action::Open:
    case LaunchHandshake::Action::None:
        break;
    }
    return true;
}

bool AgentService::forwardToRunningAgent(const LaunchHandshake& handshake, quint16 port)
{
    AgentControlClient client;
    client.setBaseUrl(QUrl(QString("http://127.0.0.1:%1").arg(port)));

    switch (handshake.action) {
    case LaunchHandshake::Action::CheckIn:
        return client.checkIn(handshake.credential, handshake.userId, handshake.name);
    case LaunchHandshake::Action::Refresh:
        return client.refresh(handshake.credential);
    case LaunchHandshake::Action::Open:
    case LaunchHandshake::Action::None: {
        QJsonObject status;
        return client.probe(status);
    }
    }
    return false;
}

AgentActions::Status AgentService::status() const
{
    Status status;
    status.hasSession = m_sessionController->hasSession();
    if (status.hasSession) {
        status.sessionId = m_sessionController->currentSession().id;
    }
    status.isOnBreak = m_sessionController->state() == SessionStateMachine::OnBreak;
    status.captureCount = m_orchestrator->captureCount();
    return status;
}

bool AgentService::checkIn(const QString& credential, const QString& userId, const QString& name,
                           bool& resumed, QString& error)
{
    if (credential.isEmpty() || userId.isEmpty()) {
        error = "credential and userId are required";
        return false;
    }

    if (!m_sessionController->setIdentity(userId, name)) {
        error = m_sessionController->lastErrorString();
        return false;
    }
    m_sessionController->setCredential(credential);

    if (m_sessionController->hasSession()) {
        // Same user asking again: report the tracked session as resumed
        resumed = true;
        return true;
    }

    if (!m_sessionController->checkIn(&resumed)) {
        error = m_sessionController->lastErrorString();
        return false;
    }

    m_sessionController->startWatching();
    m_host->notify("DeskPulse", resumed ? "Resumed your open session" : "Checked in");
    return true;
}

bool AgentService::checkOut(const QString& report, const QString& proofLink, QString& error)
{
    if (!m_sessionController->checkOut(report, proofLink)) {
        error = m_sessionController->lastErrorString();
        return false;
    }
    m_host->notify("DeskPulse", "Checked out");
    return true;
}

bool AgentService::startBreak(QString& error)
{
    if (!m_sessionController->startBreak()) {
        error = m_sessionController->lastErrorString();
        return false;
    }
    return true;
}

bool AgentService::resumeWork(QString& error)
{
    if (!m_sessionController->resumeWork()) {
        error = m_sessionController->lastErrorString();
        return false;
    }
    return true;
}

bool AgentService::refreshCredential(const QString& credential, QString& error)
{
    if (credential.isEmpty()) {
        error = "credential is required";
        return false;
    }
    m_sessionController->setCredential(credential);
    LOG_INFO("Credential refreshed");
    return true;
}

bool AgentService::triggerCapture(bool& started, QString& error)
{
    const CaptureResult result = m_orchestrator->performCapture(CaptureType::Manual);
    if (result.refused) {
        error = "No open session";
        return false;
    }
    started = result.started;
    return true;
}

void AgentService::onSessionStateChanged(int newState, int oldState)
{
    LOG_INFO(QString("Session state %1 -> %2")
             .arg(SessionStateMachine::stateName(oldState), SessionStateMachine::stateName(newState)));

    switch (newState) {
    case SessionStateMachine::Active:
    case SessionStateMachine::OnBreak:
        m_orchestrator->setIdentity(m_sessionController->userId(), m_sessionController->displayName());
        m_orchestrator->start();
        m_host->updateStatus(newState == SessionStateMachine::Active ? "active" : "break");
        break;
    case SessionStateMachine::Completed:
    case SessionStateMachine::NoSession:
        m_orchestrator->stop();
        m_host->updateStatus("idle");
        break;
    }
}

void AgentService::onMirrorChanged(const SessionMirror& mirror)
{
    m_host->syncSessionState(mirror);
}

void AgentService::onCountdownStarted(CaptureType type, int seconds)
{
    m_host->notify("DeskPulse", QString("%1 capture in %2 seconds")
                   .arg(type == CaptureType::Auto ? QString("Scheduled") : QString("Requested"))
                   .arg(seconds));
}

void AgentService::onCaptureFinished(const CaptureResult& result)
{
    if (result.permissionNeeded) {
        m_host->updateStatus("permission-needed");
    } else if (result.flagged) {
        m_host->updateStatus("capture-failed");
    } else {
        m_host->updateStatus(m_sessionController->state() == SessionStateMachine::OnBreak ? "break" : "active");
    }
}
