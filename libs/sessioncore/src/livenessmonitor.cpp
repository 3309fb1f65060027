#include "sessioncore/livenessmonitor.h"
#include "sessioncore/launchhandshake.h"
#include "logger/logger.h"

#include <QDesktopServices>
#include <QJsonObject>

LivenessMonitor::LivenessMonitor(SessionController* controller, AgentControlClient* agent, Clock* clock,
                                 QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_agent(agent)
    , m_clock(clock ? clock : Clock::system())
    , m_staleThresholdSeconds(120)
    , m_scheme("deskpulse")
    , m_launcher([](const QUrl& url) { return QDesktopServices::openUrl(url); })
    , m_stale(false)
    , m_lastPath(ReconnectPath::None)
{
    m_credentialProvider = [this]() { return m_controller->credential(); };

    m_pollTimer.setInterval(30000);
    connect(&m_pollTimer, &QTimer::timeout, this, &LivenessMonitor::evaluate);

    m_refreshTimer.setInterval(50 * 60 * 1000);
    connect(&m_refreshTimer, &QTimer::timeout, this, &LivenessMonitor::refreshCredential);

    connect(m_controller, &SessionController::sessionUpdated, this, &LivenessMonitor::onSessionUpdated);
    connect(m_controller, &SessionController::sessionClosed, this, &LivenessMonitor::onSessionClosed);
}

LivenessMonitor::~LivenessMonitor()
{
    m_pollTimer.stop();
    m_refreshTimer.stop();
}

void LivenessMonitor::setStaleThreshold(int seconds)
{
    m_staleThresholdSeconds = seconds;
}

int LivenessMonitor::staleThreshold() const
{
    return m_staleThresholdSeconds;
}

void LivenessMonitor::setPollInterval(int msecs)
{
    m_pollTimer.setInterval(msecs);
}

void LivenessMonitor::setRefreshInterval(int msecs)
{
    m_refreshTimer.setInterval(msecs);
}

void LivenessMonitor::setLaunchScheme(const QString& scheme)
{
    m_scheme = scheme;
}

void LivenessMonitor::setProfile(const QString& email, const QString& photoUrl)
{
    m_email = email;
    m_photoUrl = photoUrl;
}

void LivenessMonitor::setUrlLauncher(UrlLauncher launcher)
{
    m_launcher = std::move(launcher);
}

void LivenessMonitor::setCredentialProvider(CredentialProvider provider)
{
    m_credentialProvider = std::move(provider);
}

bool LivenessMonitor::isStale() const
{
    return m_stale;
}

bool LivenessMonitor::isPolling() const
{
    return m_pollTimer.isActive();
}

qint64 LivenessMonitor::heartbeatAgeSeconds(const WorkSession& session, const QDateTime& now)
{
    const QDateTime reference = session.lastHeartbeat.isValid() ? session.lastHeartbeat : session.checkInTime;
    if (!reference.isValid()) {
        return 0;
    }
    return reference.secsTo(now);
}

bool LivenessMonitor::isSessionStale(const WorkSession& session, const QDateTime& now, int thresholdSeconds)
{
    if (!session.isDesktop() || !session.isOpen()) {
        return false;
    }
    return heartbeatAgeSeconds(session, now) > thresholdSeconds;
}

void LivenessMonitor::evaluate()
{
    if (!m_controller->hasSession()) {
        setStale(false);
        return;
    }
    setStale(isSessionStale(m_controller->currentSession(), m_clock->now(), m_staleThresholdSeconds));
}

bool LivenessMonitor::reconnect()
{
    m_lastPath = ReconnectPath::None;
    m_lastError.clear();

    const QString credential = m_credentialProvider();
    const QString userId = m_controller->userId();
    const QString name = m_controller->displayName();
    if (credential.isEmpty() || userId.isEmpty()) {
        m_lastError = "No signed-in user to hand to the desktop agent";
        LOG_WARNING(m_lastError);
        return false;
    }

    QJsonObject status;
    if (m_agent->probe(status)) {
        bool resumed = false;
        if (m_agent->checkIn(credential, userId, name, &resumed)) {
            LOG_INFO(QString("Reconnected to desktop agent (resumed: %1)").arg(resumed ? "yes" : "no"));
            m_lastPath = ReconnectPath::Agent;
            m_refreshTimer.start();
            // The agent writes a fresh heartbeat as soon as it adopts the session
            setStale(false);
            emit reconnected(true);
            return true;
        }
        LOG_WARNING(QString("Desktop agent refused check-in: %1").arg(m_agent->lastError()));
    } else {
        LOG_INFO("Desktop agent not reachable, using the launch handshake");
    }

    const LaunchHandshake handshake = LaunchHandshake::checkIn(credential, userId, name, m_email, m_photoUrl);
    if (!launch(handshake.toUrl(m_scheme))) {
        m_lastError = "Could not reach the desktop agent or launch it";
        LOG_ERROR(m_lastError);
        return false;
    }

    m_lastPath = ReconnectPath::Handshake;
    m_refreshTimer.start();
    emit reconnected(false);
    return true;
}

LivenessMonitor::ReconnectPath LivenessMonitor::lastReconnectPath() const
{
    return m_lastPath;
}

bool LivenessMonitor::forceClose()
{
    if (!m_controller->hasSession()) {
        m_lastError = "No session to close";
        return false;
    }

    const QString sessionId = m_controller->currentSession().id;
    if (!m_controller->closeFlagged("[Auto] Desktop app became unresponsive, session closed from browser",
                                    "heartbeat stopped")) {
        m_lastError = m_controller->lastErrorString();
        return false;
    }

    m_refreshTimer.stop();
    setStale(false);
    emit forceClosed(sessionId);
    return true;
}

QString LivenessMonitor::lastError() const
{
    return m_lastError;
}

void LivenessMonitor::onSessionUpdated(const WorkSession& session)
{
    const bool watch = session.isOpen() && session.isDesktop();
    if (watch && !m_pollTimer.isActive()) {
        m_pollTimer.start();
    } else if (!watch && m_pollTimer.isActive()) {
        m_pollTimer.stop();
    }
    evaluate();
}

void LivenessMonitor::onSessionClosed(const QString& sessionId)
{
    Q_UNUSED(sessionId);
    m_pollTimer.stop();
    setStale(false);
}

void LivenessMonitor::refreshCredential()
{
    const QString credential = m_credentialProvider();
    if (credential.isEmpty()) {
        LOG_WARNING("No credential to refresh");
        return;
    }

    if (m_lastPath == ReconnectPath::Agent) {
        if (m_agent->refresh(credential)) {
            emit credentialRefreshed(true);
            return;
        }
        LOG_WARNING(QString("Credential refresh through the agent failed: %1").arg(m_agent->lastError()));
    }

    if (launch(LaunchHandshake::refresh(credential).toUrl(m_scheme))) {
        emit credentialRefreshed(false);
    }
}

void LivenessMonitor::setStale(bool stale)
{
    if (m_stale == stale) {
        return;
    }
    m_stale = stale;
    if (stale) {
        LOG_WARNING(QString("Desktop session %1 is stale").arg(m_controller->currentSession().id));
    }
    emit stalenessChanged(stale);
}

bool LivenessMonitor::launch(const QUrl& url)
{
    LOG_INFO(QString("Launching desktop agent via %1://%2").arg(url.scheme(), url.host()));
    if (!m_launcher || !m_launcher(url)) {
        LOG_WARNING("Launch handshake could not be delivered");
        return false;
    }
    return true;
}
