#include "WatchClient.h"
#include "logger/logger.h"

WatchClient::WatchClient(SessionStore* store, AgentControlClient* agent, Clock* clock, QObject* parent)
    : QObject(parent)
    , m_agent(agent)
    , m_clock(clock ? clock : Clock::system())
    , m_controller(new SessionController(store, m_clock, WorkSession::Source::Browser, this))
    , m_monitor(new LivenessMonitor(m_controller, agent, m_clock, this))
{
    connect(m_monitor, &LivenessMonitor::stalenessChanged, this, &WatchClient::onStalenessChanged);
    connect(m_monitor, &LivenessMonitor::forceClosed, this, [this](const QString& sessionId) {
        emit statusMessage(QString("Session %1 closed and flagged").arg(sessionId));
    });
    connect(m_controller, &SessionController::sessionClosed, this, [this](const QString& sessionId) {
        emit statusMessage(QString("Session %1 completed").arg(sessionId));
    });
}

WatchClient::~WatchClient() = default;

bool WatchClient::initialize(const QString& userId, const QString& displayName, const QString& credential)
{
    if (userId.isEmpty() || credential.isEmpty()) {
        return fail("A user id and credential are required");
    }

    if (!m_controller->setIdentity(userId, displayName)) {
        return fail(m_controller->lastErrorString());
    }
    m_controller->setCredential(credential);
    if (!m_controller->initialize()) {
        return fail("Session controller failed to initialize");
    }

    // Pick up whatever session is already open before any action runs
    if (!m_controller->sync()) {
        LOG_WARNING(QString("Initial sync failed: %1").arg(m_controller->lastErrorString()));
    }
    m_controller->startWatching();
    return true;
}

bool WatchClient::routedToAgent() const
{
    return m_controller->hasSession() && m_controller->currentSession().isDesktop();
}

void WatchClient::refreshFromStore()
{
    if (!m_controller->sync()) {
        LOG_WARNING(QString("Sync after agent call failed: %1").arg(m_controller->lastErrorString()));
    }
}

bool WatchClient::fail(const QString& message)
{
    m_lastError = message;
    LOG_WARNING(message);
    return false;
}

bool WatchClient::checkIn()
{
    bool resumed = false;
    if (!m_controller->checkIn(&resumed)) {
        return fail(m_controller->lastErrorString());
    }
    emit statusMessage(resumed ? QString("Resumed session %1").arg(m_controller->currentSession().id)
                               : QString("Checked in, session %1").arg(m_controller->currentSession().id));
    return true;
}

bool WatchClient::checkInDesktop()
{
    if (m_controller->hasSession() && !m_controller->currentSession().isDesktop()) {
        return fail(QString("Browser session %1 is already open").arg(m_controller->currentSession().id));
    }

    if (!m_monitor->reconnect()) {
        return fail(m_monitor->lastError());
    }

    if (m_monitor->lastReconnectPath() == LivenessMonitor::ReconnectPath::Agent) {
        // The agent has written the session already; adopt it now instead of waiting for the watch
        refreshFromStore();
        emit statusMessage("Checked in through the desktop agent");
    } else {
        emit statusMessage("Desktop agent launched; waiting for it to check in");
    }
    return true;
}

bool WatchClient::startBreak()
{
    if (routedToAgent()) {
        if (m_agent->startBreak()) {
            refreshFromStore();
            emit statusMessage("Break started");
            return true;
        }
        LOG_WARNING(QString("Agent did not start the break, writing directly: %1").arg(m_agent->lastError()));
    }

    if (!m_controller->startBreak()) {
        return fail(m_controller->lastErrorString());
    }
    emit statusMessage("Break started");
    return true;
}

bool WatchClient::resumeWork()
{
    if (routedToAgent()) {
        if (m_agent->resume()) {
            refreshFromStore();
            emit statusMessage("Break ended");
            return true;
        }
        LOG_WARNING(QString("Agent did not end the break, writing directly: %1").arg(m_agent->lastError()));
    }

    if (!m_controller->resumeWork()) {
        return fail(m_controller->lastErrorString());
    }
    emit statusMessage("Break ended");
    return true;
}

bool WatchClient::checkOut(const QString& report, const QString& proofLink)
{
    if (routedToAgent()) {
        if (m_agent->checkOut(report, proofLink)) {
            refreshFromStore();
            emit statusMessage("Checked out");
            return true;
        }
        LOG_WARNING(QString("Agent did not check out, writing directly: %1").arg(m_agent->lastError()));
    }

    if (!m_controller->checkOut(report, proofLink)) {
        return fail(m_controller->lastErrorString());
    }
    emit statusMessage("Checked out");
    return true;
}

bool WatchClient::reconnect()
{
    if (!m_monitor->reconnect()) {
        return fail(m_monitor->lastError());
    }
    emit statusMessage(m_monitor->lastReconnectPath() == LivenessMonitor::ReconnectPath::Agent
                       ? "Reconnected to the desktop agent" : "Desktop agent launched");
    return true;
}

bool WatchClient::forceClose()
{
    if (!m_monitor->forceClose()) {
        return fail(m_monitor->lastError());
    }
    return true;
}

bool WatchClient::sync()
{
    if (!m_controller->sync()) {
        return fail(m_controller->lastErrorString());
    }
    m_monitor->evaluate();
    return true;
}

QString WatchClient::describe() const
{
    if (!m_controller->hasSession()) {
        return "No open session";
    }

    const WorkSession session = m_controller->currentSession();
    QString text = QString("Session %1 (%2, %3) since %4")
                       .arg(session.id, WorkSession::statusToString(session.status),
                            WorkSession::sourceToString(session.source),
                            session.checkInTime.toLocalTime().toString("yyyy-MM-dd HH:mm"));
    if (session.isDesktop()) {
        const qint64 age = LivenessMonitor::heartbeatAgeSeconds(session, m_clock->now());
        text += QString(", heartbeat %1 s ago%2").arg(age).arg(m_monitor->isStale() ? " [stale]" : "");
    }
    return text;
}

void WatchClient::onStalenessChanged(bool stale)
{
    if (stale) {
        emit statusMessage("Desktop app is not responding; use --reconnect or --force-close");
    } else {
        emit statusMessage("Desktop app heartbeat is live");
    }
}
