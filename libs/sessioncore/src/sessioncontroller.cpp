#include "sessioncore/sessioncontroller.h"
#include "logger/logger.h"

SessionController::SessionController(SessionStore* store, Clock* clock, WorkSession::Source source, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock ? clock : Clock::system())
    , m_source(source)
    , m_stateMachine(new SessionStateMachine(this))
    , m_hasSession(false)
    , m_lastError(Error::NoError)
{
    m_heartbeatTimer.setInterval(30000);
    connect(&m_heartbeatTimer, &QTimer::timeout, this, &SessionController::sendHeartbeat);

    connect(m_stateMachine, &SessionStateMachine::stateChanged, this, &SessionController::stateChanged);
    connect(m_stateMachine, &SessionStateMachine::ready, this, &SessionController::onMachineReady);
}

SessionController::~SessionController()
{
    m_heartbeatTimer.stop();
}

bool SessionController::initialize()
{
    if (!m_store) {
        LOG_ERROR("SessionController requires a session store");
        return false;
    }

    connect(m_store, &SessionStore::sessionChanged, this, &SessionController::applyRemoteSnapshot);
    connect(m_store, &SessionStore::sessionRemoved, this, &SessionController::handleSessionRemoved);

    if (!m_stateMachine->initialize()) {
        LOG_ERROR("Failed to initialize session state machine");
        return false;
    }

    LOG_INFO(QString("SessionController initialized (source: %1)").arg(WorkSession::sourceToString(m_source)));
    return true;
}

bool SessionController::setIdentity(const QString& userId, const QString& displayName)
{
    if (m_hasSession && userId != m_userId) {
        return fail(Error::AlreadyCheckedIn,
                    QString("Session %1 of %2 is still open; check out before switching users").arg(m_session.id, m_userId));
    }
    m_userId = userId;
    m_displayName = displayName;
    return true;
}

void SessionController::setCredential(const QString& credential)
{
    m_credential = credential;
    m_store->setCredential(credential);

    if (m_hasSession) {
        emit mirrorChanged(mirror());
    }
}

QString SessionController::userId() const
{
    return m_userId;
}

QString SessionController::displayName() const
{
    return m_displayName;
}

QString SessionController::credential() const
{
    return m_credential;
}

WorkSession::Source SessionController::source() const
{
    return m_source;
}

void SessionController::setHeartbeatInterval(int msecs)
{
    m_heartbeatTimer.setInterval(msecs);
}

bool SessionController::checkIn(bool* resumed)
{
    if (resumed) {
        *resumed = false;
    }
    if (m_userId.isEmpty()) {
        return fail(Error::MissingCredential, "No signed-in user");
    }
    if (m_hasSession) {
        return fail(Error::AlreadyCheckedIn, QString("Session %1 is already open").arg(m_session.id));
    }

    // Adopt an open session started by another client instead of opening a second one
    WorkSession existing;
    bool found = false;
    if (!m_store->findOpenSession(m_userId, existing, found)) {
        LOG_WARNING(QString("Open session lookup failed, creating a new one: %1").arg(m_store->lastError()));
    } else if (found) {
        LOG_INFO(QString("Resuming open session %1").arg(existing.id));
        replaceSession(existing);
        if (resumed) {
            *resumed = true;
        }
        m_lastError = Error::NoError;
        return true;
    }

    const QDateTime now = m_clock->now();
    WorkSession session;
    session.userId = m_userId;
    session.userDisplayName = m_displayName;
    session.checkInTime = now;
    session.status = WorkSession::Status::Active;
    session.source = m_source;
    if (m_source == WorkSession::Source::Desktop) {
        session.lastHeartbeat = now;
    }

    if (!m_store->createSession(session)) {
        return fail(Error::StoreFailure, QString("Check-in failed: %1").arg(m_store->lastError()));
    }

    if (!m_store->setPresence(m_userId, true, now)) {
        LOG_WARNING(QString("Presence update failed: %1").arg(m_store->lastError()));
    }

    LOG_INFO(QString("Checked in, session %1").arg(session.id));
    replaceSession(session);
    m_lastError = Error::NoError;
    return true;
}

bool SessionController::startBreak()
{
    if (!m_hasSession || m_session.status != WorkSession::Status::Active) {
        return fail(Error::NoActiveSession, "No active session to pause");
    }

    WorkSession updated = m_session;
    updated.beginBreak(m_clock->now());

    if (!m_store->updateSession(updated, WorkSession::breakFieldMask())) {
        return fail(Error::StoreFailure, QString("Break failed: %1").arg(m_store->lastError()));
    }

    replaceSession(updated);
    m_lastError = Error::NoError;
    return true;
}

bool SessionController::resumeWork()
{
    if (!m_hasSession) {
        return fail(Error::NoActiveSession, "No session to resume");
    }
    if (m_session.status != WorkSession::Status::Break) {
        return fail(Error::NoOpenBreak, "Session is not on break");
    }
    if (!m_session.hasOpenBreak()) {
        return fail(Error::NoOpenBreak, QString("Session %1 is on break without an open break period").arg(m_session.id));
    }

    WorkSession updated = m_session;
    updated.endBreak(m_clock->now());

    if (!m_store->updateSession(updated, WorkSession::breakFieldMask())) {
        return fail(Error::StoreFailure, QString("Resume failed: %1").arg(m_store->lastError()));
    }

    replaceSession(updated);
    m_lastError = Error::NoError;
    return true;
}

bool SessionController::checkOut(const QString& report, const QString& proofLink)
{
    if (!m_hasSession) {
        return fail(Error::NotCheckedIn, "Not checked in");
    }

    const QDateTime now = m_clock->now();
    WorkSession updated = m_session;
    QStringList attachments;
    if (!proofLink.trimmed().isEmpty()) {
        attachments.append(proofLink.trimmed());
    }
    updated.complete(now, report, attachments);

    if (!m_store->updateSession(updated, WorkSession::completionFieldMask())) {
        return fail(Error::StoreFailure, QString("Check-out failed: %1").arg(m_store->lastError()));
    }

    if (!m_store->setPresence(m_userId, false, now)) {
        LOG_WARNING(QString("Presence update failed: %1").arg(m_store->lastError()));
    }

    LOG_INFO(QString("Checked out of session %1 after %2 min (%3 min break)")
             .arg(updated.id).arg(updated.durationMinutes).arg(updated.breakDurationMinutes));
    replaceSession(updated);
    m_lastError = Error::NoError;
    return true;
}

bool SessionController::closeFlagged(const QString& report, const QString& reason)
{
    if (!m_hasSession) {
        return fail(Error::NotCheckedIn, "No session to close");
    }

    const QDateTime now = m_clock->now();
    WorkSession updated = m_session;
    updated.completeFlagged(now, report, reason);

    if (!m_store->updateSession(updated, WorkSession::flaggedCompletionFieldMask())) {
        return fail(Error::StoreFailure, QString("Closing session failed: %1").arg(m_store->lastError()));
    }

    if (!m_store->setPresence(updated.userId, false, now)) {
        LOG_WARNING(QString("Presence update failed: %1").arg(m_store->lastError()));
    }

    LOG_WARNING(QString("Session %1 closed and flagged: %2").arg(updated.id, reason));
    replaceSession(updated);
    m_lastError = Error::NoError;
    return true;
}

bool SessionController::sync()
{
    if (m_userId.isEmpty()) {
        return fail(Error::MissingCredential, "No signed-in user");
    }

    if (m_hasSession) {
        WorkSession latest;
        bool exists = false;
        if (!m_store->fetchSession(m_session.id, latest, exists)) {
            return fail(Error::StoreFailure, QString("Sync failed: %1").arg(m_store->lastError()));
        }
        if (exists) {
            applyRemoteSnapshot(latest);
        } else {
            handleSessionRemoved(m_session.id);
        }
    } else {
        WorkSession open;
        bool found = false;
        if (!m_store->findOpenSession(m_userId, open, found)) {
            return fail(Error::StoreFailure, QString("Sync failed: %1").arg(m_store->lastError()));
        }
        if (found) {
            applyRemoteSnapshot(open);
        }
    }

    m_lastError = Error::NoError;
    return true;
}

void SessionController::startWatching()
{
    if (m_userId.isEmpty()) {
        LOG_WARNING("Cannot watch sessions without a user");
        return;
    }
    m_store->watchUserSessions(m_userId);
}

void SessionController::stopWatching()
{
    m_store->unwatch();
}

SessionStateMachine::State SessionController::state() const
{
    return m_hasSession ? stateFor(m_session) : SessionStateMachine::NoSession;
}

bool SessionController::hasSession() const
{
    return m_hasSession;
}

WorkSession SessionController::currentSession() const
{
    return m_session;
}

SessionMirror SessionController::mirror() const
{
    SessionMirror result;
    if (!m_hasSession) {
        return result;
    }

    result.credential = m_credential;
    result.userId = m_session.userId;
    result.sessionId = m_session.id;
    result.checkInTime = m_session.checkInTime;
    result.cumulativeBreakSeconds = m_session.closedBreakMsecs() / 1000;
    result.breakStartTime = m_session.openBreakStart();
    return result;
}

SessionStateMachine* SessionController::stateMachine() const
{
    return m_stateMachine;
}

SessionController::Error SessionController::lastError() const
{
    return m_lastError;
}

QString SessionController::lastErrorString() const
{
    return m_lastErrorString;
}

QString SessionController::errorName(Error error)
{
    switch (error) {
        case Error::NoError:          return "NoError";
        case Error::AlreadyCheckedIn: return "AlreadyCheckedIn";
        case Error::NoActiveSession:  return "NoActiveSession";
        case Error::NoOpenBreak:      return "NoOpenBreak";
        case Error::NotCheckedIn:     return "NotCheckedIn";
        case Error::StoreFailure:     return "StoreFailure";
        case Error::MissingCredential: return "MissingCredential";
    }
    return "Unknown";
}

void SessionController::applyRemoteSnapshot(const WorkSession& session)
{
    if (session.userId != m_userId || m_userId.isEmpty()) {
        return;
    }

    if (session.status == WorkSession::Status::Break && !session.breaksWellFormed()) {
        LOG_WARNING(QString("Session %1 is on break without an open break period").arg(session.id));
    }

    if (!m_hasSession) {
        if (session.isOpen()) {
            LOG_INFO(QString("Adopting session %1 from the store").arg(session.id));
            replaceSession(session);
        }
        return;
    }

    if (session.id != m_session.id) {
        // Two open sessions for one user; follow the most recent check-in
        if (session.isOpen() && session.checkInTime > m_session.checkInTime) {
            LOG_WARNING(QString("Concurrent open session %1 replaces %2").arg(session.id, m_session.id));
            clearSession();
            replaceSession(session);
        }
        return;
    }

    replaceSession(session);
}

void SessionController::handleSessionRemoved(const QString& sessionId)
{
    if (m_hasSession && sessionId == m_session.id) {
        LOG_WARNING(QString("Session %1 was deleted from the store").arg(sessionId));
        clearSession();
    }
}

void SessionController::sendHeartbeat()
{
    if (!m_hasSession || !m_session.isOpen()) {
        m_heartbeatTimer.stop();
        return;
    }

    const QDateTime now = m_clock->now();
    WorkSession updated = m_session;
    updated.lastHeartbeat = now;

    if (!m_store->updateSession(updated, WorkSession::heartbeatFieldMask())) {
        LOG_WARNING(QString("Heartbeat write failed: %1").arg(m_store->lastError()));
        return;
    }

    m_session.lastHeartbeat = now;
    LOG_DEBUG(QString("Heartbeat written for session %1").arg(m_session.id));
    emit heartbeatWritten(now);
}

void SessionController::onMachineReady()
{
    // Catch up with any session adopted before the machine was running
    driveMachine(SessionStateMachine::NoSession, state());
}

SessionStateMachine::State SessionController::stateFor(const WorkSession& session)
{
    switch (session.status) {
        case WorkSession::Status::Active:    return SessionStateMachine::Active;
        case WorkSession::Status::Break:     return SessionStateMachine::OnBreak;
        case WorkSession::Status::Completed: return SessionStateMachine::Completed;
    }
    return SessionStateMachine::NoSession;
}

void SessionController::replaceSession(const WorkSession& session)
{
    const SessionStateMachine::State before = state();

    if (!session.isOpen()) {
        const QString closedId = session.id;
        m_session = session;
        m_hasSession = false;
        updateHeartbeat();
        emit sessionUpdated(session);
        driveMachine(before, SessionStateMachine::Completed);
        m_session = WorkSession();
        emit mirrorChanged(SessionMirror());
        emit sessionClosed(closedId);
        return;
    }

    const bool changed = !m_hasSession || m_session.status != session.status ||
                         m_session.breaks.size() != session.breaks.size() ||
                         m_session.openBreakStart() != session.openBreakStart();

    m_session = session;
    m_hasSession = true;
    updateHeartbeat();
    emit sessionUpdated(m_session);

    if (changed) {
        driveMachine(before, state());
        emit mirrorChanged(mirror());
    }
}

void SessionController::clearSession()
{
    if (!m_hasSession) {
        return;
    }
    const SessionStateMachine::State before = state();
    const QString closedId = m_session.id;

    m_session = WorkSession();
    m_hasSession = false;
    updateHeartbeat();
    driveMachine(before, SessionStateMachine::Completed);
    emit mirrorChanged(SessionMirror());
    emit sessionClosed(closedId);
}

void SessionController::driveMachine(SessionStateMachine::State from, SessionStateMachine::State to)
{
    if (from == to || !m_stateMachine->isRunning()) {
        return;
    }

    if (to == SessionStateMachine::Completed || to == SessionStateMachine::NoSession) {
        if (from != SessionStateMachine::NoSession) {
            m_stateMachine->completeSession();
        }
        return;
    }

    if (from == SessionStateMachine::NoSession) {
        m_stateMachine->openSession(m_session.id, m_session.checkInTime, to == SessionStateMachine::OnBreak);
    } else if (to == SessionStateMachine::OnBreak) {
        m_stateMachine->startBreak();
    } else {
        m_stateMachine->endBreak();
    }
}

void SessionController::updateHeartbeat()
{
    const bool wanted = m_hasSession && m_source == WorkSession::Source::Desktop;
    if (wanted && !m_heartbeatTimer.isActive()) {
        m_heartbeatTimer.start();
        sendHeartbeat();
    } else if (!wanted && m_heartbeatTimer.isActive()) {
        m_heartbeatTimer.stop();
    }
}

bool SessionController::fail(Error error, const QString& message)
{
    m_lastError = error;
    m_lastErrorString = message;
    LOG_WARNING(QString("%1: %2").arg(errorName(error), message));
    return false;
}
