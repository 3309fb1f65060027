#include "sessioncore/sessionstatemachine.h"
#include "logger/logger.h"

SessionStateMachine::SessionStateMachine(QObject* parent)
    : QObject(parent)
    , m_noSessionState(nullptr)
    , m_activeState(nullptr)
    , m_onBreakState(nullptr)
    , m_completedState(nullptr)
    , m_currentState(State::NoSession)
{
}

SessionStateMachine::~SessionStateMachine()
{
    m_stateMachine.stop();
}

bool SessionStateMachine::initialize()
{
    LOG_INFO("Initializing SessionStateMachine");

    setupStates();
    setupTransitions();

    connect(&m_stateMachine, &QStateMachine::started, this, &SessionStateMachine::ready);

    // Starts on the next event loop iteration
    m_stateMachine.start();
    return true;
}

bool SessionStateMachine::isRunning() const
{
    return m_stateMachine.isRunning();
}

SessionStateMachine::State SessionStateMachine::currentState() const
{
    return m_currentState;
}

QString SessionStateMachine::currentSessionId() const
{
    return m_currentSessionId;
}

QDateTime SessionStateMachine::sessionStartTime() const
{
    return m_sessionStartTime;
}

QString SessionStateMachine::stateName(int state)
{
    switch (state) {
        case NoSession: return "NoSession";
        case Active:    return "Active";
        case OnBreak:   return "OnBreak";
        case Completed: return "Completed";
        default:        return "Unknown";
    }
}

void SessionStateMachine::openSession(const QString& sessionId, const QDateTime& checkInTime, bool onBreak)
{
    LOG_INFO(QString("Opening session: %1").arg(sessionId));

    m_currentSessionId = sessionId;
    m_sessionStartTime = checkInTime;

    if (onBreak) {
        emit sessionOpenedOnBreak();
    } else {
        emit sessionOpened();
    }
}

void SessionStateMachine::startBreak()
{
    LOG_DEBUG("Break started");
    emit breakStarted();
}

void SessionStateMachine::endBreak()
{
    LOG_DEBUG("Break ended");
    emit breakEnded();
}

void SessionStateMachine::completeSession()
{
    LOG_INFO(QString("Completing session: %1").arg(m_currentSessionId));
    emit sessionCompleted();
}

void SessionStateMachine::setupStates()
{
    m_noSessionState = new QState(&m_stateMachine);
    m_activeState = new QState(&m_stateMachine);
    m_onBreakState = new QState(&m_stateMachine);
    m_completedState = new QState(&m_stateMachine);

    m_noSessionState->setObjectName("NoSession");
    m_activeState->setObjectName("Active");
    m_onBreakState->setObjectName("OnBreak");
    m_completedState->setObjectName("Completed");

    m_stateMachine.setInitialState(m_noSessionState);

    connect(m_noSessionState, &QState::entered, this, [this]() {
        LOG_DEBUG("Entered NoSession state");
        transitionToState(State::NoSession);
    });

    connect(m_activeState, &QState::entered, this, [this]() {
        LOG_INFO("Entered Active state");
        transitionToState(State::Active);
    });

    connect(m_onBreakState, &QState::entered, this, [this]() {
        LOG_INFO("Entered OnBreak state");
        transitionToState(State::OnBreak);
    });

    connect(m_completedState, &QState::entered, this, [this]() {
        LOG_INFO("Entered Completed state");
        const QString closedId = m_currentSessionId;
        transitionToState(State::Completed);

        m_currentSessionId.clear();
        m_sessionStartTime = QDateTime();
        emit sessionClosed(closedId);
    });
}

void SessionStateMachine::setupTransitions()
{
    m_noSessionState->addTransition(this, &SessionStateMachine::sessionOpened, m_activeState);
    m_noSessionState->addTransition(this, &SessionStateMachine::sessionOpenedOnBreak, m_onBreakState);

    m_activeState->addTransition(this, &SessionStateMachine::breakStarted, m_onBreakState);
    m_activeState->addTransition(this, &SessionStateMachine::sessionCompleted, m_completedState);

    m_onBreakState->addTransition(this, &SessionStateMachine::breakEnded, m_activeState);
    m_onBreakState->addTransition(this, &SessionStateMachine::sessionCompleted, m_completedState);

    // Completed is transient: the session leaves the local view immediately
    m_completedState->addTransition(m_completedState, &QState::entered, m_noSessionState);
}

void SessionStateMachine::transitionToState(State newState)
{
    if (m_currentState != newState) {
        State oldState = m_currentState;
        m_currentState = newState;

        LOG_INFO(QString("State changed: %1 -> %2").arg(stateName(oldState), stateName(newState)));
        emit stateChanged(newState, oldState);
    }
}
