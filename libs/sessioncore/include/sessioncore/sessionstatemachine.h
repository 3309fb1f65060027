#ifndef SESSIONCORE_SESSIONSTATEMACHINE_H
#define SESSIONCORE_SESSIONSTATEMACHINE_H

#include <QDateTime>
#include <QObject>
#include <QState>
#include <QStateMachine>
#include <QString>

/**
 * @brief Lifecycle of the tracked work session
 *
 * NoSession -> Active <-> OnBreak -> Completed -> NoSession. Completed is passed
 * through on the way back to NoSession so observers see the session close.
 * Observers react to stateChanged(); the session document stays the data of record.
 */
class SessionStateMachine : public QObject
{
    Q_OBJECT

public:
    enum State {
        NoSession = 0,
        Active = 1,
        OnBreak = 2,
        Completed = 3
    };
    Q_ENUM(State)

    explicit SessionStateMachine(QObject* parent = nullptr);
    ~SessionStateMachine() override;

    bool initialize();
    bool isRunning() const;

    State currentState() const;
    QString currentSessionId() const;
    QDateTime sessionStartTime() const;

    static QString stateName(int state);

public slots:
    void openSession(const QString& sessionId, const QDateTime& checkInTime, bool onBreak);
    void startBreak();
    void endBreak();
    void completeSession();

signals:
    // Internal signals for state machine
    void sessionOpened();
    void sessionOpenedOnBreak();
    void breakStarted();
    void breakEnded();
    void sessionCompleted();

    // External signals for observers
    void ready();
    void stateChanged(int newState, int oldState);
    void sessionClosed(const QString& sessionId);

private:
    void setupStates();
    void setupTransitions();
    void transitionToState(State newState);

    QStateMachine m_stateMachine;
    QState* m_noSessionState;
    QState* m_activeState;
    QState* m_onBreakState;
    QState* m_completedState;

    State m_currentState;
    QString m_currentSessionId;
    QDateTime m_sessionStartTime;
};

#endif // SESSIONCORE_SESSIONSTATEMACHINE_H
