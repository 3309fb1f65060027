#ifndef SESSIONCORE_SESSIONCONTROLLER_H
#define SESSIONCORE_SESSIONCONTROLLER_H

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>

#include "sessioncore/clock.h"
#include "sessioncore/records.h"
#include "sessioncore/sessionstatemachine.h"
#include "sessioncore/sessionstore.h"
#include "sessioncore/worksession.h"

/**
 * @brief Check-in, break, resume and check-out for one user
 *
 * Every operation writes the store first and only then updates the local copy,
 * so a failed write leaves local state untouched. Snapshots from the store
 * always replace the local copy.
 */
class SessionController : public QObject
{
    Q_OBJECT

public:
    enum class Error {
        NoError,
        AlreadyCheckedIn,
        NoActiveSession,
        NoOpenBreak,
        NotCheckedIn,
        StoreFailure,
        MissingCredential
    };

    SessionController(SessionStore* store, Clock* clock, WorkSession::Source source, QObject* parent = nullptr);
    ~SessionController() override;

    bool initialize();

    // Refused with AlreadyCheckedIn while another user's session is tracked
    bool setIdentity(const QString& userId, const QString& displayName);
    void setCredential(const QString& credential);
    QString userId() const;
    QString displayName() const;
    QString credential() const;
    WorkSession::Source source() const;

    void setHeartbeatInterval(int msecs);

    // resumed is set when an open session already existed and was adopted
    bool checkIn(bool* resumed = nullptr);
    bool startBreak();
    bool resumeWork();
    bool checkOut(const QString& report, const QString& proofLink = QString());

    // Terminal write with flagged = true; used when the session is closed on the user's behalf
    bool closeFlagged(const QString& report, const QString& reason);

    // Re-reads the tracked or open session from the store
    bool sync();

    void startWatching();
    void stopWatching();

    SessionStateMachine::State state() const;
    bool hasSession() const;
    WorkSession currentSession() const;
    SessionMirror mirror() const;
    SessionStateMachine* stateMachine() const;

    Error lastError() const;
    QString lastErrorString() const;
    static QString errorName(Error error);

public slots:
    void applyRemoteSnapshot(const WorkSession& session);
    void handleSessionRemoved(const QString& sessionId);

signals:
    void stateChanged(int newState, int oldState);
    void sessionUpdated(const WorkSession& session);
    void sessionClosed(const QString& sessionId);
    void mirrorChanged(const SessionMirror& mirror);
    void heartbeatWritten(const QDateTime& at);

private slots:
    void sendHeartbeat();
    void onMachineReady();

private:
    static SessionStateMachine::State stateFor(const WorkSession& session);
    void replaceSession(const WorkSession& session);
    void clearSession();
    void driveMachine(SessionStateMachine::State from, SessionStateMachine::State to);
    void updateHeartbeat();
    bool fail(Error error, const QString& message);

    SessionStore* m_store;
    Clock* m_clock;
    WorkSession::Source m_source;
    SessionStateMachine* m_stateMachine;
    QTimer m_heartbeatTimer;

    QString m_userId;
    QString m_displayName;
    QString m_credential;

    WorkSession m_session;
    bool m_hasSession;

    Error m_lastError;
    QString m_lastErrorString;
};

#endif // SESSIONCORE_SESSIONCONTROLLER_H
