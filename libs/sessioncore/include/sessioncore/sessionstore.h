#ifndef SESSIONCORE_SESSIONSTORE_H
#define SESSIONCORE_SESSIONSTORE_H

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "sessioncore/records.h"
#include "sessioncore/worksession.h"

/**
 * @brief Shared document store holding work logs, capture commands and evidence
 *
 * Calls are synchronous and return false on failure with lastError() set.
 * Change notifications arrive through sessionChanged()/sessionRemoved() once
 * watchUserSessions() has been called.
 */
class SessionStore : public QObject
{
    Q_OBJECT

public:
    explicit SessionStore(QObject* parent = nullptr);
    ~SessionStore() override;

    // Bearer credential attached to every request
    virtual void setCredential(const QString& credential) = 0;

    // Writes a new work log; fills session.id and session.updateTime
    virtual bool createSession(WorkSession& session) = 0;

    virtual bool fetchSession(const QString& sessionId, WorkSession& session, bool& exists) = 0;

    // Most recent non-completed session of the user
    virtual bool findOpenSession(const QString& userId, WorkSession& session, bool& found) = 0;

    // Writes only the named fields of session
    virtual bool updateSession(const WorkSession& session, const QStringList& fieldMask) = 0;

    virtual bool setPresence(const QString& userId, bool online, const QDateTime& at) = 0;

    // Pending commands, oldest first
    virtual bool pendingCaptureCommands(const QString& userId, int limit, QList<CaptureCommand>& commands) = 0;
    virtual bool completeCaptureCommand(const QString& commandId, const QDateTime& at) = 0;

    virtual bool saveEvidence(const EvidenceRecord& record) = 0;

    virtual void watchUserSessions(const QString& userId) = 0;
    virtual void unwatch() = 0;

    QString lastError() const;

signals:
    void sessionChanged(const WorkSession& session);
    void sessionRemoved(const QString& sessionId);

protected:
    void setLastError(const QString& error);

private:
    QString m_lastError;
};

#endif // SESSIONCORE_SESSIONSTORE_H
