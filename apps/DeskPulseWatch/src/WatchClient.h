#ifndef WATCHCLIENT_H
#define WATCHCLIENT_H

#include <QObject>
#include <QString>

#include "sessioncore/agentcontrolclient.h"
#include "sessioncore/clock.h"
#include "sessioncore/livenessmonitor.h"
#include "sessioncore/sessioncontroller.h"
#include "sessioncore/sessionstore.h"

/**
 * @brief Browser-side companion of the desktop agent
 *
 * Runs a browser-sourced session controller and the liveness monitor. Actions
 * on a desktop-sourced session go to the agent first and fall back to a direct
 * store write when the agent does not take them.
 */
class WatchClient : public QObject
{
    Q_OBJECT
public:
    WatchClient(SessionStore* store, AgentControlClient* agent, Clock* clock = nullptr, QObject* parent = nullptr);
    ~WatchClient() override;

    bool initialize(const QString& userId, const QString& displayName, const QString& credential);

    SessionController* controller() const { return m_controller; }
    LivenessMonitor* monitor() const { return m_monitor; }

    // Opens a browser-sourced session
    bool checkIn();

    // Asks the agent to open (or resume) a desktop session, launching it when needed
    bool checkInDesktop();

    bool startBreak();
    bool resumeWork();
    bool checkOut(const QString& report, const QString& proofLink = QString());

    bool reconnect();
    bool forceClose();
    bool sync();

    QString describe() const;
    QString lastError() const { return m_lastError; }

signals:
    void statusMessage(const QString& message);

private slots:
    void onStalenessChanged(bool stale);

private:
    bool routedToAgent() const;
    void refreshFromStore();
    bool fail(const QString& message);

    AgentControlClient* m_agent;
    Clock* m_clock;
    SessionController* m_controller;
    LivenessMonitor* m_monitor;
    QString m_lastError;
};

#endif // WATCHCLIENT_H
