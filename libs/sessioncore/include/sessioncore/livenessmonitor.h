#ifndef SESSIONCORE_LIVENESSMONITOR_H
#define SESSIONCORE_LIVENESSMONITOR_H

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>

#include <functional>

#include "sessioncore/agentcontrolclient.h"
#include "sessioncore/clock.h"
#include "sessioncore/sessioncontroller.h"

/**
 * @brief Watches the heartbeat of desktop-sourced sessions from the browser side
 *
 * A session is stale when now - lastHeartbeat (or now - checkInTime before the
 * first heartbeat) exceeds the threshold. Staleness is re-evaluated on every
 * session update and on a poll that runs while a desktop session is tracked.
 */
class LivenessMonitor : public QObject
{
    Q_OBJECT

public:
    using UrlLauncher = std::function<bool(const QUrl&)>;
    using CredentialProvider = std::function<QString()>;

    enum class ReconnectPath {
        None,
        Agent,
        Handshake
    };

    LivenessMonitor(SessionController* controller, AgentControlClient* agent, Clock* clock,
                    QObject* parent = nullptr);
    ~LivenessMonitor() override;

    void setStaleThreshold(int seconds);
    int staleThreshold() const;
    void setPollInterval(int msecs);
    void setRefreshInterval(int msecs);
    void setLaunchScheme(const QString& scheme);
    void setProfile(const QString& email, const QString& photoUrl);

    // Defaults to QDesktopServices::openUrl
    void setUrlLauncher(UrlLauncher launcher);

    // Defaults to the controller's current credential
    void setCredentialProvider(CredentialProvider provider);

    bool isStale() const;
    bool isPolling() const;

    static qint64 heartbeatAgeSeconds(const WorkSession& session, const QDateTime& now);
    static bool isSessionStale(const WorkSession& session, const QDateTime& now, int thresholdSeconds);

    // Probe the agent and re-send credentials; fall back to the launch handshake
    bool reconnect();
    ReconnectPath lastReconnectPath() const;

    // Closes the tracked session as flagged on the user's behalf
    bool forceClose();

    QString lastError() const;

public slots:
    void evaluate();

signals:
    void stalenessChanged(bool stale);
    void reconnected(bool viaAgent);
    void credentialRefreshed(bool viaAgent);
    void forceClosed(const QString& sessionId);

private slots:
    void onSessionUpdated(const WorkSession& session);
    void onSessionClosed(const QString& sessionId);
    void refreshCredential();

private:
    void setStale(bool stale);
    bool launch(const QUrl& url);

    SessionController* m_controller;
    AgentControlClient* m_agent;
    Clock* m_clock;

    QTimer m_pollTimer;
    QTimer m_refreshTimer;
    int m_staleThresholdSeconds;
    QString m_scheme;
    QString m_email;
    QString m_photoUrl;
    UrlLauncher m_launcher;
    CredentialProvider m_credentialProvider;

    bool m_stale;
    ReconnectPath m_lastPath;
    QString m_lastError;
};

#endif // SESSIONCORE_LIVENESSMONITOR_H
