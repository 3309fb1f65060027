#ifndef AGENTSERVICE_H
#define AGENTSERVICE_H

#include <QObject>
#include <QString>

#include <memory>

#include "AgentActions.h"
#include "capture/CaptureTypes.h"
#include "httpserver/server.h"
#include "sessioncore/launchhandshake.h"
#include "sessioncore/records.h"

class AgentHost;
class CaptureOrchestrator;
class CheckoutGuard;
class ConfigManager;
class EvidenceUploader;
class QtCameraCapturer;
class RestSessionStore;
class SessionController;

/**
 * @brief The desktop agent: session control, captures, control API and exit guard
 *
 * Captures run while the desktop session is open (including breaks) and stop
 * when it closes. stop() runs the emergency checkout when a session is still
 * mirrored.
 */
class AgentService : public QObject, public AgentActions
{
    Q_OBJECT
public:
    explicit AgentService(QObject* parent = nullptr);
    ~AgentService() override;

    bool initialize();

    // Binds the control port; false when another agent already holds it
    bool start();
    bool stop();
    bool isRunning() const;

    // Check-in or credential refresh carried by a launch URL
    bool consumeHandshake(const LaunchHandshake& handshake);

    // Hands a launch URL to the agent that already owns the control port
    static bool forwardToRunningAgent(const LaunchHandshake& handshake, quint16 port);

    QString launchScheme() const;
    quint16 controlPort() const;

    // AgentActions
    Status status() const override;
    bool checkIn(const QString& credential, const QString& userId, const QString& name,
                 bool& resumed, QString& error) override;
    bool checkOut(const QString& report, const QString& proofLink, QString& error) override;
    bool startBreak(QString& error) override;
    bool resumeWork(QString& error) override;
    bool refreshCredential(const QString& credential, QString& error) override;
    bool triggerCapture(bool& started, QString& error) override;

private slots:
    void onSessionStateChanged(int newState, int oldState);
    void onMirrorChanged(const SessionMirror& mirror);
    void onCountdownStarted(CaptureType type, int seconds);
    void onCaptureFinished(const CaptureResult& result);

private:
    CaptureTimings timingsFromConfig() const;

    ConfigManager* m_configManager;
    RestSessionStore* m_store;
    SessionController* m_sessionController;
    EvidenceUploader* m_uploader;
    CheckoutGuard* m_guard;
    AgentHost* m_host;
    QtCameraCapturer* m_camera;
    CaptureOrchestrator* m_orchestrator;
    Http::Server* m_server;
    bool m_isRunning;
};

#endif // AGENTSERVICE_H
