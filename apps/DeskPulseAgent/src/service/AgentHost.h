#ifndef AGENTHOST_H
#define AGENTHOST_H

#include <QObject>
#include <QString>

#include "capture/HostBridge.h"
#include "capture/ScreenCapturer.h"

class CheckoutGuard;
class EvidenceUploader;

/**
 * @brief HostBridge of the agent process
 *
 * Screen grabs, evidence uploads and the checkout guard's mirror. Notifications
 * and status text are logged and re-emitted for whatever front end is attached.
 */
class AgentHost : public QObject, public HostBridge
{
    Q_OBJECT
public:
    AgentHost(EvidenceUploader* uploader, CheckoutGuard* guard, QObject* parent = nullptr);
    ~AgentHost() override;

    ScreenCapture captureScreen() override;
    void uploadImage(const QByteArray& jpeg, const QString& prefix, const QString& userId,
                     UploadCallback callback) override;
    void syncSessionState(const SessionMirror& mirror) override;
    void notify(const QString& title, const QString& body) override;
    void updateStatus(const QString& status) override;

    QString status() const { return m_status; }

signals:
    void notificationPosted(const QString& title, const QString& body);
    void statusChanged(const QString& status);

private:
    QtScreenCapturer m_screenCapturer;
    EvidenceUploader* m_uploader;
    CheckoutGuard* m_guard;
    QString m_status;
};

#endif // AGENTHOST_H
