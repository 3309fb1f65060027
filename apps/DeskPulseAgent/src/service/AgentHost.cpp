#include "AgentHost.h"
#include "CheckoutGuard.h"
#include "capture/EvidenceUploader.h"
#include "logger/logger.h"

AgentHost::AgentHost(EvidenceUploader* uploader, CheckoutGuard* guard, QObject* parent)
    : QObject(parent)
    , m_uploader(uploader)
    , m_guard(guard)
    , m_status("idle")
{
}

AgentHost::~AgentHost() = default;

ScreenCapture AgentHost::captureScreen()
{
    return m_screenCapturer.capture();
}

void AgentHost::uploadImage(const QByteArray& jpeg, const QString& prefix, const QString& userId,
                            UploadCallback callback)
{
    if (!m_uploader) {
        LOG_WARNING("No uploader configured");
        callback(QString());
        return;
    }
    m_uploader->upload(jpeg, prefix, userId, callback);
}

void AgentHost::syncSessionState(const SessionMirror& mirror)
{
    if (!m_guard) {
        return;
    }
    LOG_DEBUG(mirror.isValid() ? QString("Guard mirror updated for %1").arg(mirror.sessionId)
                               : QString("Guard mirror cleared"));
    m_guard->updateMirror(mirror);
}

void AgentHost::notify(const QString& title, const QString& body)
{
    LOG_INFO(QString("%1: %2").arg(title, body));
    emit notificationPosted(title, body);
}

void AgentHost::updateStatus(const QString& status)
{
    if (m_status == status) {
        return;
    }
    m_status = status;
    LOG_DEBUG(QString("Status: %1").arg(status));
    emit statusChanged(status);
}
