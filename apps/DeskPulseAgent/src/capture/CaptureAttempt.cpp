#include "CaptureAttempt.h"
#include "CameraCapturer.h"
#include "CameraPlaceholder.h"
#include "HostBridge.h"
#include "logger/logger.h"
#include "sessioncore/sessionstore.h"

#include <QList>
#include <QPair>
#include <QPointer>

CaptureAttempt::CaptureAttempt(CaptureType type, const QString& userId, const QString& userDisplayName,
                               HostBridge* host, CameraCapturer* camera, SessionStore* store, Clock* clock,
                               QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_camera(camera)
    , m_store(store)
    , m_clock(clock ? clock : Clock::system())
    , m_userId(userId)
    , m_userDisplayName(userDisplayName)
    , m_screenDone(false)
    , m_cameraDone(false)
    , m_pendingUploads(0)
    , m_aborted(false)
{
    m_result.type = type;
    m_result.started = true;
}

CaptureAttempt::~CaptureAttempt()
{
    if (m_camera) {
        disconnect(m_camera, nullptr, this, nullptr);
    }
}

void CaptureAttempt::run()
{
    LOG_INFO(QString("Starting %1 capture for %2").arg(captureTypeToString(m_result.type), m_userId));

    if (m_camera) {
        connect(m_camera, &CameraCapturer::finished, this, &CaptureAttempt::onCameraFinished);
        m_camera->capture();
    } else {
        m_cameraDone = true;
    }

    if (m_aborted) {
        return;
    }

    ScreenCapture screen = m_host->captureScreen();
    switch (screen.status) {
    case ScreenCapture::Captured:
        m_screenJpeg = screen.jpeg;
        break;
    case ScreenCapture::PermissionNeeded:
        m_result.permissionNeeded = true;
        LOG_WARNING("Screen capture needs the screen recording permission");
        m_host->notify("DeskPulse", "Please grant the screen recording permission, then restart DeskPulse.");
        break;
    case ScreenCapture::Failed:
        LOG_WARNING("Screen capture returned nothing");
        break;
    }
    m_screenDone = true;

    if (m_cameraDone) {
        startUploads();
    }
}

void CaptureAttempt::abort()
{
    if (m_aborted) {
        return;
    }
    m_aborted = true;
    if (m_camera) {
        disconnect(m_camera, nullptr, this, nullptr);
        m_camera->cancel();
    }
    LOG_DEBUG(QString("%1 capture aborted").arg(captureTypeToString(m_result.type)));
}

void CaptureAttempt::onCameraFinished(const CameraCapture& camera)
{
    if (m_aborted || m_cameraDone) {
        return;
    }
    disconnect(m_camera, nullptr, this, nullptr);

    switch (camera.status) {
    case CameraCapture::Captured:
        m_cameraJpeg = camera.jpeg;
        break;
    case CameraCapture::DeviceBusy:
        LOG_INFO("Camera is busy; using the placeholder image");
        m_cameraJpeg = CameraPlaceholder::renderJpeg(m_clock->now());
        m_result.cameraPlaceholder = true;
        break;
    case CameraCapture::Failed:
        LOG_WARNING("Camera capture failed");
        break;
    }
    m_cameraDone = true;

    if (m_screenDone) {
        startUploads();
    }
}

void CaptureAttempt::startUploads()
{
    if (m_aborted) {
        return;
    }

    QList<QPair<QString, QByteArray>> artifacts;
    if (!m_screenJpeg.isEmpty()) {
        artifacts.append(qMakePair(QString("screen"), m_screenJpeg));
    }
    if (!m_cameraJpeg.isEmpty()) {
        artifacts.append(qMakePair(QString("camera"), m_cameraJpeg));
    }

    if (artifacts.isEmpty()) {
        recordEvidence();
        return;
    }

    // Counted up front so a callback that runs synchronously cannot finish early
    m_pendingUploads = artifacts.size();
    QPointer<CaptureAttempt> guard(this);
    for (const auto& artifact : artifacts) {
        const QString prefix = artifact.first;
        m_host->uploadImage(artifact.second, prefix, m_userId, [guard, prefix](const QString& url) {
            if (!guard || guard->m_aborted) {
                return;
            }
            if (prefix == "screen") {
                guard->m_result.screenshotUrl = url;
            } else {
                guard->m_result.cameraImageUrl = url;
            }
            LOG_DEBUG(QString("%1 upload %2").arg(prefix, url.isEmpty() ? "failed" : "succeeded"));
            guard->onUploadDone();
        });
        if (!guard || m_aborted) {
            return;
        }
    }
}

void CaptureAttempt::onUploadDone()
{
    if (--m_pendingUploads > 0) {
        return;
    }
    recordEvidence();
}

void CaptureAttempt::recordEvidence()
{
    EvidenceRecord record;
    record.userId = m_userId;
    record.userDisplayName = m_userDisplayName;
    record.screenshotUrl = m_result.screenshotUrl;
    record.cameraImageUrl = m_result.cameraImageUrl;
    record.timestamp = m_clock->now();

    m_result.flagged = m_result.screenshotUrl.isEmpty() && m_result.cameraImageUrl.isEmpty();
    record.flagged = m_result.flagged;
    if (m_result.flagged) {
        record.type = CaptureType::Flagged;
        record.flagReason = "Both camera and screen capture failed";
    } else {
        record.type = m_result.type;
    }

    // Saving can spin an event loop in which the session closes and this attempt is deleted
    SessionStore* store = m_store;
    QPointer<CaptureAttempt> guard(this);
    if (store && !store->saveEvidence(record)) {
        LOG_ERROR(QString("Failed to save evidence record: %1").arg(store->lastError()));
    }
    if (!guard || guard->m_aborted) {
        return;
    }

    m_result.finishedAt = m_clock->now();
    LOG_INFO(QString("%1 capture complete%2").arg(captureTypeToString(m_result.type),
                                                 m_result.flagged ? " (flagged)" : ""));
    emit finished(m_result);
}
