#ifndef CAPTUREATTEMPT_H
#define CAPTUREATTEMPT_H

#include <QObject>
#include <QString>

#include "CaptureTypes.h"
#include "sessioncore/clock.h"

class CameraCapturer;
class HostBridge;
class SessionStore;

/**
 * @brief One pass of capture, upload and evidence logging
 *
 * The camera runs asynchronously while the screen is grabbed; once both are in,
 * the artifacts are uploaded concurrently and a single EvidenceRecord is saved.
 * finished() is emitted exactly once unless abort() is called first.
 */
class CaptureAttempt : public QObject
{
    Q_OBJECT
public:
    CaptureAttempt(CaptureType type, const QString& userId, const QString& userDisplayName,
                   HostBridge* host, CameraCapturer* camera, SessionStore* store, Clock* clock,
                   QObject* parent = nullptr);
    ~CaptureAttempt() override;

    void run();
    void abort();

    CaptureType type() const { return m_result.type; }

signals:
    void finished(const CaptureResult& result);

private slots:
    void onCameraFinished(const CameraCapture& camera);

private:
    void startUploads();
    void onUploadDone();
    void recordEvidence();

    HostBridge* m_host;
    CameraCapturer* m_camera;
    SessionStore* m_store;
    Clock* m_clock;
    QString m_userId;
    QString m_userDisplayName;

    QByteArray m_screenJpeg;
    QByteArray m_cameraJpeg;
    bool m_screenDone;
    bool m_cameraDone;
    int m_pendingUploads;
    bool m_aborted;

    CaptureResult m_result;
};

#endif // CAPTUREATTEMPT_H
