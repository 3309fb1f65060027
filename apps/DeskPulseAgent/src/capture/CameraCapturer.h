#ifndef CAMERACAPTURER_H
#define CAMERACAPTURER_H

#include <QObject>
#include <QTimer>

#include "CaptureTypes.h"

class QCamera;
class QImageCapture;
class QMediaCaptureSession;

/**
 * @brief Takes one still from the camera and reports it through finished()
 *
 * finished() is emitted exactly once per capture() call.
 */
class CameraCapturer : public QObject
{
    Q_OBJECT
public:
    explicit CameraCapturer(QObject* parent = nullptr) : QObject(parent) {}
    ~CameraCapturer() override = default;

    virtual void capture() = 0;

    // Drops an in-flight capture without emitting finished()
    virtual void cancel() = 0;

signals:
    void finished(const CameraCapture& result);
};

/**
 * @brief CameraCapturer on the default Qt Multimedia video input
 *
 * No input, a camera or resource error, or no frame within the timeout are all
 * reported as DeviceBusy.
 */
class QtCameraCapturer : public CameraCapturer
{
    Q_OBJECT
public:
    explicit QtCameraCapturer(QObject* parent = nullptr);
    ~QtCameraCapturer() override;

    void setTimeout(int msecs);

    void capture() override;
    void cancel() override;

private slots:
    void onTimeout();

private:
    void finish(CameraCapture::Status status, const QByteArray& jpeg = QByteArray());
    void teardown();

    QCamera* m_camera;
    QImageCapture* m_imageCapture;
    QMediaCaptureSession* m_session;
    QTimer m_timeoutTimer;
    bool m_busy;
    bool m_requested;
};

#endif // CAMERACAPTURER_H
