#include "CameraCapturer.h"
#include "logger/logger.h"

#include <QBuffer>
#include <QCamera>
#include <QCameraDevice>
#include <QImage>
#include <QImageCapture>
#include <QMediaCaptureSession>
#include <QMediaDevices>

namespace {
// Lets exposure settle before the still is taken
const int kWarmUpMs = 500;
}

QtCameraCapturer::QtCameraCapturer(QObject* parent)
    : CameraCapturer(parent)
    , m_camera(nullptr)
    , m_imageCapture(nullptr)
    , m_session(nullptr)
    , m_busy(false)
    , m_requested(false)
{
    m_timeoutTimer.setSingleShot(true);
    m_timeoutTimer.setInterval(8000);
    connect(&m_timeoutTimer, &QTimer::timeout, this, &QtCameraCapturer::onTimeout);
}

QtCameraCapturer::~QtCameraCapturer()
{
    teardown();
}

void QtCameraCapturer::setTimeout(int msecs)
{
    m_timeoutTimer.setInterval(msecs);
}

void QtCameraCapturer::capture()
{
    if (m_busy) {
        LOG_WARNING("Camera capture already in progress");
        return;
    }
    m_busy = true;
    m_requested = false;

    const QCameraDevice device = QMediaDevices::defaultVideoInput();
    if (device.isNull()) {
        LOG_WARNING("No video input available");
        // Report on the next iteration so callers see a uniform async contract
        QTimer::singleShot(0, this, [this]() { finish(CameraCapture::DeviceBusy); });
        return;
    }

    LOG_DEBUG(QString("Capturing from camera: %1").arg(device.description()));

    m_camera = new QCamera(device, this);
    m_session = new QMediaCaptureSession(this);
    m_imageCapture = new QImageCapture(this);
    m_session->setCamera(m_camera);
    m_session->setImageCapture(m_imageCapture);

    connect(m_camera, &QCamera::errorOccurred, this, [this](QCamera::Error error, const QString& message) {
        if (error == QCamera::NoError) {
            return;
        }
        LOG_WARNING(QString("Camera could not start: %1").arg(message));
        finish(CameraCapture::DeviceBusy);
    });

    connect(m_imageCapture, &QImageCapture::readyForCaptureChanged, this, [this](bool ready) {
        if (!ready || m_requested) {
            return;
        }
        m_requested = true;
        QTimer::singleShot(kWarmUpMs, this, [this]() {
            if (m_busy && m_imageCapture) {
                m_imageCapture->capture();
            }
        });
    });

    connect(m_imageCapture, &QImageCapture::imageCaptured, this, [this](int id, const QImage& image) {
        Q_UNUSED(id);
        QByteArray jpeg;
        QBuffer buffer(&jpeg);
        buffer.open(QIODevice::WriteOnly);
        if (image.isNull() || !image.save(&buffer, "JPG", 80)) {
            LOG_WARNING("Camera frame could not be encoded");
            finish(CameraCapture::Failed);
            return;
        }
        finish(CameraCapture::Captured, jpeg);
    });

    connect(m_imageCapture, &QImageCapture::errorOccurred, this,
            [this](int id, QImageCapture::Error error, const QString& message) {
        Q_UNUSED(id);
        LOG_WARNING(QString("Still capture failed: %1").arg(message));
        const bool busy = error == QImageCapture::ResourceError || error == QImageCapture::NotReadyError;
        finish(busy ? CameraCapture::DeviceBusy : CameraCapture::Failed);
    });

    m_timeoutTimer.start();
    m_camera->start();
}

void QtCameraCapturer::cancel()
{
    if (!m_busy) {
        return;
    }
    LOG_DEBUG("Camera capture cancelled");
    m_busy = false;
    m_timeoutTimer.stop();
    teardown();
}

void QtCameraCapturer::onTimeout()
{
    LOG_WARNING(QString("No camera frame within %1 ms").arg(m_timeoutTimer.interval()));
    finish(CameraCapture::DeviceBusy);
}

void QtCameraCapturer::finish(CameraCapture::Status status, const QByteArray& jpeg)
{
    if (!m_busy) {
        return;
    }
    m_busy = false;
    m_timeoutTimer.stop();
    teardown();

    CameraCapture result;
    result.status = status;
    result.jpeg = jpeg;
    emit finished(result);
}

void QtCameraCapturer::teardown()
{
    if (m_camera) {
        m_camera->stop();
    }
    // May run inside one of their own signals
    if (m_imageCapture) {
        m_imageCapture->deleteLater();
        m_imageCapture = nullptr;
    }
    if (m_session) {
        m_session->deleteLater();
        m_session = nullptr;
    }
    if (m_camera) {
        m_camera->deleteLater();
        m_camera = nullptr;
    }
}
