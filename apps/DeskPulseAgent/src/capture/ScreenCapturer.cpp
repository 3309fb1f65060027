#include "ScreenCapturer.h"
#include "logger/logger.h"

#include <QBuffer>
#include <QGuiApplication>
#include <QPixmap>
#include <QScreen>

QtScreenCapturer::QtScreenCapturer()
    : m_permissionChecked(false)
    , m_permissionDenied(false)
{
}

ScreenCapture QtScreenCapturer::capture()
{
    ScreenCapture result;

    if (m_permissionChecked && m_permissionDenied) {
        result.status = ScreenCapture::PermissionNeeded;
        return result;
    }

    QScreen* screen = QGuiApplication::primaryScreen();
    if (!screen) {
        LOG_WARNING("No primary screen to capture");
        return result;
    }

    QPixmap pixmap = screen->grabWindow(0);
    if (pixmap.isNull() || pixmap.width() <= 1 || pixmap.height() <= 1) {
        if (platformGatesCapture()) {
            if (!m_permissionChecked) {
                LOG_WARNING("Screen grab returned nothing; screen recording permission is likely missing");
            }
            m_permissionChecked = true;
            m_permissionDenied = true;
            result.status = ScreenCapture::PermissionNeeded;
        } else {
            LOG_WARNING("Screen grab returned an empty image");
        }
        return result;
    }
    m_permissionChecked = true;

    if (pixmap.width() > 1920 || pixmap.height() > 1080) {
        pixmap = pixmap.scaled(1920, 1080, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }

    QBuffer buffer(&result.jpeg);
    buffer.open(QIODevice::WriteOnly);
    if (!pixmap.save(&buffer, "JPG", 80)) {
        LOG_WARNING("Screen grab could not be encoded");
        result.jpeg.clear();
        return result;
    }

    result.status = ScreenCapture::Captured;
    LOG_DEBUG(QString("Screen captured: %1 bytes").arg(result.jpeg.size()));
    return result;
}

bool QtScreenCapturer::platformGatesCapture()
{
#ifdef Q_OS_MACOS
    return true;
#else
    return QGuiApplication::platformName().startsWith("wayland");
#endif
}
