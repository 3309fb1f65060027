#ifndef CAMERAPLACEHOLDER_H
#define CAMERAPLACEHOLDER_H

#include <QByteArray>
#include <QDateTime>
#include <QImage>

/**
 * @brief Stand-in evidence image used when the camera is held by another application
 */
class CameraPlaceholder
{
public:
    static const int Width = 640;
    static const int Height = 480;

    static QImage render(const QDateTime& when);

    // JPEG of render(), quality 80
    static QByteArray renderJpeg(const QDateTime& when);
};

#endif // CAMERAPLACEHOLDER_H
