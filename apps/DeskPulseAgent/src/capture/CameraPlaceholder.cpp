#include "CameraPlaceholder.h"

#include <QBuffer>
#include <QColor>
#include <QFont>
#include <QPainter>

QImage CameraPlaceholder::render(const QDateTime& when)
{
    QImage image(Width, Height, QImage::Format_RGB32);
    image.fill(QColor(0x1f, 0x29, 0x37));

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);

    // Crossed-out camera glyph
    painter.setPen(QPen(QColor(0x9c, 0xa3, 0xaf), 4));
    painter.drawRoundedRect(QRectF(260, 120, 120, 80), 10, 10);
    painter.drawEllipse(QPointF(320, 160), 22, 22);
    painter.setPen(QPen(QColor(0xef, 0x44, 0x44), 5));
    painter.drawLine(QPointF(250, 215), QPointF(390, 105));

    QFont title = painter.font();
    title.setPixelSize(32);
    title.setBold(true);
    painter.setFont(title);
    painter.setPen(QColor(0xf9, 0xfa, 0xfb));
    painter.drawText(QRect(0, 250, Width, 44), Qt::AlignCenter, "Camera Unavailable");

    QFont detail = painter.font();
    detail.setPixelSize(18);
    detail.setBold(false);
    painter.setFont(detail);
    painter.setPen(QColor(0xd1, 0xd5, 0xdb));
    painter.drawText(QRect(0, 300, Width, 30), Qt::AlignCenter, "Camera is in use by another application");

    detail.setPixelSize(16);
    painter.setFont(detail);
    painter.setPen(QColor(0x9c, 0xa3, 0xaf));
    painter.drawText(QRect(0, 350, Width, 28), Qt::AlignCenter,
                     when.toLocalTime().toString("yyyy-MM-dd HH:mm:ss"));

    painter.end();
    return image;
}

QByteArray CameraPlaceholder::renderJpeg(const QDateTime& when)
{
    QByteArray jpeg;
    QBuffer buffer(&jpeg);
    buffer.open(QIODevice::WriteOnly);
    render(when).save(&buffer, "JPG", 80);
    return jpeg;
}
