#ifndef CAPTURETYPES_H
#define CAPTURETYPES_H

#include <QByteArray>
#include <QDateTime>
#include <QMetaType>
#include <QString>

#include "sessioncore/records.h"

struct ScreenCapture
{
    enum Status {
        Captured,
        PermissionNeeded,
        Failed
    };

    Status status = Failed;
    QByteArray jpeg;
};

struct CameraCapture
{
    enum Status {
        Captured,
        DeviceBusy,
        Failed
    };

    Status status = Failed;
    QByteArray jpeg;
};

/**
 * @brief Outcome of one capture request
 *
 * skipped: another capture held the lock. refused: no session to attribute it to.
 * Otherwise the attempt ran and the URLs say which artifacts made it to storage.
 */
struct CaptureResult
{
    CaptureType type = CaptureType::Auto;
    bool skipped = false;
    bool refused = false;
    bool started = false;
    bool flagged = false;
    bool cameraPlaceholder = false;
    bool permissionNeeded = false;
    QString screenshotUrl;
    QString cameraImageUrl;
    QDateTime finishedAt;
};

// All durations in milliseconds
struct CaptureTimings
{
    int countdownSeconds = 60;
    int countdownTickMs = 1000;
    qint64 firstDelayMinMs = 3 * 60 * 1000;
    qint64 firstDelayMaxMs = 5 * 60 * 1000;
    qint64 cooldownMs = 120 * 1000;
    qint64 jitterMinMs = 10 * 60 * 1000;
    qint64 jitterMaxMs = 30 * 60 * 1000;
    int pollIntervalMs = 15000;
    int pollInitialDelayMs = 5000;
};

Q_DECLARE_METATYPE(CameraCapture)
Q_DECLARE_METATYPE(CaptureResult)

#endif // CAPTURETYPES_H
