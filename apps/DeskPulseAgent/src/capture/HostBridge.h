#ifndef HOSTBRIDGE_H
#define HOSTBRIDGE_H

#include <QByteArray>
#include <QString>

#include <functional>

#include "CaptureTypes.h"
#include "sessioncore/records.h"

/**
 * @brief Privileged operations the capture pipeline asks of its host process
 */
class HostBridge
{
public:
    // Empty url means the upload did not happen
    using UploadCallback = std::function<void(const QString& url)>;

    virtual ~HostBridge() = default;

    virtual ScreenCapture captureScreen() = 0;

    // Asynchronous; callback runs exactly once
    virtual void uploadImage(const QByteArray& jpeg, const QString& prefix, const QString& userId,
                             UploadCallback callback) = 0;

    // An invalid mirror clears the checkout guard's copy
    virtual void syncSessionState(const SessionMirror& mirror) = 0;

    virtual void notify(const QString& title, const QString& body) = 0;
    virtual void updateStatus(const QString& status) = 0;
};

#endif // HOSTBRIDGE_H
