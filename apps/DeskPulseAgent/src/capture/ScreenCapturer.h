#ifndef SCREENCAPTURER_H
#define SCREENCAPTURER_H

#include "CaptureTypes.h"

/**
 * @brief Grabs the primary screen as a JPEG no larger than 1920x1080
 *
 * On platforms that gate screen capture an empty grab means the permission is
 * missing; that answer is remembered for the life of the process.
 */
class QtScreenCapturer
{
public:
    QtScreenCapturer();

    ScreenCapture capture();

    bool permissionDenied() const { return m_permissionChecked && m_permissionDenied; }

private:
    static bool platformGatesCapture();

    bool m_permissionChecked;
    bool m_permissionDenied;
};

#endif // SCREENCAPTURER_H
