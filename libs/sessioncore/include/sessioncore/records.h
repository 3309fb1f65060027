#ifndef SESSIONCORE_RECORDS_H
#define SESSIONCORE_RECORDS_H

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

/**
 * @brief Why a capture ran; Flagged marks an attempt that produced no artifact
 */
enum class CaptureType {
    Auto,
    Manual,
    Remote,
    Flagged
};

QString captureTypeToString(CaptureType type);
CaptureType captureTypeFromString(const QString& value);

/**
 * @brief A capture request queued by an administrator for a user
 */
struct CaptureCommand
{
    QString id;
    QString userId;
    CaptureType type = CaptureType::Remote;
    bool completed = false;
    QDateTime requestedAt;
    QDateTime completedAt;
};

/**
 * @brief Audit entry written after every capture attempt
 */
struct EvidenceRecord
{
    QString userId;
    QString userDisplayName;
    QString screenshotUrl;
    QString cameraImageUrl;
    CaptureType type = CaptureType::Auto;
    bool flagged = false;
    QString flagReason;
    QString source = "desktop";
    QDateTime timestamp;

    QJsonObject toJson() const;
};

/**
 * @brief Minimal copy of the open session kept beside the process for the shutdown path
 *
 * An invalid mirror means "no session"; the checkout guard then does nothing.
 */
struct SessionMirror
{
    QString credential;
    QString userId;
    QString sessionId;
    QDateTime checkInTime;
    qint64 cumulativeBreakSeconds = 0;
    QDateTime breakStartTime;

    bool isValid() const
    {
        return !credential.isEmpty() && !userId.isEmpty() && !sessionId.isEmpty() && checkInTime.isValid();
    }

    bool operator==(const SessionMirror& other) const
    {
        return credential == other.credential && userId == other.userId &&
               sessionId == other.sessionId && checkInTime == other.checkInTime &&
               cumulativeBreakSeconds == other.cumulativeBreakSeconds &&
               breakStartTime == other.breakStartTime;
    }
    bool operator!=(const SessionMirror& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(CaptureType)
Q_DECLARE_METATYPE(CaptureCommand)
Q_DECLARE_METATYPE(EvidenceRecord)
Q_DECLARE_METATYPE(SessionMirror)

#endif // SESSIONCORE_RECORDS_H
