#include "sessioncore/records.h"

QString captureTypeToString(CaptureType type)
{
    switch (type) {
        case CaptureType::Auto:    return "auto";
        case CaptureType::Manual:  return "manual";
        case CaptureType::Remote:  return "remote";
        case CaptureType::Flagged: return "flagged";
    }
    return "auto";
}

CaptureType captureTypeFromString(const QString& value)
{
    if (value == "manual") {
        return CaptureType::Manual;
    }
    if (value == "remote") {
        return CaptureType::Remote;
    }
    if (value == "flagged") {
        return CaptureType::Flagged;
    }
    return CaptureType::Auto;
}

QJsonObject EvidenceRecord::toJson() const
{
    QJsonObject json;
    json["userId"] = userId;
    json["userDisplayName"] = userDisplayName;
    json["screenshotUrl"] = screenshotUrl.isEmpty() ? QJsonValue() : QJsonValue(screenshotUrl);
    json["cameraImageUrl"] = cameraImageUrl.isEmpty() ? QJsonValue() : QJsonValue(cameraImageUrl);
    json["type"] = captureTypeToString(type);
    json["flagged"] = flagged;
    if (flagged) {
        json["flagReason"] = flagReason;
    }
    json["source"] = source;
    json["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    return json;
}
