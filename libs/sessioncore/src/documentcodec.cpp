#include "sessioncore/documentcodec.h"

namespace DocumentCodec {

namespace {

QString timestampString(const QDateTime& value)
{
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QJsonObject optionalTimestamp(const QDateTime& value)
{
    return value.isValid() ? timestampValue(value) : nullValue();
}

QJsonObject encodeBreak(const BreakPeriod& period)
{
    QJsonObject fields;
    fields["startTime"] = timestampValue(period.startTime);
    fields["endTime"] = optionalTimestamp(period.endTime);
    fields["durationMinutes"] = period.isOpen() ? nullValue() : integerValue(period.durationMinutes);
    return mapValue(fields);
}

BreakPeriod decodeBreak(const QJsonObject& value)
{
    const QJsonObject fields = toMap(value);
    BreakPeriod period;
    period.startTime = toTimestamp(fields["startTime"].toObject());
    period.endTime = toTimestamp(fields["endTime"].toObject());
    if (!period.isOpen()) {
        period.durationMinutes = static_cast<int>(toInteger(fields["durationMinutes"].toObject()));
    }
    return period;
}

} // namespace

QJsonObject stringValue(const QString& value)
{
    return QJsonObject{{"stringValue", value}};
}

QJsonObject integerValue(qint64 value)
{
    // 64-bit integers travel as decimal strings
    return QJsonObject{{"integerValue", QString::number(value)}};
}

QJsonObject booleanValue(bool value)
{
    return QJsonObject{{"booleanValue", value}};
}

QJsonObject timestampValue(const QDateTime& value)
{
    return QJsonObject{{"timestampValue", timestampString(value)}};
}

QJsonObject nullValue()
{
    return QJsonObject{{"nullValue", QJsonValue::Null}};
}

QJsonObject arrayValue(const QJsonArray& values)
{
    return QJsonObject{{"arrayValue", QJsonObject{{"values", values}}}};
}

QJsonObject mapValue(const QJsonObject& fields)
{
    return QJsonObject{{"mapValue", QJsonObject{{"fields", fields}}}};
}

QString toString(const QJsonObject& value)
{
    return value["stringValue"].toString();
}

qint64 toInteger(const QJsonObject& value)
{
    if (value.contains("integerValue")) {
        const QJsonValue raw = value["integerValue"];
        return raw.isString() ? raw.toString().toLongLong() : static_cast<qint64>(raw.toDouble());
    }
    if (value.contains("doubleValue")) {
        return qRound64(value["doubleValue"].toDouble());
    }
    return 0;
}

bool toBool(const QJsonObject& value)
{
    return value["booleanValue"].toBool();
}

QDateTime toTimestamp(const QJsonObject& value)
{
    if (!value.contains("timestampValue")) {
        return QDateTime();
    }
    QDateTime parsed = QDateTime::fromString(value["timestampValue"].toString(), Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value["timestampValue"].toString(), Qt::ISODate);
    }
    return parsed.toUTC();
}

QJsonArray toArray(const QJsonObject& value)
{
    return value["arrayValue"].toObject()["values"].toArray();
}

QJsonObject toMap(const QJsonObject& value)
{
    return value["mapValue"].toObject()["fields"].toObject();
}

bool isNull(const QJsonObject& value)
{
    return value.isEmpty() || value.contains("nullValue");
}

QString documentId(const QString& name)
{
    return name.section('/', -1);
}

QJsonObject encodeSession(const WorkSession& session, const QStringList& fieldMask)
{
    QJsonArray breakValues;
    for (const BreakPeriod& period : session.breaks) {
        breakValues.append(encodeBreak(period));
    }

    QJsonObject all;
    all["userId"] = stringValue(session.userId);
    all["userDisplayName"] = stringValue(session.userDisplayName);
    all["checkInTime"] = timestampValue(session.checkInTime);
    all["checkOutTime"] = optionalTimestamp(session.checkOutTime);
    all["status"] = stringValue(WorkSession::statusToString(session.status));
    all["source"] = stringValue(WorkSession::sourceToString(session.source));
    all["breaks"] = arrayValue(breakValues);
    all["lastHeartbeat"] = optionalTimestamp(session.lastHeartbeat);
    all["durationMinutes"] = integerValue(session.durationMinutes);
    all["breakDurationMinutes"] = integerValue(session.breakDurationMinutes);
    all["report"] = stringValue(session.report);

    QJsonArray attachmentValues;
    for (const QString& attachment : session.attachments) {
        attachmentValues.append(stringValue(attachment));
    }
    all["attachments"] = arrayValue(attachmentValues);
    all["flagged"] = booleanValue(session.flagged);
    all["flagReason"] = session.flagReason.isEmpty() ? nullValue() : stringValue(session.flagReason);

    if (fieldMask.isEmpty()) {
        return all;
    }

    QJsonObject masked;
    for (const QString& field : fieldMask) {
        if (all.contains(field)) {
            masked[field] = all[field];
        }
    }
    return masked;
}

WorkSession decodeSession(const QJsonObject& document)
{
    const QJsonObject fields = document["fields"].toObject();

    WorkSession session;
    session.id = documentId(document["name"].toString());
    session.userId = toString(fields["userId"].toObject());
    session.userDisplayName = toString(fields["userDisplayName"].toObject());
    session.checkInTime = toTimestamp(fields["checkInTime"].toObject());
    session.checkOutTime = toTimestamp(fields["checkOutTime"].toObject());
    session.status = WorkSession::statusFromString(toString(fields["status"].toObject()));
    session.source = WorkSession::sourceFromString(toString(fields["source"].toObject()));
    session.lastHeartbeat = toTimestamp(fields["lastHeartbeat"].toObject());
    session.durationMinutes = static_cast<int>(toInteger(fields["durationMinutes"].toObject()));
    session.breakDurationMinutes = static_cast<int>(toInteger(fields["breakDurationMinutes"].toObject()));
    session.report = toString(fields["report"].toObject());
    session.flagged = toBool(fields["flagged"].toObject());
    session.flagReason = toString(fields["flagReason"].toObject());

    for (const QJsonValue& value : toArray(fields["breaks"].toObject())) {
        session.breaks.append(decodeBreak(value.toObject()));
    }
    for (const QJsonValue& value : toArray(fields["attachments"].toObject())) {
        session.attachments.append(toString(value.toObject()));
    }

    if (document.contains("updateTime")) {
        session.updateTime = QDateTime::fromString(document["updateTime"].toString(), Qt::ISODateWithMs).toUTC();
    }
    return session;
}

QJsonObject encodeEvidence(const EvidenceRecord& record)
{
    QJsonObject fields;
    fields["userId"] = stringValue(record.userId);
    fields["userDisplayName"] = stringValue(record.userDisplayName);
    fields["screenshotUrl"] = record.screenshotUrl.isEmpty() ? nullValue() : stringValue(record.screenshotUrl);
    fields["cameraImageUrl"] = record.cameraImageUrl.isEmpty() ? nullValue() : stringValue(record.cameraImageUrl);
    fields["type"] = stringValue(captureTypeToString(record.type));
    fields["flagged"] = booleanValue(record.flagged);
    if (record.flagged) {
        fields["flagReason"] = stringValue(record.flagReason);
    }
    fields["source"] = stringValue(record.source);
    fields["timestamp"] = timestampValue(record.timestamp);
    return fields;
}

CaptureCommand decodeCaptureCommand(const QJsonObject& document)
{
    const QJsonObject fields = document["fields"].toObject();

    CaptureCommand command;
    command.id = documentId(document["name"].toString());
    command.userId = toString(fields["userId"].toObject());
    command.type = captureTypeFromString(toString(fields["type"].toObject()));
    if (command.type != CaptureType::Manual) {
        command.type = CaptureType::Remote;
    }
    command.completed = toString(fields["status"].toObject()) == "completed";
    command.requestedAt = toTimestamp(fields["requestedAt"].toObject());
    command.completedAt = toTimestamp(fields["completedAt"].toObject());
    return command;
}

} // namespace DocumentCodec
