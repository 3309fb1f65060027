#include "sessioncore/worksession.h"

#include <QJsonArray>
#include <QtMath>

#include <algorithm>

qint64 BreakPeriod::elapsedMsecs(const QDateTime& now) const
{
    if (!startTime.isValid()) {
        return 0;
    }
    const QDateTime end = isOpen() ? now : endTime;
    return std::max<qint64>(0, startTime.msecsTo(end));
}

bool WorkSession::breaksWellFormed() const
{
    for (int i = 0; i < breaks.size(); ++i) {
        const bool last = (i == breaks.size() - 1);
        if (breaks[i].isOpen() && (!last || status != Status::Break)) {
            return false;
        }
    }
    if (status == Status::Break) {
        return hasOpenBreak();
    }
    return true;
}

bool WorkSession::hasOpenBreak() const
{
    return !breaks.isEmpty() && breaks.last().isOpen();
}

QDateTime WorkSession::openBreakStart() const
{
    return hasOpenBreak() ? breaks.last().startTime : QDateTime();
}

qint64 WorkSession::closedBreakMsecs() const
{
    qint64 total = 0;
    for (const BreakPeriod& period : breaks) {
        if (!period.isOpen()) {
            total += period.elapsedMsecs(period.endTime);
        }
    }
    return total;
}

qint64 WorkSession::totalBreakMsecs(const QDateTime& now) const
{
    qint64 total = 0;
    for (const BreakPeriod& period : breaks) {
        total += period.elapsedMsecs(now);
    }
    return total;
}

bool WorkSession::beginBreak(const QDateTime& now)
{
    if (status != Status::Active || hasOpenBreak()) {
        return false;
    }

    BreakPeriod period;
    period.startTime = now;
    breaks.append(period);
    status = Status::Break;
    return true;
}

bool WorkSession::endBreak(const QDateTime& now)
{
    if (!hasOpenBreak()) {
        return false;
    }

    BreakPeriod& period = breaks.last();
    period.endTime = now;
    period.durationMinutes = SessionMath::roundMinutes(period.elapsedMsecs(now));
    status = Status::Active;
    return true;
}

void WorkSession::complete(const QDateTime& now, const QString& reportText, const QStringList& attachmentList)
{
    endBreak(now);

    const qint64 breakMsecs = closedBreakMsecs();
    checkOutTime = now;
    status = Status::Completed;
    breakDurationMinutes = SessionMath::roundMinutes(breakMsecs);
    durationMinutes = SessionMath::netDurationMinutes(checkInTime, now, breakMsecs);
    report = reportText;
    attachments = attachmentList;
}

void WorkSession::completeFlagged(const QDateTime& now, const QString& reportText, const QString& reason)
{
    complete(now, reportText, QStringList());
    flagged = true;
    flagReason = reason;
}

QJsonObject WorkSession::toJson() const
{
    QJsonArray breakArray;
    for (const BreakPeriod& period : breaks) {
        QJsonObject entry;
        entry["startTime"] = period.startTime.toString(Qt::ISODateWithMs);
        entry["endTime"] = period.isOpen() ? QJsonValue() : QJsonValue(period.endTime.toString(Qt::ISODateWithMs));
        entry["durationMinutes"] = period.isOpen() ? QJsonValue() : QJsonValue(period.durationMinutes);
        breakArray.append(entry);
    }

    QJsonObject json;
    json["id"] = id;
    json["userId"] = userId;
    json["userDisplayName"] = userDisplayName;
    json["checkInTime"] = checkInTime.toString(Qt::ISODateWithMs);
    json["status"] = statusToString(status);
    json["source"] = sourceToString(source);
    json["breaks"] = breakArray;
    if (lastHeartbeat.isValid()) {
        json["lastHeartbeat"] = lastHeartbeat.toString(Qt::ISODateWithMs);
    }
    if (status == Status::Completed) {
        json["checkOutTime"] = checkOutTime.toString(Qt::ISODateWithMs);
        json["durationMinutes"] = durationMinutes;
        json["breakDurationMinutes"] = breakDurationMinutes;
        json["report"] = report;
        json["attachments"] = QJsonArray::fromStringList(attachments);
    }
    if (flagged) {
        json["flagged"] = true;
        json["flagReason"] = flagReason;
    }
    return json;
}

QString WorkSession::statusToString(Status status)
{
    switch (status) {
        case Status::Active:    return "active";
        case Status::Break:     return "break";
        case Status::Completed: return "completed";
    }
    return "active";
}

WorkSession::Status WorkSession::statusFromString(const QString& value, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    if (value == "active") {
        return Status::Active;
    }
    if (value == "break") {
        return Status::Break;
    }
    if (value == "completed") {
        return Status::Completed;
    }
    if (ok) {
        *ok = false;
    }
    return Status::Active;
}

QString WorkSession::sourceToString(Source source)
{
    return source == Source::Desktop ? "desktop" : "browser";
}

WorkSession::Source WorkSession::sourceFromString(const QString& value)
{
    // Documents written before the field existed are browser sessions
    return value == "desktop" ? Source::Desktop : Source::Browser;
}

QStringList WorkSession::breakFieldMask()
{
    return {"status", "breaks"};
}

QStringList WorkSession::completionFieldMask()
{
    return {"status", "breaks", "checkOutTime", "durationMinutes",
            "breakDurationMinutes", "report", "attachments"};
}

QStringList WorkSession::flaggedCompletionFieldMask()
{
    return completionFieldMask() << "flagged" << "flagReason";
}

QStringList WorkSession::heartbeatFieldMask()
{
    return {"lastHeartbeat"};
}

namespace SessionMath {

int roundMinutes(qint64 msecs)
{
    return qRound(msecs / 60000.0);
}

int netDurationMinutes(const QDateTime& checkIn, const QDateTime& checkOut, qint64 breakMsecs)
{
    if (!checkIn.isValid() || !checkOut.isValid()) {
        return 0;
    }
    const int totalMinutes = roundMinutes(checkIn.msecsTo(checkOut));
    return std::max(0, totalMinutes - roundMinutes(breakMsecs));
}

} // namespace SessionMath
