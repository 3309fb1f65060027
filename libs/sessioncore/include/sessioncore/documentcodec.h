#ifndef SESSIONCORE_DOCUMENTCODEC_H
#define SESSIONCORE_DOCUMENTCODEC_H

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "sessioncore/records.h"
#include "sessioncore/worksession.h"

/**
 * @brief Typed-value document encoding used by the REST store
 *
 * Every field is wrapped as {"stringValue": ...}, {"integerValue": "..."},
 * {"timestampValue": ...}, {"arrayValue": {"values": [...]}}, {"mapValue": {"fields": {...}}}
 * or {"nullValue": null}.
 */
namespace DocumentCodec {

QJsonObject stringValue(const QString& value);
QJsonObject integerValue(qint64 value);
QJsonObject booleanValue(bool value);
QJsonObject timestampValue(const QDateTime& value);
QJsonObject nullValue();
QJsonObject arrayValue(const QJsonArray& values);
QJsonObject mapValue(const QJsonObject& fields);

QString toString(const QJsonObject& value);
qint64 toInteger(const QJsonObject& value);
bool toBool(const QJsonObject& value);
QDateTime toTimestamp(const QJsonObject& value);
QJsonArray toArray(const QJsonObject& value);
QJsonObject toMap(const QJsonObject& value);
bool isNull(const QJsonObject& value);

// Last path segment of a document name
QString documentId(const QString& name);

// Fields object for the whole session, or only the masked fields
QJsonObject encodeSession(const WorkSession& session, const QStringList& fieldMask = QStringList());
WorkSession decodeSession(const QJsonObject& document);

QJsonObject encodeEvidence(const EvidenceRecord& record);
CaptureCommand decodeCaptureCommand(const QJsonObject& document);

} // namespace DocumentCodec

#endif // SESSIONCORE_DOCUMENTCODEC_H
