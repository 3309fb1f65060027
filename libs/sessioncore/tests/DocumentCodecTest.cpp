#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonObject>

#include "sessioncore/documentcodec.h"

using namespace DocumentCodec;

class DocumentCodecTest : public QObject
{
    Q_OBJECT

private slots:
    void testDecodeSessionDocument()
    {
        QJsonObject openBreak;
        openBreak["startTime"] = timestampValue(QDateTime(QDate(2024, 3, 4), QTime(10, 0), Qt::UTC));
        openBreak["endTime"] = nullValue();
        openBreak["durationMinutes"] = nullValue();

        QJsonObject fields;
        fields["userId"] = stringValue("user-1");
        fields["userDisplayName"] = stringValue("Ada");
        fields["checkInTime"] = QJsonObject{{"timestampValue", "2024-03-04T09:00:00.000Z"}};
        fields["status"] = stringValue("break");
        fields["source"] = stringValue("desktop");
        fields["breaks"] = arrayValue(QJsonArray{mapValue(openBreak)});
        fields["lastHeartbeat"] = QJsonObject{{"timestampValue", "2024-03-04T10:01:30Z"}};
        fields["durationMinutes"] = QJsonObject{{"integerValue", "0"}};

        QJsonObject document;
        document["name"] = "projects/p/databases/(default)/documents/work_logs/abc123";
        document["fields"] = fields;
        document["updateTime"] = "2024-03-04T10:01:30.250Z";

        const WorkSession session = decodeSession(document);

        QCOMPARE(session.id, QString("abc123"));
        QCOMPARE(session.userId, QString("user-1"));
        QCOMPARE(session.status, WorkSession::Status::Break);
        QCOMPARE(session.source, WorkSession::Source::Desktop);
        QCOMPARE(session.checkInTime, QDateTime(QDate(2024, 3, 4), QTime(9, 0), Qt::UTC));
        QCOMPARE(session.lastHeartbeat, QDateTime(QDate(2024, 3, 4), QTime(10, 1, 30), Qt::UTC));
        QCOMPARE(session.breaks.size(), 1);
        QVERIFY(session.hasOpenBreak());
        QVERIFY(session.breaksWellFormed());
        QVERIFY(session.updateTime.isValid());
    }

    void testMissingSourceIsBrowser()
    {
        QJsonObject fields;
        fields["userId"] = stringValue("user-1");
        fields["status"] = stringValue("active");

        QJsonObject document;
        document["name"] = "work_logs/legacy";
        document["fields"] = fields;

        const WorkSession session = decodeSession(document);
        QCOMPARE(session.source, WorkSession::Source::Browser);
        QVERIFY(!session.lastHeartbeat.isValid());
        QVERIFY(session.breaks.isEmpty());
    }

    void testMaskedEncodingOnlyCarriesMaskedFields()
    {
        WorkSession session;
        session.userId = "user-1";
        session.checkInTime = QDateTime(QDate(2024, 3, 4), QTime(9, 0), Qt::UTC);
        session.status = WorkSession::Status::Break;

        const QJsonObject encoded = encodeSession(session, WorkSession::breakFieldMask());
        QCOMPARE(encoded.keys().size(), 2);
        QCOMPARE(toString(encoded["status"].toObject()), QString("break"));
        QVERIFY(encoded.contains("breaks"));
        QVERIFY(!encoded.contains("userId"));
    }

    void testIntegerValuesAreStrings()
    {
        const QJsonObject value = integerValue(165);
        QVERIFY(value["integerValue"].isString());
        QCOMPARE(toInteger(value), qint64(165));
        QCOMPARE(toInteger(QJsonObject{{"doubleValue", 39.6}}), qint64(40));
    }

    void testEvidenceNullsMissingUrls()
    {
        EvidenceRecord record;
        record.userId = "user-1";
        record.screenshotUrl = "https://cdn.example.com/screen.jpg";
        record.type = CaptureType::Flagged;
        record.flagged = true;
        record.flagReason = "Both camera and screen capture failed";
        record.timestamp = QDateTime(QDate(2024, 3, 4), QTime(9, 0), Qt::UTC);

        const QJsonObject fields = encodeEvidence(record);
        QVERIFY(isNull(fields["cameraImageUrl"].toObject()));
        QCOMPARE(toString(fields["type"].toObject()), QString("flagged"));
        QCOMPARE(toString(fields["source"].toObject()), QString("desktop"));
        QVERIFY(toBool(fields["flagged"].toObject()));
    }

    void testDecodeCaptureCommand()
    {
        QJsonObject fields;
        fields["userId"] = stringValue("user-1");
        fields["status"] = stringValue("pending");
        fields["requestedAt"] = timestampValue(QDateTime(QDate(2024, 3, 4), QTime(9, 5), Qt::UTC));

        QJsonObject document;
        document["name"] = "capture_commands/cmd-7";
        document["fields"] = fields;

        const CaptureCommand command = decodeCaptureCommand(document);
        QCOMPARE(command.id, QString("cmd-7"));
        QCOMPARE(command.type, CaptureType::Remote);
        QVERIFY(!command.completed);
    }
};

QTEST_MAIN(DocumentCodecTest)
#include "DocumentCodecTest.moc"
