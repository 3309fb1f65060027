#include <QtTest/QtTest>

#include "sessioncore/launchhandshake.h"

class LaunchHandshakeTest : public QObject
{
    Q_OBJECT

private slots:
    void testCheckInUrlParsesBack()
    {
        const LaunchHandshake original = LaunchHandshake::checkIn("a.b+c/d==", "user-1", "Ada Lovelace",
                                                                  "ada@example.com", "https://img.example.com/a.png?s=64");
        const QUrl url = original.toUrl("deskpulse");
        QCOMPARE(url.scheme(), QString("deskpulse"));

        LaunchHandshake parsed;
        QVERIFY(LaunchHandshake::parse(url.toString(QUrl::FullyEncoded), "deskpulse", parsed));
        QCOMPARE(parsed.action, LaunchHandshake::Action::CheckIn);
        QCOMPARE(parsed.credential, original.credential);
        QCOMPARE(parsed.userId, original.userId);
        QCOMPARE(parsed.name, original.name);
        QCOMPARE(parsed.email, original.email);
        QCOMPARE(parsed.photoUrl, original.photoUrl);
    }

    void testLauncherDecorationsTolerated()
    {
        LaunchHandshake parsed;
        QVERIFY(LaunchHandshake::parse("\"deskpulse://checkin/?token=t1&uid=u1&name=Ada+L\"", "deskpulse", parsed));
        QCOMPARE(parsed.credential, QString("t1"));
        QCOMPARE(parsed.userId, QString("u1"));
        QCOMPARE(parsed.name, QString("Ada L"));

        QVERIFY(LaunchHandshake::parse("DESKPULSE://refresh?token=t2/", "deskpulse", parsed));
        QCOMPARE(parsed.action, LaunchHandshake::Action::Refresh);
        QCOMPARE(parsed.credential, QString("t2"));
    }

    void testLongKeysAccepted()
    {
        LaunchHandshake parsed;
        QVERIFY(LaunchHandshake::parse("deskpulse://checkin?credential=t1&userId=u1&photoUrl=p", "deskpulse", parsed));
        QCOMPARE(parsed.userId, QString("u1"));
        QCOMPARE(parsed.photoUrl, QString("p"));
    }

    void testInvalidHandshakes()
    {
        LaunchHandshake parsed;
        QVERIFY(!LaunchHandshake::parse("deskpulse://checkin?token=t1", "deskpulse", parsed));
        QVERIFY(!LaunchHandshake::parse("deskpulse://refresh", "deskpulse", parsed));
        QVERIFY(!LaunchHandshake::parse("otherapp://checkin?token=t1&uid=u1", "deskpulse", parsed));
        QVERIFY(!LaunchHandshake::parse("deskpulse://upgrade?token=t1", "deskpulse", parsed));
    }

    void testBareOpen()
    {
        LaunchHandshake parsed;
        QVERIFY(LaunchHandshake::parse("deskpulse://open", "deskpulse", parsed));
        QCOMPARE(parsed.action, LaunchHandshake::Action::Open);
    }

    void testFromArguments()
    {
        LaunchHandshake parsed;
        const QStringList arguments{"/usr/bin/deskpulse-agent", "--loglevel", "debug",
                                    "deskpulse://refresh?token=t3"};
        QVERIFY(LaunchHandshake::fromArguments(arguments, "deskpulse", parsed));
        QCOMPARE(parsed.credential, QString("t3"));

        QVERIFY(!LaunchHandshake::fromArguments(QStringList{"--help"}, "deskpulse", parsed));
    }
};

QTEST_MAIN(LaunchHandshakeTest)
#include "LaunchHandshakeTest.moc"
