#include <QtTest/QtTest>
#include <QSignalSpy>

#include <csignal>

#include "service/ShutdownSignalWatcher.h"

class ShutdownSignalWatcherTest : public QObject
{
    Q_OBJECT

private slots:
    void testTerminationDeliveredOnEventLoop()
    {
        ShutdownSignalWatcher watcher;
        QVERIFY(watcher.install({SIGINT, SIGTERM}));
        QVERIFY(watcher.isInstalled());
        QSignalSpy requestedSpy(&watcher, &ShutdownSignalWatcher::terminationRequested);

        QCOMPARE(::raise(SIGTERM), 0);
        // Nothing runs inside the handler itself
        QCOMPARE(requestedSpy.count(), 0);

        QTRY_COMPARE(requestedSpy.count(), 1);
        QCOMPARE(requestedSpy.at(0).at(0).toInt(), int(SIGTERM));

        QCOMPARE(::raise(SIGINT), 0);
        QTRY_COMPARE(requestedSpy.count(), 2);
        QCOMPARE(requestedSpy.at(1).at(0).toInt(), int(SIGINT));
    }

    void testSingleWatcherPerProcess()
    {
        ShutdownSignalWatcher first;
        QVERIFY(first.install({SIGTERM}));
        QVERIFY(first.install({SIGTERM}));

        ShutdownSignalWatcher second;
        QVERIFY(!second.install({SIGTERM}));
        QVERIFY(!second.isInstalled());
        QVERIFY(!second.lastError().isEmpty());
    }

    void testReinstallAfterRelease()
    {
        {
            ShutdownSignalWatcher watcher;
            QVERIFY(watcher.install({SIGTERM}));
        }

        ShutdownSignalWatcher watcher;
        QVERIFY(watcher.install({SIGTERM}));
        QSignalSpy requestedSpy(&watcher, &ShutdownSignalWatcher::terminationRequested);
        QCOMPARE(::raise(SIGTERM), 0);
        QTRY_COMPARE(requestedSpy.count(), 1);
    }
};

QTEST_MAIN(ShutdownSignalWatcherTest)
#include "ShutdownSignalWatcherTest.moc"
