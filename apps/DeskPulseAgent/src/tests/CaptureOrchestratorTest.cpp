#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QRandomGenerator>

#include <functional>

#include "capture/CameraCapturer.h"
#include "capture/CaptureOrchestrator.h"
#include "capture/HostBridge.h"
#include "support/inmemorysessionstore.h"
#include "support/manualclock.h"

// Host whose screen grab and uploads are scripted by the test
class FakeHostBridge : public HostBridge
{
public:
    ScreenCapture nextScreen;
    bool deferUploads = false;
    bool failUploads = false;
    QStringList uploadedPrefixes;
    QList<QPair<QString, UploadCallback>> pendingUploads;
    QStringList notifications;

    FakeHostBridge()
    {
        nextScreen.status = ScreenCapture::Captured;
        nextScreen.jpeg = QByteArray(2048, 's');
    }

    ScreenCapture captureScreen() override { return nextScreen; }

    void uploadImage(const QByteArray& jpeg, const QString& prefix, const QString& userId,
                     UploadCallback callback) override
    {
        Q_UNUSED(jpeg);
        uploadedPrefixes.append(prefix);
        const QString url = failUploads ? QString()
                                        : QString("https://cdn.example.com/%1_%2.jpg").arg(prefix, userId);
        if (deferUploads) {
            pendingUploads.append(qMakePair(url, callback));
            return;
        }
        callback(url);
    }

    void releaseUploads()
    {
        const auto uploads = pendingUploads;
        pendingUploads.clear();
        for (const auto& upload : uploads) {
            upload.second(upload.first);
        }
    }

    void syncSessionState(const SessionMirror& mirror) override { Q_UNUSED(mirror); }
    void notify(const QString& title, const QString& body) override { notifications.append(title + ": " + body); }
    void updateStatus(const QString& status) override { Q_UNUSED(status); }
};

class FakeCameraCapturer : public CameraCapturer
{
    Q_OBJECT
public:
    explicit FakeCameraCapturer(QObject* parent = nullptr) : CameraCapturer(parent) {}

    CameraCapture::Status status = CameraCapture::Captured;
    int captureCalls = 0;
    int cancelCalls = 0;

    void capture() override
    {
        ++captureCalls;
        CameraCapture result;
        result.status = status;
        if (status == CameraCapture::Captured) {
            result.jpeg = QByteArray(4096, 'c');
        }
        emit finished(result);
    }

    void cancel() override { ++cancelCalls; }
};

// Store that runs a callback while the evidence write is in flight, the way a
// network write spins a nested event loop
class ReentrantEvidenceStore : public InMemorySessionStore
{
public:
    explicit ReentrantEvidenceStore(Clock* clock) : InMemorySessionStore(clock) {}

    std::function<void()> whileSaving;

    bool saveEvidence(const EvidenceRecord& record) override
    {
        const bool ok = InMemorySessionStore::saveEvidence(record);
        if (whileSaving) {
            whileSaving();
        }
        return ok;
    }
};

class CaptureOrchestratorTest : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        m_clock = new ManualClock();
        m_store = new InMemorySessionStore(m_clock);
        m_host = new FakeHostBridge();
        m_camera = new FakeCameraCapturer();
        m_random = new QRandomGenerator(42);

        m_orchestrator = new CaptureOrchestrator(m_host, m_camera, m_store, m_clock);
        CaptureTimings timings;
        timings.countdownSeconds = 0;
        m_orchestrator->setTimings(timings);
        m_orchestrator->setRandomGenerator(m_random);
        m_orchestrator->setIdentity("user-1", "Ada");
    }

    void cleanup()
    {
        delete m_orchestrator;
        delete m_random;
        delete m_camera;
        delete m_host;
        delete m_store;
        delete m_clock;
    }

    void testRefusedWithoutSession()
    {
        const CaptureResult result = m_orchestrator->performCapture(CaptureType::Manual);
        QVERIFY(result.refused);
        QVERIFY(!result.started);
        QCOMPARE(m_camera->captureCalls, 0);
        QVERIFY(m_store->evidence().isEmpty());

        m_orchestrator->setIdentity(QString(), QString());
        QVERIFY(!m_orchestrator->start());
    }

    void testFirstAutoCaptureWindow()
    {
        QSignalSpy scheduledSpy(m_orchestrator, &CaptureOrchestrator::autoCaptureScheduled);
        QVERIFY(m_orchestrator->start());

        const QDateTime now = m_clock->now();
        const QDateTime next = m_orchestrator->nextAutoCaptureAt();
        QVERIFY(next >= now.addSecs(3 * 60));
        QVERIFY(next <= now.addSecs(5 * 60));
        QCOMPARE(scheduledSpy.count(), 1);
    }

    void testSuccessfulCaptureRecordsEvidence()
    {
        QVERIFY(m_orchestrator->start());
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);

        const CaptureResult started = m_orchestrator->performCapture(CaptureType::Manual);
        QVERIFY(started.started);

        QCOMPARE(finishedSpy.count(), 1);
        const CaptureResult result = finishedSpy.at(0).at(0).value<CaptureResult>();
        QVERIFY(!result.flagged);
        QVERIFY(!result.cameraPlaceholder);
        QCOMPARE(m_host->uploadedPrefixes.size(), 2);

        QCOMPARE(m_store->evidence().size(), 1);
        const EvidenceRecord record = m_store->evidence().first();
        QCOMPARE(record.type, CaptureType::Manual);
        QCOMPARE(record.userId, QString("user-1"));
        QCOMPARE(record.userDisplayName, QString("Ada"));
        QCOMPARE(record.source, QString("desktop"));
        QVERIFY(!record.screenshotUrl.isEmpty());
        QVERIFY(!record.cameraImageUrl.isEmpty());
        QCOMPARE(m_orchestrator->captureCount(), 1);
        QVERIFY(!m_orchestrator->captureInProgress());
    }

    void testBusyCameraUsesPlaceholder()
    {
        m_camera->status = CameraCapture::DeviceBusy;
        QVERIFY(m_orchestrator->start());
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);

        m_orchestrator->performCapture(CaptureType::Auto);

        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(finishedSpy.at(0).at(0).value<CaptureResult>().cameraPlaceholder);
        QVERIFY(m_host->uploadedPrefixes.contains("camera"));

        const EvidenceRecord record = m_store->evidence().first();
        QVERIFY(!record.flagged);
        QVERIFY(!record.screenshotUrl.isEmpty());
        QVERIFY(!record.cameraImageUrl.isEmpty());
        QCOMPARE(record.type, CaptureType::Auto);
    }

    void testNothingCapturedIsFlagged()
    {
        m_camera->status = CameraCapture::Failed;
        m_host->nextScreen = ScreenCapture();
        QVERIFY(m_orchestrator->start());

        m_orchestrator->performCapture(CaptureType::Auto);

        QVERIFY(m_host->uploadedPrefixes.isEmpty());
        QCOMPARE(m_store->evidence().size(), 1);
        const EvidenceRecord record = m_store->evidence().first();
        QVERIFY(record.flagged);
        QCOMPARE(record.type, CaptureType::Flagged);
        QVERIFY(!record.flagReason.isEmpty());
        QVERIFY(record.screenshotUrl.isEmpty());
        QVERIFY(record.cameraImageUrl.isEmpty());
    }

    void testFailedUploadsAreFlagged()
    {
        m_host->failUploads = true;
        QVERIFY(m_orchestrator->start());

        m_orchestrator->performCapture(CaptureType::Manual);

        QCOMPARE(m_host->uploadedPrefixes.size(), 2);
        QVERIFY(m_store->evidence().first().flagged);
        // The next auto capture is still armed after a flagged attempt
        QVERIFY(m_orchestrator->nextAutoCaptureAt().isValid());
    }

    void testScreenPermissionNotified()
    {
        m_host->nextScreen.status = ScreenCapture::PermissionNeeded;
        m_host->nextScreen.jpeg.clear();
        QVERIFY(m_orchestrator->start());
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);

        m_orchestrator->performCapture(CaptureType::Manual);

        QCOMPARE(m_host->notifications.size(), 1);
        const CaptureResult result = finishedSpy.at(0).at(0).value<CaptureResult>();
        QVERIFY(result.permissionNeeded);
        // The camera still made it
        QVERIFY(!result.flagged);
        QVERIFY(result.screenshotUrl.isEmpty());
    }

    void testLockSkipsOverlappingCapture()
    {
        m_host->deferUploads = true;
        QVERIFY(m_orchestrator->start());
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);

        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);
        QVERIFY(m_orchestrator->captureInProgress());

        const CaptureResult second = m_orchestrator->performCapture(CaptureType::Remote);
        QVERIFY(second.skipped);
        QCOMPARE(m_camera->captureCalls, 1);

        m_host->releaseUploads();
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(m_store->evidence().size(), 1);
        QVERIFY(!m_orchestrator->captureInProgress());

        QVERIFY(m_orchestrator->performCapture(CaptureType::Remote).started);
    }

    void testRescheduleWindowAfterEachAttempt()
    {
        m_host->deferUploads = true;
        QVERIFY(m_orchestrator->start());

        for (int i = 0; i < 25; ++i) {
            m_clock->advanceMinutes(17);
            QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);

            // The uploads take a while; the next capture counts from when they are done
            m_clock->advanceMinutes(5);
            m_host->releaseUploads();
            QVERIFY(!m_orchestrator->captureInProgress());

            const QDateTime finishedAt = m_clock->now();
            const QDateTime next = m_orchestrator->nextAutoCaptureAt();
            QVERIFY(next >= finishedAt.addSecs(120 + 10 * 60));
            QVERIFY(next <= finishedAt.addSecs(120 + 30 * 60));
        }
        QCOMPARE(m_orchestrator->captureCount(), 25);
    }

    void testSessionClosedWhileSavingEvidence()
    {
        ReentrantEvidenceStore store(m_clock);
        CaptureOrchestrator orchestrator(m_host, m_camera, &store, m_clock);
        CaptureTimings timings;
        timings.countdownSeconds = 0;
        orchestrator.setTimings(timings);
        orchestrator.setIdentity("user-1", "Ada");
        QVERIFY(orchestrator.start());

        bool stopped = false;
        store.whileSaving = [&]() {
            orchestrator.stop();
            stopped = true;
            QCoreApplication::processEvents();
            QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
        };

        QSignalSpy finishedSpy(&orchestrator, &CaptureOrchestrator::captureFinished);
        QVERIFY(orchestrator.performCapture(CaptureType::Manual).started);

        QVERIFY(stopped);
        QCOMPARE(store.evidence().size(), 1);
        QCOMPARE(finishedSpy.count(), 0);
        QVERIFY(!orchestrator.captureInProgress());
        QVERIFY(!orchestrator.isRunning());
        QCOMPARE(orchestrator.captureCount(), 0);
    }

    void testAutoCaptureDeferredWhileLocked()
    {
        CaptureTimings timings = m_orchestrator->timings();
        timings.firstDelayMinMs = 30;
        timings.firstDelayMaxMs = 30;
        timings.cooldownMs = 60 * 1000;
        m_orchestrator->setTimings(timings);

        m_host->deferUploads = true;
        QVERIFY(m_orchestrator->start());
        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);

        QSignalSpy scheduledSpy(m_orchestrator, &CaptureOrchestrator::autoCaptureScheduled);
        QTRY_COMPARE(scheduledSpy.count(), 1);

        // Deferred by exactly the cooldown, not dropped
        QCOMPARE(scheduledSpy.at(0).at(0).toDateTime(), m_clock->now().addSecs(60));
        QCOMPARE(m_camera->captureCalls, 1);
    }

    void testAutoCaptureFires()
    {
        CaptureTimings timings = m_orchestrator->timings();
        timings.firstDelayMinMs = 20;
        timings.firstDelayMaxMs = 40;
        m_orchestrator->setTimings(timings);

        QSignalSpy startedSpy(m_orchestrator, &CaptureOrchestrator::captureStarted);
        QVERIFY(m_orchestrator->start());

        QTRY_COMPARE(startedSpy.count(), 1);
        QCOMPARE(startedSpy.at(0).at(0).value<CaptureType>(), CaptureType::Auto);
        QCOMPARE(m_store->evidence().size(), 1);
    }

    void testCountdownPulses()
    {
        CaptureTimings timings = m_orchestrator->timings();
        timings.countdownSeconds = 5;
        timings.countdownTickMs = 10;
        m_orchestrator->setTimings(timings);
        QVERIFY(m_orchestrator->start());

        QSignalSpy countdownSpy(m_orchestrator, &CaptureOrchestrator::countdownStarted);
        QSignalSpy tickSpy(m_orchestrator, &CaptureOrchestrator::countdownTick);
        QSignalSpy pulseSpy(m_orchestrator, &CaptureOrchestrator::countdownPulse);
        QSignalSpy closedSpy(m_orchestrator, &CaptureOrchestrator::countdownFinished);
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);

        QVERIFY(m_orchestrator->performCapture(CaptureType::Remote).started);
        QVERIFY(m_orchestrator->countdownVisible());
        QCOMPARE(countdownSpy.count(), 1);
        QCOMPARE(countdownSpy.at(0).at(1).toInt(), 5);
        QCOMPARE(m_camera->captureCalls, 0);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(tickSpy.count(), 5);
        QCOMPARE(pulseSpy.count(), 3);
        QCOMPARE(pulseSpy.at(0).at(0).toInt(), 3);
        QCOMPARE(pulseSpy.at(1).at(0).toInt(), 2);
        QCOMPARE(pulseSpy.at(2).at(0).toInt(), 1);
        QCOMPARE(closedSpy.count(), 1);
        QVERIFY(!m_orchestrator->countdownVisible());
    }

    void testRemoteCommandsOldestFirst()
    {
        m_store->addCommand("cmd-new", "user-1", CaptureType::Remote, m_clock->now());
        m_store->addCommand("cmd-old", "user-1", CaptureType::Remote, m_clock->now().addSecs(-60));
        m_store->addCommand("cmd-other", "user-2", CaptureType::Remote, m_clock->now().addSecs(-120));
        QVERIFY(m_orchestrator->start());

        m_orchestrator->pollRemoteCommands();

        QCOMPARE(m_store->evidence().size(), 1);
        QCOMPARE(m_store->evidence().first().type, CaptureType::Remote);
        for (const CaptureCommand& command : m_store->commands()) {
            QCOMPARE(command.completed, command.id == "cmd-old");
        }

        m_orchestrator->pollRemoteCommands();
        QCOMPARE(m_store->evidence().size(), 2);
    }

    void testRemoteCommandWaitsForLock()
    {
        m_host->deferUploads = true;
        m_store->addCommand("cmd-1", "user-1", CaptureType::Remote, m_clock->now());
        QVERIFY(m_orchestrator->start());
        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);

        m_orchestrator->pollRemoteCommands();
        QCOMPARE(m_store->commandPolls(), 0);
        QVERIFY(!m_store->commands().first().completed);

        m_host->releaseUploads();
        m_orchestrator->pollRemoteCommands();
        QCOMPARE(m_store->commandPolls(), 1);

        // The remote attempt now holds the lock; its command completes when it ends
        QVERIFY(!m_store->commands().first().completed);
        m_host->releaseUploads();
        QVERIFY(m_store->commands().first().completed);
    }

    void testStopIsIdempotent()
    {
        CaptureTimings timings = m_orchestrator->timings();
        timings.countdownSeconds = 60;
        m_orchestrator->setTimings(timings);
        QVERIFY(m_orchestrator->start());

        QSignalSpy closedSpy(m_orchestrator, &CaptureOrchestrator::countdownFinished);
        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);
        QVERIFY(m_orchestrator->countdownVisible());

        m_orchestrator->stop();
        QVERIFY(!m_orchestrator->isRunning());
        QVERIFY(!m_orchestrator->captureInProgress());
        QVERIFY(!m_orchestrator->countdownVisible());
        QVERIFY(!m_orchestrator->nextAutoCaptureAt().isValid());
        QCOMPARE(closedSpy.count(), 1);

        m_orchestrator->stop();
        QCOMPARE(closedSpy.count(), 1);

        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).refused);
    }

    void testStopDropsInFlightAttempt()
    {
        m_host->deferUploads = true;
        QVERIFY(m_orchestrator->start());
        QSignalSpy finishedSpy(m_orchestrator, &CaptureOrchestrator::captureFinished);
        QVERIFY(m_orchestrator->performCapture(CaptureType::Manual).started);

        m_orchestrator->stop();
        m_host->releaseUploads();
        QCoreApplication::processEvents();

        QCOMPARE(finishedSpy.count(), 0);
        QVERIFY(m_store->evidence().isEmpty());
    }

private:
    ManualClock* m_clock;
    InMemorySessionStore* m_store;
    FakeHostBridge* m_host;
    FakeCameraCapturer* m_camera;
    QRandomGenerator* m_random;
    CaptureOrchestrator* m_orchestrator;
};

QTEST_MAIN(CaptureOrchestratorTest)
#include "CaptureOrchestratorTest.moc"
