#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTcpServer>

#include <memory>

#include "httpserver/response.h"
#include "httpserver/server.h"
#include "sessioncore/livenessmonitor.h"
#include "support/inmemorysessionstore.h"
#include "support/manualclock.h"

// Minimal desktop agent: answers the status probe and records what it is sent
class RecordingAgentController : public Http::Controller
{
public:
    QStringList paths;
    QList<QJsonObject> bodies;

    void setupRoutes(QHttpServer& server) override
    {
        addRoute(server, "/status", QHttpServerRequest::Method::Get, [this](const QHttpServerRequest& request) {
            return record("/status", request, QJsonObject{{"running", true}});
        });
        addRoute(server, "/checkin", QHttpServerRequest::Method::Post, [this](const QHttpServerRequest& request) {
            return record("/checkin", request, QJsonObject{{"resumed", true}});
        });
        addRoute(server, "/refresh", QHttpServerRequest::Method::Post, [this](const QHttpServerRequest& request) {
            return record("/refresh", request, QJsonObject());
        });
    }

    QString getControllerName() const override { return "RecordingAgentController"; }

private:
    QHttpServerResponse record(const QString& path, const QHttpServerRequest& request, const QJsonObject& fields)
    {
        bool ok = false;
        paths.append(path);
        bodies.append(extractJsonFromRequest(request, ok));
        return Http::Response::ok(fields);
    }
};

class LivenessMonitorTest : public QObject
{
    Q_OBJECT

private:
    WorkSession desktopSession(const QDateTime& checkIn, const QDateTime& heartbeat = QDateTime())
    {
        WorkSession session;
        session.id = "log-1";
        session.userId = "user-1";
        session.checkInTime = checkIn;
        session.source = WorkSession::Source::Desktop;
        session.lastHeartbeat = heartbeat;
        return session;
    }

    // Port nothing listens on
    static quint16 closedPort()
    {
        QTcpServer server;
        server.listen(QHostAddress::LocalHost, 0);
        const quint16 port = server.serverPort();
        server.close();
        return port;
    }

private slots:
    void init()
    {
        m_clock = new ManualClock();
        m_store = new InMemorySessionStore(m_clock);
        m_controller = new SessionController(m_store, m_clock, WorkSession::Source::Browser);
        QVERIFY(m_controller->initialize());
        m_controller->setIdentity("user-1", "Ada");
        m_controller->setCredential("token-1");

        m_agent = new AgentControlClient();
        m_agent->setBaseUrl(QUrl(QString("http://127.0.0.1:%1").arg(closedPort())));
        m_agent->setProbeTimeout(1000);

        m_monitor = new LivenessMonitor(m_controller, m_agent, m_clock);
        m_launched.clear();
        m_monitor->setUrlLauncher([this](const QUrl& url) {
            m_launched.append(url);
            return true;
        });
    }

    void cleanup()
    {
        delete m_monitor;
        delete m_agent;
        delete m_controller;
        delete m_store;
        delete m_clock;
    }

    void testThresholdBoundary()
    {
        const QDateTime now = m_clock->now();
        const WorkSession atLimit = desktopSession(now.addSecs(-3600), now.addSecs(-120));
        const WorkSession pastLimit = desktopSession(now.addSecs(-3600), now.addSecs(-121));

        QVERIFY(!LivenessMonitor::isSessionStale(atLimit, now, 120));
        QVERIFY(LivenessMonitor::isSessionStale(pastLimit, now, 120));
    }

    void testCheckInTimeUsedBeforeFirstHeartbeat()
    {
        const QDateTime now = m_clock->now();
        QCOMPARE(LivenessMonitor::heartbeatAgeSeconds(desktopSession(now.addSecs(-90)), now), qint64(90));
        QVERIFY(!LivenessMonitor::isSessionStale(desktopSession(now.addSecs(-90)), now, 120));
        QVERIFY(LivenessMonitor::isSessionStale(desktopSession(now.addSecs(-300)), now, 120));
    }

    void testBrowserSessionNeverStale()
    {
        WorkSession session = desktopSession(m_clock->now().addSecs(-7200));
        session.source = WorkSession::Source::Browser;
        QVERIFY(!LivenessMonitor::isSessionStale(session, m_clock->now(), 120));

        session.source = WorkSession::Source::Desktop;
        session.status = WorkSession::Status::Completed;
        QVERIFY(!LivenessMonitor::isSessionStale(session, m_clock->now(), 120));
    }

    void testPollDetectsStaleness()
    {
        m_monitor->setPollInterval(20);
        QSignalSpy staleSpy(m_monitor, &LivenessMonitor::stalenessChanged);

        m_store->putRemote(desktopSession(m_clock->now(), m_clock->now()));
        QVERIFY(m_controller->sync());
        QVERIFY(m_monitor->isPolling());
        QVERIFY(!m_monitor->isStale());

        m_clock->advanceSeconds(121);
        QTRY_VERIFY(m_monitor->isStale());
        QCOMPARE(staleSpy.count(), 1);
        QCOMPARE(staleSpy.at(0).at(0).toBool(), true);

        // A fresh heartbeat clears it on the next update
        WorkSession refreshed = m_controller->currentSession();
        refreshed.lastHeartbeat = m_clock->now();
        m_controller->applyRemoteSnapshot(refreshed);
        QVERIFY(!m_monitor->isStale());
        QCOMPARE(staleSpy.count(), 2);
    }

    void testBrowserSessionNotPolled()
    {
        QVERIFY(m_controller->checkIn());
        QVERIFY(!m_monitor->isPolling());
        m_clock->advanceMinutes(60);
        m_monitor->evaluate();
        QVERIFY(!m_monitor->isStale());
    }

    void testForceCloseFlagsSession()
    {
        m_store->putRemote(desktopSession(m_clock->now()));
        QVERIFY(m_controller->sync());
        const QString sessionId = m_controller->currentSession().id;

        m_clock->advanceMinutes(50);
        m_monitor->evaluate();
        QVERIFY(m_monitor->isStale());

        QSignalSpy closedSpy(m_monitor, &LivenessMonitor::forceClosed);
        QVERIFY(m_monitor->forceClose());

        const WorkSession stored = m_store->session(sessionId);
        QCOMPARE(stored.status, WorkSession::Status::Completed);
        QVERIFY(stored.flagged);
        QCOMPARE(stored.flagReason, QString("heartbeat stopped"));
        QCOMPARE(stored.durationMinutes, 50);
        QVERIFY(!m_monitor->isStale());
        QVERIFY(!m_monitor->isPolling());
        QCOMPARE(closedSpy.count(), 1);

        QVERIFY(!m_monitor->forceClose());
    }

    void testReconnectFallsBackToHandshake()
    {
        m_monitor->setLaunchScheme("deskpulse");
        m_monitor->setProfile("ada@example.com", "");
        QSignalSpy reconnectedSpy(m_monitor, &LivenessMonitor::reconnected);

        QVERIFY(m_monitor->reconnect());
        QCOMPARE(m_monitor->lastReconnectPath(), LivenessMonitor::ReconnectPath::Handshake);
        QCOMPARE(reconnectedSpy.count(), 1);
        QCOMPARE(reconnectedSpy.at(0).at(0).toBool(), false);

        QCOMPARE(m_launched.size(), 1);
        LaunchHandshake handshake;
        QVERIFY(LaunchHandshake::parse(m_launched.first().toString(QUrl::FullyEncoded), "deskpulse", handshake));
        QCOMPARE(handshake.action, LaunchHandshake::Action::CheckIn);
        QCOMPARE(handshake.credential, QString("token-1"));
        QCOMPARE(handshake.userId, QString("user-1"));
        QCOMPARE(handshake.email, QString("ada@example.com"));
    }

    void testReconnectWithoutIdentityFails()
    {
        m_controller->setCredential(QString());
        QVERIFY(!m_monitor->reconnect());
        QVERIFY(!m_monitor->lastError().isEmpty());
        QVERIFY(m_launched.isEmpty());
    }

    void testReconnectFailsWhenLaunchFails()
    {
        m_monitor->setUrlLauncher([](const QUrl&) { return false; });
        QVERIFY(!m_monitor->reconnect());
        QCOMPARE(m_monitor->lastReconnectPath(), LivenessMonitor::ReconnectPath::None);
    }

    void testCredentialRefreshUsesHandshake()
    {
        m_monitor->setRefreshInterval(30);
        m_monitor->setCredentialProvider([]() { return QString("token-2"); });
        QVERIFY(m_monitor->reconnect());

        QSignalSpy refreshSpy(m_monitor, &LivenessMonitor::credentialRefreshed);
        QTRY_VERIFY(refreshSpy.count() >= 1);
        QCOMPARE(refreshSpy.at(0).at(0).toBool(), false);

        LaunchHandshake handshake;
        QVERIFY(LaunchHandshake::parse(m_launched.last().toString(QUrl::FullyEncoded), "deskpulse", handshake));
        QCOMPARE(handshake.action, LaunchHandshake::Action::Refresh);
        QCOMPARE(handshake.credential, QString("token-2"));
    }

    void testReconnectThroughRunningAgent()
    {
        auto agentController = std::make_shared<RecordingAgentController>();
        Http::Server agent;
        agent.registerController(agentController);
        QVERIFY(agent.start(0));
        m_agent->setBaseUrl(QUrl(QString("http://127.0.0.1:%1").arg(agent.port())));

        m_store->putRemote(desktopSession(m_clock->now().addSecs(-3600), m_clock->now().addSecs(-600)));
        QVERIFY(m_controller->sync());
        m_monitor->evaluate();
        QVERIFY(m_monitor->isStale());

        m_monitor->setRefreshInterval(200);
        m_monitor->setCredentialProvider([]() { return QString("token-2"); });
        QSignalSpy reconnectedSpy(m_monitor, &LivenessMonitor::reconnected);
        QSignalSpy refreshSpy(m_monitor, &LivenessMonitor::credentialRefreshed);

        QVERIFY(m_monitor->reconnect());
        QCOMPARE(m_monitor->lastReconnectPath(), LivenessMonitor::ReconnectPath::Agent);
        QCOMPARE(reconnectedSpy.count(), 1);
        QCOMPARE(reconnectedSpy.at(0).at(0).toBool(), true);
        QVERIFY(!m_monitor->isStale());
        QVERIFY(m_launched.isEmpty());

        QCOMPARE(agentController->paths, (QStringList{"/status", "/checkin"}));
        const QJsonObject checkIn = agentController->bodies.at(1);
        QCOMPARE(checkIn["credential"].toString(), QString("token-2"));
        QCOMPARE(checkIn["userId"].toString(), QString("user-1"));
        QCOMPARE(checkIn["name"].toString(), QString("Ada"));

        // The periodic refresh goes to the running agent, not through a relaunch
        QTRY_VERIFY(refreshSpy.count() >= 1);
        QCOMPARE(refreshSpy.at(0).at(0).toBool(), true);
        QCOMPARE(agentController->paths.at(2), QString("/refresh"));
        QCOMPARE(agentController->bodies.at(2)["credential"].toString(), QString("token-2"));
        QVERIFY(m_launched.isEmpty());
    }

private:
    ManualClock* m_clock;
    InMemorySessionStore* m_store;
    SessionController* m_controller;
    AgentControlClient* m_agent;
    LivenessMonitor* m_monitor;
    QList<QUrl> m_launched;
};

QTEST_MAIN(LivenessMonitorTest)
#include "LivenessMonitorTest.moc"
