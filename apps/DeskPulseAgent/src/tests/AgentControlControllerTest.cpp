#include <QtTest/QtTest>
#include <QJsonObject>

#include <memory>

#include "httpserver/server.h"
#include "service/AgentActions.h"
#include "service/AgentControlController.h"
#include "sessioncore/agentcontrolclient.h"

// Records what the control API asked for and answers from canned values
class FakeAgentActions : public AgentActions
{
public:
    Status currentStatus;
    bool succeed = true;
    bool resumed = false;
    bool captureStarted = true;
    QString refusal = "refused by fake";
    QStringList calls;
    QString lastCredential;
    QString lastUserId;
    QString lastName;
    QString lastReport;
    QString lastProofLink;

    Status status() const override { return currentStatus; }

    bool checkIn(const QString& credential, const QString& userId, const QString& name,
                 bool& wasResumed, QString& error) override
    {
        calls.append("checkin");
        lastCredential = credential;
        lastUserId = userId;
        lastName = name;
        wasResumed = resumed;
        return answer(error);
    }

    bool checkOut(const QString& report, const QString& proofLink, QString& error) override
    {
        calls.append("checkout");
        lastReport = report;
        lastProofLink = proofLink;
        return answer(error);
    }

    bool startBreak(QString& error) override
    {
        calls.append("break");
        return answer(error);
    }

    bool resumeWork(QString& error) override
    {
        calls.append("resume");
        return answer(error);
    }

    bool refreshCredential(const QString& credential, QString& error) override
    {
        calls.append("refresh");
        lastCredential = credential;
        return answer(error);
    }

    bool triggerCapture(bool& started, QString& error) override
    {
        calls.append("capture");
        started = captureStarted;
        return answer(error);
    }

private:
    bool answer(QString& error)
    {
        if (!succeed) {
            error = refusal;
        }
        return succeed;
    }
};

class AgentControlControllerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QCoreApplication::setApplicationVersion("1.0.0");
    }

    void init()
    {
        m_actions = new FakeAgentActions();
        m_server = new Http::Server();
        m_server->registerController(std::make_shared<AgentControlController>(m_actions));
        QVERIFY(m_server->start(0));

        m_client = new AgentControlClient();
        m_client->setBaseUrl(QUrl(QString("http://127.0.0.1:%1").arg(m_server->port())));
    }

    void cleanup()
    {
        delete m_client;
        delete m_server;
        delete m_actions;
    }

    void testStatusWithoutSession()
    {
        QJsonObject status;
        QVERIFY(m_client->probe(status));
        QCOMPARE(status["ok"].toBool(), true);
        QCOMPARE(status["running"].toBool(), true);
        QCOMPARE(status["version"].toString(), QString("1.0.0"));
        QVERIFY(!status["platform"].toString().isEmpty());
        QCOMPARE(status["hasSession"].toBool(), false);
        QVERIFY(status["sessionId"].isNull());
    }

    void testStatusWithSession()
    {
        m_actions->currentStatus.hasSession = true;
        m_actions->currentStatus.sessionId = "log-1";
        m_actions->currentStatus.isOnBreak = true;
        m_actions->currentStatus.captureCount = 4;

        QJsonObject status;
        QVERIFY(m_client->probe(status));
        QCOMPARE(status["sessionId"].toString(), QString("log-1"));
        QCOMPARE(status["isOnBreak"].toBool(), true);
        QCOMPARE(status["captureCount"].toInt(), 4);
    }

    void testCheckInForwardsIdentity()
    {
        m_actions->resumed = true;
        bool resumed = false;
        QVERIFY(m_client->checkIn("token-1", "user-1", "Ada", &resumed));
        QVERIFY(resumed);
        QCOMPARE(m_actions->calls, QStringList{"checkin"});
        QCOMPARE(m_actions->lastCredential, QString("token-1"));
        QCOMPARE(m_actions->lastUserId, QString("user-1"));
        QCOMPARE(m_actions->lastName, QString("Ada"));
    }

    void testCheckInRequiresUser()
    {
        QVERIFY(!m_client->checkIn("token-1", QString(), "Ada"));
        QVERIFY(m_client->lastError().contains("userId"));
        QVERIFY(!m_client->lastCallUnreachable());
        QVERIFY(m_actions->calls.isEmpty());
    }

    void testCheckOutCarriesReportAndProof()
    {
        QVERIFY(m_client->checkOut("Closed three tickets", "https://example.com/pr/9"));
        QCOMPARE(m_actions->lastReport, QString("Closed three tickets"));
        QCOMPARE(m_actions->lastProofLink, QString("https://example.com/pr/9"));

        QVERIFY(!m_client->checkOut(QString()));
        QCOMPARE(m_actions->calls.size(), 1);
    }

    void testRefusalCarriesError()
    {
        m_actions->succeed = false;
        m_actions->refusal = "No active session to pause";

        QVERIFY(!m_client->startBreak());
        QCOMPARE(m_client->lastError(), QString("No active session to pause"));
        QVERIFY(!m_client->lastCallUnreachable());

        QVERIFY(!m_client->resume());
        QCOMPARE(m_actions->calls, (QStringList{"break", "resume"}));
    }

    void testRefreshAndCapture()
    {
        QVERIFY(m_client->refresh("token-2"));
        QCOMPARE(m_actions->lastCredential, QString("token-2"));

        m_actions->captureStarted = false;
        QVERIFY(m_client->capture());
        QCOMPARE(m_actions->calls, (QStringList{"refresh", "capture"}));
    }

    void testStoppedAgentIsUnreachable()
    {
        m_server->stop();
        m_client->setProbeTimeout(1000);

        QJsonObject status;
        QVERIFY(!m_client->probe(status));
        QVERIFY(m_client->lastCallUnreachable());
    }

private:
    FakeAgentActions* m_actions;
    Http::Server* m_server;
    AgentControlClient* m_client;
};

QTEST_MAIN(AgentControlControllerTest)
#include "AgentControlControllerTest.moc"
