#ifndef AGENTCONTROLCONTROLLER_H
#define AGENTCONTROLCONTROLLER_H

#include "httpserver/controller.h"

class AgentActions;

/**
 * @brief Loopback control API of the agent
 *
 * GET /status, POST /checkin, /checkout, /break, /resume, /refresh and /capture.
 * Every response is the {ok, error?} envelope.
 */
class AgentControlController : public Http::Controller
{
    Q_OBJECT
public:
    explicit AgentControlController(AgentActions* actions, QObject* parent = nullptr);
    ~AgentControlController() override;

    void setupRoutes(QHttpServer& server) override;
    QString getControllerName() const override { return "AgentControlController"; }

private:
    QHttpServerResponse handleStatus(const QHttpServerRequest& request);
    QHttpServerResponse handleCheckIn(const QHttpServerRequest& request);
    QHttpServerResponse handleCheckOut(const QHttpServerRequest& request);
    QHttpServerResponse handleBreak(const QHttpServerRequest& request);
    QHttpServerResponse handleResume(const QHttpServerRequest& request);
    QHttpServerResponse handleRefresh(const QHttpServerRequest& request);
    QHttpServerResponse handleCapture(const QHttpServerRequest& request);

    // Parses the body and checks the named fields; on failure response holds the reply
    bool readBody(const QHttpServerRequest& request, const QStringList& required,
                  QJsonObject& body, QHttpServerResponse& response) const;

    AgentActions* m_actions;
};

#endif // AGENTCONTROLCONTROLLER_H
