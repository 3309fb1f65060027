#include "AgentControlController.h"
#include "AgentActions.h"
#include "httpserver/response.h"
#include "logger/logger.h"

#include <QCoreApplication>
#include <QSysInfo>

AgentControlController::AgentControlController(AgentActions* actions, QObject* parent)
    : Http::Controller(parent)
    , m_actions(actions)
{
}

AgentControlController::~AgentControlController() = default;

void AgentControlController::setupRoutes(QHttpServer& server)
{
    LOG_INFO("Setting up AgentControlController routes");

    addRoute(server, "/status", QHttpServerRequest::Method::Get,
             [this](const QHttpServerRequest& request) { return handleStatus(request); });
    addRoute(server, "/checkin", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleCheckIn(request); });
    addRoute(server, "/checkout", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleCheckOut(request); });
    addRoute(server, "/break", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleBreak(request); });
    addRoute(server, "/resume", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleResume(request); });
    addRoute(server, "/refresh", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleRefresh(request); });
    addRoute(server, "/capture", QHttpServerRequest::Method::Post,
             [this](const QHttpServerRequest& request) { return handleCapture(request); });
}

bool AgentControlController::readBody(const QHttpServerRequest& request, const QStringList& required,
                                      QJsonObject& body, QHttpServerResponse& response) const
{
    bool ok = false;
    body = extractJsonFromRequest(request, ok);
    if (!ok) {
        response = Http::Response::badRequest("Invalid JSON body");
        return false;
    }

    QStringList missing;
    if (!validateRequiredFields(body, required, missing)) {
        response = Http::Response::badRequest(QString("Missing fields: %1").arg(missing.join(", ")));
        return false;
    }
    return true;
}

QHttpServerResponse AgentControlController::handleStatus(const QHttpServerRequest& request)
{
    Q_UNUSED(request);
    const AgentActions::Status status = m_actions->status();

    QJsonObject fields;
    fields["running"] = true;
    fields["version"] = QCoreApplication::applicationVersion();
    fields["platform"] = QSysInfo::productType();
    fields["hasSession"] = status.hasSession;
    fields["sessionId"] = status.hasSession ? QJsonValue(status.sessionId) : QJsonValue();
    fields["isOnBreak"] = status.isOnBreak;
    fields["captureCount"] = status.captureCount;
    return Http::Response::ok(fields);
}

QHttpServerResponse AgentControlController::handleCheckIn(const QHttpServerRequest& request)
{
    QJsonObject body;
    QHttpServerResponse response(QHttpServerResponder::StatusCode::Ok);
    if (!readBody(request, {"credential", "userId"}, body, response)) {
        return response;
    }

    bool resumed = false;
    QString error;
    if (!m_actions->checkIn(body["credential"].toString(), body["userId"].toString(),
                            body["name"].toString(), resumed, error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok(QJsonObject{{"resumed", resumed}});
}

QHttpServerResponse AgentControlController::handleCheckOut(const QHttpServerRequest& request)
{
    QJsonObject body;
    QHttpServerResponse response(QHttpServerResponder::StatusCode::Ok);
    if (!readBody(request, {"report"}, body, response)) {
        return response;
    }

    QString error;
    if (!m_actions->checkOut(body["report"].toString(), body["proofLink"].toString(), error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok();
}

QHttpServerResponse AgentControlController::handleBreak(const QHttpServerRequest& request)
{
    Q_UNUSED(request);
    QString error;
    if (!m_actions->startBreak(error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok();
}

QHttpServerResponse AgentControlController::handleResume(const QHttpServerRequest& request)
{
    Q_UNUSED(request);
    QString error;
    if (!m_actions->resumeWork(error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok();
}

QHttpServerResponse AgentControlController::handleRefresh(const QHttpServerRequest& request)
{
    QJsonObject body;
    QHttpServerResponse response(QHttpServerResponder::StatusCode::Ok);
    if (!readBody(request, {"credential"}, body, response)) {
        return response;
    }

    QString error;
    if (!m_actions->refreshCredential(body["credential"].toString(), error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok();
}

QHttpServerResponse AgentControlController::handleCapture(const QHttpServerRequest& request)
{
    Q_UNUSED(request);
    bool started = false;
    QString error;
    if (!m_actions->triggerCapture(started, error)) {
        return Http::Response::failure(error);
    }
    return Http::Response::ok(QJsonObject{{"started", started}});
}
