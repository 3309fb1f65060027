#include "sessioncore/agentcontrolclient.h"
#include "logger/logger.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

AgentControlClient::AgentControlClient(QObject* parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl(QUrl("http://127.0.0.1:59210"))
    , m_probeTimeoutMs(2000)
    , m_callTimeoutMs(10000)
    , m_unreachable(false)
{
}

AgentControlClient::~AgentControlClient() = default;

void AgentControlClient::setBaseUrl(const QUrl& baseUrl)
{
    m_baseUrl = baseUrl;
}

QUrl AgentControlClient::baseUrl() const
{
    return m_baseUrl;
}

void AgentControlClient::setProbeTimeout(int msecs)
{
    m_probeTimeoutMs = msecs;
}

void AgentControlClient::setCallTimeout(int msecs)
{
    m_callTimeoutMs = msecs;
}

bool AgentControlClient::probe(QJsonObject& status)
{
    return call("GET", "/status", QJsonObject(), m_probeTimeoutMs, status);
}

bool AgentControlClient::checkIn(const QString& credential, const QString& userId, const QString& name, bool* resumed)
{
    QJsonObject body{
        {"credential", credential},
        {"userId", userId},
        {"name", name}
    };
    QJsonObject response;
    if (!call("POST", "/checkin", body, m_callTimeoutMs, response)) {
        return false;
    }
    if (resumed) {
        *resumed = response["resumed"].toBool();
    }
    return true;
}

bool AgentControlClient::checkOut(const QString& report, const QString& proofLink)
{
    QJsonObject body{{"report", report}};
    if (!proofLink.isEmpty()) {
        body["proofLink"] = proofLink;
    }
    QJsonObject response;
    return call("POST", "/checkout", body, m_callTimeoutMs, response);
}

bool AgentControlClient::startBreak()
{
    QJsonObject response;
    return call("POST", "/break", QJsonObject(), m_callTimeoutMs, response);
}

bool AgentControlClient::resume()
{
    QJsonObject response;
    return call("POST", "/resume", QJsonObject(), m_callTimeoutMs, response);
}

bool AgentControlClient::refresh(const QString& credential)
{
    QJsonObject response;
    return call("POST", "/refresh", QJsonObject{{"credential", credential}}, m_callTimeoutMs, response);
}

bool AgentControlClient::capture()
{
    QJsonObject response;
    return call("POST", "/capture", QJsonObject(), m_callTimeoutMs, response);
}

bool AgentControlClient::lastCallUnreachable() const
{
    return m_unreachable;
}

QString AgentControlClient::lastError() const
{
    return m_lastError;
}

bool AgentControlClient::call(const QString& method, const QString& path, const QJsonObject& body,
                              int timeoutMs, QJsonObject& response)
{
    m_unreachable = false;
    m_lastError.clear();

    QUrl url = m_baseUrl;
    url.setPath(path);

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QEventLoop loop;
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);

    QNetworkReply* reply = method == "GET"
        ? m_networkManager->get(request)
        : m_networkManager->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timeoutTimer.start(timeoutMs);
    loop.exec();

    if (timeoutTimer.isActive()) {
        timeoutTimer.stop();
    } else {
        reply->abort();
        reply->deleteLater();
        m_unreachable = true;
        m_lastError = QString("Agent did not answer %1 %2 within %3 ms").arg(method, path).arg(timeoutMs);
        LOG_WARNING(m_lastError);
        return false;
    }

    const QByteArray data = reply->readAll();
    const QNetworkReply::NetworkError error = reply->error();
    const QString errorString = reply->errorString();
    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    reply->deleteLater();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);

    if (error != QNetworkReply::NoError && httpStatus == 0) {
        m_unreachable = true;
        m_lastError = QString("Agent unreachable: %1").arg(errorString);
        LOG_DEBUG(m_lastError);
        return false;
    }

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_lastError = QString("Agent returned an invalid response to %1 (HTTP %2)").arg(path).arg(httpStatus);
        LOG_WARNING(m_lastError);
        return false;
    }

    response = doc.object();
    if (!response["ok"].toBool()) {
        m_lastError = response["error"].toString(QString("HTTP %1").arg(httpStatus));
        LOG_WARNING(QString("Agent refused %1: %2").arg(path, m_lastError));
        return false;
    }
    return true;
}
