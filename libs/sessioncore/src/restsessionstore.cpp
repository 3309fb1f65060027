#include "sessioncore/restsessionstore.h"
#include "sessioncore/documentcodec.h"
#include "logger/logger.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QNetworkRequest>
#include <QSet>
#include <QUrl>

#include <algorithm>

namespace {

const QLatin1String kWorkLogs("work_logs");
const QLatin1String kCaptureCommands("capture_commands");
const QLatin1String kTrackerLogs("tracker_logs");
const QLatin1String kMemberProfiles("member_profiles");

QJsonObject fieldFilter(const QString& field, const QString& op, const QJsonObject& value)
{
    return QJsonObject{
        {"fieldFilter", QJsonObject{
            {"field", QJsonObject{{"fieldPath", field}}},
            {"op", op},
            {"value", value}
        }}
    };
}

QJsonObject andFilter(const QJsonArray& filters)
{
    return QJsonObject{
        {"compositeFilter", QJsonObject{
            {"op", "AND"},
            {"filters", filters}
        }}
    };
}

} // namespace

RestSessionStore::RestSessionStore(QObject* parent)
    : SessionStore(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_initialized(false)
    , m_requestTimeoutMs(10000)
    , m_polling(false)
{
    m_watchTimer.setInterval(5000);
    connect(&m_watchTimer, &QTimer::timeout, this, &RestSessionStore::pollWatchedSessions);
}

RestSessionStore::~RestSessionStore()
{
    m_watchTimer.stop();
}

bool RestSessionStore::initialize(const QString& storeUrl, const QString& projectId)
{
    QUrl url(storeUrl);
    if (!url.isValid() || url.scheme().isEmpty() || projectId.isEmpty()) {
        setLastError(QString("Invalid store location: %1 / %2").arg(storeUrl, projectId));
        LOG_ERROR(lastError());
        return false;
    }

    QString base = storeUrl;
    while (base.endsWith('/')) {
        base.chop(1);
    }
    m_documentsUrl = QString("%1/v1/projects/%2/databases/(default)/documents").arg(base, projectId);
    m_initialized = true;

    LOG_INFO(QString("Session store initialized at %1").arg(m_documentsUrl));
    return true;
}

QString RestSessionStore::documentsUrl() const
{
    return m_documentsUrl;
}

void RestSessionStore::setRequestTimeout(int msecs)
{
    m_requestTimeoutMs = msecs;
}

int RestSessionStore::requestTimeout() const
{
    return m_requestTimeoutMs;
}

void RestSessionStore::setWatchInterval(int msecs)
{
    m_watchTimer.setInterval(msecs);
}

void RestSessionStore::setCredential(const QString& credential)
{
    QMutexLocker locker(&m_credentialMutex);
    m_credential = credential;
}

QString RestSessionStore::credential() const
{
    QMutexLocker locker(&m_credentialMutex);
    return m_credential;
}

bool RestSessionStore::createSession(WorkSession& session)
{
    QJsonObject body{{"fields", DocumentCodec::encodeSession(session)}};
    QJsonDocument response;
    if (!sendRequest("POST", QString("/%1").arg(kWorkLogs), body, response)) {
        return false;
    }

    const QJsonObject document = response.object();
    session.id = DocumentCodec::documentId(document["name"].toString());
    session.updateTime = QDateTime::fromString(document["updateTime"].toString(), Qt::ISODateWithMs).toUTC();
    if (session.id.isEmpty()) {
        setLastError("Store did not return a document name for the new session");
        LOG_ERROR(lastError());
        return false;
    }

    LOG_INFO(QString("Created work log %1 for user %2").arg(session.id, session.userId));
    return true;
}

bool RestSessionStore::fetchSession(const QString& sessionId, WorkSession& session, bool& exists)
{
    exists = false;
    QJsonDocument response;
    int status = 0;
    if (!sendRequest("GET", QString("/%1/%2").arg(kWorkLogs, sessionId), QJsonObject(), response, &status)) {
        // A missing document is an answer, not a failure
        return status == 404;
    }

    session = DocumentCodec::decodeSession(response.object());
    exists = true;
    return true;
}

bool RestSessionStore::findOpenSession(const QString& userId, WorkSession& session, bool& found)
{
    found = false;
    QList<WorkSession> sessions;
    if (!queryOpenSessions(userId, 1, sessions)) {
        return false;
    }
    if (!sessions.isEmpty()) {
        session = sessions.first();
        found = true;
    }
    return true;
}

bool RestSessionStore::updateSession(const WorkSession& session, const QStringList& fieldMask)
{
    if (session.id.isEmpty()) {
        setLastError("Cannot update a session without an id");
        LOG_ERROR(lastError());
        return false;
    }

    QJsonObject body{{"fields", DocumentCodec::encodeSession(session, fieldMask)}};
    QJsonDocument response;
    return sendRequest("PATCH", QString("/%1/%2?%3").arg(kWorkLogs, session.id, maskQuery(fieldMask)),
                       body, response);
}

bool RestSessionStore::setPresence(const QString& userId, bool online, const QDateTime& at)
{
    QJsonObject fields;
    fields["isOnline"] = DocumentCodec::booleanValue(online);
    fields["lastActive"] = DocumentCodec::timestampValue(at);

    QJsonDocument response;
    return sendRequest("PATCH",
                       QString("/%1/%2?%3").arg(kMemberProfiles, userId, maskQuery({"isOnline", "lastActive"})),
                       QJsonObject{{"fields", fields}}, response);
}

bool RestSessionStore::pendingCaptureCommands(const QString& userId, int limit, QList<CaptureCommand>& commands)
{
    commands.clear();

    QJsonArray filters;
    filters.append(fieldFilter("userId", "EQUAL", DocumentCodec::stringValue(userId)));
    filters.append(fieldFilter("status", "EQUAL", DocumentCodec::stringValue("pending")));

    QJsonObject query{
        {"from", QJsonArray{QJsonObject{{"collectionId", kCaptureCommands}}}},
        {"where", andFilter(filters)},
        {"limit", limit}
    };

    QList<QJsonObject> documents;
    if (!runQuery(query, documents)) {
        return false;
    }

    for (const QJsonObject& document : documents) {
        commands.append(DocumentCodec::decodeCaptureCommand(document));
    }
    std::sort(commands.begin(), commands.end(), [](const CaptureCommand& a, const CaptureCommand& b) {
        return a.requestedAt < b.requestedAt;
    });
    return true;
}

bool RestSessionStore::completeCaptureCommand(const QString& commandId, const QDateTime& at)
{
    QJsonObject fields;
    fields["status"] = DocumentCodec::stringValue("completed");
    fields["completedAt"] = DocumentCodec::timestampValue(at);

    QJsonDocument response;
    return sendRequest("PATCH",
                       QString("/%1/%2?%3").arg(kCaptureCommands, commandId, maskQuery({"status", "completedAt"})),
                       QJsonObject{{"fields", fields}}, response);
}

bool RestSessionStore::saveEvidence(const EvidenceRecord& record)
{
    QJsonDocument response;
    return sendRequest("POST", QString("/%1").arg(kTrackerLogs),
                       QJsonObject{{"fields", DocumentCodec::encodeEvidence(record)}}, response);
}

void RestSessionStore::watchUserSessions(const QString& userId)
{
    if (m_watchedUserId != userId) {
        m_seenUpdateTimes.clear();
    }
    m_watchedUserId = userId;
    LOG_INFO(QString("Watching work logs of user %1 every %2 ms").arg(userId).arg(m_watchTimer.interval()));

    m_watchTimer.start();
    pollWatchedSessions();
}

void RestSessionStore::unwatch()
{
    m_watchTimer.stop();
    m_watchedUserId.clear();
    m_seenUpdateTimes.clear();
}

void RestSessionStore::pollWatchedSessions()
{
    // Requests spin a local event loop, so the timer can fire again mid-poll
    if (m_polling || m_watchedUserId.isEmpty()) {
        return;
    }
    m_polling = true;

    const QString userId = m_watchedUserId;
    QList<WorkSession> sessions;
    if (!queryOpenSessions(userId, 5, sessions)) {
        LOG_WARNING(QString("Work log poll failed: %1").arg(lastError()));
        m_polling = false;
        return;
    }

    QSet<QString> present;
    for (const WorkSession& session : sessions) {
        present.insert(session.id);
        auto seen = m_seenUpdateTimes.constFind(session.id);
        if (seen == m_seenUpdateTimes.constEnd() || session.updateTime > seen.value()) {
            m_seenUpdateTimes[session.id] = session.updateTime;
            emit sessionChanged(session);
        }
    }

    // A session that left the open set was completed or deleted elsewhere
    const QStringList known = m_seenUpdateTimes.keys();
    for (const QString& sessionId : known) {
        if (present.contains(sessionId)) {
            continue;
        }
        m_seenUpdateTimes.remove(sessionId);

        WorkSession session;
        bool exists = false;
        if (!fetchSession(sessionId, session, exists)) {
            LOG_WARNING(QString("Could not read departed work log %1: %2").arg(sessionId, lastError()));
            continue;
        }
        if (exists) {
            emit sessionChanged(session);
        } else {
            emit sessionRemoved(sessionId);
        }
    }

    m_polling = false;
}

bool RestSessionStore::queryOpenSessions(const QString& userId, int limit, QList<WorkSession>& sessions)
{
    sessions.clear();

    QJsonArray statuses;
    statuses.append(DocumentCodec::stringValue("active"));
    statuses.append(DocumentCodec::stringValue("break"));

    QJsonArray filters;
    filters.append(fieldFilter("userId", "EQUAL", DocumentCodec::stringValue(userId)));
    filters.append(fieldFilter("status", "IN", DocumentCodec::arrayValue(statuses)));

    QJsonObject query{
        {"from", QJsonArray{QJsonObject{{"collectionId", kWorkLogs}}}},
        {"where", andFilter(filters)},
        {"orderBy", QJsonArray{QJsonObject{
            {"field", QJsonObject{{"fieldPath", "checkInTime"}}},
            {"direction", "DESCENDING"}
        }}},
        {"limit", limit}
    };

    QList<QJsonObject> documents;
    if (!runQuery(query, documents)) {
        return false;
    }
    for (const QJsonObject& document : documents) {
        sessions.append(DocumentCodec::decodeSession(document));
    }
    return true;
}

bool RestSessionStore::runQuery(const QJsonObject& structuredQuery, QList<QJsonObject>& documents)
{
    documents.clear();
    QJsonDocument response;
    if (!sendRequest("POST", ":runQuery", QJsonObject{{"structuredQuery", structuredQuery}}, response)) {
        return false;
    }

    // One entry per result; an empty result set is a single entry without "document"
    const QJsonArray results = response.array();
    for (const QJsonValue& result : results) {
        const QJsonObject entry = result.toObject();
        if (entry.contains("document")) {
            documents.append(entry["document"].toObject());
        }
    }
    return true;
}

QString RestSessionStore::maskQuery(const QStringList& fieldMask)
{
    QStringList parts;
    for (const QString& field : fieldMask) {
        parts.append(QString("updateMask.fieldPaths=%1").arg(field));
    }
    return parts.join('&');
}

bool RestSessionStore::sendRequest(const QString& method, const QString& path, const QJsonObject& body,
                                   QJsonDocument& response, int* httpStatus)
{
    if (!m_initialized) {
        setLastError("Session store not initialized");
        LOG_ERROR(lastError());
        return false;
    }

    const QString token = credential();
    if (token.isEmpty()) {
        setLastError("No credential available for the session store");
        LOG_WARNING(lastError());
        return false;
    }

    const QString url = m_documentsUrl + path;
    QNetworkRequest request;
    request.setUrl(QUrl(url));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Authorization", QString("Bearer %1").arg(token).toUtf8());

    QEventLoop loop;
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);

    const QString logPath = path.section('?', 0, 0);
    LOG_DEBUG(QString("Store %1 %2").arg(method, logPath));

    QNetworkReply* reply = nullptr;
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);
    if (method == "GET") {
        reply = m_networkManager->get(request);
    } else if (method == "POST") {
        reply = m_networkManager->post(request, payload);
    } else if (method == "PATCH") {
        reply = m_networkManager->sendCustomRequest(request, "PATCH", payload);
    } else if (method == "DELETE") {
        reply = m_networkManager->deleteResource(request);
    } else {
        setLastError("Unsupported HTTP method: " + method);
        LOG_ERROR(lastError());
        return false;
    }

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_requestTimeoutMs);
    loop.exec();

    if (timeoutTimer.isActive()) {
        timeoutTimer.stop();
    } else {
        reply->abort();
        reply->deleteLater();
        setLastError(QString("Request timeout for %1 %2").arg(method, logPath));
        LOG_ERROR(lastError());
        return false;
    }

    if (httpStatus) {
        *httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    }

    bool success = processReply(reply, response);
    reply->deleteLater();
    return success;
}

bool RestSessionStore::processReply(QNetworkReply* reply, QJsonDocument& response)
{
    const QByteArray data = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        QString message = reply->errorString();

        QJsonDocument errorDoc = QJsonDocument::fromJson(data);
        if (errorDoc.isObject() && errorDoc.object()["error"].isObject()) {
            message = errorDoc.object()["error"].toObject()["message"].toString(message);
        }

        setLastError(QString("HTTP %1: %2").arg(httpStatus).arg(message));
        if (httpStatus != 404) {
            LOG_ERROR(QString("Store request failed: %1").arg(lastError()));
        }
        return false;
    }

    if (data.isEmpty()) {
        response = QJsonDocument();
        return true;
    }

    QJsonParseError parseError;
    response = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setLastError(QString("Invalid store response: %1").arg(parseError.errorString()));
        LOG_ERROR(lastError());
        return false;
    }
    return true;
}
