#include "CheckoutGuard.h"
#include "logger/logger.h"
#include "sessioncore/documentcodec.h"
#include "sessioncore/worksession.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <QUrl>

CheckoutGuard::CheckoutGuard(Clock* clock, QObject* parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_clock(clock ? clock : Clock::system())
    , m_overallTimeoutMs(6000)
    , m_sessionWriteMs(5000)
    , m_presenceWriteMs(3000)
{
}

CheckoutGuard::~CheckoutGuard() = default;

bool CheckoutGuard::initialize(const QString& storeUrl, const QString& projectId)
{
    if (storeUrl.isEmpty() || projectId.isEmpty()) {
        m_lastError = "Checkout guard needs a store URL and project id";
        LOG_ERROR(m_lastError);
        return false;
    }

    QString base = storeUrl;
    while (base.endsWith('/')) {
        base.chop(1);
    }
    m_documentsUrl = QString("%1/v1/projects/%2/databases/(default)/documents").arg(base, projectId);
    return true;
}

void CheckoutGuard::setTimeouts(int overallMs, int sessionWriteMs, int presenceWriteMs)
{
    m_overallTimeoutMs = overallMs;
    m_sessionWriteMs = sessionWriteMs;
    m_presenceWriteMs = presenceWriteMs;
}

void CheckoutGuard::updateMirror(const SessionMirror& mirror)
{
    QMutexLocker locker(&m_mutex);
    if (mirror.isValid()) {
        m_mirror = mirror;
    } else {
        m_mirror = SessionMirror();
    }
}

SessionMirror CheckoutGuard::mirror() const
{
    QMutexLocker locker(&m_mutex);
    return m_mirror;
}

bool CheckoutGuard::hasMirror() const
{
    QMutexLocker locker(&m_mutex);
    return m_mirror.isValid();
}

QString CheckoutGuard::lastError() const
{
    return m_lastError;
}

QStringList CheckoutGuard::emergencyFieldMask()
{
    return {"status", "checkOutTime", "durationMinutes", "breakDurationMinutes",
            "report", "attachments", "flagged", "flagReason"};
}

QJsonObject CheckoutGuard::emergencyPayload(const SessionMirror& mirror, const QDateTime& now)
{
    // A break still open at exit is not counted as work
    qint64 breakMsecs = mirror.cumulativeBreakSeconds * 1000;
    if (mirror.breakStartTime.isValid() && mirror.breakStartTime < now) {
        breakMsecs += mirror.breakStartTime.msecsTo(now);
    }

    QJsonObject fields;
    fields["status"] = DocumentCodec::stringValue(WorkSession::statusToString(WorkSession::Status::Completed));
    fields["checkOutTime"] = DocumentCodec::timestampValue(now);
    fields["durationMinutes"] =
        DocumentCodec::integerValue(SessionMath::netDurationMinutes(mirror.checkInTime, now, breakMsecs));
    fields["breakDurationMinutes"] = DocumentCodec::integerValue(SessionMath::roundMinutes(breakMsecs));
    fields["report"] = DocumentCodec::stringValue("[Auto] App closed without manual checkout");
    fields["attachments"] = DocumentCodec::arrayValue(QJsonArray());
    fields["flagged"] = DocumentCodec::booleanValue(true);
    fields["flagReason"] = DocumentCodec::stringValue("closed without manual checkout");

    return QJsonObject{{"fields", fields}};
}

QString CheckoutGuard::documentUrl(const QString& collection, const QString& id, const QStringList& fieldMask) const
{
    QStringList parts;
    for (const QString& field : fieldMask) {
        parts.append(QString("updateMask.fieldPaths=%1").arg(field));
    }
    return QString("%1/%2/%3?%4").arg(m_documentsUrl, collection, id, parts.join('&'));
}

bool CheckoutGuard::emergencyCheckout()
{
    const SessionMirror mirror = this->mirror();
    if (!mirror.isValid()) {
        LOG_DEBUG("No mirrored session; nothing to close");
        return false;
    }
    if (m_documentsUrl.isEmpty()) {
        m_lastError = "Checkout guard not initialized";
        LOG_ERROR(m_lastError);
        updateMirror(SessionMirror());
        return false;
    }

    const QDateTime now = m_clock->now();
    LOG_WARNING(QString("Closing session %1 without a manual checkout").arg(mirror.sessionId));

    const QByteArray authorization = QString("Bearer %1").arg(mirror.credential).toUtf8();

    QNetworkRequest sessionRequest(QUrl(documentUrl("work_logs", mirror.sessionId, emergencyFieldMask())));
    sessionRequest.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    sessionRequest.setRawHeader("Authorization", authorization);
    sessionRequest.setTransferTimeout(m_sessionWriteMs);

    QJsonObject presenceFields;
    presenceFields["isOnline"] = DocumentCodec::booleanValue(false);
    presenceFields["lastActive"] = DocumentCodec::timestampValue(now);

    QNetworkRequest presenceRequest(QUrl(documentUrl("member_profiles", mirror.userId, {"isOnline", "lastActive"})));
    presenceRequest.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    presenceRequest.setRawHeader("Authorization", authorization);
    presenceRequest.setTransferTimeout(m_presenceWriteMs);

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);

    bool sessionWritten = false;
    QPointer<QNetworkReply> sessionReply = m_networkManager->sendCustomRequest(
        sessionRequest, "PATCH", QJsonDocument(emergencyPayload(mirror, now)).toJson(QJsonDocument::Compact));
    QPointer<QNetworkReply> presenceReply;

    connect(sessionReply, &QNetworkReply::finished, &loop, [&]() {
        sessionWritten = sessionReply->error() == QNetworkReply::NoError;
        if (sessionWritten) {
            LOG_INFO(QString("Emergency checkout written for %1").arg(mirror.sessionId));
        } else {
            m_lastError = sessionReply->errorString();
            LOG_ERROR(QString("Emergency checkout failed: %1").arg(m_lastError));
        }

        // Presence is best effort and runs whatever the first write returned
        presenceReply = m_networkManager->sendCustomRequest(
            presenceRequest, "PATCH",
            QJsonDocument(QJsonObject{{"fields", presenceFields}}).toJson(QJsonDocument::Compact));
        connect(presenceReply, &QNetworkReply::finished, &loop, [&]() {
            if (presenceReply->error() != QNetworkReply::NoError) {
                LOG_WARNING(QString("Presence update failed: %1").arg(presenceReply->errorString()));
            }
            loop.quit();
        });
    });

    deadline.start(m_overallTimeoutMs);
    loop.exec();

    if (!deadline.isActive()) {
        m_lastError = QString("Emergency checkout timed out after %1 ms").arg(m_overallTimeoutMs);
        LOG_ERROR(m_lastError);
    }
    deadline.stop();

    for (QNetworkReply* reply : {sessionReply.data(), presenceReply.data()}) {
        if (reply) {
            disconnect(reply, nullptr, &loop, nullptr);
            if (reply->isRunning()) {
                reply->abort();
            }
            reply->deleteLater();
        }
    }

    updateMirror(SessionMirror());
    emit emergencyCheckoutFinished(sessionWritten);
    return sessionWritten;
}
