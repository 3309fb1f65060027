#include "httpserver/response.h"
#include "logger/logger.h"

namespace Http {

    QHttpServerResponse Response::ok(const QJsonObject& fields) {
        QJsonObject body = fields;
        body["ok"] = true;
        return QHttpServerResponse(body, QHttpServerResponder::StatusCode::Ok);
    }

    QHttpServerResponse Response::failure(const QString& message, QHttpServerResponder::StatusCode statusCode) {
        QJsonObject body{
            {"ok", false},
            {"error", message}
        };
        return QHttpServerResponse(body, statusCode);
    }

    QHttpServerResponse Response::badRequest(const QString& message) {
        LOG_WARNING(QString("Bad Request: %1").arg(message));
        return failure(message, QHttpServerResponder::StatusCode::BadRequest);
    }

    QHttpServerResponse Response::notFound(const QString& message) {
        LOG_WARNING(QString("Not Found: %1").arg(message));
        return failure(message, QHttpServerResponder::StatusCode::NotFound);
    }

    QHttpServerResponse Response::noContent() {
        return QHttpServerResponse(QHttpServerResponder::StatusCode::NoContent);
    }

} // namespace Http
