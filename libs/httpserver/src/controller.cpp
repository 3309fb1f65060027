#include "httpserver/controller.h"
#include "logger/logger.h"
#include <QJsonDocument>

namespace Http {

    namespace {
        QString methodName(QHttpServerRequest::Method method) {
            switch (method) {
                case QHttpServerRequest::Method::Get:     return "GET";
                case QHttpServerRequest::Method::Post:    return "POST";
                case QHttpServerRequest::Method::Put:     return "PUT";
                case QHttpServerRequest::Method::Delete:  return "DELETE";
                case QHttpServerRequest::Method::Options: return "OPTIONS";
                default:                                  return "OTHER";
            }
        }
    }

    Controller::Controller(QObject* parent)
        : QObject(parent)
    {
    }

    Controller::~Controller() = default;

    void Controller::addRoute(QHttpServer& server, const QString& path,
                              QHttpServerRequest::Method method, Handler handler) {
        server.route(path, method,
            [this, handler](const QHttpServerRequest& request) {
                logRequestReceived(request);
                QHttpServerResponse response = handler(request);
                logRequestCompleted(request, response.statusCode());
                return response;
            });
    }

    QJsonObject Controller::extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const {
        ok = false;
        QByteArray body = request.body();

        if (body.trimmed().isEmpty()) {
            ok = true;
            return QJsonObject();
        }

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

        if (parseError.error != QJsonParseError::NoError) {
            LOG_WARNING(QString("JSON parse error: %1").arg(parseError.errorString()));
            return QJsonObject();
        }

        if (!doc.isObject()) {
            LOG_WARNING("Request body is not a JSON object");
            return QJsonObject();
        }

        ok = true;
        return doc.object();
    }

    bool Controller::validateRequiredFields(const QJsonObject& data, const QStringList& fields, QStringList& missingFields) const {
        missingFields.clear();

        for (const auto& field : fields) {
            if (!data.contains(field) || data[field].isNull() ||
                (data[field].isString() && data[field].toString().isEmpty())) {
                missingFields.append(field);
            }
        }

        return missingFields.isEmpty();
    }

    void Controller::logRequestReceived(const QHttpServerRequest& request) const {
        // Never log bodies here: /checkin and /refresh carry credentials
        LOG_DEBUG(QString("[%1] Request received: %2 %3")
                 .arg(getControllerName(), methodName(request.method()), request.url().path()));
    }

    void Controller::logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const {
        LOG_DEBUG(QString("[%1] Request completed: %2 %3 - Status: %4")
                 .arg(getControllerName(), methodName(request.method()), request.url().path(),
                      QString::number(static_cast<int>(status))));
    }

} // namespace Http
