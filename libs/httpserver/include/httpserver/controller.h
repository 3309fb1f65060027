#ifndef HTTP_CONTROLLER_H
#define HTTP_CONTROLLER_H

#include <QObject>
#include <QJsonObject>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QStringList>
#include <functional>
#include "logger/logger.h"

namespace Http {

    class Controller : public QObject {
        Q_OBJECT
    public:
        explicit Controller(QObject* parent = nullptr);
        virtual ~Controller();

        virtual void setupRoutes(QHttpServer& server) = 0;

        virtual QString getControllerName() const = 0;

    protected:
        using Handler = std::function<QHttpServerResponse(const QHttpServerRequest&)>;

        // Registers a route wrapped with request/response logging
        void addRoute(QHttpServer& server, const QString& path,
                      QHttpServerRequest::Method method, Handler handler);

        // Request parsing helpers; an empty body is a valid empty object
        QJsonObject extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const;

        // Validation helpers
        bool validateRequiredFields(const QJsonObject& data, const QStringList& fields, QStringList& missingFields) const;

        // Logging helpers
        void logRequestReceived(const QHttpServerRequest& request) const;
        void logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const;
    };

} // namespace Http

#endif // HTTP_CONTROLLER_H
