#ifndef HTTP_RESPONSE_H
#define HTTP_RESPONSE_H

#include <QHttpServerResponse>
#include <QString>
#include <QJsonObject>

namespace Http {

    /**
     * @brief Builders for the `{ok: bool, error?: string, ...}` envelope used by the local control API
     */
    class Response {
    public:
        // {ok: true} merged with the given fields
        static QHttpServerResponse ok(const QJsonObject& fields = QJsonObject());

        // {ok: false, error: message}; the status stays 200 for operation failures so
        // clients can always read the envelope
        static QHttpServerResponse failure(const QString& message,
                                           QHttpServerResponder::StatusCode statusCode = QHttpServerResponder::StatusCode::Ok);

        static QHttpServerResponse badRequest(const QString& message);
        static QHttpServerResponse notFound(const QString& message = "Not found");
        static QHttpServerResponse noContent();
    };

} // namespace Http

#endif // HTTP_RESPONSE_H
