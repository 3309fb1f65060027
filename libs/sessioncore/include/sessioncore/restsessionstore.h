#ifndef SESSIONCORE_RESTSESSIONSTORE_H
#define SESSIONCORE_RESTSESSIONSTORE_H

#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>

#include "sessioncore/sessionstore.h"

/**
 * @brief SessionStore over the document database REST endpoint
 *
 * Documents live under {storeUrl}/v1/projects/{projectId}/databases/(default)/documents.
 * Requests block on a local event loop bounded by requestTimeout(); the watch is a
 * poll of the user's open sessions that emits when a document's updateTime advances.
 */
class RestSessionStore : public SessionStore
{
    Q_OBJECT

public:
    explicit RestSessionStore(QObject* parent = nullptr);
    ~RestSessionStore() override;

    bool initialize(const QString& storeUrl, const QString& projectId);
    QString documentsUrl() const;

    void setRequestTimeout(int msecs);
    int requestTimeout() const;
    void setWatchInterval(int msecs);

    void setCredential(const QString& credential) override;
    bool createSession(WorkSession& session) override;
    bool fetchSession(const QString& sessionId, WorkSession& session, bool& exists) override;
    bool findOpenSession(const QString& userId, WorkSession& session, bool& found) override;
    bool updateSession(const WorkSession& session, const QStringList& fieldMask) override;
    bool setPresence(const QString& userId, bool online, const QDateTime& at) override;
    bool pendingCaptureCommands(const QString& userId, int limit, QList<CaptureCommand>& commands) override;
    bool completeCaptureCommand(const QString& commandId, const QDateTime& at) override;
    bool saveEvidence(const EvidenceRecord& record) override;
    void watchUserSessions(const QString& userId) override;
    void unwatch() override;

private slots:
    void pollWatchedSessions();

private:
    bool sendRequest(const QString& method, const QString& path, const QJsonObject& body,
                     QJsonDocument& response, int* httpStatus = nullptr);
    bool processReply(QNetworkReply* reply, QJsonDocument& response);
    bool runQuery(const QJsonObject& structuredQuery, QList<QJsonObject>& documents);
    bool queryOpenSessions(const QString& userId, int limit, QList<WorkSession>& sessions);
    static QString maskQuery(const QStringList& fieldMask);
    QString credential() const;

    QNetworkAccessManager* m_networkManager;
    QString m_documentsUrl;
    QString m_credential;
    bool m_initialized;
    int m_requestTimeoutMs;
    mutable QMutex m_credentialMutex;

    QTimer m_watchTimer;
    QString m_watchedUserId;
    QHash<QString, QDateTime> m_seenUpdateTimes;
    bool m_polling;
};

#endif // SESSIONCORE_RESTSESSIONSTORE_H
