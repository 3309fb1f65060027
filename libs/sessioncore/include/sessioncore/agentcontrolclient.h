#ifndef SESSIONCORE_AGENTCONTROLCLIENT_H
#define SESSIONCORE_AGENTCONTROLCLIENT_H

#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

/**
 * @brief Client for the desktop agent's loopback control API
 *
 * Every call blocks on a local event loop until the agent answers or the
 * timeout expires; false means the agent is unreachable or refused the call,
 * with the reason in lastError().
 */
class AgentControlClient : public QObject
{
    Q_OBJECT

public:
    explicit AgentControlClient(QObject* parent = nullptr);
    ~AgentControlClient() override;

    void setBaseUrl(const QUrl& baseUrl);
    QUrl baseUrl() const;

    void setProbeTimeout(int msecs);
    void setCallTimeout(int msecs);

    // GET /status with the short probe timeout
    bool probe(QJsonObject& status);

    bool checkIn(const QString& credential, const QString& userId, const QString& name, bool* resumed = nullptr);
    bool checkOut(const QString& report, const QString& proofLink = QString());
    bool startBreak();
    bool resume();
    bool refresh(const QString& credential);
    bool capture();

    // True when the last failure was a transport failure rather than a refusal
    bool lastCallUnreachable() const;
    QString lastError() const;

private:
    bool call(const QString& method, const QString& path, const QJsonObject& body,
              int timeoutMs, QJsonObject& response);

    QNetworkAccessManager* m_networkManager;
    QUrl m_baseUrl;
    int m_probeTimeoutMs;
    int m_callTimeoutMs;
    bool m_unreachable;
    QString m_lastError;
};

#endif // SESSIONCORE_AGENTCONTROLCLIENT_H
