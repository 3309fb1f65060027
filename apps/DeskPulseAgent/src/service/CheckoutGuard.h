#ifndef CHECKOUTGUARD_H
#define CHECKOUTGUARD_H

#include <QDateTime>
#include <QJsonObject>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QStringList>

#include "sessioncore/clock.h"
#include "sessioncore/records.h"

/**
 * @brief Closes the mirrored session when the agent exits without a checkout
 *
 * Holds the last SessionMirror pushed by the session controller. On shutdown
 * emergencyCheckout() writes the terminal flagged state straight to the store
 * with its own network manager, then marks the user offline. The whole exchange
 * is bounded by the overall timeout; the mirror is cleared afterwards so the
 * write cannot fire twice.
 */
class CheckoutGuard : public QObject
{
    Q_OBJECT
public:
    explicit CheckoutGuard(Clock* clock = nullptr, QObject* parent = nullptr);
    ~CheckoutGuard() override;

    bool initialize(const QString& storeUrl, const QString& projectId);
    void setTimeouts(int overallMs, int sessionWriteMs = 5000, int presenceWriteMs = 3000);
    int overallTimeout() const { return m_overallTimeoutMs; }

    SessionMirror mirror() const;
    bool hasMirror() const;

    // Blocks for at most overallTimeout(); false when nothing was written
    bool emergencyCheckout();

    static QJsonObject emergencyPayload(const SessionMirror& mirror, const QDateTime& now);
    static QStringList emergencyFieldMask();

    QString lastError() const;

public slots:
    // An invalid mirror clears the guard
    void updateMirror(const SessionMirror& mirror);

signals:
    void emergencyCheckoutFinished(bool sessionWritten);

private:
    QString documentUrl(const QString& collection, const QString& id, const QStringList& fieldMask) const;

    QNetworkAccessManager* m_networkManager;
    Clock* m_clock;
    QString m_documentsUrl;

    mutable QMutex m_mutex;
    SessionMirror m_mirror;

    int m_overallTimeoutMs;
    int m_sessionWriteMs;
    int m_presenceWriteMs;
    QString m_lastError;
};

#endif // CHECKOUTGUARD_H
