#ifndef CAPTUREORCHESTRATOR_H
#define CAPTUREORCHESTRATOR_H

#include <QDateTime>
#include <QObject>
#include <QRandomGenerator>
#include <QString>
#include <QTimer>

#include "CaptureTypes.h"
#include "sessioncore/clock.h"

class CameraCapturer;
class CaptureAttempt;
class HostBridge;
class SessionStore;

/**
 * @brief Runs evidence captures for the open session
 *
 * Owns the capture lock, the countdown warning, the auto-capture schedule and
 * the remote command poller. At most one capture pipeline runs at a time;
 * callers that find the lock held are told the attempt was skipped.
 *
 * The countdown and capture progress are published through signals; nothing
 * listening to them takes part in control flow.
 */
class CaptureOrchestrator : public QObject
{
    Q_OBJECT
public:
    CaptureOrchestrator(HostBridge* host, CameraCapturer* camera, SessionStore* store,
                        Clock* clock = nullptr, QObject* parent = nullptr);
    ~CaptureOrchestrator() override;

    void setTimings(const CaptureTimings& timings);
    CaptureTimings timings() const { return m_timings; }

    // Not owned; defaults to QRandomGenerator::global()
    void setRandomGenerator(QRandomGenerator* random);

    void setIdentity(const QString& userId, const QString& displayName);
    QString userId() const { return m_userId; }

    // Arms the first auto capture and the remote poller
    bool start();

    // Cancels every timer, drops any in-flight attempt and releases the lock. Idempotent.
    void stop();

    bool isRunning() const { return m_running; }
    bool captureInProgress() const { return m_captureInProgress; }
    bool countdownVisible() const { return m_countdownVisible; }
    int countdownRemaining() const { return m_countdownRemaining; }
    int captureCount() const { return m_captureCount; }

    // Invalid when no auto capture is armed
    QDateTime nextAutoCaptureAt() const { return m_nextAutoCaptureAt; }

    /**
     * @brief Begins a capture of the given type
     *
     * Returns at once: skipped if the lock is held, refused if there is no
     * session to attribute it to, otherwise started. The outcome of a started
     * attempt arrives through captureFinished().
     */
    CaptureResult performCapture(CaptureType type);

public slots:
    void pollRemoteCommands();

signals:
    void countdownStarted(CaptureType type, int seconds);
    void countdownTick(int remaining);
    // Emitted at 3, 2 and 1 seconds remaining
    void countdownPulse(int remaining);
    void countdownFinished();

    void captureStarted(CaptureType type);
    void captureFinished(const CaptureResult& result);
    void autoCaptureScheduled(const QDateTime& at);

private slots:
    void onAutoTimer();
    void onPollTimer();
    void onCountdownTick();
    void onAttemptFinished(const CaptureResult& result);

private:
    void scheduleAutoCapture(qint64 delayMs);
    qint64 randomBetween(qint64 minMs, qint64 maxMs);
    void launchAttempt();
    void closeCountdown();
    void completePendingCommand();

    HostBridge* m_host;
    CameraCapturer* m_camera;
    SessionStore* m_store;
    Clock* m_clock;
    QRandomGenerator* m_random;
    CaptureTimings m_timings;

    QString m_userId;
    QString m_userDisplayName;

    QTimer m_autoTimer;
    QTimer m_pollTimer;
    QTimer m_countdownTimer;

    bool m_running;
    bool m_captureInProgress;
    bool m_countdownVisible;
    bool m_polling;
    int m_countdownRemaining;
    int m_captureCount;
    CaptureType m_pendingType;
    QString m_pendingCommandId;
    QDateTime m_nextAutoCaptureAt;
    CaptureAttempt* m_attempt;
};

#endif // CAPTUREORCHESTRATOR_H
