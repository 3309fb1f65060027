#include "CaptureOrchestrator.h"
#include "CaptureAttempt.h"
#include "HostBridge.h"
#include "logger/logger.h"
#include "sessioncore/sessionstore.h"

#include <QList>

CaptureOrchestrator::CaptureOrchestrator(HostBridge* host, CameraCapturer* camera, SessionStore* store,
                                         Clock* clock, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_camera(camera)
    , m_store(store)
    , m_clock(clock ? clock : Clock::system())
    , m_random(QRandomGenerator::global())
    , m_running(false)
    , m_captureInProgress(false)
    , m_countdownVisible(false)
    , m_polling(false)
    , m_countdownRemaining(0)
    , m_captureCount(0)
    , m_pendingType(CaptureType::Auto)
    , m_attempt(nullptr)
{
    qRegisterMetaType<CaptureType>();
    qRegisterMetaType<CaptureResult>();

    m_autoTimer.setSingleShot(true);
    connect(&m_autoTimer, &QTimer::timeout, this, &CaptureOrchestrator::onAutoTimer);
    connect(&m_pollTimer, &QTimer::timeout, this, &CaptureOrchestrator::onPollTimer);
    connect(&m_countdownTimer, &QTimer::timeout, this, &CaptureOrchestrator::onCountdownTick);
}

CaptureOrchestrator::~CaptureOrchestrator()
{
    stop();
}

void CaptureOrchestrator::setTimings(const CaptureTimings& timings)
{
    m_timings = timings;
}

void CaptureOrchestrator::setRandomGenerator(QRandomGenerator* random)
{
    m_random = random ? random : QRandomGenerator::global();
}

void CaptureOrchestrator::setIdentity(const QString& userId, const QString& displayName)
{
    m_userId = userId;
    m_userDisplayName = displayName;
}

bool CaptureOrchestrator::start()
{
    if (m_running) {
        LOG_DEBUG("Capture orchestrator already running");
        return true;
    }
    if (m_userId.isEmpty()) {
        LOG_WARNING("Cannot start captures without a user");
        return false;
    }

    m_running = true;
    LOG_INFO(QString("Capture orchestrator started for %1").arg(m_userId));

    scheduleAutoCapture(randomBetween(m_timings.firstDelayMinMs, m_timings.firstDelayMaxMs));

    // The first poll waits a little so it does not race the session start
    m_pollTimer.setInterval(m_timings.pollInitialDelayMs);
    m_pollTimer.start();
    return true;
}

void CaptureOrchestrator::stop()
{
    const bool wasRunning = m_running;
    m_running = false;

    m_autoTimer.stop();
    m_pollTimer.stop();
    m_countdownTimer.stop();
    m_nextAutoCaptureAt = QDateTime();

    if (m_attempt) {
        m_attempt->abort();
        disconnect(m_attempt, nullptr, this, nullptr);
        m_attempt->deleteLater();
        m_attempt = nullptr;
    }

    // An abandoned command stays pending and is picked up by the next session
    m_pendingCommandId.clear();
    m_captureInProgress = false;
    closeCountdown();

    if (wasRunning) {
        LOG_INFO("Capture orchestrator stopped");
    }
}

CaptureResult CaptureOrchestrator::performCapture(CaptureType type)
{
    CaptureResult result;
    result.type = type;

    if (m_captureInProgress) {
        LOG_WARNING(QString("Skipping %1 capture: another capture is in progress").arg(captureTypeToString(type)));
        result.skipped = true;
        return result;
    }
    if (!m_running || m_userId.isEmpty()) {
        LOG_WARNING(QString("Refusing %1 capture: no open session").arg(captureTypeToString(type)));
        result.refused = true;
        return result;
    }

    m_captureInProgress = true;
    m_pendingType = type;
    result.started = true;
    emit captureStarted(type);

    if (m_timings.countdownSeconds <= 0) {
        launchAttempt();
        return result;
    }

    m_countdownRemaining = m_timings.countdownSeconds;
    m_countdownVisible = true;
    emit countdownStarted(type, m_countdownRemaining);
    m_countdownTimer.start(m_timings.countdownTickMs);
    return result;
}

void CaptureOrchestrator::onCountdownTick()
{
    --m_countdownRemaining;
    emit countdownTick(m_countdownRemaining);

    if (m_countdownRemaining > 0 && m_countdownRemaining <= 3) {
        emit countdownPulse(m_countdownRemaining);
    }

    if (m_countdownRemaining <= 0) {
        m_countdownTimer.stop();
        closeCountdown();
        launchAttempt();
    }
}

void CaptureOrchestrator::closeCountdown()
{
    if (!m_countdownVisible) {
        return;
    }
    m_countdownVisible = false;
    m_countdownRemaining = 0;
    emit countdownFinished();
}

void CaptureOrchestrator::launchAttempt()
{
    m_attempt = new CaptureAttempt(m_pendingType, m_userId, m_userDisplayName,
                                   m_host, m_camera, m_store, m_clock, this);
    connect(m_attempt, &CaptureAttempt::finished, this, &CaptureOrchestrator::onAttemptFinished);
    m_attempt->run();
}

void CaptureOrchestrator::onAttemptFinished(const CaptureResult& result)
{
    CaptureAttempt* attempt = qobject_cast<CaptureAttempt*>(sender());
    if (attempt) {
        attempt->deleteLater();
    }
    if (attempt != m_attempt) {
        return;
    }
    m_attempt = nullptr;
    m_captureInProgress = false;
    ++m_captureCount;

    completePendingCommand();

    // Measured from the end of this attempt so captures never cluster
    if (m_running) {
        scheduleAutoCapture(m_timings.cooldownMs + randomBetween(m_timings.jitterMinMs, m_timings.jitterMaxMs));
    }

    emit captureFinished(result);
}

void CaptureOrchestrator::scheduleAutoCapture(qint64 delayMs)
{
    m_nextAutoCaptureAt = m_clock->now().addMSecs(delayMs);
    m_autoTimer.start(static_cast<int>(delayMs));
    LOG_INFO(QString("Next auto capture in ~%1 min").arg(qRound(delayMs / 60000.0)));
    emit autoCaptureScheduled(m_nextAutoCaptureAt);
}

qint64 CaptureOrchestrator::randomBetween(qint64 minMs, qint64 maxMs)
{
    if (maxMs <= minMs) {
        return minMs;
    }
    return minMs + static_cast<qint64>(m_random->generateDouble() * (maxMs - minMs));
}

void CaptureOrchestrator::onAutoTimer()
{
    if (!m_running) {
        return;
    }
    if (m_captureInProgress) {
        LOG_INFO("Auto capture deferred: another capture is in progress");
        scheduleAutoCapture(m_timings.cooldownMs);
        return;
    }
    m_nextAutoCaptureAt = QDateTime();
    performCapture(CaptureType::Auto);
}

void CaptureOrchestrator::onPollTimer()
{
    if (m_pollTimer.interval() != m_timings.pollIntervalMs) {
        m_pollTimer.setInterval(m_timings.pollIntervalMs);
    }
    pollRemoteCommands();
}

void CaptureOrchestrator::pollRemoteCommands()
{
    if (!m_running || m_polling || !m_store) {
        return;
    }
    if (m_captureInProgress) {
        LOG_DEBUG("Remote poll skipped: capture in progress");
        return;
    }

    m_polling = true;
    QList<CaptureCommand> commands;
    const bool ok = m_store->pendingCaptureCommands(m_userId, 1, commands);
    m_polling = false;

    if (!ok) {
        LOG_WARNING(QString("Remote command poll failed: %1").arg(m_store->lastError()));
        return;
    }
    if (commands.isEmpty() || !m_running) {
        return;
    }

    const CaptureCommand command = commands.first();
    LOG_INFO(QString("Remote capture command %1 received").arg(command.id));

    const CaptureResult result = performCapture(command.type);
    if (result.skipped) {
        // Left pending for the next cycle
        return;
    }
    if (result.refused) {
        if (!m_store->completeCaptureCommand(command.id, m_clock->now())) {
            LOG_WARNING(QString("Failed to complete command %1: %2").arg(command.id, m_store->lastError()));
        }
        return;
    }

    m_pendingCommandId = command.id;
    // The attempt may already be over if every step ran synchronously
    if (!m_captureInProgress) {
        completePendingCommand();
    }
}

void CaptureOrchestrator::completePendingCommand()
{
    if (m_pendingCommandId.isEmpty() || !m_store) {
        return;
    }
    const QString commandId = m_pendingCommandId;
    m_pendingCommandId.clear();
    if (!m_store->completeCaptureCommand(commandId, m_clock->now())) {
        LOG_WARNING(QString("Failed to complete command %1: %2").arg(commandId, m_store->lastError()));
    }
}
