#include "sessioncore/configmanager.h"
#include "logger/logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

#include <utility>

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_initialized(false)
{
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
    delete m_settings;
}

bool ConfigManager::initialize(const QString& fileName)
{
    if (m_initialized) {
        LOG_WARNING("ConfigManager already initialized");
        return true;
    }

    LOG_INFO("Initializing ConfigManager");
    m_fileName = fileName;

    QString configPath = configFilePath();
    LOG_INFO("Config file path: " + configPath);

    QFileInfo fileInfo(configPath);
    QDir dir = fileInfo.dir();
    if (!dir.exists()) {
        LOG_INFO("Creating config directory: " + dir.path());
        if (!dir.mkpath(".")) {
            LOG_ERROR("Failed to create config directory");
            return false;
        }
    }

    m_settings = new QSettings(configPath, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Error initializing QSettings: " + QString::number(m_settings->status()));
        return false;
    }

    m_initialized = true;
    return true;
}

void ConfigManager::loadDefaults()
{
    m_storeUrl = "https://firestore.googleapis.com";
    m_projectId = "";
    m_storageUrl = "";
    m_storageBucket = "tracker-evidence";
    m_storageApiKey = "";
    m_webAppUrl = "";
    m_controlPort = 59210;
    m_launchScheme = "deskpulse";
    m_countdownSeconds = 60;
    m_firstCaptureMinMinutes = 3;
    m_firstCaptureMaxMinutes = 5;
    m_captureCooldownSeconds = 120;
    m_captureJitterMinMinutes = 10;
    m_captureJitterMaxMinutes = 30;
    m_remotePollSeconds = 15;
    m_remotePollInitialDelaySeconds = 5;
    m_heartbeatIntervalSeconds = 30;
    m_staleThresholdSeconds = 120;
    m_stalePollSeconds = 30;
    m_storeWatchIntervalSeconds = 5;
    m_emergencyTimeoutMs = 6000;
    m_logLevel = "info";
    m_logFilePath = "";
}

QString ConfigManager::configFilePath() const
{
    QString configDir = qEnvironmentVariable("DESKPULSE_CONFIG_DIR");
    if (configDir.isEmpty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    }
    return QDir(configDir).filePath(m_fileName.isEmpty() ? QString("deskpulse.conf") : m_fileName);
}

bool ConfigManager::configFileExists() const
{
    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    QFileInfo info(m_settings->fileName());
    return info.exists() && info.size() > 0;
}

void ConfigManager::validate()
{
    auto positive = [](int& value, int fallback, const char* key) {
        if (value <= 0) {
            LOG_WARNING(QString("Invalid %1 corrected from %2 to %3").arg(key).arg(value).arg(fallback));
            value = fallback;
        }
    };

    if (m_countdownSeconds < 0) {
        LOG_WARNING(QString("Invalid CountdownSeconds corrected from %1 to 60").arg(m_countdownSeconds));
        m_countdownSeconds = 60;
    }
    if (m_controlPort <= 0 || m_controlPort > 65535) {
        LOG_WARNING(QString("Invalid ControlPort corrected from %1 to 59210").arg(m_controlPort));
        m_controlPort = 59210;
    }

    positive(m_firstCaptureMinMinutes, 3, "FirstCaptureMinMinutes");
    positive(m_firstCaptureMaxMinutes, 5, "FirstCaptureMaxMinutes");
    positive(m_captureCooldownSeconds, 120, "CaptureCooldownSeconds");
    positive(m_captureJitterMinMinutes, 10, "CaptureJitterMinMinutes");
    positive(m_captureJitterMaxMinutes, 30, "CaptureJitterMaxMinutes");
    positive(m_remotePollSeconds, 15, "RemotePollSeconds");
    positive(m_remotePollInitialDelaySeconds, 5, "RemotePollInitialDelaySeconds");
    positive(m_heartbeatIntervalSeconds, 30, "HeartbeatIntervalSeconds");
    positive(m_staleThresholdSeconds, 120, "StaleThresholdSeconds");
    positive(m_stalePollSeconds, 30, "StalePollSeconds");
    positive(m_storeWatchIntervalSeconds, 5, "StoreWatchIntervalSeconds");
    positive(m_emergencyTimeoutMs, 6000, "EmergencyTimeoutMs");

    if (m_firstCaptureMinMinutes > m_firstCaptureMaxMinutes) {
        std::swap(m_firstCaptureMinMinutes, m_firstCaptureMaxMinutes);
    }
    if (m_captureJitterMinMinutes > m_captureJitterMaxMinutes) {
        std::swap(m_captureJitterMinMinutes, m_captureJitterMaxMinutes);
    }
    if (m_launchScheme.isEmpty()) {
        m_launchScheme = "deskpulse";
    }
}

bool ConfigManager::loadLocalConfig()
{
    LOG_INFO("Loading local configuration");

    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    if (configFileExists()) {
        LOG_INFO("Configuration file found: " + m_settings->fileName());
        LOG_DEBUG("Config contains " + QString::number(m_settings->allKeys().size()) + " keys");
    } else {
        LOG_INFO("Configuration file not found, will use defaults");
        return saveLocalConfig();
    }

    {
        QMutexLocker locker(&m_mutex);

        m_storeUrl = m_settings->value("StoreUrl", m_storeUrl).toString();
        m_projectId = m_settings->value("ProjectId", m_projectId).toString();
        m_storageUrl = m_settings->value("StorageUrl", m_storageUrl).toString();
        m_storageBucket = m_settings->value("StorageBucket", m_storageBucket).toString();
        m_storageApiKey = m_settings->value("StorageApiKey", m_storageApiKey).toString();
        m_webAppUrl = m_settings->value("WebAppUrl", m_webAppUrl).toString();
        m_controlPort = m_settings->value("ControlPort", m_controlPort).toInt();
        m_launchScheme = m_settings->value("LaunchScheme", m_launchScheme).toString();
        m_countdownSeconds = m_settings->value("CountdownSeconds", m_countdownSeconds).toInt();
        m_firstCaptureMinMinutes = m_settings->value("FirstCaptureMinMinutes", m_firstCaptureMinMinutes).toInt();
        m_firstCaptureMaxMinutes = m_settings->value("FirstCaptureMaxMinutes", m_firstCaptureMaxMinutes).toInt();
        m_captureCooldownSeconds = m_settings->value("CaptureCooldownSeconds", m_captureCooldownSeconds).toInt();
        m_captureJitterMinMinutes = m_settings->value("CaptureJitterMinMinutes", m_captureJitterMinMinutes).toInt();
        m_captureJitterMaxMinutes = m_settings->value("CaptureJitterMaxMinutes", m_captureJitterMaxMinutes).toInt();
        m_remotePollSeconds = m_settings->value("RemotePollSeconds", m_remotePollSeconds).toInt();
        m_remotePollInitialDelaySeconds = m_settings->value("RemotePollInitialDelaySeconds", m_remotePollInitialDelaySeconds).toInt();
        m_heartbeatIntervalSeconds = m_settings->value("HeartbeatIntervalSeconds", m_heartbeatIntervalSeconds).toInt();
        m_staleThresholdSeconds = m_settings->value("StaleThresholdSeconds", m_staleThresholdSeconds).toInt();
        m_stalePollSeconds = m_settings->value("StalePollSeconds", m_stalePollSeconds).toInt();
        m_storeWatchIntervalSeconds = m_settings->value("StoreWatchIntervalSeconds", m_storeWatchIntervalSeconds).toInt();
        m_emergencyTimeoutMs = m_settings->value("EmergencyTimeoutMs", m_emergencyTimeoutMs).toInt();
        m_logLevel = m_settings->value("LogLevel", m_logLevel).toString();
        m_logFilePath = m_settings->value("LogFilePath", m_logFilePath).toString();

        validate();
    }

    Logger::instance()->setLogLevel(Logger::levelFromString(m_logLevel, Logger::Info));
    if (!m_logFilePath.isEmpty()) {
        Logger::instance()->setLogFile(m_logFilePath);
    }

    LOG_INFO("Local configuration loaded successfully");
    return true;
}

bool ConfigManager::saveLocalConfig()
{
    if (!m_initialized || !m_settings) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    LOG_INFO("Saving configuration to: " + m_settings->fileName());

    {
        QMutexLocker locker(&m_mutex);

        m_settings->setValue("StoreUrl", m_storeUrl);
        m_settings->setValue("ProjectId", m_projectId);
        m_settings->setValue("StorageUrl", m_storageUrl);
        m_settings->setValue("StorageBucket", m_storageBucket);
        m_settings->setValue("StorageApiKey", m_storageApiKey);
        m_settings->setValue("WebAppUrl", m_webAppUrl);
        m_settings->setValue("ControlPort", m_controlPort);
        m_settings->setValue("LaunchScheme", m_launchScheme);
        m_settings->setValue("CountdownSeconds", m_countdownSeconds);
        m_settings->setValue("FirstCaptureMinMinutes", m_firstCaptureMinMinutes);
        m_settings->setValue("FirstCaptureMaxMinutes", m_firstCaptureMaxMinutes);
        m_settings->setValue("CaptureCooldownSeconds", m_captureCooldownSeconds);
        m_settings->setValue("CaptureJitterMinMinutes", m_captureJitterMinMinutes);
        m_settings->setValue("CaptureJitterMaxMinutes", m_captureJitterMaxMinutes);
        m_settings->setValue("RemotePollSeconds", m_remotePollSeconds);
        m_settings->setValue("RemotePollInitialDelaySeconds", m_remotePollInitialDelaySeconds);
        m_settings->setValue("HeartbeatIntervalSeconds", m_heartbeatIntervalSeconds);
        m_settings->setValue("StaleThresholdSeconds", m_staleThresholdSeconds);
        m_settings->setValue("StalePollSeconds", m_stalePollSeconds);
        m_settings->setValue("StoreWatchIntervalSeconds", m_storeWatchIntervalSeconds);
        m_settings->setValue("EmergencyTimeoutMs", m_emergencyTimeoutMs);
        m_settings->setValue("LogLevel", m_logLevel);
        m_settings->setValue("LogFilePath", m_logFilePath);

        m_settings->sync();
    }

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration, error code: " + QString::number(status));
        return false;
    }

    LOG_INFO("Configuration saved successfully");
    return true;
}

QString ConfigManager::storeUrl() const
{
    QMutexLocker locker(&m_mutex);
    return m_storeUrl;
}

QString ConfigManager::projectId() const
{
    QMutexLocker locker(&m_mutex);
    return m_projectId;
}

QString ConfigManager::storageUrl() const
{
    QMutexLocker locker(&m_mutex);
    return m_storageUrl;
}

QString ConfigManager::storageBucket() const
{
    QMutexLocker locker(&m_mutex);
    return m_storageBucket;
}

QString ConfigManager::storageApiKey() const
{
    QMutexLocker locker(&m_mutex);
    return m_storageApiKey;
}

QString ConfigManager::webAppUrl() const
{
    QMutexLocker locker(&m_mutex);
    return m_webAppUrl;
}

int ConfigManager::controlPort() const
{
    QMutexLocker locker(&m_mutex);
    return m_controlPort;
}

QString ConfigManager::launchScheme() const
{
    QMutexLocker locker(&m_mutex);
    return m_launchScheme;
}

int ConfigManager::countdownSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_countdownSeconds;
}

int ConfigManager::firstCaptureMinMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_firstCaptureMinMinutes;
}

int ConfigManager::firstCaptureMaxMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_firstCaptureMaxMinutes;
}

int ConfigManager::captureCooldownSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_captureCooldownSeconds;
}

int ConfigManager::captureJitterMinMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_captureJitterMinMinutes;
}

int ConfigManager::captureJitterMaxMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_captureJitterMaxMinutes;
}

int ConfigManager::remotePollSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_remotePollSeconds;
}

int ConfigManager::remotePollInitialDelaySeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_remotePollInitialDelaySeconds;
}

int ConfigManager::heartbeatIntervalSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_heartbeatIntervalSeconds;
}

int ConfigManager::staleThresholdSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_staleThresholdSeconds;
}

int ConfigManager::stalePollSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_stalePollSeconds;
}

int ConfigManager::storeWatchIntervalSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_storeWatchIntervalSeconds;
}

int ConfigManager::emergencyTimeoutMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_emergencyTimeoutMs;
}

QString ConfigManager::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString ConfigManager::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

void ConfigManager::setStoreUrl(const QString& url)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_storeUrl == url) {
            return;
        }
        m_storeUrl = url;
    }
    emit configChanged();
}

void ConfigManager::setProjectId(const QString& projectId)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_projectId == projectId) {
            return;
        }
        m_projectId = projectId;
    }
    emit configChanged();
}

void ConfigManager::setStorageUrl(const QString& url)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_storageUrl == url) {
            return;
        }
        m_storageUrl = url;
    }
    emit configChanged();
}

void ConfigManager::setStorageBucket(const QString& bucket)
{
    {
        QMutexLocker locker(&m_mutex);
        if (bucket.isEmpty() || m_storageBucket == bucket) {
            return;
        }
        m_storageBucket = bucket;
    }
    emit configChanged();
}

void ConfigManager::setStorageApiKey(const QString& key)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_storageApiKey == key) {
            return;
        }
        m_storageApiKey = key;
    }
    emit configChanged();
}

void ConfigManager::setWebAppUrl(const QString& url)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_webAppUrl == url) {
            return;
        }
        m_webAppUrl = url;
    }
    emit configChanged();
}

void ConfigManager::setControlPort(int port)
{
    {
        QMutexLocker locker(&m_mutex);
        if (port <= 0 || port > 65535 || m_controlPort == port) {
            return;
        }
        m_controlPort = port;
    }
    emit configChanged();
}

void ConfigManager::setLaunchScheme(const QString& scheme)
{
    {
        QMutexLocker locker(&m_mutex);
        if (scheme.isEmpty() || m_launchScheme == scheme) {
            return;
        }
        m_launchScheme = scheme;
    }
    emit configChanged();
}

void ConfigManager::setCountdownSeconds(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds < 0 || m_countdownSeconds == seconds) {
            return;
        }
        m_countdownSeconds = seconds;
    }
    emit configChanged();
}

void ConfigManager::setFirstCaptureWindow(int minMinutes, int maxMinutes)
{
    {
        QMutexLocker locker(&m_mutex);
        if (minMinutes <= 0 || maxMinutes < minMinutes) {
            return;
        }
        if (m_firstCaptureMinMinutes == minMinutes && m_firstCaptureMaxMinutes == maxMinutes) {
            return;
        }
        m_firstCaptureMinMinutes = minMinutes;
        m_firstCaptureMaxMinutes = maxMinutes;
    }
    emit configChanged();
}

void ConfigManager::setCaptureCooldownSeconds(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds <= 0 || m_captureCooldownSeconds == seconds) {
            return;
        }
        m_captureCooldownSeconds = seconds;
    }
    emit configChanged();
}

void ConfigManager::setCaptureJitter(int minMinutes, int maxMinutes)
{
    {
        QMutexLocker locker(&m_mutex);
        if (minMinutes <= 0 || maxMinutes < minMinutes) {
            return;
        }
        if (m_captureJitterMinMinutes == minMinutes && m_captureJitterMaxMinutes == maxMinutes) {
            return;
        }
        m_captureJitterMinMinutes = minMinutes;
        m_captureJitterMaxMinutes = maxMinutes;
    }
    emit configChanged();
}

void ConfigManager::setRemotePollSeconds(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds <= 0 || m_remotePollSeconds == seconds) {
            return;
        }
        m_remotePollSeconds = seconds;
    }
    emit configChanged();
}

void ConfigManager::setHeartbeatIntervalSeconds(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds <= 0 || m_heartbeatIntervalSeconds == seconds) {
            return;
        }
        m_heartbeatIntervalSeconds = seconds;
    }
    emit configChanged();
}

void ConfigManager::setStaleThresholdSeconds(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds <= 0 || m_staleThresholdSeconds == seconds) {
            return;
        }
        m_staleThresholdSeconds = seconds;
    }
    emit configChanged();
}

void ConfigManager::setEmergencyTimeoutMs(int msecs)
{
    {
        QMutexLocker locker(&m_mutex);
        if (msecs <= 0 || m_emergencyTimeoutMs == msecs) {
            return;
        }
        m_emergencyTimeoutMs = msecs;
    }
    emit configChanged();
}

void ConfigManager::setLogLevel(const QString& level)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logLevel == level) {
            return;
        }
        m_logLevel = level;
    }
    emit configChanged();
}

void ConfigManager::setLogFilePath(const QString& path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logFilePath == path) {
            return;
        }
        m_logFilePath = path;
    }
    emit configChanged();
}
