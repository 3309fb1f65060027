#ifndef SESSIONCORE_CONFIGMANAGER_H
#define SESSIONCORE_CONFIGMANAGER_H

#include <QMutex>
#include <QObject>
#include <QSettings>
#include <QString>

/**
 * @brief INI-backed settings shared by the agent and the companion
 *
 * The file lives in the application config directory, or in $DESKPULSE_CONFIG_DIR
 * when set. Missing files are created with defaults on load.
 */
class ConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager() override;

    bool initialize(const QString& fileName = "deskpulse.conf");

    // Remote services
    QString storeUrl() const;
    QString projectId() const;
    QString storageUrl() const;
    QString storageBucket() const;
    QString storageApiKey() const;
    QString webAppUrl() const;

    // Local integration
    int controlPort() const;
    QString launchScheme() const;

    // Capture scheduling
    int countdownSeconds() const;
    int firstCaptureMinMinutes() const;
    int firstCaptureMaxMinutes() const;
    int captureCooldownSeconds() const;
    int captureJitterMinMinutes() const;
    int captureJitterMaxMinutes() const;
    int remotePollSeconds() const;
    int remotePollInitialDelaySeconds() const;

    // Liveness
    int heartbeatIntervalSeconds() const;
    int staleThresholdSeconds() const;
    int stalePollSeconds() const;
    int storeWatchIntervalSeconds() const;
    int emergencyTimeoutMs() const;

    QString logLevel() const;
    QString logFilePath() const;

    void setStoreUrl(const QString& url);
    void setProjectId(const QString& projectId);
    void setStorageUrl(const QString& url);
    void setStorageBucket(const QString& bucket);
    void setStorageApiKey(const QString& key);
    void setWebAppUrl(const QString& url);
    void setControlPort(int port);
    void setLaunchScheme(const QString& scheme);
    void setCountdownSeconds(int seconds);
    void setFirstCaptureWindow(int minMinutes, int maxMinutes);
    void setCaptureCooldownSeconds(int seconds);
    void setCaptureJitter(int minMinutes, int maxMinutes);
    void setRemotePollSeconds(int seconds);
    void setHeartbeatIntervalSeconds(int seconds);
    void setStaleThresholdSeconds(int seconds);
    void setEmergencyTimeoutMs(int msecs);
    void setLogLevel(const QString& level);
    void setLogFilePath(const QString& path);

    bool loadLocalConfig();
    bool saveLocalConfig();

    QString configFilePath() const;

signals:
    void configChanged();

private:
    void loadDefaults();
    void validate();
    bool configFileExists() const;

    QSettings* m_settings;
    mutable QMutex m_mutex;
    QString m_fileName;
    bool m_initialized;

    QString m_storeUrl;
    QString m_projectId;
    QString m_storageUrl;
    QString m_storageBucket;
    QString m_storageApiKey;
    QString m_webAppUrl;
    int m_controlPort;
    QString m_launchScheme;
    int m_countdownSeconds;
    int m_firstCaptureMinMinutes;
    int m_firstCaptureMaxMinutes;
    int m_captureCooldownSeconds;
    int m_captureJitterMinMinutes;
    int m_captureJitterMaxMinutes;
    int m_remotePollSeconds;
    int m_remotePollInitialDelaySeconds;
    int m_heartbeatIntervalSeconds;
    int m_staleThresholdSeconds;
    int m_stalePollSeconds;
    int m_storeWatchIntervalSeconds;
    int m_emergencyTimeoutMs;
    QString m_logLevel;
    QString m_logFilePath;
};

#endif // SESSIONCORE_CONFIGMANAGER_H
