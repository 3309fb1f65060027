#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QSettings>
#include <QTemporaryDir>

#include "sessioncore/configmanager.h"

class ConfigManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        // Create temporary directory for config files
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        // Set environment variable to redirect config file location
        qputenv("DESKPULSE_CONFIG_DIR", m_tempDir->path().toUtf8());
    }

    void cleanupTestCase() {
        m_tempDir.reset();
    }

    void init() {
        m_configManager = new ConfigManager();
        QVERIFY(m_configManager->initialize());
    }

    void cleanup() {
        delete m_configManager;
    }

    void testDefaultValues() {
        QCOMPARE(m_configManager->controlPort(), 59210);
        QCOMPARE(m_configManager->launchScheme(), QString("deskpulse"));
        QCOMPARE(m_configManager->countdownSeconds(), 60);
        QCOMPARE(m_configManager->firstCaptureMinMinutes(), 3);
        QCOMPARE(m_configManager->firstCaptureMaxMinutes(), 5);
        QCOMPARE(m_configManager->captureCooldownSeconds(), 120);
        QCOMPARE(m_configManager->captureJitterMinMinutes(), 10);
        QCOMPARE(m_configManager->captureJitterMaxMinutes(), 30);
        QCOMPARE(m_configManager->remotePollSeconds(), 15);
        QCOMPARE(m_configManager->heartbeatIntervalSeconds(), 30);
        QCOMPARE(m_configManager->staleThresholdSeconds(), 120);
        QCOMPARE(m_configManager->emergencyTimeoutMs(), 6000);
        QCOMPARE(m_configManager->projectId(), QString(""));
        QCOMPARE(m_configManager->logLevel(), QString("info"));
        QVERIFY(m_configManager->configFilePath().startsWith(m_tempDir->path()));
    }

    void testSaveAndLoad() {
        m_configManager->setStoreUrl("https://store.example.com");
        m_configManager->setProjectId("deskpulse-test");
        m_configManager->setControlPort(60001);
        m_configManager->setCountdownSeconds(10);
        m_configManager->setCaptureJitter(1, 2);

        QVERIFY(m_configManager->saveLocalConfig());

        // Create new config manager and load saved file
        ConfigManager newConfig;
        QVERIFY(newConfig.initialize());
        QVERIFY(newConfig.loadLocalConfig());

        QCOMPARE(newConfig.storeUrl(), QString("https://store.example.com"));
        QCOMPARE(newConfig.projectId(), QString("deskpulse-test"));
        QCOMPARE(newConfig.controlPort(), 60001);
        QCOMPARE(newConfig.countdownSeconds(), 10);
        QCOMPARE(newConfig.captureJitterMinMinutes(), 1);
        QCOMPARE(newConfig.captureJitterMaxMinutes(), 2);
    }

    void testSignalsEmitted() {
        QSignalSpy configChangedSpy(m_configManager, &ConfigManager::configChanged);

        m_configManager->setStoreUrl("https://other.example.com");
        QCOMPARE(configChangedSpy.count(), 1);

        // Same value again is not a change
        m_configManager->setStoreUrl("https://other.example.com");
        QCOMPARE(configChangedSpy.count(), 1);

        m_configManager->setHeartbeatIntervalSeconds(45);
        QCOMPARE(configChangedSpy.count(), 2);
    }

    void testSettersRejectInvalidValues() {
        m_configManager->setControlPort(70000);
        QCOMPARE(m_configManager->controlPort(), 59210);

        m_configManager->setCountdownSeconds(-5);
        QCOMPARE(m_configManager->countdownSeconds(), 60);

        // Zero disables the countdown
        m_configManager->setCountdownSeconds(0);
        QCOMPARE(m_configManager->countdownSeconds(), 0);

        m_configManager->setFirstCaptureWindow(6, 4);
        QCOMPARE(m_configManager->firstCaptureMinMinutes(), 3);

        m_configManager->setLaunchScheme("");
        QCOMPARE(m_configManager->launchScheme(), QString("deskpulse"));
    }

    void testLoadCorrectsInvalidFile() {
        {
            QSettings raw(m_configManager->configFilePath(), QSettings::IniFormat);
            raw.setValue("ControlPort", -1);
            raw.setValue("CaptureCooldownSeconds", 0);
            raw.setValue("CaptureJitterMinMinutes", 40);
            raw.setValue("CaptureJitterMaxMinutes", 20);
            raw.setValue("LaunchScheme", "");
            raw.sync();
        }

        QVERIFY(m_configManager->loadLocalConfig());
        QCOMPARE(m_configManager->controlPort(), 59210);
        QCOMPARE(m_configManager->captureCooldownSeconds(), 120);
        QCOMPARE(m_configManager->captureJitterMinMinutes(), 20);
        QCOMPARE(m_configManager->captureJitterMaxMinutes(), 40);
        QCOMPARE(m_configManager->launchScheme(), QString("deskpulse"));
    }

    void testLoadWithoutFileWritesDefaults() {
        ConfigManager fresh;
        QVERIFY(fresh.initialize("fresh.conf"));
        QVERIFY(!QFile::exists(fresh.configFilePath()));
        QVERIFY(fresh.loadLocalConfig());
        QVERIFY(QFile::exists(fresh.configFilePath()));
        QCOMPARE(fresh.controlPort(), 59210);
    }

private:
    ConfigManager* m_configManager;
    QScopedPointer<QTemporaryDir> m_tempDir;
};

QTEST_MAIN(ConfigManagerTest)
#include "ConfigManagerTest.moc"
