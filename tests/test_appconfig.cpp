/**
 * @file test_appconfig.cpp
 * @brief Unit tests for AppConfig
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include "appconfig.h"

using namespace Backup;

class TestAppConfig : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDefaults();
    void testWebDavConfigPersists();
    void testNonPositiveTimeoutFallsBack();
    void testPathsPersist();
    void testExportDestination();

private:
    QString iniPath() const { return m_tempDir->filePath("kelivosync.ini"); }

    QTemporaryDir *m_tempDir;
};

void TestAppConfig::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void TestAppConfig::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

void TestAppConfig::testDefaults()
{
    AppConfig config(iniPath());

    QVERIFY(!config.hasWebDavConfig());
    QVERIFY(!config.webDavConfig().isValid());
    QCOMPARE(config.webDavConfig().path, WebDavConfig::defaultPath());
    QCOMPARE(config.transferTimeoutMs(), 60000);
    QCOMPARE(config.debugLogging(), false);
    QVERIFY(config.tempDirectory().isEmpty());
    QVERIFY(!config.dataRoot().isEmpty());
}

void TestAppConfig::testWebDavConfigPersists()
{
    WebDavConfig cfg;
    cfg.url = "https://dav.example.com/remote.php/dav";
    cfg.username = "alice";
    cfg.password = "secret";
    cfg.path = "kelivo";
    cfg.includeFiles = false;

    {
        AppConfig config(iniPath());
        config.setWebDavConfig(cfg);
        config.sync();
    }

    AppConfig reloaded(iniPath());
    QVERIFY(reloaded.hasWebDavConfig());
    const WebDavConfig loaded = reloaded.webDavConfig();
    QCOMPARE(loaded.url, cfg.url);
    QCOMPARE(loaded.username, QString("alice"));
    QCOMPARE(loaded.password, QString("secret"));
    QCOMPARE(loaded.path, QString("kelivo"));
    QCOMPARE(loaded.includeChats, true);
    QCOMPARE(loaded.includeFiles, false);
}

void TestAppConfig::testNonPositiveTimeoutFallsBack()
{
    AppConfig config(iniPath());

    config.setTransferTimeoutMs(5000);
    QCOMPARE(config.transferTimeoutMs(), 5000);

    config.setTransferTimeoutMs(0);
    QCOMPARE(config.transferTimeoutMs(), 60000);

    config.setTransferTimeoutMs(-1);
    QCOMPARE(config.transferTimeoutMs(), 60000);
}

void TestAppConfig::testPathsPersist()
{
    {
        AppConfig config(iniPath());
        config.setDataRoot(m_tempDir->filePath("data/"));
        config.setTempDirectory(m_tempDir->filePath("tmp"));
        config.setDebugLogging(true);
        config.sync();
    }

    AppConfig reloaded(iniPath());
    QCOMPARE(reloaded.dataRoot(), QDir::cleanPath(m_tempDir->filePath("data")));
    QCOMPARE(reloaded.tempDirectory(), m_tempDir->filePath("tmp"));
    QCOMPARE(reloaded.debugLogging(), true);
}

void TestAppConfig::testExportDestination()
{
    AppConfig config(iniPath());
    QCOMPARE(config.lastExportPath(), QDir::homePath());
    QCOMPARE(config.exportDestination(QString()), QDir::homePath());

    config.setLastExportPath(m_tempDir->filePath("exports"));
    QCOMPARE(config.exportDestination("  "), m_tempDir->filePath("exports"));
    QCOMPARE(config.exportDestination("/tmp/backup.zip"), QString("/tmp/backup.zip"));
}

QTEST_MAIN(TestAppConfig)
#include "test_appconfig.moc"
