#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/config.hpp"
#include "common/errors.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testDefaults();
    void testReadsConfigFile();
    void testInvalidValuesKeepDefaults();
    void testEnvironmentOverridesFile();
    void testInvalidEnvironmentIgnored();
    void testUnreadableFileRejected();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevRuntime;

    QString writeConfig(const QString &name, const QByteArray &content);
};

namespace {

const char *const kOverrideVariables[] = {
    "TESTLINE_UTC_OFFSET_MINUTES",
    "TESTLINE_SOURCE_TIE_POLICY",
    "TESTLINE_TREND_CACHE",
    "TESTLINE_REFRESH_INTERVAL_SECONDS",
    "TESTLINE_BUNDLE_DIR",
    "TESTLINE_SOCKET_NAME",
};

} // namespace

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevRuntime = qgetenv("XDG_RUNTIME_DIR");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qputenv("XDG_RUNTIME_DIR", m_tempDir.path().toUtf8());
    cleanup();
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }

    if (m_prevRuntime.isEmpty()) {
        qunsetenv("XDG_RUNTIME_DIR");
    } else {
        qputenv("XDG_RUNTIME_DIR", m_prevRuntime);
    }
}

void ConfigTests::cleanup()
{
    for (const char *name : kOverrideVariables) {
        qunsetenv(name);
    }
}

QString ConfigTests::writeConfig(const QString &name, const QByteArray &content)
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void ConfigTests::testDefaults()
{
    const auto config = testline::loadEngineConfig(QString());
    QCOMPARE(config.referenceUtcOffsetMinutes, 0);
    QCOMPARE(config.sourceTiePolicy, testline::SourceTiePolicy::PreferManual);
    QVERIFY(config.trendCacheEnabled);
    QCOMPARE(config.refreshIntervalSeconds, 60);
    QVERIFY(config.bundleDir.isEmpty());
    QCOMPARE(config.socketName, m_tempDir.path() + "/testline.sock");
    QCOMPARE(testline::defaultSocketPath(), config.socketName);
}

void ConfigTests::testReadsConfigFile()
{
    const QString path = writeConfig("full.json", R"({
        "referenceUtcOffsetMinutes": -300,
        "sourceTiePolicy": "prefer_automated",
        "trendCacheEnabled": false,
        "refreshIntervalSeconds": 15,
        "bundleDir": "/srv/testline/bundle",
        "socketName": "/tmp/testline-test.sock"
    })");

    const auto config = testline::loadEngineConfig(path);
    QCOMPARE(config.referenceUtcOffsetMinutes, -300);
    QCOMPARE(config.sourceTiePolicy, testline::SourceTiePolicy::PreferAutomated);
    QVERIFY(!config.trendCacheEnabled);
    QCOMPARE(config.refreshIntervalSeconds, 15);
    QCOMPARE(config.bundleDir, QStringLiteral("/srv/testline/bundle"));
    QCOMPARE(config.socketName, QStringLiteral("/tmp/testline-test.sock"));
}

void ConfigTests::testInvalidValuesKeepDefaults()
{
    const QString path = writeConfig("invalid.json", R"({
        "referenceUtcOffsetMinutes": 9000,
        "sourceTiePolicy": "coin_flip",
        "refreshIntervalSeconds": 0,
        "trendCacheEnabled": "no"
    })");

    const auto config = testline::loadEngineConfig(path);
    QCOMPARE(config.referenceUtcOffsetMinutes, 0);
    QCOMPARE(config.sourceTiePolicy, testline::SourceTiePolicy::PreferManual);
    QCOMPARE(config.refreshIntervalSeconds, 60);
    QVERIFY(config.trendCacheEnabled);
}

void ConfigTests::testEnvironmentOverridesFile()
{
    const QString path = writeConfig("base.json", R"({"referenceUtcOffsetMinutes": 60,
                                                      "bundleDir": "/from/file"})");
    qputenv("TESTLINE_UTC_OFFSET_MINUTES", "330");
    qputenv("TESTLINE_SOURCE_TIE_POLICY", "prefer_automated");
    qputenv("TESTLINE_TREND_CACHE", "0");
    qputenv("TESTLINE_BUNDLE_DIR", "/from/env");

    const auto config = testline::loadEngineConfig(path);
    QCOMPARE(config.referenceUtcOffsetMinutes, 330);
    QCOMPARE(config.sourceTiePolicy, testline::SourceTiePolicy::PreferAutomated);
    QVERIFY(!config.trendCacheEnabled);
    QCOMPARE(config.bundleDir, QStringLiteral("/from/env"));
}

void ConfigTests::testInvalidEnvironmentIgnored()
{
    qputenv("TESTLINE_UTC_OFFSET_MINUTES", "east");
    qputenv("TESTLINE_REFRESH_INTERVAL_SECONDS", "-5");

    testline::EngineConfig config;
    config.referenceUtcOffsetMinutes = 120;
    testline::applyEnvironmentOverrides(config);
    QCOMPARE(config.referenceUtcOffsetMinutes, 120);
    QCOMPARE(config.refreshIntervalSeconds, 60);
}

void ConfigTests::testUnreadableFileRejected()
{
    bool missing = false;
    try {
        testline::loadEngineConfig(m_tempDir.path() + "/does-not-exist.json");
    } catch (const testline::EngineError &e) {
        missing = e.kind() == testline::ErrorKind::InvalidRequest;
    }
    QVERIFY(missing);

    const QString broken = writeConfig("broken.json", "{\"referenceUtcOffsetMinutes\": ");
    bool malformed = false;
    try {
        testline::loadEngineConfig(broken);
    } catch (const testline::EngineError &e) {
        malformed = e.kind() == testline::ErrorKind::InvalidRequest;
    }
    QVERIFY(malformed);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
