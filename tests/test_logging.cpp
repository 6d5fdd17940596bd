#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testScopeCountsWarningsAndErrors();
    void testLogDirOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/testline/logs/testline-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    testline::logging::initLogging(QStringLiteral("testline-test"), false);
    QCOMPARE(testline::logging::logsDirPath(), m_tempDir.path() + "/.local/share/testline/logs");

    testline::logging::logEvent(testline::logging::LogLevel::Info,
                                QStringLiteral("testline-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                testline::logging::defaultWho(),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    QFile file(logPath(".log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    testline::logging::initLogging(QStringLiteral("testline-test"), false);
    QFile::remove(logPath(".log"));

    TLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugSkippedWithoutTrace"),
               QStringLiteral("test_debug"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro_call"),
               testline::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(".log")));
    QVERIFY(!testline::logging::isTraceEnabled());
}

void LoggingTests::testTraceWrites()
{
    testline::logging::initLogging(QStringLiteral("testline-test"), true);

    testline::logging::logEvent(testline::logging::LogLevel::Debug,
                                QStringLiteral("testline-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testTraceWrites"),
                                QStringLiteral("test_trace"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                testline::logging::defaultWho(),
                                QStringLiteral("corr-2"),
                                nlohmann::json::object());

    QFile file(logPath("-trace.log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
    QVERIFY(testline::logging::isTraceEnabled());
}

void LoggingTests::testCorrelationScope()
{
    testline::logging::setCorrelationId(QStringLiteral("outer"));
    {
        testline::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(testline::logging::currentCorrelationId(), QStringLiteral("inner"));
    }
    QCOMPARE(testline::logging::currentCorrelationId(), QStringLiteral("outer"));
    testline::logging::setCorrelationId(QString());
}

void LoggingTests::testScopeCountsWarningsAndErrors()
{
    testline::logging::initLogging(QStringLiteral("testline-test"), false);
    const QString who = testline::logging::defaultWho();

    testline::logging::CorrelationScope outer(QStringLiteral("cycle-1"));
    TLOG_WARN(QStringLiteral("Test"), QStringLiteral("scope"), QStringLiteral("first_warning"),
              QStringLiteral("unit_test"), QStringLiteral("macro_call"), who, QString(),
              nlohmann::json::object());
    {
        testline::logging::CorrelationScope inner(QStringLiteral("request-1"));
        TLOG_ERROR(QStringLiteral("Test"), QStringLiteral("scope"), QStringLiteral("inner_error"),
                   QStringLiteral("unit_test"), QStringLiteral("macro_call"), who, QString(),
                   nlohmann::json::object());
        TLOG_INFO(QStringLiteral("Test"), QStringLiteral("scope"), QStringLiteral("inner_info"),
                  QStringLiteral("unit_test"), QStringLiteral("macro_call"), who, QString(),
                  nlohmann::json::object());
        QCOMPARE(inner.warnings(), 0);
        QCOMPARE(inner.errors(), 1);
    }
    TLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("scope"), QStringLiteral("skipped_debug"),
               QStringLiteral("unit_test"), QStringLiteral("macro_call"), who, QString(),
               nlohmann::json::object());

    QCOMPARE(outer.warnings(), 1);
    QCOMPARE(outer.errors(), 1);
    QCOMPARE(testline::logging::currentCorrelationId(), QStringLiteral("cycle-1"));
}

void LoggingTests::testLogDirOverride()
{
    const QString dir = m_tempDir.path() + "/custom-logs";
    qputenv("TESTLINE_LOG_DIR", dir.toUtf8());
    testline::logging::initLogging(QStringLiteral("testline-test"), false);
    QCOMPARE(testline::logging::logsDirPath(), dir);

    TLOG_INFO(QStringLiteral("Test"), QStringLiteral("testLogDirOverride"),
              QStringLiteral("moved_log"), QStringLiteral("unit_test"),
              QStringLiteral("macro_call"), testline::logging::defaultWho(),
              QStringLiteral("corr-3"), nlohmann::json::object());

    QFile file(dir + "/testline-test.log");
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("moved_log"));

    qunsetenv("TESTLINE_LOG_DIR");
    QCOMPARE(testline::logging::logsDirPath(), m_tempDir.path() + "/.local/share/testline/logs");
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
