#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QRegularExpression>

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
    void testNewCorrelationId();
    void testScopeIdUsedWhenNoneGiven();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const
    {
        return m_tempDir.path() + "/.local/share/twreport/logs/twreport-test" + suffix;
    }
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

void LoggingTests::testLogEventWrites()
{
    twreport::logging::initLogging(QStringLiteral("twreport-test"), false);

    twreport::logging::logEvent(twreport::logging::LogLevel::Info,
                                QStringLiteral("twreport-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                twreport::logging::defaultWho(),
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
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")),
             QStringLiteral("value"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    twreport::logging::initLogging(QStringLiteral("twreport-test"), false);

    twreport::logging::logEvent(twreport::logging::LogLevel::Debug,
                                QStringLiteral("twreport-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testDebugSkippedWithoutTrace"),
                                QStringLiteral("test_debug_hidden"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                twreport::logging::defaultWho(),
                                QString());

    QFile file(logPath(".log"));
    QVERIFY(file.open(QIODevice::ReadOnly));
    QVERIFY(!file.readAll().contains("test_debug_hidden"));
    QVERIFY(!QFile::exists(logPath("-trace.log")));
}

void LoggingTests::testTraceWrites()
{
    twreport::logging::initLogging(QStringLiteral("twreport-test"), true);

    twreport::logging::logEvent(twreport::logging::LogLevel::Debug,
                                QStringLiteral("twreport-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testTraceWrites"),
                                QStringLiteral("test_trace"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                twreport::logging::defaultWho(),
                                QStringLiteral("corr-2"),
                                nlohmann::json::object());

    QFile file(logPath("-trace.log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
    QVERIFY(line.contains("test_trace"));
}

void LoggingTests::testCorrelationScope()
{
    QVERIFY(twreport::logging::currentCorrelationId().isEmpty());
    {
        twreport::logging::CorrelationScope outer(QStringLiteral("outer"));
        {
            twreport::logging::CorrelationScope inner(QStringLiteral("inner"));
            QCOMPARE(twreport::logging::currentCorrelationId(), QStringLiteral("inner"));
        }
        QCOMPARE(twreport::logging::currentCorrelationId(), QStringLiteral("outer"));
    }
    QVERIFY(twreport::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testNewCorrelationId()
{
    const QString first = twreport::logging::newCorrelationId(QStringLiteral("parse"));
    const QString second = twreport::logging::newCorrelationId(QStringLiteral("parse"));
    QVERIFY(QRegularExpression(QStringLiteral("^parse-[0-9a-f]{8}$")).match(first).hasMatch());
    QVERIFY(first != second);
}

void LoggingTests::testScopeIdUsedWhenNoneGiven()
{
    twreport::logging::initLogging(QStringLiteral("twreport-test"), false);
    {
        twreport::logging::CorrelationScope scope(QStringLiteral("corr-scope"));
        twreport::logging::logEvent(twreport::logging::LogLevel::Error,
                                    QStringLiteral("twreport-test"),
                                    QStringLiteral("Test"),
                                    QStringLiteral("testScopeIdUsedWhenNoneGiven"),
                                    QStringLiteral("test_scope_corr"),
                                    QStringLiteral("unit_test"),
                                    QStringLiteral("direct_call"),
                                    twreport::logging::defaultWho(),
                                    QString());
    }

    QFile file(logPath(".log"));
    QVERIFY(file.open(QIODevice::ReadOnly));
    bool found = false;
    while (!file.atEnd()) {
        const auto parsed = nlohmann::json::parse(file.readLine().trimmed().toStdString());
        if (parsed.value("what", "") == "test_scope_corr") {
            QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-scope"));
            QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("ERROR"));
            found = true;
        }
    }
    QVERIFY(found);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
