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
    void testTraceWrites();
    void testCorrelationScopeRestores();
    void testSecretsAreMasked();
    void testLevelThreshold();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    // Elevation variables would redirect logs to the invoking user's home.
    qunsetenv("SUDO_UID");
    qunsetenv("PKEXEC_UID");
    qunsetenv("IMPRINT_LOG_LEVEL");
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
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/imprint/logs/imprint-test.log";

    imprint::logging::logEvent(imprint::logging::LogLevel::Info,
                               QStringLiteral("imprint-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               imprint::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    QFile file(logPath);
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

void LoggingTests::testTraceWrites()
{
    imprint::logging::initLogging(QStringLiteral("imprint-test"), true);
    QVERIFY(imprint::logging::isTraceEnabled());
    const QString tracePath = m_tempDir.path() + "/.local/share/imprint/logs/imprint-test-trace.log";

    imprint::logging::logEvent(imprint::logging::LogLevel::Debug,
                               QStringLiteral("imprint-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testTraceWrites"),
                               QStringLiteral("test_trace"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               imprint::logging::defaultWho(),
                               QStringLiteral("corr-2"),
                               nlohmann::json::object());

    QFile file(tracePath);
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
}

void LoggingTests::testCorrelationScopeRestores()
{
    imprint::logging::setCorrelationId(QStringLiteral("outer"));
    {
        imprint::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(imprint::logging::currentCorrelationId(), QStringLiteral("inner"));
    }
    QCOMPARE(imprint::logging::currentCorrelationId(), QStringLiteral("outer"));
    imprint::logging::setCorrelationId(QString());
}

void LoggingTests::testSecretsAreMasked()
{
    const nlohmann::json context = {
        {"user", "alice"},
        {"password", "hunter2"},
        {"settings", {{"wifi_password", "pa55word"}, {"wifi_ssid", "Lab"}}},
        {"networks", nlohmann::json::array({{{"psk", "secret"}}})},
        {"unset", {{"password", nullptr}}}
    };
    const nlohmann::json masked = imprint::logging::redactSecrets(context);

    QCOMPARE(QString::fromStdString(masked.at("user").get<std::string>()), QStringLiteral("alice"));
    QCOMPARE(QString::fromStdString(masked.at("password").get<std::string>()), QStringLiteral("********"));
    QCOMPARE(QString::fromStdString(masked["settings"].at("wifi_password").get<std::string>()),
             QStringLiteral("********"));
    QCOMPARE(QString::fromStdString(masked["settings"].at("wifi_ssid").get<std::string>()),
             QStringLiteral("Lab"));
    QCOMPARE(QString::fromStdString(masked["networks"][0].at("psk").get<std::string>()),
             QStringLiteral("********"));
    QVERIFY(masked["unset"].at("password").is_null());

    imprint::logging::initLogging(QStringLiteral("imprint-redact"), false);
    imprint::logging::logEvent(imprint::logging::LogLevel::Warn,
                               QStringLiteral("imprint-redact"),
                               QStringLiteral("Test"),
                               QStringLiteral("testSecretsAreMasked"),
                               QStringLiteral("secret_context"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               imprint::logging::defaultWho(),
                               QString(),
                               context);
    QFile file(m_tempDir.path() + "/.local/share/imprint/logs/imprint-redact.log");
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    QVERIFY(!contents.contains("hunter2"));
    QVERIFY(!contents.contains("pa55word"));
}

void LoggingTests::testLevelThreshold()
{
    QVERIFY(imprint::logging::parseLogLevel(QStringLiteral(" Warning "))
            == imprint::logging::LogLevel::Warn);
    QVERIFY(!imprint::logging::parseLogLevel(QStringLiteral("loud")).has_value());

    qputenv("IMPRINT_LOG_LEVEL", "error");
    imprint::logging::initLogging(QStringLiteral("imprint-level"), false);
    qunsetenv("IMPRINT_LOG_LEVEL");

    const QString logPath = m_tempDir.path() + "/.local/share/imprint/logs/imprint-level.log";
    imprint::logging::logEvent(imprint::logging::LogLevel::Warn,
                               QStringLiteral("imprint-level"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLevelThreshold"),
                               QStringLiteral("below_threshold"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               imprint::logging::defaultWho(),
                               QString(),
                               nlohmann::json::object());
    QVERIFY(!QFile::exists(logPath));

    imprint::logging::logEvent(imprint::logging::LogLevel::Error,
                               QStringLiteral("imprint-level"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLevelThreshold"),
                               QStringLiteral("at_threshold"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               imprint::logging::defaultWho(),
                               QString(),
                               nlohmann::json::object());
    QVERIFY(QFile::exists(logPath));
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
