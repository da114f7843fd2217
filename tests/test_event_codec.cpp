#include <QtTest/QtTest>

#include "worker/event_codec.hpp"

class EventCodecTests : public QObject
{
    Q_OBJECT
private slots:
    void testEncodeIsSingleLine();
    void testDecodeKnownRecords();
    void testDecodeSkipsGarbage();
};

void EventCodecTests::testEncodeIsSingleLine()
{
    const std::string line =
        imprint::encodeEventLine(imprint::TransferEvent::error("Download verification failed!\nExpected: a"));
    QVERIFY(line.find('\n') == std::string::npos);

    const auto decoded = imprint::decodeEventLine(line);
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->kind, imprint::TransferEventKind::Error);
    QCOMPARE(QString::fromStdString(decoded->message),
             QStringLiteral("Download verification failed!\nExpected: a"));
}

void EventCodecTests::testDecodeKnownRecords()
{
    const auto progress = imprint::decodeEventLine(R"({"type":"Progress","data":37.5})");
    QVERIFY(progress.has_value());
    QVERIFY(*progress == imprint::TransferEvent::progress(37.5));

    const auto phase = imprint::decodeEventLine("  {\"type\":\"Phase\",\"data\":\"Verifying\"}\r");
    QVERIFY(phase.has_value());
    QVERIFY(*phase == imprint::TransferEvent::phaseChange(imprint::TransferPhase::Verifying));

    const auto finished = imprint::decodeEventLine(R"({"type":"Finished"})");
    QVERIFY(finished.has_value());
    QVERIFY(finished->isTerminal());
}

void EventCodecTests::testDecodeSkipsGarbage()
{
    QVERIFY(!imprint::decodeEventLine("").has_value());
    QVERIFY(!imprint::decodeEventLine("   ").has_value());
    QVERIFY(!imprint::decodeEventLine("[sudo] password for pi:").has_value());
    QVERIFY(!imprint::decodeEventLine("{\"type\":\"Progress\"").has_value());
    QVERIFY(!imprint::decodeEventLine(R"({"type":"Telemetry","data":1})").has_value());
    QVERIFY(!imprint::decodeEventLine(R"({"type":"Progress","data":"x"})").has_value());
}

QTEST_MAIN(EventCodecTests)
#include "test_event_codec.moc"
