#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testEventShapes();
    void testEventStrictParsing();
    void testSettingsKeys();
    void testSettingsMissingFieldsDefaults();
    void testCatalogEntryNesting();
    void testNegativeSizesIgnored();
    void testErrorKindNames();
};

void ModelsJsonTests::testEventShapes()
{
    const nlohmann::json progress = imprint::TransferEvent::progress(42.5);
    QCOMPARE(QString::fromStdString(progress.at("type").get<std::string>()),
             QStringLiteral("Progress"));
    QCOMPARE(progress.at("data").get<double>(), 42.5);

    const nlohmann::json phase = imprint::TransferEvent::phaseChange(imprint::TransferPhase::Verifying);
    QCOMPARE(QString::fromStdString(phase.at("data").get<std::string>()),
             QStringLiteral("Verifying"));

    const nlohmann::json error = imprint::TransferEvent::error("boom");
    QCOMPARE(QString::fromStdString(error.at("type").get<std::string>()), QStringLiteral("Error"));
    QCOMPARE(QString::fromStdString(error.at("data").get<std::string>()), QStringLiteral("boom"));

    const nlohmann::json finished = imprint::TransferEvent::finished();
    QCOMPARE(QString::fromStdString(finished.at("type").get<std::string>()),
             QStringLiteral("Finished"));
    QVERIFY(!finished.contains("data"));

    const auto parsed = nlohmann::json::parse(R"({"type":"VerifyProgress","data":12})")
                            .get<imprint::TransferEvent>();
    QCOMPARE(parsed.kind, imprint::TransferEventKind::VerifyProgress);
    QCOMPARE(parsed.percent, 12.0);
}

void ModelsJsonTests::testEventStrictParsing()
{
    const char *const invalid[] = {
        R"({"data":1})",
        R"({"type":"Bogus"})",
        R"({"type":"Progress","data":"half"})",
        R"({"type":"Phase","data":"Flashing"})",
        R"({"type":"Status"})",
        R"([1,2])",
    };
    for (const char *text : invalid) {
        bool threw = false;
        try {
            nlohmann::json::parse(text).get<imprint::TransferEvent>();
        } catch (const imprint::ImprintError &ex) {
            threw = ex.kind() == imprint::ErrorKind::ProtocolError;
        }
        QVERIFY2(threw, text);
    }
}

void ModelsJsonTests::testSettingsKeys()
{
    imprint::ProvisioningSettings settings;
    settings.keyboardLayout = "us";
    settings.ejectOnFinish = false;

    const nlohmann::json j = settings;
    QCOMPARE(QString::fromStdString(j.at("keyboard_layout").get<std::string>()), QStringLiteral("us"));
    QCOMPARE(j.at("eject_finished").get<bool>(), false);
    QVERIFY(j.at("password").is_null());
    QVERIFY(j.contains("ssh_public_keys"));
    QVERIFY(j.contains("wifi_hidden"));
}

void ModelsJsonTests::testSettingsMissingFieldsDefaults()
{
    const auto parsed = nlohmann::json::parse(R"({"hostname":"pi-lab","password":null})")
                            .get<imprint::ProvisioningSettings>();
    QCOMPARE(QString::fromStdString(parsed.hostname), QStringLiteral("pi-lab"));
    QVERIFY(!parsed.password.has_value());
    QCOMPARE(QString::fromStdString(parsed.wifiCountry), QStringLiteral("GB"));
    QVERIFY(parsed.sshPasswordAuth);
    QVERIFY(parsed.telemetry);
}

void ModelsJsonTests::testCatalogEntryNesting()
{
    const auto j = nlohmann::json::parse(R"({
        "name": "Other",
        "subitems": [
            {"name": "Lite", "url": "https://example.invalid/lite.img.xz",
             "extract_size": 2147483648, "extract_sha256": "ab", "devices": ["pi4-64bit"]}
        ]
    })");
    const auto entry = j.get<imprint::CatalogEntry>();
    QCOMPARE(QString::fromStdString(entry.name), QStringLiteral("Other"));
    QVERIFY(!entry.url.has_value());
    QCOMPARE(entry.subitems.size(), static_cast<size_t>(1));
    const imprint::CatalogEntry &child = entry.subitems.front();
    QVERIFY(child.extractSize.has_value());
    QCOMPARE(*child.extractSize, static_cast<std::uint64_t>(2147483648ULL));
    QCOMPARE(child.devices.size(), static_cast<size_t>(1));
    QVERIFY(!child.releaseDate.has_value());
}

void ModelsJsonTests::testNegativeSizesIgnored()
{
    const auto entry = nlohmann::json::parse(R"({
        "name": "Broken",
        "url": "https://example.invalid/broken.img.xz",
        "extract_size": -1,
        "image_download_size": -4096,
        "extract_sha256": "ab"
    })").get<imprint::CatalogEntry>();
    QVERIFY(!entry.extractSize.has_value());
    QVERIFY(!entry.imageDownloadSize.has_value());
    QCOMPARE(QString::fromStdString(*entry.extractSha256), QStringLiteral("ab"));

    const auto zero = nlohmann::json::parse(R"({"name": "Empty", "extract_size": 0})")
                          .get<imprint::CatalogEntry>();
    QVERIFY(zero.extractSize.has_value());
    QCOMPARE(*zero.extractSize, static_cast<std::uint64_t>(0));
}

void ModelsJsonTests::testErrorKindNames()
{
    QCOMPARE(QString::fromStdString(imprint::toErrorKindString(imprint::ErrorKind::IntegrityError)),
             QStringLiteral("IntegrityError"));
    const imprint::ImprintError error(imprint::ErrorKind::InstallError, "mount failed");
    QCOMPARE(error.kind(), imprint::ErrorKind::InstallError);
    QCOMPARE(QString::fromUtf8(error.what()), QStringLiteral("mount failed"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_json.moc"
