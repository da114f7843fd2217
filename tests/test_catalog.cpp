#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "catalog/catalog.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace {

const char *const kCatalogDocument = R"({
  "imager": {
    "latest_version": "1.8.5",
    "devices": [
      {"name": "Raspberry Pi 5", "tags": ["pi5-64bit"], "default": false},
      {"name": "Raspberry Pi 4", "description": "Models B, 400", "tags": ["pi4-64bit", "pi4-32bit"], "default": true}
    ]
  },
  "os_list": [
    {
      "name": "Raspberry Pi OS (64-bit)",
      "url": "https://downloads.example.invalid/raspios_arm64.img.xz",
      "extract_size": 6000000000,
      "extract_sha256": "aa11",
      "image_download_size": 1200000000,
      "release_date": "2024-07-04",
      "devices": ["pi5-64bit", "pi4-64bit"]
    },
    {
      "name": "Raspberry Pi OS (other)",
      "description": "Other variants",
      "subitems": [
        {"name": "Lite (32-bit)", "url": "https://downloads.example.invalid/lite_armhf.img.xz",
         "devices": ["pi4-32bit"]},
        {"name": "Legacy", "url": "https://downloads.example.invalid/legacy.img.xz",
         "devices": ["pi3-32bit"]}
      ]
    },
    {"name": "Erase", "url": "internal://format"}
  ]
})";

bool throwsCatalogError(const std::string &document)
{
    try {
        imprint::parseCatalog(document);
    } catch (const imprint::ImprintError &ex) {
        return ex.kind() == imprint::ErrorKind::CatalogError;
    }
    return false;
}

} // namespace

class CatalogTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testParseCatalog();
    void testInvalidDocuments();
    void testFilterForDevice();
    void testFindAndDescribe();
    void testLoadFromFile();
    void testDefaultLocationOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void CatalogTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
}

void CatalogTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void CatalogTests::testParseCatalog()
{
    const imprint::Catalog catalog = imprint::parseCatalog(kCatalogDocument);
    QCOMPARE(QString::fromStdString(catalog.latestVersion), QStringLiteral("1.8.5"));
    QCOMPARE(catalog.devices.size(), static_cast<size_t>(2));
    QVERIFY(catalog.devices[1].isDefault);
    QCOMPARE(catalog.devices[1].tags.size(), static_cast<size_t>(2));
    QCOMPARE(catalog.entries.size(), static_cast<size_t>(3));

    const imprint::CatalogEntry &first = catalog.entries.front();
    QCOMPARE(*first.extractSize, static_cast<std::uint64_t>(6000000000ULL));
    QCOMPARE(QString::fromStdString(*first.releaseDate), QStringLiteral("2024-07-04"));
    QCOMPARE(catalog.entries[1].subitems.size(), static_cast<size_t>(2));
}

void CatalogTests::testInvalidDocuments()
{
    QVERIFY(throwsCatalogError("not json"));
    QVERIFY(throwsCatalogError("{}"));
    QVERIFY(throwsCatalogError(R"({"os_list": {}})"));
    QVERIFY(throwsCatalogError(R"({"os_list": [{"description": "no name"}]})"));

    const imprint::Catalog minimal = imprint::parseCatalog(R"({"os_list": []})");
    QVERIFY(minimal.entries.empty());
    QVERIFY(minimal.latestVersion.empty());
}

void CatalogTests::testFilterForDevice()
{
    const imprint::Catalog catalog = imprint::parseCatalog(kCatalogDocument);

    const auto pi5 = imprint::filterForDevice(catalog.entries, {"pi5-64bit"});
    QCOMPARE(pi5.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(pi5[0].name), QStringLiteral("Raspberry Pi OS (64-bit)"));
    QCOMPARE(QString::fromStdString(pi5[1].name), QStringLiteral("Erase"));

    const auto pi4 = imprint::filterForDevice(catalog.entries, {"pi4-64bit", "pi4-32bit"});
    QCOMPARE(pi4.size(), static_cast<size_t>(3));
    QCOMPARE(pi4[1].subitems.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(pi4[1].subitems[0].name), QStringLiteral("Lite (32-bit)"));

    const auto all = imprint::filterForDevice(catalog.entries, {});
    QCOMPARE(all.size(), static_cast<size_t>(3));
    QCOMPARE(all[1].subitems.size(), static_cast<size_t>(2));
}

void CatalogTests::testFindAndDescribe()
{
    const imprint::Catalog catalog = imprint::parseCatalog(kCatalogDocument);

    const imprint::CatalogEntry *legacy = imprint::findEntry(catalog.entries, "Legacy");
    QVERIFY(legacy != nullptr);
    const imprint::ImageDescriptor image = imprint::toImageDescriptor(*legacy);
    QCOMPARE(QString::fromStdString(image.url),
             QStringLiteral("https://downloads.example.invalid/legacy.img.xz"));
    QVERIFY(!image.expectedSize.has_value());

    const imprint::ImageDescriptor main = imprint::toImageDescriptor(catalog.entries.front());
    QCOMPARE(QString::fromStdString(*main.expectedSha256), QStringLiteral("aa11"));
    QCOMPARE(*main.expectedSize, static_cast<std::uint64_t>(6000000000ULL));

    QVERIFY(imprint::findEntry(catalog.entries, "Missing") == nullptr);

    const imprint::CatalogEntry *category =
        imprint::findEntry(catalog.entries, "Raspberry Pi OS (other)");
    QVERIFY(category != nullptr);
    bool threw = false;
    try {
        imprint::toImageDescriptor(*category);
    } catch (const imprint::ImprintError &ex) {
        threw = ex.kind() == imprint::ErrorKind::CatalogError;
    }
    QVERIFY(threw);
}

void CatalogTests::testLoadFromFile()
{
    const QString path = m_tempDir.path() + "/catalog.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(kCatalogDocument);
    file.close();

    const imprint::Catalog catalog = imprint::loadCatalog(path);
    QCOMPARE(catalog.entries.size(), static_cast<size_t>(3));

    const imprint::Catalog viaUrl = imprint::loadCatalog(QStringLiteral("file://") + path);
    QCOMPARE(viaUrl.devices.size(), static_cast<size_t>(2));

    bool threw = false;
    try {
        imprint::loadCatalog(m_tempDir.path() + "/missing.json");
    } catch (const imprint::ImprintError &ex) {
        threw = ex.kind() == imprint::ErrorKind::CatalogError;
        QVERIFY(QString::fromUtf8(ex.what()).startsWith(QStringLiteral("Failed to load catalog from")));
    }
    QVERIFY(threw);
}

void CatalogTests::testDefaultLocationOverride()
{
    const QByteArray previous = qgetenv("IMPRINT_CATALOG_URL");
    qputenv("IMPRINT_CATALOG_URL", "/srv/mirror/os_list.json");
    QCOMPARE(imprint::defaultCatalogLocation(), QStringLiteral("/srv/mirror/os_list.json"));

    qunsetenv("IMPRINT_CATALOG_URL");
    const QString previousDir = QDir::currentPath();
    QVERIFY(QDir::setCurrent(m_tempDir.path()));
    QCOMPARE(imprint::defaultCatalogLocation(), QString::fromLatin1(imprint::kDefaultCatalogUrl));

    QFile local(QString::fromLatin1(imprint::kLocalCatalogFile));
    QVERIFY(local.open(QIODevice::WriteOnly));
    local.write("{\"os_list\": []}");
    local.close();
    QCOMPARE(imprint::defaultCatalogLocation(), QString::fromLatin1(imprint::kLocalCatalogFile));
    QVERIFY(QDir::setCurrent(previousDir));

    if (!previous.isEmpty()) {
        qputenv("IMPRINT_CATALOG_URL", previous);
    }
}

QTEST_MAIN(CatalogTests)
#include "test_catalog.moc"
