#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "devices/drive_list.hpp"

namespace {

const char *const kLsblkOutput = R"({
  "blockdevices": [
    {"name": "nvme0n1", "size": 512110190592, "model": "Samsung SSD 980", "type": "disk",
     "mountpoint": null, "label": null, "rm": false, "ro": false,
     "children": [
       {"name": "nvme0n1p1", "size": 536870912, "type": "part", "mountpoint": "/boot/efi"},
       {"name": "nvme0n1p2", "size": 511571918848, "type": "part", "mountpoint": "/"}
     ]},
    {"name": "sdb", "size": "31914983424", "model": "SD Card Reader  ", "type": "disk",
     "mountpoint": null, "label": null, "rm": "1", "ro": "0",
     "children": [
       {"name": "sdb1", "size": "268435456", "type": "part", "mountpoint": "/media/pi/bootfs", "label": "bootfs"}
     ]},
    {"name": "sdc", "size": 1610612736, "model": null, "type": "disk",
     "label": "RECOVERY", "rm": 1, "ro": true},
    {"name": "loop0", "size": 4096, "type": "loop"},
    {"name": "sr0", "size": 1073741312, "type": "rom", "rm": true}
  ]
})";

class FakeLsblkRunner : public imprint::CommandRunner
{
public:
    QByteArray output;
    int exitCode = 0;
    QString program;
    QStringList args;

    imprint::CommandResult run(const QString &p, const QStringList &a) override
    {
        program = p;
        args = a;
        imprint::CommandResult result;
        result.started = true;
        result.exitCode = exitCode;
        result.standardOutput = output;
        result.standardError = exitCode == 0 ? QByteArray() : QByteArray("lsblk: boom\n");
        return result;
    }
};

} // namespace

class DriveListTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testFormatSize();
    void testParseDisksOnly();
    void testFlags();
    void testInvalidOutput();
    void testListDropsSystemDrive();
    void testListFailure();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void DriveListTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
}

void DriveListTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void DriveListTests::testFormatSize()
{
    QCOMPARE(QString::fromStdString(imprint::formatSize(900)), QStringLiteral("900 B"));
    QCOMPARE(QString::fromStdString(imprint::formatSize(512ULL * 1024 * 1024)), QStringLiteral("512 MB"));
    QCOMPARE(QString::fromStdString(imprint::formatSize(1610612736ULL)), QStringLiteral("1.50 GB"));
    QCOMPARE(QString::fromStdString(imprint::formatSize(2ULL * 1024 * 1024 * 1024 * 1024)),
             QStringLiteral("2.00 TB"));
}

void DriveListTests::testParseDisksOnly()
{
    const auto drives = imprint::parseLsblk(kLsblkOutput);
    QCOMPARE(drives.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(drives[0].path), QStringLiteral("/dev/nvme0n1"));
    QCOMPARE(QString::fromStdString(drives[1].path), QStringLiteral("/dev/sdb"));
    QCOMPARE(QString::fromStdString(drives[2].path), QStringLiteral("/dev/sdc"));

    QCOMPARE(drives[1].size, static_cast<std::uint64_t>(31914983424ULL));
    QCOMPARE(QString::fromStdString(drives[1].description), QStringLiteral("SD Card Reader (29.72 GB)"));
    QCOMPARE(QString::fromStdString(drives[2].description),
             QStringLiteral("Unknown - RECOVERY (1.50 GB)"));
}

void DriveListTests::testFlags()
{
    const auto drives = imprint::parseLsblk(kLsblkOutput);

    QVERIFY(drives[0].isSystem);
    QVERIFY(!drives[0].isRemovable);
    QCOMPARE(drives[0].mountpoints.size(), static_cast<size_t>(2));

    QVERIFY(!drives[1].isSystem);
    QVERIFY(drives[1].isRemovable);
    QVERIFY(!drives[1].isReadonly);
    QCOMPARE(drives[1].mountpoints.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(drives[1].mountpoints.front()), QStringLiteral("/media/pi/bootfs"));

    QVERIFY(drives[2].isRemovable);
    QVERIFY(drives[2].isReadonly);
    QVERIFY(drives[2].mountpoints.empty());
}

void DriveListTests::testInvalidOutput()
{
    const char *const invalid[] = {
        "",
        "lsblk: unknown column",
        R"({"devices": []})",
        R"({"blockdevices": [{"name": "sdz", "type": "disk", "size": "huge"}]})",
        R"({"blockdevices": [{"name": "sdz", "type": "disk", "size": -1}]})",
    };
    for (const char *text : invalid) {
        bool threw = false;
        try {
            imprint::parseLsblk(text);
        } catch (const imprint::ImprintError &ex) {
            threw = ex.kind() == imprint::ErrorKind::DeviceUnavailable;
        }
        QVERIFY2(threw, text);
    }
}

void DriveListTests::testListDropsSystemDrive()
{
    FakeLsblkRunner runner;
    runner.output = QByteArray(kLsblkOutput);

    const auto drives = imprint::listDrives(runner);
    QCOMPARE(runner.program, QStringLiteral("lsblk"));
    QVERIFY(runner.args.contains(QStringLiteral("-J")));
    QCOMPARE(drives.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(drives[0].path), QStringLiteral("/dev/sdb"));

    QCOMPARE(imprint::listDrives(runner, true).size(), static_cast<size_t>(3));
}

void DriveListTests::testListFailure()
{
    FakeLsblkRunner runner;
    runner.exitCode = 1;

    bool threw = false;
    try {
        imprint::listDrives(runner);
    } catch (const imprint::ImprintError &ex) {
        threw = ex.kind() == imprint::ErrorKind::DeviceUnavailable;
        QCOMPARE(QString::fromUtf8(ex.what()), QStringLiteral("lsblk failed: lsblk: boom"));
    }
    QVERIFY(threw);
}

QTEST_MAIN(DriveListTests)
#include "test_drive_list.moc"
