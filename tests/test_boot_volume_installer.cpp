#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "provision/boot_volume_installer.hpp"

namespace {

// Simulates the host tools. The "boot partition" is a fixture directory:
// mount copies it into the mount point, umount moves the result out.
class FakeMountRunner : public imprint::CommandRunner
{
public:
    QString fixtureDir;
    QString capturedDir;
    int mountExitCode = 0;
    int umountExitCode = 0;
    int partprobeExitCode = 0;
    QList<QStringList> calls;

    imprint::CommandResult run(const QString &program, const QStringList &args) override
    {
        calls.append(QStringList{program} + args);
        imprint::CommandResult result;
        result.started = true;
        if (program == QLatin1String("partprobe")) {
            result.exitCode = partprobeExitCode;
        } else if (program == QLatin1String("mount")) {
            result.exitCode = mountExitCode;
            if (mountExitCode == 0) {
                const QDir source(fixtureDir);
                for (const QString &name : source.entryList(QDir::Files)) {
                    QFile::copy(source.filePath(name), QDir(args.at(1)).filePath(name));
                }
            }
        } else if (program == QLatin1String("umount")) {
            result.exitCode = umountExitCode;
            const QDir mounted(args.at(0));
            QDir().mkpath(capturedDir);
            for (const QString &name : mounted.entryList(QDir::Files)) {
                QFile::remove(QDir(capturedDir).filePath(name));
                QFile::rename(mounted.filePath(name), QDir(capturedDir).filePath(name));
            }
        }
        return result;
    }
};

} // namespace

class BootVolumeInstallerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testBootPartitionNaming();
    void testPatchCmdlineAppendsOnce();
    void testInstallWritesScriptAndCmdline();
    void testInstallWithoutCmdline();
    void testMountFailure();
    void testUnmountFailure();
    void testPartprobeFailureIsTolerated();

private:
    static void writeFile(const QString &path, const QByteArray &data)
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(data);
    }

    static QByteArray readFile(const QString &path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    void prepare(FakeMountRunner &runner, imprint::BootVolumeInstaller &installer) const
    {
        runner.fixtureDir = m_fixtureDir;
        runner.capturedDir = m_captureDir;
        installer.setSettleDelays(std::chrono::milliseconds(0), std::chrono::milliseconds(0));
        installer.setMountRoot(m_tempDir.path());
    }

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_fixtureDir;
    QString m_captureDir;
};

void BootVolumeInstallerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    imprint::logging::initLogging(QStringLiteral("imprint-test"), false);
}

void BootVolumeInstallerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void BootVolumeInstallerTests::init()
{
    m_fixtureDir = m_tempDir.path() + "/fixture";
    m_captureDir = m_tempDir.path() + "/captured";
    QDir(m_fixtureDir).removeRecursively();
    QDir(m_captureDir).removeRecursively();
    QVERIFY(QDir().mkpath(m_fixtureDir));
}

void BootVolumeInstallerTests::testBootPartitionNaming()
{
    QCOMPARE(QString::fromStdString(imprint::bootPartitionFor("/dev/nvme0n1")),
             QStringLiteral("/dev/nvme0n1p1"));
    QCOMPARE(QString::fromStdString(imprint::bootPartitionFor("/dev/mmcblk0")),
             QStringLiteral("/dev/mmcblk0p1"));
    QCOMPARE(QString::fromStdString(imprint::bootPartitionFor("/dev/sdb")),
             QStringLiteral("/dev/sdb1"));
}

void BootVolumeInstallerTests::testPatchCmdlineAppendsOnce()
{
    const std::string suffix =
        " systemd.run=/boot/firstrun.sh systemd.run_success_action=reboot"
        " systemd.unit=kernel-command-line.target";

    const std::string once = imprint::patchCmdline("console=tty1 root=PARTUUID=1-02 rootwait\n");
    QCOMPARE(QString::fromStdString(once),
             QString::fromStdString("console=tty1 root=PARTUUID=1-02 rootwait" + suffix));

    const std::string twice = imprint::patchCmdline(once + "\n");
    QCOMPARE(QString::fromStdString(twice), QString::fromStdString(once));
}

void BootVolumeInstallerTests::testInstallWritesScriptAndCmdline()
{
    writeFile(m_fixtureDir + "/cmdline.txt", QByteArray("console=tty1 rootwait\n"));
    writeFile(m_fixtureDir + "/config.txt", QByteArray("arm_64bit=1\n"));

    FakeMountRunner runner;
    imprint::BootVolumeInstaller installer(runner);
    prepare(runner, installer);

    imprint::TargetDevice device;
    device.path = "/dev/mmcblk0";
    QVERIFY(installer.install(device, "#!/bin/bash\nexit 0\n"));

    QCOMPARE(runner.calls.size(), 3);
    QCOMPARE(runner.calls.at(0), (QStringList{QStringLiteral("partprobe"), QStringLiteral("/dev/mmcblk0")}));
    QCOMPARE(runner.calls.at(1),
             (QStringList{QStringLiteral("mount"), QStringLiteral("/dev/mmcblk0p1"),
                          installer.mountPointPath()}));
    QCOMPARE(runner.calls.at(2), (QStringList{QStringLiteral("umount"), installer.mountPointPath()}));

    QCOMPARE(readFile(m_captureDir + "/firstrun.sh"), QByteArray("#!/bin/bash\nexit 0\n"));
    QCOMPARE(readFile(m_captureDir + "/cmdline.txt"),
             QByteArray("console=tty1 rootwait systemd.run=/boot/firstrun.sh "
                        "systemd.run_success_action=reboot systemd.unit=kernel-command-line.target"));
    QCOMPARE(readFile(m_captureDir + "/config.txt"), QByteArray("arm_64bit=1\n"));
    QVERIFY(!QDir(installer.mountPointPath()).exists());
}

void BootVolumeInstallerTests::testInstallWithoutCmdline()
{
    FakeMountRunner runner;
    imprint::BootVolumeInstaller installer(runner);
    prepare(runner, installer);

    imprint::TargetDevice device;
    device.path = "/dev/sdb";
    QVERIFY(!installer.install(device, "#!/bin/bash\n"));
    QCOMPARE(runner.calls.at(1).at(1), QStringLiteral("/dev/sdb1"));
    QVERIFY(QFile::exists(m_captureDir + "/firstrun.sh"));
    QVERIFY(!QFile::exists(m_captureDir + "/cmdline.txt"));
    QVERIFY(!QDir(installer.mountPointPath()).exists());
}

void BootVolumeInstallerTests::testMountFailure()
{
    FakeMountRunner runner;
    runner.mountExitCode = 32;
    imprint::BootVolumeInstaller installer(runner);
    prepare(runner, installer);

    imprint::TargetDevice device;
    device.path = "/dev/sdb";
    bool threw = false;
    try {
        installer.install(device, "#!/bin/bash\n");
    } catch (const imprint::ImprintError &ex) {
        threw = ex.kind() == imprint::ErrorKind::InstallError;
        QCOMPARE(QString::fromUtf8(ex.what()),
                 QStringLiteral("Failed to mount boot partition /dev/sdb1. Exit code: 32"));
    }
    QVERIFY(threw);
    QCOMPARE(runner.calls.size(), 2);
    QVERIFY(!QDir(installer.mountPointPath()).exists());
}

void BootVolumeInstallerTests::testUnmountFailure()
{
    writeFile(m_fixtureDir + "/cmdline.txt", QByteArray("console=tty1\n"));
    FakeMountRunner runner;
    runner.umountExitCode = 16;
    imprint::BootVolumeInstaller installer(runner);
    prepare(runner, installer);

    imprint::TargetDevice device;
    device.path = "/dev/sdb";
    bool threw = false;
    try {
        installer.install(device, "#!/bin/bash\n");
    } catch (const imprint::ImprintError &ex) {
        threw = ex.kind() == imprint::ErrorKind::InstallError;
        QVERIFY(QString::fromUtf8(ex.what()).startsWith(
            QStringLiteral("Failed to unmount boot partition. Check if busy.")));
    }
    QVERIFY(threw);
    // Exactly one umount attempt: the scope guard does not retry.
    int umounts = 0;
    for (const QStringList &call : runner.calls) {
        if (call.first() == QLatin1String("umount")) {
            ++umounts;
        }
    }
    QCOMPARE(umounts, 1);
}

void BootVolumeInstallerTests::testPartprobeFailureIsTolerated()
{
    writeFile(m_fixtureDir + "/cmdline.txt", QByteArray("console=tty1\n"));
    FakeMountRunner runner;
    runner.partprobeExitCode = 1;
    imprint::BootVolumeInstaller installer(runner);
    prepare(runner, installer);

    imprint::TargetDevice device;
    device.path = "/dev/sdb";
    QVERIFY(installer.install(device, "#!/bin/bash\n"));
}

QTEST_MAIN(BootVolumeInstallerTests)
#include "test_boot_volume_installer.moc"
