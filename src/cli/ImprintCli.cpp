#include "cli/ImprintCli.hpp"

#include <iostream>
#include <string>

#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "catalog/catalog.hpp"
#include "cli/InterruptWatcher.hpp"
#include "cli/WriteSession.hpp"
#include "common/errors.hpp"
#include "common/imprint_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/settings_store.hpp"
#include "devices/drive_list.hpp"
#include "supervisor/elevator.hpp"
#include "supervisor/worker_supervisor.hpp"
#include "worker/worker_invocation.hpp"

namespace imprint {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  imprint devices [--catalog PATH|URL]\n"
        "  imprint os [--device NAME|TAG] [--catalog PATH|URL]\n"
        "  imprint drives [--all]\n"
        "  imprint settings show\n"
        "  imprint settings set KEY VALUE\n"
        "  imprint settings reset\n"
        "  imprint ssh-keys\n"
        "  imprint write (--image URL|PATH | --os NAME | PATH) --drive DEVICE\n"
        "                [--size BYTES] [--sha256 HEX] [--catalog PATH|URL]\n"
        "                [--no-customize] [--yes]\n"
        "\n"
        "Global options: --trace, --version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// First bare argument after the subcommand that is not the value of a flag.
QString positionalArgument(const QStringList &args, const QStringList &valueFlags)
{
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valueFlags.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QLatin1String("--"))) {
            continue;
        }
        return arg;
    }
    return {};
}

QString catalogLocation(const QStringList &args)
{
    const QString explicitLocation = getArgValue(args, QStringLiteral("--catalog"));
    return explicitLocation.isEmpty() ? defaultCatalogLocation() : explicitLocation;
}

bool isRemoteLocation(const QString &value)
{
    return value.startsWith(QLatin1String("http://"), Qt::CaseInsensitive)
        || value.startsWith(QLatin1String("https://"), Qt::CaseInsensitive)
        || value.startsWith(QLatin1String("file://"), Qt::CaseInsensitive);
}

void printEntries(const std::vector<CatalogEntry> &entries, int depth)
{
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');
    for (const auto &entry : entries) {
        std::cout << indent << entry.name;
        if (entry.url) {
            if (entry.extractSize) {
                std::cout << "  [" << formatSize(*entry.extractSize) << "]";
            }
            if (entry.releaseDate) {
                std::cout << "  " << *entry.releaseDate;
            }
        }
        std::cout << "\n";
        if (!entry.subitems.empty()) {
            printEntries(entry.subitems, depth + 1);
        }
    }
}

bool confirm(const std::string &question)
{
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    const QString normalized = QString::fromStdString(answer).trimmed().toLower();
    return normalized == QLatin1String("y") || normalized == QLatin1String("yes");
}

nlohmann::json maskedSettings(const ProvisioningSettings &settings)
{
    nlohmann::json payload = settings;
    if (settings.password) {
        payload["password"] = "********";
    }
    if (!settings.wifiPassword.empty()) {
        payload["wifi_password"] = "********";
    }
    return payload;
}

} // namespace

int ImprintCli::run(const QStringList &args)
{
    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    ILOG_INFO(QStringLiteral("ImprintCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("devices")) {
            return runDevices(args);
        }
        if (command == QStringLiteral("os")) {
            return runOsList(args);
        }
        if (command == QStringLiteral("drives")) {
            return runDrives(args);
        }
        if (command == QStringLiteral("settings")) {
            return runSettings(args);
        }
        if (command == QStringLiteral("ssh-keys")) {
            return runSshKeys(args);
        }
        if (command == QStringLiteral("write")) {
            return runWrite(args);
        }
        if (command == QStringLiteral("--version")) {
            std::cout << "imprint " << IMPRINT_VERSION << std::endl;
            return 0;
        }
    } catch (const std::exception &ex) {
        ILOG_ERROR(QStringLiteral("ImprintCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("cli"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ImprintCli::runDevices(const QStringList &args)
{
    const Catalog catalog = loadCatalog(catalogLocation(args));
    if (catalog.devices.empty()) {
        std::cout << "The catalog lists no device types.\n";
        return 0;
    }
    for (const auto &device : catalog.devices) {
        std::cout << device.name;
        if (device.isDefault) {
            std::cout << " (default)";
        }
        if (!device.tags.empty()) {
            std::cout << "  tags: " << nlohmann::json(device.tags).dump();
        }
        std::cout << "\n";
        if (!device.description.empty()) {
            std::cout << "  " << device.description << "\n";
        }
    }
    return 0;
}

int ImprintCli::runOsList(const QStringList &args)
{
    const Catalog catalog = loadCatalog(catalogLocation(args));
    const QString deviceArg = getArgValue(args, QStringLiteral("--device"));

    std::vector<CatalogEntry> entries = catalog.entries;
    if (!deviceArg.isEmpty()) {
        std::vector<std::string> tags;
        for (const auto &device : catalog.devices) {
            if (QString::fromStdString(device.name).compare(deviceArg, Qt::CaseInsensitive) == 0) {
                tags = device.tags;
                break;
            }
        }
        if (tags.empty()) {
            tags.push_back(deviceArg.toStdString());
        }
        entries = filterForDevice(catalog.entries, tags);
    }

    if (entries.empty()) {
        std::cout << "No operating systems match.\n";
        return 0;
    }
    printEntries(entries, 0);
    return 0;
}

int ImprintCli::runDrives(const QStringList &args)
{
    const bool includeSystem = args.contains(QStringLiteral("--all"));
    ProcessCommandRunner runner;
    const auto drives = listDrives(runner, includeSystem);

    if (drives.empty()) {
        std::cout << "No storage devices found.\n";
        return 0;
    }
    for (const auto &drive : drives) {
        std::cout << drive.path << "  " << drive.description;
        if (drive.isRemovable) {
            std::cout << "  [removable]";
        }
        if (drive.isReadonly) {
            std::cout << "  [read-only]";
        }
        if (drive.isSystem) {
            std::cout << "  [system]";
        }
        std::cout << "\n";
    }
    return 0;
}

int ImprintCli::runSettings(const QStringList &args)
{
    const SettingsStore store;
    const QString action = args.size() > 2 ? args.at(2) : QStringLiteral("show");

    if (action == QStringLiteral("show")) {
        const ProvisioningSettings settings = store.load();
        std::cout << maskedSettings(settings).dump(2) << std::endl;
        std::cout << "customization: " << (needsCustomization(settings) ? "yes" : "no")
                  << std::endl;
        return 0;
    }

    if (action == QStringLiteral("set")) {
        if (args.size() < 5) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        ProvisioningSettings settings = store.load();
        std::string error;
        if (!applySetting(settings, args.at(3).toStdString(), args.at(4).toStdString(), &error)) {
            std::cerr << error << std::endl;
            return 1;
        }
        if (!store.save(settings)) {
            std::cerr << "Failed to save settings to " << store.path().toStdString() << std::endl;
            return 1;
        }
        return 0;
    }

    if (action == QStringLiteral("reset")) {
        if (!store.save(ProvisioningSettings())) {
            std::cerr << "Failed to save settings to " << store.path().toStdString() << std::endl;
            return 1;
        }
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ImprintCli::runSshKeys(const QStringList &)
{
    const auto keys = discoverSshKeys(QDir::homePath());
    if (keys.empty()) {
        std::cout << "No SSH public keys found in ~/.ssh.\n";
        return 0;
    }
    for (const auto &key : keys) {
        std::cout << key << "\n";
    }
    return 0;
}

int ImprintCli::runWrite(const QStringList &args)
{
    const QStringList valueFlags = {
        QStringLiteral("--image"), QStringLiteral("--drive"), QStringLiteral("--size"),
        QStringLiteral("--sha256"), QStringLiteral("--os"), QStringLiteral("--catalog")};

    QString imageArg = getArgValue(args, QStringLiteral("--image"));
    if (imageArg.isEmpty()) {
        imageArg = positionalArgument(args, valueFlags);
    }
    const QString osName = getArgValue(args, QStringLiteral("--os"));
    const QString drivePath = getArgValue(args, QStringLiteral("--drive"));

    if (drivePath.isEmpty() || (imageArg.isEmpty() && osName.isEmpty())) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    ImageDescriptor image;
    if (!osName.isEmpty()) {
        const Catalog catalog = loadCatalog(catalogLocation(args));
        const CatalogEntry *entry = findEntry(catalog.entries, osName.toStdString());
        if (!entry) {
            std::cerr << "No operating system named \"" << osName.toStdString()
                      << "\" in the catalog." << std::endl;
            return 1;
        }
        image = toImageDescriptor(*entry);
    } else if (isRemoteLocation(imageArg)) {
        image.name = imageArg.toStdString();
        image.url = imageArg.toStdString();
    } else {
        // The worker may start in another directory (pkexec uses /root).
        const QFileInfo info(imageArg);
        if (!info.isFile()) {
            std::cerr << "Image file not found: " << imageArg.toStdString() << std::endl;
            return 1;
        }
        image.name = info.fileName().toStdString();
        image.url = info.absoluteFilePath().toStdString();
    }

    const QString sizeArg = getArgValue(args, QStringLiteral("--size"));
    if (!sizeArg.isEmpty()) {
        bool ok = false;
        const qulonglong size = sizeArg.toULongLong(&ok);
        if (!ok) {
            std::cerr << "Invalid --size value: " << sizeArg.toStdString() << std::endl;
            return 1;
        }
        image.expectedSize = size;
    }
    const QString shaArg = getArgValue(args, QStringLiteral("--sha256"));
    if (!shaArg.isEmpty()) {
        image.expectedSha256 = shaArg.toStdString();
    }

    TargetDevice target;
    target.path = drivePath.toStdString();
    ProcessCommandRunner runner;
    bool listed = false;
    try {
        for (const auto &drive : listDrives(runner, true)) {
            if (drive.path == target.path) {
                target = drive;
                listed = true;
                break;
            }
        }
    } catch (const ImprintError &ex) {
        ILOG_WARN(QStringLiteral("ImprintCli"),
                  QStringLiteral("runWrite"),
                  QStringLiteral("drive_enumeration_failed"),
                  QString::fromUtf8(ex.what()),
                  QStringLiteral("lsblk"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"drive", target.path}}));
    }

    if (listed && target.isSystem) {
        std::cerr << "Refusing to write to " << target.path
                  << ": it holds the running system." << std::endl;
        return 1;
    }
    if (listed && target.isReadonly) {
        std::cerr << target.path << " is read-only." << std::endl;
        return 1;
    }
    if (!listed) {
        // Plain files stand in for a card when testing.
        if (!QFileInfo(drivePath).isFile()) {
            std::cerr << target.path << " is not a whole disk reported by lsblk." << std::endl;
            return 1;
        }
        target.description = "Image file";
    }

    const ProvisioningSettings settings = args.contains(QStringLiteral("--no-customize"))
        ? ProvisioningSettings()
        : SettingsStore().load();

    std::cout << "Image:  " << image.name << "\n"
              << "Target: " << target.path << "  " << target.description << "\n"
              << "Customization: " << (needsCustomization(settings) ? "yes" : "no") << "\n";

    if (!args.contains(QStringLiteral("--yes"))
        && !confirm("All existing data on " + target.path + " will be erased. Continue?")) {
        std::cout << "Cancelled." << std::endl;
        return 1;
    }

    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    WorkerInvocation invocation;
    invocation.devicePath = target.path;
    invocation.imageUrl = image.url;
    invocation.expectedSize = image.expectedSize;
    invocation.expectedSha256 = image.expectedSha256;
    invocation.settings = settings;
    invocation.correlationId = corrId.toStdString();
    invocation.trace = logging::isTraceEnabled();

    auto elevator = makeElevatorFromEnvironment();
    WorkerSupervisor supervisor(*elevator);
    WriteSession session;
    session.begin();

    std::string lastStatus;
    SessionState lastState = session.state();
    auto render = [&session, &lastStatus, &lastState]() {
        if (session.state() != lastState) {
            lastState = session.state();
            if (lastState == SessionState::Writing || lastState == SessionState::Verifying) {
                std::cout << "==> " << toSessionStateString(lastState) << std::endl;
            }
        }
        if (session.statusText() != lastStatus) {
            lastStatus = session.statusText();
            std::cout << lastStatus << std::endl;
        }
    };

    QEventLoop loop;
    QObject::connect(&supervisor, &WorkerSupervisor::eventReceived, &loop,
                     [&session, &render](const TransferEvent &event) {
                         session.apply(event);
                         render();
                     });
    QObject::connect(&supervisor, &WorkerSupervisor::launchFailed, &loop,
                     [&session](const QString &message) {
                         session.launchFailed(message.toStdString());
                     });
    QObject::connect(&supervisor, &WorkerSupervisor::workerCrashed, &loop,
                     [&session](int, const QString &message) {
                         session.workerCrashed(message.toStdString());
                     });
    QObject::connect(&supervisor, &WorkerSupervisor::finished, &loop, &QEventLoop::quit);

    std::cerr << "Requesting administrator privileges for the write..." << std::endl;
    if (!supervisor.start(invocation, selfExecutablePath())) {
        std::cerr << "Error: " << session.errorText() << std::endl;
        return 1;
    }

    InterruptWatcher interrupts;
    abortOnInterrupt(interrupts, supervisor, session);
    QObject::connect(&interrupts, &InterruptWatcher::interrupted, &loop, [](int) {
        std::cerr << "\nAborting; data already written to the card is not rolled back."
                  << std::endl;
    });

    loop.exec();

    if (session.state() == SessionState::Aborted) {
        std::cerr << "Write aborted." << std::endl;
        return 130;
    }
    if (session.state() != SessionState::Finished) {
        if (session.isActive()) {
            session.workerCrashed("Worker process ended unexpectedly");
        }
        std::cerr << "Error: " << session.errorText() << std::endl;
        return 1;
    }

    std::cout << "Write successful." << std::endl;

    if (settings.ejectOnFinish && listed) {
        const CommandResult ejected = runner.run(QStringLiteral("eject"), {drivePath});
        if (!ejected.succeeded()) {
            ILOG_WARN(QStringLiteral("ImprintCli"),
                      QStringLiteral("runWrite"),
                      QStringLiteral("eject_failed"),
                      QString::fromUtf8(ejected.standardError).trimmed(),
                      QStringLiteral("eject"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"drive", target.path}}));
            std::cout << "You can now remove the card (eject it manually first)." << std::endl;
        } else {
            std::cout << "The card was ejected and can be removed." << std::endl;
        }
    }
    return 0;
}

} // namespace imprint
