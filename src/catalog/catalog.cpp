#include "catalog/catalog.hpp"

#include <algorithm>

#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "transfer/image_source.hpp"

namespace imprint {

namespace {

// Catalog documents are a few hundred KiB; anything far larger is not one.
constexpr qint64 kMaxCatalogBytes = 64 * 1024 * 1024;

bool matchesTags(const CatalogEntry &entry, const std::vector<std::string> &deviceTags)
{
    if (entry.devices.empty() || deviceTags.empty()) {
        return true;
    }
    for (const auto &tag : entry.devices) {
        if (std::find(deviceTags.begin(), deviceTags.end(), tag) != deviceTags.end()) {
            return true;
        }
    }
    return false;
}

std::string readAll(ImageSource &source)
{
    std::string data;
    std::vector<char> buffer(64 * 1024);
    while (true) {
        const qint64 n = source.read(buffer.data(), static_cast<qint64>(buffer.size()));
        if (n == 0) {
            break;
        }
        data.append(buffer.data(), static_cast<size_t>(n));
        if (static_cast<qint64>(data.size()) > kMaxCatalogBytes) {
            throw ImprintError(ErrorKind::CatalogError, "Catalog document is too large");
        }
    }
    return data;
}

} // namespace

Catalog parseCatalog(const std::string &document)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ImprintError(ErrorKind::CatalogError,
                           std::string("Catalog is not valid JSON: ") + ex.what());
    }

    if (!root.is_object() || !root.contains("os_list") || !root.at("os_list").is_array()) {
        throw ImprintError(ErrorKind::CatalogError, "Catalog has no os_list array");
    }

    Catalog catalog;
    try {
        const auto imager = root.find("imager");
        if (imager != root.end() && imager->is_object()) {
            catalog.latestVersion = imager->value("latest_version", "");
            const auto devices = imager->find("devices");
            if (devices != imager->end() && devices->is_array()) {
                catalog.devices = devices->get<std::vector<CatalogDevice>>();
            }
        }
        catalog.entries = root.at("os_list").get<std::vector<CatalogEntry>>();
    } catch (const nlohmann::json::exception &ex) {
        throw ImprintError(ErrorKind::CatalogError,
                           std::string("Catalog has an unexpected shape: ") + ex.what());
    }
    return catalog;
}

QString defaultCatalogLocation()
{
    const QString overrideLocation = qEnvironmentVariable("IMPRINT_CATALOG_URL");
    if (!overrideLocation.isEmpty()) {
        return overrideLocation;
    }
    if (QFileInfo::exists(QString::fromLatin1(kLocalCatalogFile))) {
        return QString::fromLatin1(kLocalCatalogFile);
    }
    return QString::fromLatin1(kDefaultCatalogUrl);
}

Catalog loadCatalog(const QString &location)
{
    std::string document;
    try {
        auto source = openImageSource(location.toStdString());
        document = readAll(*source);
    } catch (const ImprintError &ex) {
        if (ex.kind() == ErrorKind::CatalogError) {
            throw;
        }
        throw ImprintError(ErrorKind::CatalogError,
                           "Failed to load catalog from " + location.toStdString() + ": " + ex.what());
    }

    Catalog catalog = parseCatalog(document);

    ILOG_INFO(QStringLiteral("Catalog"),
              QStringLiteral("loadCatalog"),
              QStringLiteral("catalog_loaded"),
              QStringLiteral("os_selection"),
              QStringLiteral("json_parse"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"location", location.toStdString()},
                              {"devices", catalog.devices.size()},
                              {"entries", catalog.entries.size()}}));
    return catalog;
}

std::vector<CatalogEntry> filterForDevice(const std::vector<CatalogEntry> &entries,
                                          const std::vector<std::string> &deviceTags)
{
    std::vector<CatalogEntry> kept;
    for (const auto &entry : entries) {
        if (!matchesTags(entry, deviceTags)) {
            continue;
        }
        if (entry.subitems.empty()) {
            kept.push_back(entry);
            continue;
        }
        CatalogEntry category = entry;
        category.subitems = filterForDevice(entry.subitems, deviceTags);
        if (!category.subitems.empty() || category.url) {
            kept.push_back(std::move(category));
        }
    }
    return kept;
}

const CatalogEntry *findEntry(const std::vector<CatalogEntry> &entries, const std::string &name)
{
    for (const auto &entry : entries) {
        if (entry.name == name) {
            return &entry;
        }
        if (const CatalogEntry *child = findEntry(entry.subitems, name)) {
            return child;
        }
    }
    return nullptr;
}

ImageDescriptor toImageDescriptor(const CatalogEntry &entry)
{
    if (!entry.url || entry.url->empty()) {
        throw ImprintError(ErrorKind::CatalogError,
                           "\"" + entry.name + "\" is a category, not an image");
    }
    ImageDescriptor image;
    image.name = entry.name;
    image.url = *entry.url;
    image.expectedSize = entry.extractSize;
    image.expectedSha256 = entry.extractSha256;
    return image;
}

} // namespace imprint
