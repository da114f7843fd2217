#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace imprint {

constexpr const char *kDefaultCatalogUrl =
    "https://downloads.raspberrypi.com/os_list_imagingutility_v4.json";
constexpr const char *kLocalCatalogFile = "os_list_imagingutility_v4.json";

/**
 * Parse an imaging-utility catalog document.
 *
 * Reads imager.latest_version, imager.devices[] and the os_list[] tree.
 * Throws ImprintError(CatalogError) when the document is not JSON or has no
 * os_list array.
 */
Catalog parseCatalog(const std::string &document);

// IMPRINT_CATALOG_URL, else the local catalog file if present in the working
// directory, else the published catalog URL.
QString defaultCatalogLocation();

// Reads a catalog from a path, file:// or http(s):// location.
Catalog loadCatalog(const QString &location);

// Entries usable on a device with the given tags. Entries without device
// tags match every device; categories are kept while any child matches.
std::vector<CatalogEntry> filterForDevice(const std::vector<CatalogEntry> &entries,
                                          const std::vector<std::string> &deviceTags);

// Depth-first search by exact name; nullptr when absent.
const CatalogEntry *findEntry(const std::vector<CatalogEntry> &entries, const std::string &name);

// Throws ImprintError(CatalogError) for category entries without a URL.
ImageDescriptor toImageDescriptor(const CatalogEntry &entry);

} // namespace imprint
