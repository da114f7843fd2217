#pragma once

#include <memory>
#include <optional>
#include <string>

#include <QtGlobal>

namespace imprint {

// Pull-style byte stream over the raw (possibly compressed) image.
// read() returns 0 only at end of stream and throws ImprintError
// (SourceUnavailable) on any transport failure.
class ImageSource {
public:
    virtual ~ImageSource() = default;

    virtual qint64 read(char *buffer, qint64 maxSize) = 0;
    virtual std::optional<qint64> totalSize() const = 0;
};

// Local paths, file:// URLs and http(s):// URLs.
std::unique_ptr<ImageSource> openImageSource(const std::string &location);

// Path component used for format sniffing: URL path without query or
// fragment, or the location itself for plain paths.
std::string sourcePathOf(const std::string &location);

} // namespace imprint
