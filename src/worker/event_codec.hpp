#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace imprint {

// One event per line on the worker's stdout: {"type": <kind>, "data": <payload>}.
// The returned string has no trailing newline.
std::string encodeEventLine(const TransferEvent &event);

// Returns std::nullopt for blank, malformed or unknown records; the reader
// skips those lines and keeps going.
std::optional<TransferEvent> decodeEventLine(const std::string &line);

} // namespace imprint
