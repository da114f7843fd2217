#include "worker/event_codec.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace imprint {

std::string encodeEventLine(const TransferEvent &event)
{
    return nlohmann::json(event).dump();
}

std::optional<TransferEvent> decodeEventLine(const std::string &line)
{
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }

    const auto parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }

    try {
        return parsed.get<TransferEvent>();
    } catch (const ImprintError &) {
        return std::nullopt;
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

} // namespace imprint
