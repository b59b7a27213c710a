#include "trigger_event.hpp"

using json = nlohmann::json;

std::expected<TriggerEvent, std::string> parse_trigger_event(const json& event) {
    try {
        const auto& records = event.at("Records");
        if (!records.is_array() || records.empty()) {
            return std::unexpected("event has no Records");
        }

        const auto& s3 = records.at(0).at("s3");
        return TriggerEvent{
            .bucket = s3.at("bucket").at("name").get<std::string>(),
            .key = s3.at("object").at("key").get<std::string>(),
        };
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid trigger event: ") + e.what());
    }
}
