#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct TriggerEvent {
    std::string bucket;
    std::string key;
};

// Reads Records[0].s3.bucket.name and Records[0].s3.object.key. Nothing is
// defaulted: a missing record or field is an error.
std::expected<TriggerEvent, std::string> parse_trigger_event(const nlohmann::json& event);
