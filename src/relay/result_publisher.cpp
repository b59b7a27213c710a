#include "result_publisher.hpp"

#include <nlohmann/json.hpp>

std::string result_key(const std::string& object_key, const std::string& prefix) {
    return prefix + object_key + ".json";
}

std::expected<std::string, std::string>
publish_transcript(ObjectStore& store, const std::string& bucket, const std::string& object_key,
                   const std::string& transcript, const std::string& prefix) {
    auto key = result_key(object_key, prefix);
    // Invalid UTF-8 is replaced with U+FFFD rather than failing the upload.
    auto body = nlohmann::json(transcript).dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace);

    auto res = store.put(bucket, key, body, "application/json");
    if (!res) {
        return std::unexpected(res.error());
    }
    return key;
}
