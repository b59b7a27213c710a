#include <catch2/catch.hpp>

#include "trigger_event.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

json s3_event(const std::string& bucket, const std::string& key) {
    return {
        {"Records", {{
            {"eventSource", "aws:s3"},
            {"eventName", "ObjectCreated:Put"},
            {"s3", {
                {"bucket", {{"name", bucket}, {"arn", "arn:aws:s3:::" + bucket}}},
                {"object", {{"key", key}, {"size", 1024}}},
            }},
        }}},
    };
}

} // namespace

TEST_CASE("Trigger event parsing", "[event]") {

    SECTION("ObjectCreatedNotification") {
        auto ev = parse_trigger_event(s3_event("b", "audio/sample.wav"));
        REQUIRE(ev.has_value());
        REQUIRE(ev->bucket == "b");
        REQUIRE(ev->key == "audio/sample.wav");
    }

    SECTION("UsesFirstRecord") {
        auto event = s3_event("first", "one.wav");
        event["Records"].push_back(s3_event("second", "two.wav")["Records"][0]);

        auto ev = parse_trigger_event(event);
        REQUIRE(ev.has_value());
        REQUIRE(ev->bucket == "first");
        REQUIRE(ev->key == "one.wav");
    }

    SECTION("KeyIsNotDecoded") {
        auto ev = parse_trigger_event(s3_event("b", "my+recording%281%29.wav"));
        REQUIRE(ev.has_value());
        REQUIRE(ev->key == "my+recording%281%29.wav");
    }

    SECTION("ZeroRecordsFails") {
        auto ev = parse_trigger_event(json{{"Records", json::array()}});
        REQUIRE_FALSE(ev.has_value());
    }

    SECTION("MissingRecordsFails") {
        auto ev = parse_trigger_event(json::object());
        REQUIRE_FALSE(ev.has_value());
    }

    SECTION("MissingBucketFails") {
        auto event = s3_event("b", "k.wav");
        event["Records"][0]["s3"].erase("bucket");
        REQUIRE_FALSE(parse_trigger_event(event).has_value());
    }

    SECTION("MissingKeyFails") {
        auto event = s3_event("b", "k.wav");
        event["Records"][0]["s3"]["object"].erase("key");
        auto ev = parse_trigger_event(event);
        REQUIRE_FALSE(ev.has_value());
        REQUIRE(ev.error().find("invalid trigger event") != std::string::npos);
    }

    SECTION("WrongTypeFails") {
        auto event = s3_event("b", "k.wav");
        event["Records"][0]["s3"]["object"]["key"] = 42;
        REQUIRE_FALSE(parse_trigger_event(event).has_value());
    }
}
