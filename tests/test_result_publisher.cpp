#include <catch2/catch.hpp>

#include "result_publisher.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Result publisher", "[publisher]") {
    MockObjectStore store;

    SECTION("ResultKey") {
        REQUIRE(result_key("audio/sample.wav") == "processed/audio/sample.wav.json");
        REQUIRE(result_key("x.wav", "out/") == "out/x.wav.json");
    }

    SECTION("StoresJsonString") {
        auto key = publish_transcript(store, "b", "audio/sample.wav", "He said \"hi\"\nthen left.");
        REQUIRE(key.has_value());
        REQUIRE(*key == "processed/audio/sample.wav.json");

        auto& body = store.objects.at({"b", "processed/audio/sample.wav.json"});
        REQUIRE(body == R"("He said \"hi\"\nthen left.")");
        REQUIRE(json::parse(body).get<std::string>() == "He said \"hi\"\nthen left.");
        REQUIRE(store.content_types.at({"b", "processed/audio/sample.wav.json"}) == "application/json");
    }

    SECTION("EmptyTranscript") {
        REQUIRE(publish_transcript(store, "b", "quiet.wav", "").has_value());
        REQUIRE(store.objects.at({"b", "processed/quiet.wav.json"}) == "\"\"");
    }

    SECTION("PublishingTwiceOverwrites") {
        REQUIRE(publish_transcript(store, "b", "a.wav", "same text").has_value());
        auto first = store.objects.at({"b", "processed/a.wav.json"});

        REQUIRE(publish_transcript(store, "b", "a.wav", "same text").has_value());
        REQUIRE(store.put_count == 2);
        REQUIRE(store.objects.size() == 1);
        REQUIRE(store.objects.at({"b", "processed/a.wav.json"}) == first);
    }

    SECTION("PutErrorPropagates") {
        store.fail_put = "AccessDenied";
        auto key = publish_transcript(store, "b", "a.wav", "text");
        REQUIRE_FALSE(key.has_value());
        REQUIRE(key.error() == "AccessDenied");
    }

    SECTION("InvalidUtf8IsReplaced") {
        auto key = publish_transcript(store, "b", "audio/sample.wav", "caf\xC3");
        REQUIRE(key.has_value());

        auto& body = store.objects.at({"b", "processed/audio/sample.wav.json"});
        // U+FFFD in place of the truncated sequence
        REQUIRE(json::parse(body).get<std::string>() == "caf\xEF\xBF\xBD");
    }
}
