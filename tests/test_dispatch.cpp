#include <catch2/catch.hpp>

#include "runtime/dispatch.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

class MockRuntimeApi : public RuntimeApi {
public:
    struct Posted {
        std::string request_id;
        json response;
        std::optional<InvocationError> error;
    };
    std::vector<Posted> posted;
    std::string fail_with;

    std::expected<Invocation, std::string> next_invocation() override {
        return std::unexpected("not used");
    }

    std::expected<void, std::string>
    post_response(const std::string& request_id, const json& response) override {
        if (!fail_with.empty()) return std::unexpected(fail_with);
        posted.push_back({request_id, response, std::nullopt});
        return {};
    }

    std::expected<void, std::string>
    post_error(const std::string& request_id, const InvocationError& error) override {
        if (!fail_with.empty()) return std::unexpected(fail_with);
        posted.push_back({request_id, nullptr, error});
        return {};
    }
};

Invocation invocation(const std::string& payload) {
    return {.context = {.request_id = "req-42"}, .payload = payload};
}

} // namespace

TEST_CASE("Invocation dispatch", "[runtime]") {
    MockRuntimeApi api;
    int handler_calls = 0;
    json seen_event;

    auto ok_handler = [&](const json& event, const InvocationContext&)
        -> std::expected<json, InvocationError> {
        handler_calls++;
        seen_event = event;
        return json{{"statusCode", 200}, {"body", "\"Processing complete\""}};
    };

    SECTION("PostsHandlerResponse") {
        REQUIRE(dispatch_invocation(api, invocation(R"({"Records": []})"), ok_handler).has_value());
        REQUIRE(handler_calls == 1);
        REQUIRE(seen_event == json{{"Records", json::array()}});
        REQUIRE(api.posted.size() == 1);
        REQUIRE(api.posted[0].request_id == "req-42");
        REQUIRE_FALSE(api.posted[0].error.has_value());
        REQUIRE(api.posted[0].response["statusCode"] == 200);
    }

    SECTION("NonJsonPayloadIsInvalidEvent") {
        REQUIRE(dispatch_invocation(api, invocation("not json {"), ok_handler).has_value());
        REQUIRE(handler_calls == 0);
        REQUIRE(api.posted.size() == 1);
        REQUIRE(api.posted[0].request_id == "req-42");
        REQUIRE(api.posted[0].error.has_value());
        REQUIRE(api.posted[0].error->type == "InvalidEvent");
        REQUIRE(api.posted[0].error->message == "event payload is not valid JSON");
    }

    SECTION("HandlerErrorPostedWithType") {
        auto failing = [](const json&, const InvocationContext&)
            -> std::expected<json, InvocationError> {
            return std::unexpected(InvocationError{"ModelNotFound", "Model file not found: x"});
        };

        REQUIRE(dispatch_invocation(api, invocation("{}"), failing).has_value());
        REQUIRE(api.posted.size() == 1);
        REQUIRE(api.posted[0].error->type == "ModelNotFound");
        REQUIRE(api.posted[0].error->message == "Model file not found: x");
    }

    SECTION("UnreachableRuntimeApiReported") {
        api.fail_with = "curl error: Couldn't connect to server";
        auto res = dispatch_invocation(api, invocation("{}"), ok_handler);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "curl error: Couldn't connect to server");
    }
}
