#include "dispatch.hpp"

#include <cstdlib>
#include <print>

using json = nlohmann::json;

std::expected<void, std::string>
dispatch_invocation(RuntimeApi& api, const Invocation& invocation,
                    const InvocationHandler& handler) {
    const auto& ctx = invocation.context;
    if (!ctx.trace_id.empty()) {
        ::setenv("_X_AMZN_TRACE_ID", ctx.trace_id.c_str(), 1);
    }

    auto event = json::parse(invocation.payload, nullptr, false);
    if (event.is_discarded()) {
        return api.post_error(ctx.request_id,
                              {"InvalidEvent", "event payload is not valid JSON"});
    }

    auto result = handler(event, ctx);
    if (!result) {
        std::println(stderr, "[whisper-relay] {}: {}", result.error().type, result.error().message);
        return api.post_error(ctx.request_id, result.error());
    }
    return api.post_response(ctx.request_id, *result);
}
