#include "config.hpp"
#include "event_handler.hpp"
#include "platform/platform_env.hpp"
#include "runtime/dispatch.hpp"
#include "runtime/runtime_client.hpp"
#include "storage/s3_object_store.hpp"
#include "whisper/whisper_cli.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::println("Usage: whisper-relay-bootstrap");
            std::println("Lambda custom runtime: transcribes audio objects named by S3");
            std::println("object-created events and writes processed/<key>.json.");
            std::println("Environment:");
            std::println("  AWS_LAMBDA_RUNTIME_API   Runtime API host:port (set by the sandbox)");
            std::println("  LAMBDA_TASK_ROOT         Directory containing bin/whisper-cli");
            std::println("  WHISPER_MODEL            Model name (default: tiny)");
            std::println("  WHISPER_RELAY_CONFIG     Optional JSON config file");
            std::println("  S3_ENDPOINT_URL          Alternative S3 endpoint");
            return 0;
        }
    }

    auto endpoint = platform::runtime_api();
    if (endpoint.empty()) {
        std::println(stderr, "AWS_LAMBDA_RUNTIME_API is not set; whisper-relay-bootstrap "
                             "must run inside a Lambda sandbox");
        return 1;
    }

    Config config = Config::load_default();
    RuntimeClient runtime(endpoint);
    WhisperCli whisper(config.whisper.runtime_root, config.whisper.models_dir);

    // Built on first use and kept for the life of the sandbox.
    std::unique_ptr<S3ObjectStore> store;

    std::println(stderr, "[whisper-relay] Runtime started (model: {}, root: {})",
                 config.whisper.model, config.whisper.runtime_root);

    auto handle = [&](const json& event, const InvocationContext& ctx) {
        if (!store) {
            store = std::make_unique<S3ObjectStore>(S3Options::from_environment(
                config.storage.region, config.storage.endpoint, config.storage.path_style));
        }
        EventHandler handler(config, *store, whisper);
        return handler.handle(event, ctx);
    };

    while (true) {
        auto invocation = runtime.next_invocation();
        if (!invocation) {
            std::println(stderr, "[whisper-relay] Runtime API unavailable: {}", invocation.error());
            return 1;
        }

        auto posted = dispatch_invocation(runtime, *invocation, handle);
        if (!posted) {
            std::println(stderr, "[whisper-relay] Failed to post result: {}", posted.error());
            return 1;
        }
    }
}
