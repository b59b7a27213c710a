#include "config.hpp"

#include "platform/platform_env.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("whisper")) {
            auto& w = j["whisper"];
            if (w.contains("runtime_root")) cfg.whisper.runtime_root = w["runtime_root"].get<std::string>();
            if (w.contains("models_dir")) cfg.whisper.models_dir = w["models_dir"].get<std::string>();
            if (w.contains("model")) cfg.whisper.model = w["model"].get<std::string>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("region")) cfg.storage.region = s["region"].get<std::string>();
            if (s.contains("endpoint")) cfg.storage.endpoint = s["endpoint"].get<std::string>();
            if (s.contains("path_style")) cfg.storage.path_style = s["path_style"].get<bool>();
            if (s.contains("result_prefix")) cfg.storage.result_prefix = s["result_prefix"].get<std::string>();
        }

        if (j.contains("scratch_path")) {
            cfg.scratch_path = j["scratch_path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    Config cfg;
    auto path = platform::env_or("WHISPER_RELAY_CONFIG");
    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec)) {
        cfg = load(path);
    }
    cfg.apply_environment();
    return cfg;
}

void Config::apply_environment() {
    whisper.runtime_root = platform::env_or("LAMBDA_TASK_ROOT", whisper.runtime_root);
    whisper.model = platform::env_or("WHISPER_MODEL", whisper.model);

    // The sandbox sets AWS_REGION; AWS_DEFAULT_REGION is what local tooling sets.
    storage.region = platform::env_or("AWS_REGION",
                                      platform::env_or("AWS_DEFAULT_REGION", storage.region));
    storage.endpoint = platform::env_or("S3_ENDPOINT_URL", storage.endpoint);
}
