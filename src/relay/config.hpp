#pragma once

#include <string>

struct Config {
    struct Whisper {
        std::string runtime_root = ".";   // bin/whisper-cli lives under here
        std::string models_dir = "models";
        std::string model = "tiny";
    } whisper;

    struct Storage {
        std::string region = "us-east-1";
        std::string endpoint;             // empty: AWS virtual-hosted URLs
        bool path_style = false;
        std::string result_prefix = "processed/";
    } storage;

    std::string scratch_path = "/tmp/audio.wav";

    static Config load(const std::string& path);

    // WHISPER_RELAY_CONFIG file (if any), then environment overrides.
    static Config load_default();

    void apply_environment();
};
