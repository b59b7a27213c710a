#include "cli.hpp"

#include <exception>
#include <print>
#include <string>

int run_cli(int argc, char* argv[], std::FILE* out, WhisperCli& whisper) {
    if (argc < 2) {
        std::println(out, "Usage: whisper-relay-cli <wav_file> [<model_name>]");
        return 0;
    }

    std::string wav_file = argv[1];
    std::string model_name = argc == 3 ? argv[2] : "tiny";

    try {
        auto result = whisper.transcribe(wav_file, model_name);
        if (!result) {
            std::println(out, "Error: {}", result.error().message);
            return 0;
        }
        std::println(out, "{}", *result);
    } catch (const std::exception& e) {
        std::println(out, "Error: {}", e.what());
    }
    return 0;
}
