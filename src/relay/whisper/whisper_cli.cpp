#include "whisper_cli.hpp"
#include "transcript.hpp"
#include "../process/subprocess.hpp"

#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// Unreadable paths (EACCES, ENAMETOOLONG) count as missing.
static bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// Output is published as a JSON string, so it has to decode as UTF-8.
static std::expected<void, std::string> check_utf8(const std::string& text) {
    try {
        (void)json(text).dump();
    } catch (const json::type_error& e) {
        return std::unexpected(e.what());
    }
    return {};
}

WhisperCli::WhisperCli(std::string runtime_root, std::string models_dir)
    : runtime_root_(std::move(runtime_root)), models_dir_(std::move(models_dir)) {}

std::string WhisperCli::model_path(const std::string& model_name) const {
    return (fs::path(models_dir_) / ("ggml-" + model_name + ".bin")).string();
}

std::string WhisperCli::executable_path() const {
    return (fs::path(runtime_root_) / "bin" / "whisper-cli").string();
}

std::string WhisperCli::library_dir() const {
    return (fs::path(runtime_root_) / "bin").string();
}

std::expected<std::string, TranscribeError>
WhisperCli::transcribe(const std::string& audio_path, const std::string& model_name) {
    auto model = model_path(model_name);

    if (!path_exists(model)) {
        return std::unexpected(TranscribeError{
            TranscribeErrorKind::ModelNotFound,
            std::format("Model file not found: {} \n\n"
                        "Download a model with this command:\n\n"
                        "> bash ./models/download-ggml-model.sh {}\n\n",
                        model, model_name),
        });
    }

    if (!path_exists(audio_path)) {
        return std::unexpected(TranscribeError{
            TranscribeErrorKind::AudioNotFound,
            "WAV file not found: " + audio_path,
        });
    }

    // -nt: no timestamps, plain text on stdout
    std::vector<std::string> argv = {
        executable_path(), "-m", model, "-f", audio_path, "-nt",
    };

    auto proc = run_process(argv, build_environment(library_dir()));
    if (!proc) {
        return std::unexpected(TranscribeError{TranscribeErrorKind::Execution, proc.error()});
    }

    if (proc->exit_code != 0) {
        const std::string& err = proc->stderr_data;
        return std::unexpected(TranscribeError{
            TranscribeErrorKind::Execution,
            std::format("Error processing audio (exit code {}): {}",
                        proc->exit_code, err.empty() ? "Unknown error" : err),
        });
    }

    if (auto utf8 = check_utf8(proc->stdout_data); !utf8) {
        return std::unexpected(TranscribeError{
            TranscribeErrorKind::Execution,
            "whisper-cli output is not valid UTF-8: " + utf8.error(),
        });
    }

    return clean_transcript(proc->stdout_data);
}
