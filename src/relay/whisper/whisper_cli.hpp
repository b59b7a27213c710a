#pragma once

#include "transcriber.hpp"

#include <string>

// Runs the bundled whisper.cpp command-line binary on a local audio file.
class WhisperCli : public Transcriber {
public:
    explicit WhisperCli(std::string runtime_root = ".", std::string models_dir = "models");

    std::expected<std::string, TranscribeError>
        transcribe(const std::string& audio_path, const std::string& model_name = "tiny") override;

    std::string model_path(const std::string& model_name) const;
    std::string executable_path() const;
    std::string library_dir() const;

private:
    std::string runtime_root_;
    std::string models_dir_;
};
