#pragma once

#include <expected>
#include <string>

enum class TranscribeErrorKind { ModelNotFound, AudioNotFound, Execution };

struct TranscribeError {
    TranscribeErrorKind kind;
    std::string message;
};

// Name used for the runtime's errorType field.
inline const char* to_string(TranscribeErrorKind kind) {
    switch (kind) {
        case TranscribeErrorKind::ModelNotFound: return "ModelNotFound";
        case TranscribeErrorKind::AudioNotFound: return "AudioNotFound";
        case TranscribeErrorKind::Execution: return "ExecutionError";
    }
    return "ExecutionError";
}

class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual std::expected<std::string, TranscribeError>
        transcribe(const std::string& audio_path, const std::string& model_name) = 0;
};
