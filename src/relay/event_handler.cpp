#include "event_handler.hpp"

#include "audio_stager.hpp"
#include "result_publisher.hpp"
#include "trigger_event.hpp"

#include <format>
#include <print>

using json = nlohmann::json;

EventHandler::EventHandler(Config config, ObjectStore& store, Transcriber& transcriber)
    : config_(std::move(config)), store_(store), transcriber_(transcriber) {}

std::expected<json, InvocationError>
EventHandler::handle(const json& event, const InvocationContext& context) {
    log(event.dump(-1, ' ', false, json::error_handler_t::replace));

    auto trigger = parse_trigger_event(event);
    if (!trigger) {
        return std::unexpected(InvocationError{"InvalidEvent", trigger.error()});
    }
    log(std::format("Processing file {} from bucket {}", trigger->key, trigger->bucket));

    auto audio = stage_audio(store_, trigger->bucket, trigger->key, config_.scratch_path);
    if (!audio) {
        return std::unexpected(audio.error());
    }

    auto transcript = transcriber_.transcribe(*audio, config_.whisper.model);
    if (!transcript) {
        return std::unexpected(InvocationError{to_string(transcript.error().kind),
                                               transcript.error().message});
    }
    log(std::format("Transcription complete, {} chars", transcript->size()));

    auto key = publish_transcript(store_, trigger->bucket, trigger->key, *transcript,
                                  config_.storage.result_prefix);
    if (!key) {
        return std::unexpected(InvocationError{"StorageError", key.error()});
    }
    log(std::format("Wrote s3://{}/{} (request {})", trigger->bucket, *key, context.request_id));

    return json{
        {"statusCode", 200},
        {"body", json("Processing complete").dump()},
    };
}

void EventHandler::log(const std::string& msg) {
    std::println(stderr, "[whisper-relay] {}", msg);
}
