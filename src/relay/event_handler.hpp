#pragma once

#include "config.hpp"
#include "runtime/invocation.hpp"
#include "storage/object_store.hpp"
#include "whisper/transcriber.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// One object-created notification: download, transcribe, publish.
class EventHandler {
public:
    EventHandler(Config config, ObjectStore& store, Transcriber& transcriber);

    // {"statusCode": 200, "body": ...} on success. Any failure aborts the
    // remaining stages and is returned for the runtime to report.
    std::expected<nlohmann::json, InvocationError>
        handle(const nlohmann::json& event, const InvocationContext& context);

private:
    void log(const std::string& msg);

    Config config_;
    ObjectStore& store_;
    Transcriber& transcriber_;
};
