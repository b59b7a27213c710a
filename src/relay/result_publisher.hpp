#pragma once

#include "storage/object_store.hpp"

#include <expected>
#include <string>

std::string result_key(const std::string& object_key, const std::string& prefix = "processed/");

// Stores the transcript as a JSON string value next to the source object.
// Returns the key written.
std::expected<std::string, std::string>
publish_transcript(ObjectStore& store, const std::string& bucket, const std::string& object_key,
                   const std::string& transcript, const std::string& prefix = "processed/");
