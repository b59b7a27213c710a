#pragma once

#include "runtime/invocation.hpp"
#include "storage/object_store.hpp"

#include <expected>
#include <string>

// Downloads the triggering object to the scratch path and confirms it landed.
// Errors are typed StorageError (download failed) or AudioNotFound.
std::expected<std::string, InvocationError>
stage_audio(ObjectStore& store, const std::string& bucket, const std::string& key,
            const std::string& scratch_path);
