#include "audio_stager.hpp"

#include <filesystem>

std::expected<std::string, InvocationError>
stage_audio(ObjectStore& store, const std::string& bucket, const std::string& key,
            const std::string& scratch_path) {
    auto res = store.download(bucket, key, scratch_path);
    if (!res) {
        return std::unexpected(InvocationError{"StorageError", res.error()});
    }

    // A store can report success without producing a file.
    std::error_code ec;
    if (!std::filesystem::exists(scratch_path, ec)) {
        return std::unexpected(InvocationError{"AudioNotFound", "WAV file not found: " + scratch_path});
    }

    return scratch_path;
}
