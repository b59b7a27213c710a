#pragma once

#include <string>
#include <string_view>

// whisper-cli prints this for segments without speech.
inline constexpr std::string_view kBlankAudioToken = "[BLANK_AUDIO]";

inline std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r\f\v");
    return std::string(text.substr(start, end - start + 1));
}

// Trim, drop every blank-audio marker, trim again. An empty result means no
// speech was detected.
inline std::string clean_transcript(std::string_view raw) {
    std::string text = trim(raw);
    // Rescan from the start so a removal cannot leave a new marker behind.
    for (auto pos = text.find(kBlankAudioToken); pos != std::string::npos;
         pos = text.find(kBlankAudioToken)) {
        text.erase(pos, kBlankAudioToken.size());
    }
    return trim(text);
}
