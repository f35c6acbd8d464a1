#pragma once
#include <optional>
#include <string>

namespace wakescribe {

// Input device remembered by `--save-device`, stored as audio_settings.json.
struct AudioSettings {
    int inputDevice{-1};
    std::string deviceName;
};

std::string default_audio_settings_path();

// Missing or unreadable file returns nullopt.
std::optional<AudioSettings> loadAudioSettings(const std::string& path);

// Creates parent directories. Returns false on I/O error.
bool saveAudioSettings(const std::string& path, const AudioSettings& settings);

} // namespace wakescribe
