#include "core/audio_settings.hpp"
#include "core/config.hpp"
#include "core/log.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace wakescribe {

std::string default_audio_settings_path() {
    return default_config_dir() + "/audio_settings.json";
}

std::optional<AudioSettings> loadAudioSettings(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        if (!json.contains("input_device") || !json["input_device"].is_number_integer()) {
            Log::warn("Config", path + " has no integer input_device, ignoring");
            return std::nullopt;
        }
        AudioSettings settings;
        settings.inputDevice = json["input_device"].get<int>();
        settings.deviceName = json.value("device_name", std::string{});
        return settings;
    } catch (const nlohmann::json::exception& e) {
        Log::warn("Config", "Cannot parse " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool saveAudioSettings(const std::string& path, const AudioSettings& settings) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
        Log::error("Config", "Cannot create " + p.parent_path().string() + ": " + ec.message());
        return false;
    }

    nlohmann::json json = {
        {"input_device", settings.inputDevice},
        {"device_name", settings.deviceName}
    };
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        Log::error("Config", "Cannot write " + path);
        return false;
    }
    file << json.dump(2) << "\n";
    return static_cast<bool>(file);
}

} // namespace wakescribe
